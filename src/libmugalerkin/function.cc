/**
 * @file   function.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  scalar and vector expansions in spectral spaces
 *
 * Copyright © 2026 µElastic developers
 *
 * µElastic is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, either version 3, or (at
 * your option) any later version.
 *
 * µElastic is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with µElastic; see the file COPYING. If not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 *
 */

#include "function.hh"

#include <sstream>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  ScalarFunction::ScalarFunction(Space_ptr space)
      : space{std::move(space)},
        coefficients{DynMatrix_t::Zero(this->space->get_shape()[0],
                                       this->space->get_shape()[1])} {}

  /* ---------------------------------------------------------------------- */
  ScalarFunction::ScalarFunction(Space_ptr space, DynMatrix_t coefficients)
      : space{std::move(space)}, coefficients{std::move(coefficients)} {
    auto && shape{this->space->get_shape()};
    if (this->coefficients.rows() != shape[0] or
        this->coefficients.cols() != shape[1]) {
      std::stringstream err{};
      err << "coefficient array of shape (" << this->coefficients.rows()
          << ", " << this->coefficients.cols()
          << ") does not match the space shape (" << shape[0] << ", "
          << shape[1] << ")";
      throw SpaceError(err.str());
    }
  }

  /* ---------------------------------------------------------------------- */
  const TensorProductSpace & ScalarFunction::get_space() const {
    return *this->space;
  }

  /* ---------------------------------------------------------------------- */
  auto ScalarFunction::get_space_ptr() const -> const Space_ptr & {
    return this->space;
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t & ScalarFunction::get_coefficients() {
    return this->coefficients;
  }

  /* ---------------------------------------------------------------------- */
  const DynMatrix_t & ScalarFunction::get_coefficients() const {
    return this->coefficients;
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t ScalarFunction::backward(const DerivOrder_t & derivative) const {
    return this->space->backward(this->coefficients, derivative);
  }

  /* ---------------------------------------------------------------------- */
  void ScalarFunction::check_same_space(const ScalarFunction & other) const {
    if (not(*this->space == *other.space)) {
      throw SpaceError("cannot combine functions of different spaces");
    }
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction & ScalarFunction::operator+=(const ScalarFunction & other) {
    this->check_same_space(other);
    this->coefficients += other.coefficients;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction & ScalarFunction::operator-=(const ScalarFunction & other) {
    this->check_same_space(other);
    this->coefficients -= other.coefficients;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction & ScalarFunction::operator*=(const Real & factor) {
    this->coefficients *= factor;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction
  ScalarFunction::operator+(const ScalarFunction & other) const {
    ScalarFunction ret_val{*this};
    ret_val += other;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction
  ScalarFunction::operator-(const ScalarFunction & other) const {
    ScalarFunction ret_val{*this};
    ret_val -= other;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction ScalarFunction::operator-() const {
    return ScalarFunction{this->space, -this->coefficients};
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction operator*(const Real & factor, const ScalarFunction & u) {
    ScalarFunction ret_val{u};
    ret_val *= factor;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction project(const ScalarFunction & u,
                         const DerivOrder_t & derivative,
                         const ScalarFunction::Space_ptr & target) {
    if (not target->is_compatible(u.get_space())) {
      throw SpaceError("projection target does not share the grid of the "
                       "projected function");
    }
    return ScalarFunction{target, target->forward(u.backward(derivative))};
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction project(const ScalarField & field,
                         const ScalarFunction::Space_ptr & target) {
    return ScalarFunction{target, target->forward(target->sample(field))};
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction::VectorFunction(VectorSpace_ptr space)
      : space{std::move(space)} {
    for (Dim_t i{0}; i < this->space->get_nb_components(); ++i) {
      auto && shape{this->space->get_space(i).get_shape()};
      this->coefficients.push_back(DynMatrix_t::Zero(shape[0], shape[1]));
    }
  }

  /* ---------------------------------------------------------------------- */
  const VectorSpace & VectorFunction::get_space() const {
    return *this->space;
  }

  /* ---------------------------------------------------------------------- */
  auto VectorFunction::get_space_ptr() const -> const VectorSpace_ptr & {
    return this->space;
  }

  /* ---------------------------------------------------------------------- */
  Dim_t VectorFunction::get_nb_components() const {
    return this->space->get_nb_components();
  }

  /* ---------------------------------------------------------------------- */
  void VectorFunction::check_component(const Dim_t & component) const {
    if (component < 0 or component >= this->get_nb_components()) {
      std::stringstream err{};
      err << "component " << component << " out of range for a vector "
          << "function of " << this->get_nb_components() << " components";
      throw SpaceError(err.str());
    }
  }

  /* ---------------------------------------------------------------------- */
  ScalarFunction VectorFunction::operator[](const Dim_t & component) const {
    this->check_component(component);
    return ScalarFunction{this->space->get_space_ptr(component),
                          this->coefficients[component]};
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t & VectorFunction::get_coefficients(const Dim_t & component) {
    this->check_component(component);
    return this->coefficients[component];
  }

  /* ---------------------------------------------------------------------- */
  const DynMatrix_t &
  VectorFunction::get_coefficients(const Dim_t & component) const {
    this->check_component(component);
    return this->coefficients[component];
  }

  /* ---------------------------------------------------------------------- */
  Vector_t VectorFunction::get_free_dofs() const {
    Vector_t ret_val(this->space->get_nb_free());
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      auto && space{this->space->get_space(i)};
      const Vector_t flat{space.flatten(this->coefficients[i])};
      Index_t position{this->space->get_free_offset(i)};
      for (auto && dof : space.get_free_dofs()) {
        ret_val(position++) = flat(dof);
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  void
  VectorFunction::set_free_dofs(const Eigen::Ref<const Vector_t> & free_dofs) {
    if (free_dofs.size() != this->space->get_nb_free()) {
      std::stringstream err{};
      err << "expected " << this->space->get_nb_free() << " free dofs, got "
          << free_dofs.size();
      throw SpaceError(err.str());
    }
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      auto && space{this->space->get_space(i)};
      Vector_t flat{space.flatten(this->coefficients[i])};
      Index_t position{this->space->get_free_offset(i)};
      for (auto && dof : space.get_free_dofs()) {
        flat(dof) = free_dofs(position++);
      }
      this->coefficients[i] = space.unflatten(flat);
    }
  }

  /* ---------------------------------------------------------------------- */
  Vector_t VectorFunction::get_boundary_dofs() const {
    Vector_t ret_val(this->space->get_nb_boundary());
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      auto && space{this->space->get_space(i)};
      const Vector_t flat{space.flatten(this->coefficients[i])};
      Index_t position{this->space->get_boundary_offset(i)};
      for (auto && dof : space.get_boundary_dofs()) {
        ret_val(position++) = flat(dof);
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction & VectorFunction::set_boundary_dofs() {
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      this->coefficients[i] = this->space->get_space(i).boundary_coefficients();
    }
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  void VectorFunction::assign_coefficients(const VectorFunction & other) {
    if (this->get_nb_components() != other.get_nb_components()) {
      throw SpaceError("cannot assign coefficients between vector functions "
                       "of different numbers of components");
    }
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      if (this->space->get_space(i).get_shape() !=
          other.space->get_space(i).get_shape()) {
        std::stringstream err{};
        err << "component " << i << " of both vector functions differs in "
            << "shape";
        throw SpaceError(err.str());
      }
      this->coefficients[i] = other.coefficients[i];
    }
  }

  /* ---------------------------------------------------------------------- */
  std::vector<DynMatrix_t> VectorFunction::backward() const {
    std::vector<DynMatrix_t> ret_val{};
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      ret_val.push_back(
          this->space->get_space(i).backward(this->coefficients[i]));
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  void VectorFunction::check_same_space(const VectorFunction & other) const {
    if (not(*this->space == *other.space)) {
      throw SpaceError("cannot combine vector functions of different spaces");
    }
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction & VectorFunction::operator+=(const VectorFunction & other) {
    this->check_same_space(other);
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      this->coefficients[i] += other.coefficients[i];
    }
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction & VectorFunction::operator-=(const VectorFunction & other) {
    this->check_same_space(other);
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      this->coefficients[i] -= other.coefficients[i];
    }
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction & VectorFunction::operator*=(const Real & factor) {
    for (auto && coeffs : this->coefficients) {
      coeffs *= factor;
    }
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction
  VectorFunction::operator+(const VectorFunction & other) const {
    VectorFunction ret_val{*this};
    ret_val += other;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction
  VectorFunction::operator-(const VectorFunction & other) const {
    VectorFunction ret_val{*this};
    ret_val -= other;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction VectorFunction::operator-() const {
    VectorFunction ret_val{*this};
    ret_val *= -1.;
    return ret_val;
  }

}  // namespace muGalerkin
