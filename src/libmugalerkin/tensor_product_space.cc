/**
 * @file   tensor_product_space.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  two-dimensional tensor-product spaces of Legendre bases
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

#include "tensor_product_space.hh"

#include <sstream>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  TensorProductSpace::TensorProductSpace(const Basis & basis0,
                                         const Basis & basis1)
      : bases{basis0, basis1} {}

  /* ---------------------------------------------------------------------- */
  const Basis & TensorProductSpace::get_basis(const Dim_t & axis) const {
    if (axis < 0 or axis >= twoD) {
      std::stringstream err{};
      err << "axis " << axis << " out of range";
      throw SpaceError(err.str());
    }
    return this->bases[axis];
  }

  /* ---------------------------------------------------------------------- */
  auto TensorProductSpace::get_shape() const -> Shape_t {
    return Shape_t{this->bases[0].size(), this->bases[1].size()};
  }

  /* ---------------------------------------------------------------------- */
  Index_t TensorProductSpace::size() const {
    return this->bases[0].size() * this->bases[1].size();
  }

  /* ---------------------------------------------------------------------- */
  Index_t TensorProductSpace::flat_index(const Index_t & i,
                                         const Index_t & j) const {
    return i * this->bases[1].size() + j;
  }

  /* ---------------------------------------------------------------------- */
  bool TensorProductSpace::is_boundary_dof(const Index_t & i,
                                           const Index_t & j) const {
    return this->bases[0].is_boundary_dof(i) or
           this->bases[1].is_boundary_dof(j);
  }

  /* ---------------------------------------------------------------------- */
  std::vector<Index_t> TensorProductSpace::get_free_dofs() const {
    std::vector<Index_t> ret_val{};
    ret_val.reserve(this->get_nb_free());
    for (Index_t i{0}; i < this->bases[0].size(); ++i) {
      for (Index_t j{0}; j < this->bases[1].size(); ++j) {
        if (not this->is_boundary_dof(i, j)) {
          ret_val.push_back(this->flat_index(i, j));
        }
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  std::vector<Index_t> TensorProductSpace::get_boundary_dofs() const {
    std::vector<Index_t> ret_val{};
    for (Index_t i{0}; i < this->bases[0].size(); ++i) {
      for (Index_t j{0}; j < this->bases[1].size(); ++j) {
        if (this->is_boundary_dof(i, j)) {
          ret_val.push_back(this->flat_index(i, j));
        }
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  Index_t TensorProductSpace::get_nb_free() const {
    return this->bases[0].get_nb_free() * this->bases[1].get_nb_free();
  }

  /* ---------------------------------------------------------------------- */
  bool TensorProductSpace::has_nonhomogeneous_bcs() const {
    return this->bases[0].has_nonhomogeneous_bcs() or
           this->bases[1].has_nonhomogeneous_bcs();
  }

  /* ---------------------------------------------------------------------- */
  bool TensorProductSpace::is_orthogonal() const {
    return this->bases[0].is_orthogonal() and this->bases[1].is_orthogonal();
  }

  /* ---------------------------------------------------------------------- */
  TensorProductSpace TensorProductSpace::get_orthogonal() const {
    return TensorProductSpace{this->bases[0].get_orthogonal(),
                              this->bases[1].get_orthogonal()};
  }

  /* ---------------------------------------------------------------------- */
  bool TensorProductSpace::is_compatible(
      const TensorProductSpace & other) const {
    return this->bases[0].is_compatible(other.bases[0]) and
           this->bases[1].is_compatible(other.bases[1]);
  }

  /* ---------------------------------------------------------------------- */
  bool
  TensorProductSpace::operator==(const TensorProductSpace & other) const {
    return this->bases[0] == other.bases[0] and
           this->bases[1] == other.bases[1];
  }

  /* ---------------------------------------------------------------------- */
  const Vector_t & TensorProductSpace::get_mesh(const Dim_t & axis) const {
    return this->get_basis(axis).get_mesh();
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t TensorProductSpace::get_weights() const {
    return this->bases[0].get_weights() *
           this->bases[1].get_weights().transpose();
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t TensorProductSpace::sample(const ScalarField & field) const {
    auto && x{this->get_mesh(0)};
    auto && y{this->get_mesh(1)};
    if (field.is_constant()) {
      return DynMatrix_t::Constant(x.size(), y.size(), field.get_constant());
    }
    DynMatrix_t ret_val(x.size(), y.size());
    for (Index_t i{0}; i < x.size(); ++i) {
      for (Index_t j{0}; j < y.size(); ++j) {
        ret_val(i, j) = field(x(i), y(j));
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t
  TensorProductSpace::backward(const DynMatrix_t & coefficients,
                               const DerivOrder_t & derivative) const {
    if (coefficients.rows() != this->bases[0].size() or
        coefficients.cols() != this->bases[1].size()) {
      std::stringstream err{};
      err << "coefficient array of shape (" << coefficients.rows() << ", "
          << coefficients.cols() << ") does not match the space shape ("
          << this->bases[0].size() << ", " << this->bases[1].size() << ")";
      throw SpaceError(err.str());
    }
    return this->bases[0].evaluate(derivative[0]) * coefficients *
           this->bases[1].evaluate(derivative[1]).transpose();
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t TensorProductSpace::forward(const DynMatrix_t & values) const {
    if (values.rows() != this->get_mesh(0).size() or
        values.cols() != this->get_mesh(1).size()) {
      throw SpaceError("grid values do not match the grid of the space");
    }
    return this->bases[0].get_projection() * values *
           this->bases[1].get_projection().transpose();
  }

  /* ---------------------------------------------------------------------- */
  Real TensorProductSpace::integrate(const DynMatrix_t & values) const {
    return this->bases[0].get_weights().dot(values *
                                            this->bases[1].get_weights());
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t TensorProductSpace::boundary_coefficients() const {
    auto && basis0{this->bases[0]};
    auto && basis1{this->bases[1]};
    DynMatrix_t ret_val{DynMatrix_t::Zero(basis0.size(), basis1.size())};

    // edges normal to axis 0: data as functions of y, whole rows
    {
      auto && values{basis0.get_boundary_condition().get_values()};
      auto && functionals{basis0.get_boundary_condition().get_functionals()};
      auto && y{basis1.get_mesh()};
      const DynMatrix_t projection1{basis1.get_projection()};
      for (size_t b{0}; b < values.size(); ++b) {
        const Real x{basis0.get_domain().at(functionals[b].end)};
        const Real scale{
            basis0.get_functional_scale(functionals[b].derivative)};
        Vector_t edge_data(y.size());
        for (Index_t q{0}; q < y.size(); ++q) {
          edge_data(q) = scale * values[b](x, y(q));
        }
        const Index_t row{basis0.get_nb_free() + static_cast<Index_t>(b)};
        ret_val.row(row) = (projection1 * edge_data).transpose();
      }
    }

    // edges normal to axis 1: data as functions of x, remaining rows only
    {
      auto && values{basis1.get_boundary_condition().get_values()};
      auto && functionals{basis1.get_boundary_condition().get_functionals()};
      auto && x{basis0.get_mesh()};
      const DynMatrix_t projection0{basis0.get_projection()};
      const Index_t nb_free0{basis0.get_nb_free()};
      for (size_t b{0}; b < values.size(); ++b) {
        const Real y{basis1.get_domain().at(functionals[b].end)};
        const Real scale{
            basis1.get_functional_scale(functionals[b].derivative)};
        Vector_t edge_data(x.size());
        for (Index_t q{0}; q < x.size(); ++q) {
          edge_data(q) = scale * values[b](x(q), y);
        }
        const Index_t col{basis1.get_nb_free() + static_cast<Index_t>(b)};
        ret_val.col(col).head(nb_free0) =
            (projection0 * edge_data).head(nb_free0);
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  Vector_t TensorProductSpace::flatten(const DynMatrix_t & coefficients) const {
    const Index_t N0{this->bases[0].size()}, N1{this->bases[1].size()};
    if (coefficients.rows() != N0 or coefficients.cols() != N1) {
      throw SpaceError("coefficient array does not match the space shape");
    }
    Vector_t ret_val(N0 * N1);
    for (Index_t i{0}; i < N0; ++i) {
      ret_val.segment(i * N1, N1) = coefficients.row(i).transpose();
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t
  TensorProductSpace::unflatten(const Eigen::Ref<const Vector_t> & flat) const {
    const Index_t N0{this->bases[0].size()}, N1{this->bases[1].size()};
    if (flat.size() != N0 * N1) {
      throw SpaceError("flat coefficient vector does not match the space size");
    }
    DynMatrix_t ret_val(N0, N1);
    for (Index_t i{0}; i < N0; ++i) {
      ret_val.row(i) = flat.segment(i * N1, N1).transpose();
    }
    return ret_val;
  }

}  // namespace muGalerkin
