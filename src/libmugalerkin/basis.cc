/**
 * @file   basis.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  one-dimensional Legendre bases satisfying boundary conditions
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

#include "basis.hh"

#include <Eigen/LU>

#include <cmath>
#include <sstream>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  Basis::Basis(const Index_t & size, const Interval & domain,
               const BoundaryCondition & bc)
      : nb_functions{size}, domain{domain}, bc{bc} {
    if (not(domain.lower < domain.upper)) {
      std::stringstream err{};
      err << "invalid interval " << domain << ": the lower bound has to be "
          << "smaller than the upper bound";
      throw BasisError(err.str());
    }
    const Index_t nb_constraints{bc.get_nb_constraints()};
    if (size <= nb_constraints) {
      std::stringstream err{};
      err << "a " << bc.get_kind() << " basis needs more than "
          << nb_constraints << " functions, got " << size;
      throw BasisError(err.str());
    }
    this->build_stencil();

    auto && rule{Legendre::gauss_legendre(size)};
    this->reference_mesh = rule.points;
    this->reference_weights = rule.weights;
    const Real half_length{.5 * domain.length()};
    this->mesh = (domain.lower + half_length * (rule.points.array() + 1.))
                     .matrix();
    this->weights = half_length * rule.weights;
  }

  /* ---------------------------------------------------------------------- */
  void Basis::build_stencil() {
    using Kind = BoundaryCondition::Kind;
    const Index_t N{this->nb_functions};
    const Index_t nb_free{this->get_nb_free()};
    this->stencil = DynMatrix_t::Zero(N, N);

    for (Index_t k{0}; k < nb_free; ++k) {
      this->stencil(k, k) = 1.;
      switch (this->bc.get_kind()) {
      case Kind::None: {
        break;
      }
      case Kind::Dirichlet: {
        this->stencil(k, k + 2) = -1.;
        break;
      }
      case Kind::Biharmonic: {
        const Real kk{static_cast<Real>(k)};
        this->stencil(k, k + 2) = -2. * (2. * kk + 5.) / (2. * kk + 7.);
        this->stencil(k, k + 4) = (2. * kk + 3.) / (2. * kk + 7.);
        break;
      }
      case Kind::UpperDirichlet: {
        this->stencil(k, k + 1) = -1.;
        break;
      }
      case Kind::LowerDirichlet: {
        this->stencil(k, k + 1) = 1.;
        break;
      }
      default:
        throw BasisError("unknown boundary condition kind");
        break;
      }
    }

    // lifting functions: the first nb_bc Legendre modes, recombined so that
    // boundary function b is dual to functional b
    const Index_t nb_bc{this->get_nb_boundary()};
    if (nb_bc == 0) {
      return;
    }
    auto && functionals{this->bc.get_functionals()};
    DynMatrix_t duality(nb_bc, nb_bc);
    for (Index_t m{0}; m < nb_bc; ++m) {
      duality.row(m) = Legendre::endpoint_values(nb_bc, functionals[m].end,
                                                 functionals[m].derivative)
                           .transpose();
    }
    const DynMatrix_t lifting{duality.transpose().fullPivLu().inverse()};
    this->stencil.block(nb_free, 0, nb_bc, nb_bc) = lifting;
  }

  /* ---------------------------------------------------------------------- */
  const Index_t & Basis::size() const { return this->nb_functions; }

  /* ---------------------------------------------------------------------- */
  Index_t Basis::get_nb_free() const {
    return this->nb_functions - this->get_nb_boundary();
  }

  /* ---------------------------------------------------------------------- */
  Index_t Basis::get_nb_boundary() const {
    return this->bc.get_nb_constraints();
  }

  /* ---------------------------------------------------------------------- */
  bool Basis::is_boundary_dof(const Index_t & index) const {
    return index >= this->get_nb_free();
  }

  /* ---------------------------------------------------------------------- */
  const BoundaryCondition & Basis::get_boundary_condition() const {
    return this->bc;
  }

  /* ---------------------------------------------------------------------- */
  const BoundaryCondition::Kind & Basis::get_kind() const {
    return this->bc.get_kind();
  }

  /* ---------------------------------------------------------------------- */
  bool Basis::is_orthogonal() const {
    return this->bc.get_kind() == BoundaryCondition::Kind::None;
  }

  /* ---------------------------------------------------------------------- */
  bool Basis::has_nonhomogeneous_bcs() const {
    return not this->bc.is_homogeneous();
  }

  /* ---------------------------------------------------------------------- */
  const Interval & Basis::get_domain() const { return this->domain; }

  /* ---------------------------------------------------------------------- */
  const Vector_t & Basis::get_mesh() const { return this->mesh; }

  /* ---------------------------------------------------------------------- */
  const Vector_t & Basis::get_weights() const { return this->weights; }

  /* ---------------------------------------------------------------------- */
  Real Basis::get_jacobian() const { return 2. / this->domain.length(); }

  /* ---------------------------------------------------------------------- */
  Real Basis::get_functional_scale(const Index_t & derivative) const {
    return std::pow(1. / this->get_jacobian(), static_cast<Real>(derivative));
  }

  /* ---------------------------------------------------------------------- */
  const DynMatrix_t & Basis::get_stencil() const { return this->stencil; }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t Basis::evaluate(const Index_t & derivative) const {
    const Real scale{
        std::pow(this->get_jacobian(), static_cast<Real>(derivative))};
    return scale *
           Legendre::vandermonde(this->nb_functions, this->reference_mesh,
                                 derivative) *
           this->stencil.transpose();
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t Basis::evaluate_at(const Eigen::Ref<const Vector_t> & points,
                                 const Index_t & derivative) const {
    const Vector_t reference{
        (this->get_jacobian() * (points.array() - this->domain.lower) - 1.)
            .matrix()};
    const Real scale{
        std::pow(this->get_jacobian(), static_cast<Real>(derivative))};
    return scale *
           Legendre::vandermonde(this->nb_functions, reference, derivative) *
           this->stencil.transpose();
  }

  /* ---------------------------------------------------------------------- */
  DynMatrix_t Basis::get_projection() const {
    const Index_t N{this->nb_functions};
    // orthogonal Legendre expansion of grid data
    const Vector_t norms{Legendre::norms_squared(N)};
    const DynMatrix_t to_legendre{
        norms.cwiseInverse().asDiagonal() *
        Legendre::vandermonde(N, this->reference_mesh).transpose() *
        this->reference_weights.asDiagonal()};

    if (this->is_orthogonal()) {
      return to_legendre;
    }

    // boundary coefficients are the functionals applied to the expansion
    const Index_t nb_free{this->get_nb_free()};
    const Index_t nb_bc{this->get_nb_boundary()};
    auto && functionals{this->bc.get_functionals()};
    DynMatrix_t traces(nb_bc, N);
    for (Index_t b{0}; b < nb_bc; ++b) {
      traces.row(b) = Legendre::endpoint_values(N, functionals[b].end,
                                                functionals[b].derivative)
                          .transpose();
    }
    const DynMatrix_t boundary_part{traces * to_legendre};

    // the remainder vanishes under all functionals and is expanded into
    // the free functions by Galerkin projection
    auto && free_stencil{this->stencil.topRows(nb_free)};
    auto && lifting_stencil{this->stencil.bottomRows(nb_bc)};
    const DynMatrix_t remainder{to_legendre -
                                lifting_stencil.transpose() * boundary_part};
    const DynMatrix_t mass{free_stencil * norms.asDiagonal() *
                           free_stencil.transpose()};

    DynMatrix_t projection(N, N);
    projection.topRows(nb_free) =
        mass.ldlt().solve(free_stencil * norms.asDiagonal() * remainder);
    projection.bottomRows(nb_bc) = boundary_part;
    return projection;
  }

  /* ---------------------------------------------------------------------- */
  Vector_t Basis::project(const Eigen::Ref<const Vector_t> & values) const {
    if (values.size() != this->nb_functions) {
      std::stringstream err{};
      err << "expected " << this->nb_functions << " grid values, got "
          << values.size();
      throw BasisError(err.str());
    }
    return this->get_projection() * values;
  }

  /* ---------------------------------------------------------------------- */
  Basis Basis::get_orthogonal() const {
    return Basis{this->nb_functions, this->domain};
  }

  /* ---------------------------------------------------------------------- */
  bool Basis::is_compatible(const Basis & other) const {
    return this->nb_functions == other.nb_functions and
           this->domain == other.domain;
  }

  /* ---------------------------------------------------------------------- */
  bool Basis::operator==(const Basis & other) const {
    return this->is_compatible(other) and
           this->get_kind() == other.get_kind();
  }

}  // namespace muGalerkin
