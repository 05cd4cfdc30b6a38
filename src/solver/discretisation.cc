/**
 * @file   discretisation.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  classification of boundary conditions and construction of solution spaces
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

#include "solver/discretisation.hh"

#include <sstream>

namespace muElastic {

  using Kind = BoundaryCondition::Kind;

  /* ---------------------------------------------------------------------- */
  BoundaryConditionResolver::BoundaryConditionResolver(
      const ElasticityModel & model)
      : model{model} {}

  /* ---------------------------------------------------------------------- */
  const ElasticityModel & BoundaryConditionResolver::get_model() const {
    return this->model;
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition::Kind BoundaryConditionResolver::get_closed_kind() const {
    switch (this->model) {
    case ElasticityModel::Cauchy: {
      return Kind::Dirichlet;
    }
    case ElasticityModel::Gradient: {
      return Kind::Biharmonic;
    }
    default:
      throw AssemblyError("unknown elasticity model");
      break;
    }
  }

  /* ---------------------------------------------------------------------- */
  void
  BoundaryConditionResolver::check(const BoundaryConditions_t & bcs) const {
    check_boundary_conditions(bcs);
    if (this->model != ElasticityModel::Cauchy) {
      return;
    }
    for (size_t i{0}; i < bcs.size(); ++i) {
      for (size_t j{0}; j < bcs[i].size(); ++j) {
        if (bcs[i][j].get_kind() == Kind::Biharmonic) {
          std::stringstream err{};
          err << "The boundary condition of displacement component " << i
              << " along axis " << j << " prescribes slopes, which the "
              << "second-order equation of Cauchy elasticity cannot satisfy";
          throw AssemblyError(err.str());
        }
      }
    }
  }

  /* ---------------------------------------------------------------------- */
  bool BoundaryConditionResolver::is_only_dirichlet(
      const BoundaryConditions_t & bcs) const {
    const Kind closed{this->get_closed_kind()};
    for (auto && component_bcs : bcs) {
      for (auto && bc : component_bcs) {
        if (bc.get_kind() != closed) {
          return false;
        }
      }
    }
    return true;
  }

  /* ---------------------------------------------------------------------- */
  bool BoundaryConditionResolver::is_nonhomogeneous(
      const BoundaryConditions_t & bcs) const {
    for (auto && component_bcs : bcs) {
      for (auto && bc : component_bcs) {
        if (not bc.is_homogeneous()) {
          return true;
        }
      }
    }
    return false;
  }

  /* ---------------------------------------------------------------------- */
  std::shared_ptr<const muGalerkin::VectorSpace>
  build_vector_space(const Index_t & nb_modes, const Domain_t & domain,
                     const BoundaryConditions_t & bcs) {
    check_domain(domain);
    check_boundary_conditions(bcs);
    std::vector<muGalerkin::TensorProductSpace> spaces{};
    for (Dim_t i{0}; i < twoD; ++i) {
      for (Dim_t j{0}; j < twoD; ++j) {
        if (nb_modes <= bcs[i][j].get_nb_constraints()) {
          std::stringstream err{};
          err << "A basis with " << bcs[i][j].get_kind()
              << " boundary conditions needs more than "
              << bcs[i][j].get_nb_constraints() << " modes, got "
              << nb_modes;
          throw InputError(err.str());
        }
      }
      spaces.emplace_back(
          muGalerkin::Basis{nb_modes, domain[0], bcs[i][0]},
          muGalerkin::Basis{nb_modes, domain[1], bcs[i][1]});
    }
    return std::make_shared<const muGalerkin::VectorSpace>(spaces);
  }

  /* ---------------------------------------------------------------------- */
  Discretisation
  build_discretisation(const Index_t & nb_modes, const Domain_t & domain,
                       const BoundaryConditions_t & bcs,
                       const BoundaryConditionResolver & resolver) {
    resolver.check(bcs);
    auto space{build_vector_space(nb_modes, domain, bcs)};
    auto orthogonal{std::make_shared<const muGalerkin::VectorSpace>(
        space->get_orthogonal())};
    return Discretisation{space, orthogonal, resolver.is_only_dirichlet(bcs),
                          resolver.is_nonhomogeneous(bcs)};
  }

}  // namespace muElastic
