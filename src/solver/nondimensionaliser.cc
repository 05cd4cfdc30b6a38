/**
 * @file   nondimensionaliser.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  rescaling of elastic problems to dimensionless form
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

#include "solver/nondimensionaliser.hh"

#include <sstream>

namespace muElastic {

  /* ---------------------------------------------------------------------- */
  Nondimensionaliser::Nondimensionaliser(const DimensionlessScaling & scaling)
      : scaling{scaling} {
    if (not(scaling.displacement > 0. and scaling.length > 0. and
            scaling.modulus > 0.)) {
      std::stringstream err{};
      err << "The reference displacement, length and modulus have to be "
          << "strictly positive, got U = " << scaling.displacement
          << ", L = " << scaling.length << ", M = " << scaling.modulus;
      throw InputError(err.str());
    }
  }

  /* ---------------------------------------------------------------------- */
  const DimensionlessScaling & Nondimensionaliser::get_scaling() const {
    return this->scaling;
  }

  /* ---------------------------------------------------------------------- */
  Domain_t Nondimensionaliser::scale_domain(const Domain_t & domain) const {
    return Domain_t{domain[0].scaled(this->scaling.length),
                    domain[1].scaled(this->scaling.length)};
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition Nondimensionaliser::scale_boundary_condition(
      const BoundaryCondition & bc) const {
    return bc.transformed([this](const ScalarField & value,
                                 const muGalerkin::BoundaryFunctional &
                                     functional) {
      switch (functional.derivative) {
      case zerothOrder: {
        return this->scale_displacement(value);
      }
      case firstOrder: {
        return this->scale_displacement_gradient(value);
      }
      default:
        throw InputError("boundary data of higher derivatives cannot be "
                         "rescaled");
      }
    });
  }

  /* ---------------------------------------------------------------------- */
  BoundaryConditions_t Nondimensionaliser::scale_boundary_conditions(
      const BoundaryConditions_t & bcs) const {
    BoundaryConditions_t ret_val{};
    for (auto && component_bcs : bcs) {
      ret_val.emplace_back();
      for (auto && bc : component_bcs) {
        ret_val.back().push_back(this->scale_boundary_condition(bc));
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  BodyForces_t Nondimensionaliser::scale_body_forces(
      const BodyForces_t & body_forces) const {
    auto && s{this->scaling};
    const Real factor{s.length * s.length / (s.displacement * s.modulus)};
    BodyForces_t ret_val{};
    for (Dim_t i{0}; i < twoD; ++i) {
      ret_val[i] = body_forces[i]
                       .with_rescaled_coordinates(s.length)
                       .scaled(factor);
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  ScalarField Nondimensionaliser::scale_displacement(
      const ScalarField & displacement) const {
    return displacement.with_rescaled_coordinates(this->scaling.length)
        .scaled(1. / this->scaling.displacement);
  }

  /* ---------------------------------------------------------------------- */
  ScalarField Nondimensionaliser::scale_displacement_gradient(
      const ScalarField & gradient) const {
    return gradient.with_rescaled_coordinates(this->scaling.length)
        .scaled(this->scaling.length / this->scaling.displacement);
  }

  /* ---------------------------------------------------------------------- */
  CauchyParameters
  Nondimensionaliser::scale_parameters(const CauchyParameters & params) const {
    return CauchyParameters{params.lambda / this->scaling.modulus,
                            params.mu / this->scaling.modulus};
  }

  /* ---------------------------------------------------------------------- */
  GradientParameters Nondimensionaliser::scale_parameters(
      const GradientParameters & params) const {
    auto && s{this->scaling};
    GradientParameters ret_val{params};
    ret_val.lambda /= s.modulus;
    ret_val.mu /= s.modulus;
    for (auto && c : ret_val.c) {
      c /= s.modulus * s.length * s.length;
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  const Real & Nondimensionaliser::get_displacement_scale() const {
    return this->scaling.displacement;
  }

}  // namespace muElastic
