/**
 * @file   nondimensionaliser.hh
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

#include "common/elastic_common.hh"
#include "materials/elastic_parameters.hh"

#ifndef SRC_SOLVER_NONDIMENSIONALISER_HH_
#define SRC_SOLVER_NONDIMENSIONALISER_HH_

namespace muElastic {

  /**
   * reference displacement U, reference length L and reference modulus M;
   * all three have to be strictly positive
   */
  struct DimensionlessScaling {
    Real displacement{1.};
    Real length{1.};
    Real modulus{1.};
  };

  /**
   * Maps the data of an elastic problem onto its dimensionless counterpart:
   *
   * - coordinates x ↦ x / L,
   * - displacement data g ↦ (p ↦ g(L p) / U), the coordinates of a field are
   *   substituted before it is scaled,
   * - displacement gradient data (slopes) s ↦ (p ↦ s(L p) · L / U),
   * - body forces f ↦ (p ↦ f(L p) · L² / (U M)),
   * - λ, µ ↦ λ / M, µ / M and c_i ↦ c_i / (M L²).
   *
   * Dimensionless displacements are mapped back by a factor U.
   */
  class Nondimensionaliser {
   public:
    //! Default constructor
    Nondimensionaliser() = delete;

    //! throws an InputError for non-positive scales
    explicit Nondimensionaliser(const DimensionlessScaling & scaling);

    //! Copy constructor
    Nondimensionaliser(const Nondimensionaliser & other) = default;

    //! Move constructor
    Nondimensionaliser(Nondimensionaliser && other) = default;

    //! Destructor
    virtual ~Nondimensionaliser() = default;

    //! Copy assignment operator
    Nondimensionaliser & operator=(const Nondimensionaliser & other) = default;

    //! Move assignment operator
    Nondimensionaliser & operator=(Nondimensionaliser && other) = default;

    const DimensionlessScaling & get_scaling() const;

    Domain_t scale_domain(const Domain_t & domain) const;

    BoundaryCondition
    scale_boundary_condition(const BoundaryCondition & bc) const;
    BoundaryConditions_t
    scale_boundary_conditions(const BoundaryConditions_t & bcs) const;

    BodyForces_t scale_body_forces(const BodyForces_t & body_forces) const;

    //! displacement field (e.g., an analytical solution) in scaled units
    ScalarField scale_displacement(const ScalarField & displacement) const;
    //! displacement gradient field in scaled units
    ScalarField scale_displacement_gradient(const ScalarField & gradient) const;

    CauchyParameters scale_parameters(const CauchyParameters & params) const;
    GradientParameters
    scale_parameters(const GradientParameters & params) const;

    //! factor restoring physical displacements
    const Real & get_displacement_scale() const;

   protected:
    DimensionlessScaling scaling;
  };

}  // namespace muElastic

#endif  // SRC_SOLVER_NONDIMENSIONALISER_HH_
