/**
 * @file   discretisation.hh
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

#include "common/elastic_common.hh"

#include <libmugalerkin/vector_space.hh>

#include <memory>

#ifndef SRC_SOLVER_DISCRETISATION_HH_
#define SRC_SOLVER_DISCRETISATION_HH_

namespace muElastic {

  /**
   * Classifies the boundary conditions of the displacement components with
   * respect to the order of the differential equation: the closed basis of
   * Cauchy elasticity is the Dirichlet basis, the one of gradient
   * elasticity the biharmonic basis.
   */
  class BoundaryConditionResolver {
   public:
    //! Default constructor
    BoundaryConditionResolver() = delete;

    //! resolver for the differential equation of `model`
    explicit BoundaryConditionResolver(const ElasticityModel & model);

    //! Copy constructor
    BoundaryConditionResolver(const BoundaryConditionResolver & other) =
        default;

    //! Move constructor
    BoundaryConditionResolver(BoundaryConditionResolver && other) = default;

    //! Destructor
    virtual ~BoundaryConditionResolver() = default;

    //! Copy assignment operator
    BoundaryConditionResolver &
    operator=(const BoundaryConditionResolver & other) = default;

    //! Move assignment operator
    BoundaryConditionResolver &
    operator=(BoundaryConditionResolver && other) = default;

    const ElasticityModel & get_model() const;

    //! the kind of basis closing all boundaries for the model
    BoundaryCondition::Kind get_closed_kind() const;

    /**
     * throws an InputError for a badly shaped matrix and an AssemblyError
     * for boundary conditions the model cannot represent (clamped slopes in
     * Cauchy elasticity)
     */
    void check(const BoundaryConditions_t & bcs) const;

    //! true iff every entry is of the closed kind of the model
    bool is_only_dirichlet(const BoundaryConditions_t & bcs) const;

    //! true iff any entry carries boundary data that is not constant zero
    bool is_nonhomogeneous(const BoundaryConditions_t & bcs) const;

   protected:
    ElasticityModel model;
  };

  /**
   * solution space of one solve, its unconstrained companion (body forces,
   * stresses) and the flags selecting the assembly and solve branches
   */
  struct Discretisation {
    std::shared_ptr<const muGalerkin::VectorSpace> space;
    std::shared_ptr<const muGalerkin::VectorSpace> orthogonal;
    bool only_dirichlet;
    bool nonhomogeneous;
  };

  /**
   * vector space of `nb_modes` Legendre modes per axis and component, the
   * basis of component i along axis j satisfies `bcs[i][j]`
   */
  std::shared_ptr<const muGalerkin::VectorSpace>
  build_vector_space(const Index_t & nb_modes, const Domain_t & domain,
                     const BoundaryConditions_t & bcs);

  /**
   * checks the boundary conditions against the model, builds the spaces
   * and takes the branch flags from the resolver
   */
  Discretisation
  build_discretisation(const Index_t & nb_modes, const Domain_t & domain,
                       const BoundaryConditions_t & bcs,
                       const BoundaryConditionResolver & resolver);

}  // namespace muElastic

#endif  // SRC_SOLVER_DISCRETISATION_HH_
