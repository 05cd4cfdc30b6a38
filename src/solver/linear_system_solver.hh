/**
 * @file   linear_system_solver.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  assembly and solution of the Galerkin system with lifted boundary data
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
#include "solver/discretisation.hh"

#include <libmugalerkin/forms.hh>
#include <libmugalerkin/function.hh>

#ifndef SRC_SOLVER_LINEAR_SYSTEM_SOLVER_HH_
#define SRC_SOLVER_LINEAR_SYSTEM_SOLVER_HH_

namespace muElastic {

  /**
   * Solves a(u, v) = ∫ v·f for all test functions v of a discretisation.
   *
   * With homogeneous boundary data, the block operator over the free dofs
   * is solved directly. Otherwise, u = u_0 + u_b, where u_b holds the
   * lifting of the boundary data: the part of the operator acting on the
   * boundary dofs is applied to -u_b and added to the right-hand side, the
   * free part is solved for u_0, and u_b is added back.
   */
  class LinearSystemSolver {
   public:
    //! Default constructor
    LinearSystemSolver() = delete;

    //! solver on `discretisation`
    LinearSystemSolver(const Discretisation & discretisation,
                       const Verbosity & verbosity = Verbosity::Silent);

    //! Copy constructor
    LinearSystemSolver(const LinearSystemSolver & other) = delete;

    //! Move constructor
    LinearSystemSolver(LinearSystemSolver && other) = default;

    //! Destructor
    virtual ~LinearSystemSolver() = default;

    //! Copy assignment operator
    LinearSystemSolver & operator=(const LinearSystemSolver & other) = delete;

    //! Move assignment operator
    LinearSystemSolver & operator=(LinearSystemSolver && other) = delete;

    /**
     * ∫ v·f, with the body force sampled on the grid of the unconstrained
     * companion space
     */
    Vector_t assemble_rhs(const BodyForces_t & body_forces) const;

    //! coefficients of the solution, throws a SolverError if singular
    muGalerkin::VectorFunction solve(const muGalerkin::Form_t & form,
                                     const BodyForces_t & body_forces) const;

   protected:
    Discretisation discretisation;
    Verbosity verbosity;
  };

}  // namespace muElastic

#endif  // SRC_SOLVER_LINEAR_SYSTEM_SOLVER_HH_
