/**
 * @file   solve_elastic_problem.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  spectral Galerkin solvers for Cauchy and strain-gradient elasticity
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
#include "common/options_dictionary.hh"
#include "materials/elastic_parameters.hh"
#include "solver/error_evaluator.hh"
#include "solver/nondimensionaliser.hh"

#include <libmugalerkin/function.hh>

#include <optional>
#include <vector>

#ifndef SRC_SOLVER_SOLVE_ELASTIC_PROBLEM_HH_
#define SRC_SOLVER_SOLVE_ELASTIC_PROBLEM_HH_

namespace muElastic {

  /**
   * boundary value problem on a rectangle in physical units. Entry (i, j)
   * of `boundary_conditions` constrains displacement component i at the two
   * ends of axis j.
   */
  struct ElasticProblem {
    Domain_t domain;
    BoundaryConditions_t boundary_conditions;
    BodyForces_t body_forces;
    //! reference solution for the analytical error, physical units
    std::optional<DisplacementField_t> analytical_solution{};
  };

  //! discretisation and diagnostics settings of a solve
  struct SolverOptions {
    //! number of Legendre modes per axis
    Index_t nb_modes{30};
    DimensionlessScaling scaling{};
    //! log the wall time of the solve
    bool measure_time{false};
    //! evaluate (and log) the residual and analytical errors
    bool compute_error{false};
    Verbosity verbosity{Verbosity::Silent};

    /**
     * reads the keys `N` (Int), `nondim_disp`, `nondim_length`,
     * `nondim_mat_param` (Real), `measure_time`, `compute_error` and
     * `verbosity` (Int); absent keys keep their defaults
     */
    static SolverOptions from_dictionary(const Dictionary & options);
  };

  //! result of a solve
  struct ElasticSolution {
    //! displacement in physical units on the original domain
    muGalerkin::VectorFunction displacement;
    //! displacement of the dimensionless problem (same coefficients / U)
    muGalerkin::VectorFunction dimensionless;
    //! whether all bases were of the closed kind of the model
    bool only_dirichlet;
    //! whether any boundary data was nonzero
    bool nonhomogeneous;
    //! number of assembled tensor-product operators
    Index_t nb_operators;
    //! seconds spent, if measured
    std::optional<Real> wall_time{};
    //! residual error of the dimensionless problem, if computed
    std::optional<Real> residual_error{};
    //! error against the analytical solution (dimensionless), if computed
    std::optional<Real> analytical_error{};
  };

  /**
   * solves classical isotropic linear elasticity; the diagnostics are
   * appended to `log` if given
   */
  ElasticSolution solve_cauchy_elasticity(const ElasticProblem & problem,
                                          const CauchyParameters & parameters,
                                          const SolverOptions & options,
                                          ConvergenceLog * log = nullptr);

  //! overload taking the parameter list (λ, µ)
  ElasticSolution
  solve_cauchy_elasticity(const ElasticProblem & problem,
                          const std::vector<Real> & material_parameters,
                          const SolverOptions & options,
                          ConvergenceLog * log = nullptr);

  /**
   * solves strain-gradient elasticity; the diagnostics are appended to
   * `log` if given
   */
  ElasticSolution
  solve_gradient_elasticity(const ElasticProblem & problem,
                            const GradientParameters & parameters,
                            const SolverOptions & options,
                            ConvergenceLog * log = nullptr);

  //! overload taking the parameter list (λ, µ, c1, …, c5)
  ElasticSolution
  solve_gradient_elasticity(const ElasticProblem & problem,
                            const std::vector<Real> & material_parameters,
                            const SolverOptions & options,
                            ConvergenceLog * log = nullptr);

}  // namespace muElastic

#endif  // SRC_SOLVER_SOLVE_ELASTIC_PROBLEM_HH_
