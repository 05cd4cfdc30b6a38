/**
 * @file   error_evaluator.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  self-consistency and analytical error measures of computed displacements
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

#include <libmugalerkin/function.hh>

#include <array>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#ifndef SRC_SOLVER_ERROR_EVALUATOR_HH_
#define SRC_SOLVER_ERROR_EVALUATOR_HH_

namespace muElastic {

  //! displacement field given component-wise
  using DisplacementField_t = std::array<ScalarField, twoD>;

  /**
   * Append-only diagnostics of a sweep over discretisation orders: one line
   * `<N> <value>` per solve in each of the wall-time, residual error and
   * analytical error logs. Sinks that are not set are skipped.
   */
  class ConvergenceLog {
   public:
    //! log without any sink
    ConvergenceLog() = default;

    //! log into caller-owned streams, each of which may be null
    ConvergenceLog(std::ostream * time_sink, std::ostream * residual_sink,
                   std::ostream * analytical_sink);

    //! Copy constructor
    ConvergenceLog(const ConvergenceLog & other) = delete;

    //! Move constructor
    ConvergenceLog(ConvergenceLog && other) = default;

    //! Destructor
    virtual ~ConvergenceLog() = default;

    //! Copy assignment operator
    ConvergenceLog & operator=(const ConvergenceLog & other) = delete;

    //! Move assignment operator
    ConvergenceLog & operator=(ConvergenceLog && other) = default;

    /**
     * log appending to `N_time.dat`, `N_errorLameNavier.dat` (Cauchy) or
     * `N_errorBalanceLinMom.dat` (gradient), and `N_error_u_ana.dat` in
     * `directory`; throws a RuntimeError if a file cannot be opened
     */
    static ConvergenceLog append_to_files(const std::string & directory,
                                          const ElasticityModel & model);

    void log_time(const Index_t & nb_modes, const Real & seconds);
    void log_residual_error(const Index_t & nb_modes, const Real & error);
    void log_analytical_error(const Index_t & nb_modes, const Real & error);

   protected:
    static void write(std::ostream * sink, const Index_t & nb_modes,
                      const Real & value);

    std::ostream * time_sink{nullptr};
    std::ostream * residual_sink{nullptr};
    std::ostream * analytical_sink{nullptr};
    std::vector<std::unique_ptr<std::ofstream>> owned_files{};
  };

  /**
   * L2 norm over the domain of the strong-form residual
   * r = -µ Δu - (λ+µ) ∇div u + (c1+c4) ΔΔu + (c2+c3+c5) ∇Δ div u - f
   * of a (dimensionless) displacement; zero gradient constants give the
   * Lamé-Navier residual of Cauchy elasticity
   */
  Real residual_error(const muGalerkin::VectorFunction & u,
                      const GradientParameters & parameters,
                      const BodyForces_t & body_forces);

  //! overload for Cauchy elasticity
  Real residual_error(const muGalerkin::VectorFunction & u,
                      const CauchyParameters & parameters,
                      const BodyForces_t & body_forces);

  /**
   * sqrt(Σ_i ∫ (u_ana,i - u_i)²), the analytical solution sampled on the
   * grid of the space of u
   */
  Real analytical_error(const muGalerkin::VectorFunction & u,
                        const DisplacementField_t & analytical_solution);

}  // namespace muElastic

#endif  // SRC_SOLVER_ERROR_EVALUATOR_HH_
