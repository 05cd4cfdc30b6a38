/**
 * @file   solve_elastic_problem.cc
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

#include "solver/solve_elastic_problem.hh"
#include "solver/discretisation.hh"
#include "solver/linear_system_solver.hh"
#include "solver/weak_form.hh"

#include <chrono>
#include <iostream>
#include <sstream>

namespace muElastic {

  using muGalerkin::VectorFunction;

  /* ---------------------------------------------------------------------- */
  SolverOptions SolverOptions::from_dictionary(const Dictionary & options) {
    SolverOptions ret_val{};
    if (options.has_key("N")) {
      ret_val.nb_modes = options["N"].get_int();
    }
    if (options.has_key("nondim_disp")) {
      ret_val.scaling.displacement = options["nondim_disp"].get_real();
    }
    if (options.has_key("nondim_length")) {
      ret_val.scaling.length = options["nondim_length"].get_real();
    }
    if (options.has_key("nondim_mat_param")) {
      ret_val.scaling.modulus = options["nondim_mat_param"].get_real();
    }
    if (options.has_key("measure_time")) {
      ret_val.measure_time = options["measure_time"].get_int() != 0;
    }
    if (options.has_key("compute_error")) {
      ret_val.compute_error = options["compute_error"].get_int() != 0;
    }
    if (options.has_key("verbosity")) {
      const Int verbosity{options["verbosity"].get_int()};
      if (verbosity < static_cast<Int>(Verbosity::Silent) or
          verbosity > static_cast<Int>(Verbosity::Full)) {
        std::stringstream err{};
        err << "verbosity has to be between "
            << static_cast<Int>(Verbosity::Silent) << " and "
            << static_cast<Int>(Verbosity::Full) << ", got " << verbosity;
        throw ValueError(err.str());
      }
      ret_val.verbosity = static_cast<Verbosity>(verbosity);
    }
    return ret_val;
  }

  namespace internal {

    /**
     * common pipeline of both models, `parameters` in physical units (zero
     * gradient constants for Cauchy elasticity)
     */
    ElasticSolution solve_elastic_problem(const ElasticProblem & problem,
                                          const ElasticityModel & model,
                                          const GradientParameters & parameters,
                                          const SolverOptions & options,
                                          ConvergenceLog * log) {
      // input contract, before any assembly work
      check_domain(problem.domain);
      check_boundary_conditions(problem.boundary_conditions);
      if (options.nb_modes < 1) {
        std::stringstream err{};
        err << "The number of modes has to be positive, got "
            << options.nb_modes;
        throw InputError(err.str());
      }
      const Nondimensionaliser scaler{options.scaling};
      const auto verbose{options.verbosity};

      auto start{std::chrono::high_resolution_clock::now()};

      const Domain_t domain{scaler.scale_domain(problem.domain)};
      const BoundaryConditions_t bcs{
          scaler.scale_boundary_conditions(problem.boundary_conditions)};
      const BodyForces_t body_forces{
          scaler.scale_body_forces(problem.body_forces)};
      const GradientParameters dimless_parameters{
          scaler.scale_parameters(parameters)};

      const BoundaryConditionResolver resolver{model};
      const Discretisation discretisation{
          build_discretisation(options.nb_modes, domain, bcs, resolver)};

      if (verbose > Verbosity::Silent) {
        std::cout << resolver.get_model() << " elasticity with N = "
                  << options.nb_modes
                  << " modes per axis, dimensionless parameters "
                  << dimless_parameters << std::endl;
        std::cout << "only Dirichlet bases: " << std::boolalpha
                  << discretisation.only_dirichlet
                  << ", nonhomogeneous boundary data: "
                  << discretisation.nonhomogeneous << std::noboolalpha
                  << std::endl;
      }

      muGalerkin::Form_t form{};
      switch (resolver.get_model()) {
      case ElasticityModel::Cauchy: {
        form = cauchy_weak_form(dimless_parameters.get_cauchy(),
                                discretisation.only_dirichlet);
        break;
      }
      case ElasticityModel::Gradient: {
        form = gradient_weak_form(dimless_parameters,
                                  discretisation.only_dirichlet);
        break;
      }
      default:
        throw AssemblyError("unknown elasticity model");
        break;
      }
      if (verbose >= Verbosity::Full) {
        for (auto && term : form) {
          std::cout << "  " << term << std::endl;
        }
      }

      const LinearSystemSolver solver{discretisation, verbose};
      VectorFunction u_hat{solver.solve(form, body_forces)};

      // same coefficients on the original domain with the original data
      VectorFunction u{build_vector_space(options.nb_modes, problem.domain,
                                          problem.boundary_conditions)};
      u.assign_coefficients(u_hat);
      u *= scaler.get_displacement_scale();

      ElasticSolution ret_val{u,
                              u_hat,
                              discretisation.only_dirichlet,
                              discretisation.nonhomogeneous,
                              static_cast<Index_t>(form.size())};

      if (options.measure_time) {
        std::chrono::duration<Real> duration{
            std::chrono::high_resolution_clock::now() - start};
        ret_val.wall_time = duration.count();
        if (log != nullptr) {
          log->log_time(options.nb_modes, duration.count());
        }
        if (verbose > Verbosity::Silent) {
          std::cout << "solve time = " << duration.count() << "s"
                    << std::endl;
        }
      }

      if (options.compute_error) {
        ret_val.residual_error =
            residual_error(u_hat, dimless_parameters, body_forces);
        if (log != nullptr) {
          log->log_residual_error(options.nb_modes, *ret_val.residual_error);
        }
        if (verbose > Verbosity::Silent) {
          std::cout << "residual error = " << *ret_val.residual_error
                    << std::endl;
        }
        if (problem.analytical_solution) {
          DisplacementField_t dimless_solution{};
          for (Dim_t i{0}; i < twoD; ++i) {
            dimless_solution[i] =
                scaler.scale_displacement((*problem.analytical_solution)[i]);
          }
          ret_val.analytical_error = analytical_error(u_hat, dimless_solution);
          if (log != nullptr) {
            log->log_analytical_error(options.nb_modes,
                                      *ret_val.analytical_error);
          }
          if (verbose > Verbosity::Silent) {
            std::cout << "error with respect to the analytical solution = "
                      << *ret_val.analytical_error << std::endl;
          }
        }
      }
      return ret_val;
    }

  }  // namespace internal

  /* ---------------------------------------------------------------------- */
  ElasticSolution solve_cauchy_elasticity(const ElasticProblem & problem,
                                          const CauchyParameters & parameters,
                                          const SolverOptions & options,
                                          ConvergenceLog * log) {
    return internal::solve_elastic_problem(
        problem, ElasticityModel::Cauchy,
        GradientParameters{parameters.lambda, parameters.mu, {}}, options,
        log);
  }

  /* ---------------------------------------------------------------------- */
  ElasticSolution
  solve_cauchy_elasticity(const ElasticProblem & problem,
                          const std::vector<Real> & material_parameters,
                          const SolverOptions & options, ConvergenceLog * log) {
    return solve_cauchy_elasticity(
        problem, CauchyParameters::from_values(material_parameters), options,
        log);
  }

  /* ---------------------------------------------------------------------- */
  ElasticSolution
  solve_gradient_elasticity(const ElasticProblem & problem,
                            const GradientParameters & parameters,
                            const SolverOptions & options,
                            ConvergenceLog * log) {
    return internal::solve_elastic_problem(problem, ElasticityModel::Gradient,
                                           parameters, options, log);
  }

  /* ---------------------------------------------------------------------- */
  ElasticSolution
  solve_gradient_elasticity(const ElasticProblem & problem,
                            const std::vector<Real> & material_parameters,
                            const SolverOptions & options,
                            ConvergenceLog * log) {
    return solve_gradient_elasticity(
        problem, GradientParameters::from_values(material_parameters), options,
        log);
  }

}  // namespace muElastic
