/**
 * @file   uniaxial_tension.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  uniaxial tension of a rectangle in Cauchy elasticity, sweep over the number of modes
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
#include "postprocessing/stresses.hh"
#include "solver/error_evaluator.hh"
#include "solver/solve_elastic_problem.hh"

#include <iostream>

using namespace muElastic;

int main() {
  banner("uniaxial_tension", 2026, "µElastic developers");

  // rectangle of length l and height h, stretched by u0 along x
  constexpr Real l{100.};
  constexpr Real h{l / 2};
  constexpr Real u0{1.};

  constexpr Real E{400.};
  constexpr Real nu{.4};
  const auto material{CauchyParameters::from_young_poisson(E, nu)};
  std::cout << "material: " << material << std::endl;

  ElasticProblem problem{
      Domain_t{Interval{0., l}, Interval{0., h}},
      BoundaryConditions_t{
          {BoundaryCondition::dirichlet(0., u0), BoundaryCondition::none()},
          {BoundaryCondition::none(),
           BoundaryCondition::tagged("upperdirichlet", {})}},
      BodyForces_t{0., 0.}};
  problem.analytical_solution = DisplacementField_t{
      ScalarField{[](const Point_t & x) { return x(0) / l * u0; }},
      ScalarField{[](const Point_t & x) {
        return nu / (1 - nu) * u0 / l * (h - x(1));
      }}};

  SolverOptions options{};
  options.scaling = DimensionlessScaling{u0, l, material.lambda};
  options.measure_time = true;
  options.compute_error = true;
  options.verbosity = Verbosity::Some;

  auto log{ConvergenceLog::append_to_files(".", ElasticityModel::Cauchy)};

  for (Index_t nb_modes{20}; nb_modes <= 30; nb_modes += 2) {
    options.nb_modes = nb_modes;
    try {
      auto && solution{
          solve_cauchy_elasticity(problem, material, options, &log)};
      auto && stresses{cauchy_stresses(material, solution.displacement)};
      auto && sigma_xx{stresses(0, 0).backward()};
      auto && sigma_yy{stresses(1, 1).backward()};
      std::cout << "N = " << nb_modes
                << ": max |sigma_xx| = " << sigma_xx.cwiseAbs().maxCoeff()
                << ", max |sigma_yy| = " << sigma_yy.cwiseAbs().maxCoeff()
                << std::endl;
    } catch (const muGalerkin::RuntimeError & error) {
      std::cerr << "N = " << nb_modes << " failed: " << error.what()
                << std::endl;
    }
  }
  return 0;
}
