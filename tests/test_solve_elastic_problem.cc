/**
 * @file   test_solve_elastic_problem.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for the Cauchy and strain-gradient elasticity solvers
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

#include "tests.hh"
#include "test_goodies.hh"

#include "solver/solve_elastic_problem.hh"

#include <cmath>
#include <sstream>

namespace muElastic {

  using testGoodies::rel_error;

  BOOST_AUTO_TEST_SUITE(solve_elastic_problem_tests)

  BOOST_FIXTURE_TEST_CASE(uniaxial_tension, testGoodies::TensionFixture) {
    options.nb_modes = 16;
    options.measure_time = true;
    auto && solution{solve_cauchy_elasticity(problem, material, options)};

    BOOST_CHECK(not solution.only_dirichlet);
    BOOST_CHECK(solution.nonhomogeneous);
    BOOST_CHECK_EQUAL(solution.nb_operators, 12);
    BOOST_CHECK(solution.wall_time.has_value());
    BOOST_REQUIRE(solution.residual_error.has_value());
    BOOST_REQUIRE(solution.analytical_error.has_value());
    BOOST_CHECK_LT(*solution.residual_error, 1e-6);
    BOOST_CHECK_LT(*solution.analytical_error, 1e-8);

    // the displacement lives on the physical domain
    auto && space{solution.displacement.get_space()};
    BOOST_CHECK(space.get_space(0).get_basis(0).get_domain() ==
                problem.domain[0]);
    auto && values{solution.displacement.backward()};
    for (Dim_t i{0}; i < twoD; ++i) {
      const DynMatrix_t exact{
          space.get_space(i).sample((*problem.analytical_solution)[i])};
      BOOST_CHECK_LE(rel_error(values[i], exact), solve_tol);
    }
  }

  BOOST_FIXTURE_TEST_CASE(uniaxial_tension_high_order,
                          testGoodies::TensionFixture) {
    options.nb_modes = 30;
    auto && solution{solve_cauchy_elasticity(problem, material, options)};
    BOOST_REQUIRE(solution.residual_error.has_value());
    BOOST_CHECK(std::isfinite(*solution.residual_error));
    BOOST_CHECK(solution.displacement.get_free_dofs().allFinite());
    BOOST_CHECK_LT(*solution.analytical_error, 1e-6);
    BOOST_CHECK(not solution.wall_time.has_value());
  }

  BOOST_FIXTURE_TEST_CASE(dimensionless_and_physical_solutions,
                          testGoodies::TensionFixture) {
    options.nb_modes = 10;
    options.scaling = DimensionlessScaling{2., 50., 100.};
    auto && solution{solve_cauchy_elasticity(problem, material, options)};
    for (Dim_t i{0}; i < twoD; ++i) {
      const DynMatrix_t rescaled{
          2. * solution.dimensionless.get_coefficients(i)};
      BOOST_CHECK_LE(
          rel_error(solution.displacement.get_coefficients(i), rescaled), tol);
    }
    BOOST_CHECK(solution.dimensionless.get_space()
                    .get_space(0)
                    .get_basis(0)
                    .get_domain() == (Interval{0., 2.}));
  }

  BOOST_FIXTURE_TEST_CASE(scaling_invariance, testGoodies::SineFixture) {
    options.nb_modes = 12;
    auto && unscaled{solve_cauchy_elasticity(problem, material, options)};
    options.scaling = DimensionlessScaling{3., 2., 5.};
    auto && scaled{solve_cauchy_elasticity(problem, material, options)};
    // u_y vanishes up to round-off, compare the field as a whole
    Real difference{0.}, magnitude{0.};
    for (Dim_t i{0}; i < twoD; ++i) {
      auto && reference{unscaled.displacement.get_coefficients(i)};
      difference +=
          (reference - scaled.displacement.get_coefficients(i)).squaredNorm();
      magnitude += reference.squaredNorm();
    }
    BOOST_CHECK_GT(magnitude, 0.);
    BOOST_CHECK_LE(std::sqrt(difference), solve_tol * std::sqrt(magnitude));
    BOOST_CHECK(unscaled.only_dirichlet);
    BOOST_CHECK(not unscaled.nonhomogeneous);
    BOOST_CHECK_EQUAL(unscaled.nb_operators, 8);
  }

  BOOST_FIXTURE_TEST_CASE(spectral_convergence, testGoodies::SineFixture) {
    options.nb_modes = 8;
    auto && coarse{solve_cauchy_elasticity(problem, material, options)};
    options.nb_modes = 12;
    auto && fine{solve_cauchy_elasticity(problem, material.get_values(),
                                         options)};
    BOOST_REQUIRE(coarse.analytical_error.has_value());
    BOOST_REQUIRE(fine.analytical_error.has_value());
    BOOST_CHECK_LT(*fine.analytical_error, *coarse.analytical_error);
    BOOST_CHECK_LT(*fine.analytical_error, 1e-6);
  }

  BOOST_AUTO_TEST_CASE(gradient_elasticity_linear_field) {
    // u = (.1 + .2x - .3y, .05x + .4y) solves the gradient equations
    // without body forces, clamped values and slopes on all edges
    const ScalarField u_x{
        [](const Point_t & x) { return .1 + .2 * x(0) - .3 * x(1); }};
    const ScalarField u_y{
        [](const Point_t & x) { return .05 * x(0) + .4 * x(1); }};
    ElasticProblem problem{
        Domain_t{Interval{0., 1.}, Interval{0., 2.}},
        BoundaryConditions_t{
            {BoundaryCondition::biharmonic(u_x, .2, u_x, .2),
             BoundaryCondition::biharmonic(u_x, -.3, u_x, -.3)},
            {BoundaryCondition::biharmonic(u_y, .05, u_y, .05),
             BoundaryCondition::biharmonic(u_y, .4, u_y, .4)}},
        BodyForces_t{0., 0.}};
    problem.analytical_solution = DisplacementField_t{u_x, u_y};

    SolverOptions options{};
    options.nb_modes = 10;
    options.compute_error = true;
    const std::vector<Real> material{1.5, 1., .1, .05, .1, .4, .05};
    auto && solution{solve_gradient_elasticity(problem, material, options)};

    BOOST_CHECK(solution.only_dirichlet);
    BOOST_CHECK(solution.nonhomogeneous);
    BOOST_CHECK_EQUAL(solution.nb_operators, 5 * 8 + 8);
    BOOST_REQUIRE(solution.analytical_error.has_value());
    BOOST_CHECK_LT(*solution.analytical_error, 1e-6);
    BOOST_CHECK(std::isfinite(*solution.residual_error));
  }

  BOOST_FIXTURE_TEST_CASE(gradient_elasticity_clamped_plate,
                          testGoodies::ClampedPlateFixture) {
    // each gradient constant alone, all of them, and none
    const std::vector<std::vector<Real>> materials{
        {1.5, 1., .3, 0., 0., 0., 0.}, {1.5, 1., 0., .3, 0., 0., 0.},
        {1.5, 1., 0., 0., .3, 0., 0.}, {1.5, 1., 0., 0., 0., .3, 0.},
        {1.5, 1., 0., 0., 0., 0., .3}, {1.5, 1., .1, .2, .3, .4, .5},
        {1.5, 1., 0., 0., 0., 0., 0.}};
    for (auto && values : materials) {
      auto && problem{problem_for(values)};
      auto && solution{solve_gradient_elasticity(problem, values, options)};

      Index_t nb_active{0};
      for (Index_t i{2}; i < GradientParameters::NbParameters; ++i) {
        nb_active += (values[i] != 0.);
      }
      BOOST_CHECK(solution.only_dirichlet);
      BOOST_CHECK(not solution.nonhomogeneous);
      BOOST_CHECK_EQUAL(solution.nb_operators, 8 * nb_active + 8);
      BOOST_REQUIRE(solution.analytical_error.has_value());
      BOOST_CHECK_LT(*solution.analytical_error, 1e-10);
      BOOST_CHECK_LT(*solution.residual_error, 1e-6);
    }
  }

  BOOST_FIXTURE_TEST_CASE(gradient_constants_change_the_solution,
                          testGoodies::ClampedPlateFixture) {
    // body force of c4 = .3, solved without the c4 term
    auto && problem{problem_for({1.5, 1., 0., 0., 0., .3, 0.})};
    auto && solution{solve_gradient_elasticity(
        problem, std::vector<Real>{1.5, 1., 0., 0., 0., 0., 0.}, options)};
    BOOST_REQUIRE(solution.analytical_error.has_value());
    BOOST_CHECK_GT(*solution.analytical_error, 1e-6);
  }

  BOOST_AUTO_TEST_CASE(options_from_dictionary) {
    Dictionary dict{"N", Int{12}};
    dict.add("nondim_disp", 2.);
    dict.add("nondim_length", 3.);
    dict.add("nondim_mat_param", 4.);
    dict.add("measure_time", Int{1});
    dict.add("verbosity", Int{2});
    auto && options{SolverOptions::from_dictionary(dict)};
    BOOST_CHECK_EQUAL(options.nb_modes, 12);
    BOOST_CHECK_EQUAL(options.scaling.displacement, 2.);
    BOOST_CHECK_EQUAL(options.scaling.length, 3.);
    BOOST_CHECK_EQUAL(options.scaling.modulus, 4.);
    BOOST_CHECK(options.measure_time);
    BOOST_CHECK(not options.compute_error);
    BOOST_CHECK(options.verbosity == Verbosity::Detailed);

    auto && defaults{SolverOptions::from_dictionary(Dictionary{})};
    BOOST_CHECK_EQUAL(defaults.nb_modes, 30);
    BOOST_CHECK(defaults.verbosity == Verbosity::Silent);

    BOOST_CHECK_THROW(
        SolverOptions::from_dictionary(Dictionary{"verbosity", Int{4}}),
        ValueError);
    BOOST_CHECK_THROW(SolverOptions::from_dictionary(Dictionary{"N", 12.}),
                      ValueError);
  }

  BOOST_FIXTURE_TEST_CASE(convergence_log, testGoodies::TensionFixture) {
    std::stringstream time{}, residual{}, analytical{};
    ConvergenceLog log{&time, &residual, &analytical};
    options.nb_modes = 12;
    options.measure_time = true;
    solve_cauchy_elasticity(problem, material, options, &log);
    options.nb_modes = 14;
    solve_cauchy_elasticity(problem, material, options, &log);

    Index_t nb_modes{};
    Real value{};
    for (auto * stream : {&time, &residual, &analytical}) {
      *stream >> nb_modes >> value;
      BOOST_CHECK_EQUAL(nb_modes, 12);
      BOOST_CHECK(std::isfinite(value));
      *stream >> nb_modes >> value;
      BOOST_CHECK_EQUAL(nb_modes, 14);
    }

    // without sinks, nothing is written
    ConvergenceLog silent{};
    BOOST_CHECK_NO_THROW(
        solve_cauchy_elasticity(problem, material, options, &silent));
    BOOST_CHECK_THROW(ConvergenceLog::append_to_files(
                          "/nonexistent/directory", ElasticityModel::Cauchy),
                      muGalerkin::RuntimeError);
  }

  BOOST_FIXTURE_TEST_CASE(invalid_input, testGoodies::TensionFixture) {
    options.nb_modes = 0;
    BOOST_CHECK_THROW(solve_cauchy_elasticity(problem, material, options),
                      InputError);
    options.nb_modes = 8;
    BOOST_CHECK_THROW(
        solve_cauchy_elasticity(problem, std::vector<Real>{1.}, options),
        InputError);
    BOOST_CHECK_THROW(solve_gradient_elasticity(
                          problem, std::vector<Real>{1., 1., 0.}, options),
                      InputError);

    ElasticProblem clamped_slopes{problem};
    clamped_slopes.boundary_conditions[0][1] =
        BoundaryCondition::biharmonic(0., 0., 0., 0.);
    BOOST_CHECK_THROW(
        solve_cauchy_elasticity(clamped_slopes, material, options),
        AssemblyError);

    ElasticProblem flipped{problem};
    flipped.domain[1] = Interval{1., 0.};
    BOOST_CHECK_THROW(solve_cauchy_elasticity(flipped, material, options),
                      InputError);

    options.scaling.length = 0.;
    BOOST_CHECK_THROW(solve_cauchy_elasticity(problem, material, options),
                      InputError);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muElastic
