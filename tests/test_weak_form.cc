/**
 * @file   test_weak_form.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for the weak forms of Cauchy and strain-gradient elasticity
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

#include "solver/discretisation.hh"
#include "solver/weak_form.hh"

#include <libmugalerkin/operators.hh>

namespace muElastic {

  using testGoodies::rel_error;

  BOOST_AUTO_TEST_SUITE(weak_form_tests)

  const CauchyParameters lame{1.5, 1.};

  BOOST_AUTO_TEST_CASE(cauchy_branches) {
    auto && closed{cauchy_weak_form(lame, true)};
    auto && open{cauchy_weak_form(lame, false)};
    BOOST_CHECK_EQUAL(closed.size(), 8);
    BOOST_CHECK_EQUAL(open.size(), 12);

    const WeakFormContext context{GradientParameters{1.5, 1., {}}, true};
    auto && labels{active_labels(cauchy_contributions(), context)};
    BOOST_REQUIRE_EQUAL(labels.size(), 2);
    BOOST_CHECK_EQUAL(labels[0], "mu grad(u):grad(v)");
    BOOST_CHECK_EQUAL(labels[1], "(lambda + mu) div(u) div(v)");

    // the coefficient of the div-div pairing carries λ + µ
    BOOST_CHECK_EQUAL(closed.back().coefficient, 2.5);
    BOOST_CHECK_EQUAL(open.back().coefficient, 1.5);
  }

  BOOST_AUTO_TEST_CASE(gradient_term_selection) {
    auto && full{
        GradientParameters::from_values({1.5, 1., 1., 2., 3., 4., 5.})};
    BOOST_CHECK_EQUAL(gradient_weak_form(full, true).size(), 5 * 8 + 8);
    BOOST_CHECK_EQUAL(gradient_weak_form(full, false).size(), 5 * 8 + 12);

    auto && sparse{
        GradientParameters::from_values({1.5, 1., 0., 0., 0., 4., 0.})};
    auto && form{gradient_weak_form(sparse, true)};
    BOOST_CHECK_EQUAL(form.size(), 8 + 8);
    for (Index_t i{0}; i < 8; ++i) {
      BOOST_CHECK_EQUAL(form[i].coefficient, 4.);
    }

    auto && labels{active_labels(gradient_contributions(),
                                 WeakFormContext{sparse, false})};
    BOOST_REQUIRE_EQUAL(labels.size(), 4);
    BOOST_CHECK_EQUAL(labels[0], "c4 d_jk(u_i) d_jk(v_i)");
    BOOST_CHECK_EQUAL(labels[1], "mu grad(u):grad(v)");

    // without gradient constants, the Cauchy form remains
    auto && cauchy_only{
        GradientParameters::from_values({1.5, 1., 0., 0., 0., 0., 0.})};
    BOOST_CHECK_EQUAL(gradient_weak_form(cauchy_only, false).size(),
                      cauchy_weak_form(lame, false).size());
  }

  BOOST_AUTO_TEST_CASE(equivalence_of_cauchy_branches) {
    // for fields vanishing on the boundary, ∫ ∂_j u_i ∂_i v_j equals
    // ∫ div u div v and both branches assemble the same operator
    const BoundaryCondition clamped{BoundaryCondition::dirichlet(0., 0.)};
    auto && space{build_vector_space(
        7, Domain_t{Interval{0., 2.}, Interval{0., 1.}},
        BoundaryConditions_t{{clamped, clamped}, {clamped, clamped}})};
    const muGalerkin::BlockMatrix closed{
        muGalerkin::inner(cauchy_weak_form(lame, true), *space), space};
    const muGalerkin::BlockMatrix open{
        muGalerkin::inner(cauchy_weak_form(lame, false), *space), space};
    BOOST_CHECK_LE(rel_error(DynMatrix_t(closed.get_matrix()),
                             DynMatrix_t(open.get_matrix())),
                   solve_tol);
  }

  BOOST_AUTO_TEST_CASE(omitted_terms_of_zero_constants) {
    // vanishing constants give the operator and the solution of the form
    // written without their terms
    const BoundaryCondition clamped{
        BoundaryCondition::biharmonic(0., 0., 0., 0.)};
    auto && space{build_vector_space(
        9, Domain_t{Interval{0., 1.}, Interval{0., 2.}},
        BoundaryConditions_t{{clamped, clamped}, {clamped, clamped}})};
    auto && parameters{
        GradientParameters::from_values({1.5, 1., 2., 0., .7, 0., 0.})};
    const muGalerkin::BlockMatrix assembled{
        muGalerkin::inner(gradient_weak_form(parameters, true), *space),
        space};

    namespace Forms = muGalerkin::Forms;
    const muGalerkin::Form_t written_out{
        Forms::laplace_laplace(2.) + Forms::grad_div_grad_div(.7) +
        Forms::grad_grad(1.) + Forms::div_div(2.5)};
    const muGalerkin::BlockMatrix reference{
        muGalerkin::inner(written_out, *space), space};

    BOOST_CHECK_LE(rel_error(DynMatrix_t(assembled.get_matrix()),
                             DynMatrix_t(reference.get_matrix())),
                   tol);

    const Vector_t rhs{Vector_t::LinSpaced(space->get_nb_free(), -1., 1.)};
    auto && solution{assembled.solve(rhs)};
    auto && reference_solution{reference.solve(rhs)};
    BOOST_CHECK_LE(rel_error(solution.get_free_dofs(),
                             reference_solution.get_free_dofs()),
                   solve_tol);

    // a nonzero c2 changes the operator
    auto && with_c2{
        GradientParameters::from_values({1.5, 1., 2., .1, .7, 0., 0.})};
    const muGalerkin::BlockMatrix changed{
        muGalerkin::inner(gradient_weak_form(with_c2, true), *space), space};
    BOOST_CHECK_GT(rel_error(DynMatrix_t(changed.get_matrix()),
                             DynMatrix_t(reference.get_matrix())),
                   solve_tol);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muElastic
