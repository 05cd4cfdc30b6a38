/**
 * @file   test_operators.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for weak-form terms, tensor-product matrices and block solves
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

#include <libmugalerkin/forms.hh>
#include <libmugalerkin/legendre.hh>
#include <libmugalerkin/operators.hh>

namespace muGalerkin {

  BOOST_AUTO_TEST_SUITE(operator_tests)

  //! one-component space with homogeneous Dirichlet data on [-1, 1]²
  std::shared_ptr<const VectorSpace> dirichlet_space(const Index_t & N) {
    const Interval domain{-1., 1.};
    return std::make_shared<const VectorSpace>(
        std::vector<TensorProductSpace>{TensorProductSpace{
            Basis{N, domain, BoundaryCondition::dirichlet(0., 0.)},
            Basis{N, domain, BoundaryCondition::dirichlet(0., 0.)}}});
  }

  //! ∫ ∇u · ∇v of a scalar field
  Form_t laplace_form() {
    return Forms::pairing(1., 0, dx(0), 0, dx(0)) +
           Forms::pairing(1., 0, dx(1), 0, dx(1));
  }

  BOOST_AUTO_TEST_CASE(form_term_counts) {
    BOOST_CHECK_EQUAL(Forms::grad_grad(1.).size(), 4);
    BOOST_CHECK_EQUAL(Forms::div_div(1.).size(), 4);
    BOOST_CHECK_EQUAL(Forms::transposed_grad_grad(1.).size(), 4);
    BOOST_CHECK_EQUAL(Forms::laplace_laplace(1.).size(), 8);
    BOOST_CHECK_EQUAL(Forms::hessian_hessian(1.).size(), 8);
    BOOST_CHECK_EQUAL((Forms::div_div(1.) + Forms::grad_grad(1.)).size(), 8);

    const FormTerm term{Forms::transposed_grad_grad(3.)[1]};
    // (i, j) = (0, 1): ∂_1 u_0 ∂_0 v_1
    BOOST_CHECK_EQUAL(term.coefficient, 3.);
    BOOST_CHECK_EQUAL(term.trial_component, 0);
    BOOST_CHECK(term.trial_derivative == dx(1));
    BOOST_CHECK_EQUAL(term.test_component, 1);
    BOOST_CHECK(term.test_derivative == dx(0));
  }

  BOOST_AUTO_TEST_CASE(mass_factors_of_orthogonal_bases) {
    const VectorSpace space{{TensorProductSpace{
        Basis{5, Interval{0., 1.}}, Basis{5, Interval{0., 2.}}}}};
    const TPMatrix mass{
        Forms::pairing(1., 0, NoDerivative, 0, NoDerivative).front(), space};
    const Vector_t norms{Legendre::norms_squared(5)};
    BOOST_CHECK_LE(
        testGoodies::rel_error(DynMatrix_t(mass.get_factor(0)),
                               DynMatrix_t((.5 * norms).asDiagonal())),
        tol);
    BOOST_CHECK_LE(testGoodies::rel_error(DynMatrix_t(mass.get_factor(1)),
                                          DynMatrix_t(norms.asDiagonal())),
                   tol);
    BOOST_CHECK_THROW(mass.get_factor(2), SpaceError);
  }

  BOOST_AUTO_TEST_CASE(kronecker_structure) {
    const VectorSpace space{{TensorProductSpace{
        Basis{4, Interval{0., 1.}},
        Basis{3, Interval{0., 2.}, BoundaryCondition::dirichlet(0., 0.)}}}};
    const TPMatrix matrix{Forms::pairing(2., 0, dx(0), 0, dx(1)).front(),
                          space};
    BOOST_CHECK(matrix.acts_on_boundary_dofs());
    const DynMatrix_t full{matrix.kron()};
    const DynMatrix_t A0{matrix.get_factor(0)};
    const DynMatrix_t A1{matrix.get_factor(1)};
    auto && tp_space{space.get_space(0)};
    BOOST_CHECK_EQUAL(full.rows(), tp_space.size());
    for (Index_t i0{0}; i0 < 4; ++i0) {
      for (Index_t i1{0}; i1 < 3; ++i1) {
        for (Index_t j0{0}; j0 < 4; ++j0) {
          for (Index_t j1{0}; j1 < 3; ++j1) {
            BOOST_CHECK_LE(
                std::abs(full(tp_space.flat_index(i0, i1),
                              tp_space.flat_index(j0, j1)) -
                         2. * A0(i0, j0) * A1(i1, j1)),
                tol);
          }
        }
      }
    }
  }

  BOOST_AUTO_TEST_CASE(boundary_matrix_extraction) {
    const VectorSpace space{
        {TensorProductSpace{
             Basis{5, Interval{0., 1.}, BoundaryCondition::dirichlet(0., 1.)},
             Basis{5, Interval{0., 1.}}},
         TensorProductSpace{Basis{5, Interval{0., 1.}},
                            Basis{5, Interval{0., 1.}}}}};
    auto && matrices{inner(Forms::grad_grad(1.), space)};
    BOOST_CHECK_EQUAL(matrices.size(), 4);
    auto && bc_matrices{extract_bc_matrices(matrices)};
    BOOST_CHECK_EQUAL(bc_matrices.size(), 2);
    for (auto && matrix : bc_matrices) {
      BOOST_CHECK_EQUAL(matrix.get_trial_component(), 0);
    }
  }

  BOOST_AUTO_TEST_CASE(poisson_problem) {
    constexpr Index_t N{6};
    auto && space{dirichlet_space(N)};
    // -Δu = f with u = (1 - x²)(1 - y²)
    const ScalarField exact{[](const Point_t & p) {
      return (1 - p(0) * p(0)) * (1 - p(1) * p(1));
    }};
    const ScalarField source{[](const Point_t & p) {
      return 2 * (1 - p(1) * p(1)) + 2 * (1 - p(0) * p(0));
    }};
    auto && tp_space{space->get_space(0)};
    const Vector_t rhs{inner_rhs(*space, {tp_space.sample(source)})};

    const BlockMatrix operator_{inner(laplace_form(), *space), space};
    BOOST_CHECK_EQUAL(operator_.get_matrix().rows(), (N - 2) * (N - 2));
    BOOST_CHECK_EQUAL(operator_.get_matrix().cols(), (N - 2) * (N - 2));

    const VectorFunction solution{operator_.solve(rhs)};
    const ScalarFunction projection{project(exact, space->get_space_ptr(0))};
    BOOST_CHECK_LE(testGoodies::rel_error(solution.get_coefficients(0),
                                          projection.get_coefficients()),
                   solve_tol);
    BOOST_CHECK_LE(testGoodies::rel_error(solution.backward()[0],
                                          tp_space.sample(exact)),
                   solve_tol);
    BOOST_CHECK_LE(testGoodies::rel_error(operator_.matvec(solution), rhs),
                   solve_tol);

    BOOST_CHECK_THROW(operator_.solve(Vector_t::Zero(3)), SolverError);
    BOOST_CHECK_THROW(
        inner_rhs(*space, {tp_space.sample(source), tp_space.sample(source)}),
        SpaceError);
  }

  BOOST_AUTO_TEST_CASE(singular_operator) {
    auto && space{dirichlet_space(5)};
    const BlockMatrix operator_{
        inner(Forms::pairing(0., 0, dx(0), 0, dx(0)), *space), space};
    BOOST_CHECK_THROW(operator_.solve(Vector_t::Ones(space->get_nb_free())),
                      SolverError);

    const BlockMatrix boundary_operator{inner(laplace_form(), *space), space,
                                        BlockMatrix::Columns::Boundary};
    BOOST_CHECK_EQUAL(boundary_operator.get_matrix().cols(),
                      space->get_nb_boundary());
    BOOST_CHECK_THROW(
        boundary_operator.solve(Vector_t::Zero(space->get_nb_free())),
        SolverError);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muGalerkin
