/**
 * @file   test_tensor_product_space.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for tensor-product spaces, vector spaces and spectral functions
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

#include <libmugalerkin/function.hh>
#include <libmugalerkin/tensor_product_space.hh>
#include <libmugalerkin/vector_space.hh>

namespace muGalerkin {

  BOOST_AUTO_TEST_SUITE(tensor_product_space_tests)

  //! f(x, y) = x²y + 3y³ - x
  Real cubic_field(const Point_t & p) {
    return p(0) * p(0) * p(1) + 3 * p(1) * p(1) * p(1) - p(0);
  }

  BOOST_AUTO_TEST_CASE(dof_bookkeeping) {
    TensorProductSpace space{
        Basis{5, Interval{0., 1.}, BoundaryCondition::dirichlet(0., 0.)},
        Basis{4, Interval{0., 2.}, BoundaryCondition::upper_dirichlet()}};
    auto && shape{space.get_shape()};
    BOOST_CHECK_EQUAL(shape[0], 5);
    BOOST_CHECK_EQUAL(shape[1], 4);
    BOOST_CHECK_EQUAL(space.size(), 20);
    BOOST_CHECK_EQUAL(space.get_nb_free(), 9);
    BOOST_CHECK_EQUAL(space.get_free_dofs().size(), 9);
    BOOST_CHECK_EQUAL(space.get_boundary_dofs().size(), 11);
    BOOST_CHECK_EQUAL(space.flat_index(1, 2), 6);
    BOOST_CHECK(space.is_boundary_dof(3, 0));
    BOOST_CHECK(space.is_boundary_dof(0, 3));
    BOOST_CHECK(not space.is_boundary_dof(2, 2));
    BOOST_CHECK(not space.is_orthogonal());
    BOOST_CHECK(space.get_orthogonal().is_orthogonal());
    BOOST_CHECK(space.is_compatible(space.get_orthogonal()));
    BOOST_CHECK_THROW(space.get_basis(2), SpaceError);

    DynMatrix_t coefficients{DynMatrix_t::Random(5, 4)};
    BOOST_CHECK_EQUAL(
        testGoodies::rel_error(
            space.unflatten(space.flatten(coefficients)), coefficients),
        0.);
    BOOST_CHECK_EQUAL(space.flatten(coefficients)(space.flat_index(1, 2)),
                      coefficients(1, 2));
    BOOST_CHECK_THROW(space.flatten(DynMatrix_t::Zero(4, 4)), SpaceError);
  }

  BOOST_AUTO_TEST_CASE(transforms_and_derivatives) {
    auto && space{testGoodies::orthogonal_space(6, Interval{0., 1.},
                                                Interval{-1., 1.})};
    const ScalarField field{&cubic_field};
    const DynMatrix_t coefficients{space->forward(space->sample(field))};

    auto && x{space->get_mesh(0)};
    auto && y{space->get_mesh(1)};
    DynMatrix_t d_x(x.size(), y.size()), d_yy(x.size(), y.size()),
        d_xy(x.size(), y.size());
    for (Index_t i{0}; i < x.size(); ++i) {
      for (Index_t j{0}; j < y.size(); ++j) {
        d_x(i, j) = 2 * x(i) * y(j) - 1;
        d_yy(i, j) = 18 * y(j);
        d_xy(i, j) = 2 * x(i);
      }
    }
    BOOST_CHECK_LE(testGoodies::rel_error(space->backward(coefficients),
                                          space->sample(field)),
                   solve_tol);
    BOOST_CHECK_LE(
        testGoodies::rel_error(space->backward(coefficients, dx(0)), d_x),
        solve_tol);
    BOOST_CHECK_LE(testGoodies::rel_error(
                       space->backward(coefficients, dx(1, secondOrder)), d_yy),
                   solve_tol);
    BOOST_CHECK_LE(testGoodies::rel_error(
                       space->backward(coefficients, dx(0) + dx(1)), d_xy),
                   solve_tol);
  }

  BOOST_AUTO_TEST_CASE(integration) {
    auto && space{
        testGoodies::orthogonal_space(4, Interval{0., 1.}, Interval{0., 2.})};
    const ScalarField xy{[](const Point_t & p) { return p(0) * p(1); }};
    BOOST_CHECK_LE(testGoodies::rel_error(space->integrate(space->sample(xy)),
                                          1.),
                   tol);
    BOOST_CHECK_LE(
        testGoodies::rel_error(space->integrate(space->sample(1.)), 2.), tol);
  }

  BOOST_AUTO_TEST_CASE(lifting_of_bilinear_boundary_data) {
    // g(x, y) = 1 + x + 2xy on [0, 1] × [0, 2]
    const ScalarField g{
        [](const Point_t & p) { return 1 + p(0) + 2 * p(0) * p(1); }};
    TensorProductSpace space{
        Basis{6, Interval{0., 1.}, BoundaryCondition::dirichlet(g, g)},
        Basis{5, Interval{0., 2.}, BoundaryCondition::dirichlet(g, g)}};
    BOOST_CHECK(space.has_nonhomogeneous_bcs());

    const DynMatrix_t lifting{space.boundary_coefficients()};
    BOOST_CHECK_LE(
        testGoodies::rel_error(space.backward(lifting), space.sample(g)),
        solve_tol);
    // the lifting does not touch the free dofs
    const Vector_t flat{space.flatten(lifting)};
    for (auto && dof : space.get_free_dofs()) {
      BOOST_CHECK_EQUAL(flat(dof), 0.);
    }
  }

  BOOST_AUTO_TEST_CASE(vector_space_offsets) {
    TensorProductSpace first{
        Basis{5, Interval{0., 1.}, BoundaryCondition::dirichlet(0., 0.)},
        Basis{5, Interval{0., 1.}, BoundaryCondition::dirichlet(0., 0.)}};
    TensorProductSpace second{
        Basis{5, Interval{0., 1.}},
        Basis{5, Interval{0., 1.}, BoundaryCondition::upper_dirichlet()}};
    VectorSpace space{{first, second}};
    BOOST_CHECK_EQUAL(space.get_nb_components(), 2);
    BOOST_CHECK_EQUAL(space.get_free_offset(0), 0);
    BOOST_CHECK_EQUAL(space.get_free_offset(1), 9);
    BOOST_CHECK_EQUAL(space.get_nb_free(), 29);
    BOOST_CHECK_EQUAL(space.get_boundary_offset(1), 16);
    BOOST_CHECK_EQUAL(space.get_nb_boundary(), 21);
    BOOST_CHECK(not space.has_nonhomogeneous_bcs());
    BOOST_CHECK_THROW(space.get_space(2), SpaceError);

    TensorProductSpace coarse{Basis{4, Interval{0., 1.}},
                              Basis{4, Interval{0., 1.}}};
    BOOST_CHECK_THROW(VectorSpace({first, coarse}), SpaceError);
    BOOST_CHECK_THROW(VectorSpace(std::vector<TensorProductSpace>{}),
                      SpaceError);
  }

  BOOST_AUTO_TEST_CASE(scalar_function_projection) {
    auto && space{testGoodies::orthogonal_space(6, Interval{0., 1.},
                                                Interval{-1., 1.})};
    const ScalarFunction u{project(ScalarField{&cubic_field}, space)};
    const ScalarFunction du{project(u, dx(0), space)};
    BOOST_CHECK_LE(
        testGoodies::rel_error(du.backward(), u.backward(dx(0))), solve_tol);

    const ScalarFunction twice{2. * u};
    BOOST_CHECK_LE(testGoodies::rel_error((twice - u).get_coefficients(),
                                          u.get_coefficients()),
                   tol);

    auto && other{testGoodies::orthogonal_space(5, Interval{0., 1.},
                                                Interval{-1., 1.})};
    const ScalarFunction v{other};
    BOOST_CHECK_THROW(u + v, SpaceError);
    BOOST_CHECK_THROW(project(u, dx(1), other), SpaceError);
  }

  BOOST_AUTO_TEST_CASE(vector_function_dofs) {
    auto && space{std::make_shared<const VectorSpace>(
        std::vector<TensorProductSpace>{
            TensorProductSpace{
                Basis{5, Interval{0., 1.},
                      BoundaryCondition::dirichlet(0., 1.)},
                Basis{5, Interval{0., 1.}}},
            TensorProductSpace{
                Basis{5, Interval{0., 1.}},
                Basis{5, Interval{0., 1.},
                      BoundaryCondition::lower_dirichlet(2.)}}})};
    VectorFunction u{space};
    const Vector_t free_dofs{Vector_t::Random(space->get_nb_free())};
    u.set_free_dofs(free_dofs);
    BOOST_CHECK_EQUAL(testGoodies::rel_error(u.get_free_dofs(), free_dofs),
                      0.);
    BOOST_CHECK_EQUAL(u.get_boundary_dofs().norm(), 0.);
    BOOST_CHECK_THROW(u.set_free_dofs(Vector_t::Zero(3)), SpaceError);

    // the lifting carries the boundary data, the free part stays zero
    VectorFunction lifting{space};
    lifting.set_boundary_dofs();
    BOOST_CHECK_EQUAL(lifting.get_free_dofs().norm(), 0.);
    Vector_t ends(2);
    ends << 0., 1.;
    // traces of the first component along x = 0 and x = 1 in the y-basis
    const DynMatrix_t traces0{
        space->get_space(0).get_basis(0).evaluate_at(ends) *
        lifting.get_coefficients(0)};
    DynMatrix_t expected0{DynMatrix_t::Zero(2, 5)};
    expected0(1, 0) = 1.;
    BOOST_CHECK_LE(testGoodies::rel_error(traces0, expected0), solve_tol);
    // trace of the second component along y = 0 in the x-basis
    const Vector_t trace1{
        lifting.get_coefficients(1) *
        space->get_space(1).get_basis(1).evaluate_at(ends.head(1)).transpose()};
    Vector_t expected1{Vector_t::Zero(5)};
    expected1(0) = 2.;
    BOOST_CHECK_LE(testGoodies::rel_error(trace1, expected1), solve_tol);

    const VectorFunction sum{u + lifting};
    BOOST_CHECK_EQUAL(testGoodies::rel_error(sum.get_free_dofs(), free_dofs),
                      0.);
    BOOST_CHECK_EQUAL(testGoodies::rel_error(sum.get_boundary_dofs(),
                                             lifting.get_boundary_dofs()),
                      0.);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muGalerkin
