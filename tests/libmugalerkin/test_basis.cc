/**
 * @file   test_basis.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for the one-dimensional bases with boundary conditions
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

#include <libmugalerkin/basis.hh>

#include <vector>

namespace muGalerkin {

  BOOST_AUTO_TEST_SUITE(basis_tests)

  using Kind = BoundaryCondition::Kind;

  //! 1 + x - x²/2 + x⁴/10 and its derivative
  Real quartic(const Real & x) {
    return 1 + x - .5 * x * x + .1 * x * x * x * x;
  }
  Real quartic_slope(const Real & x) { return 1 - x + .4 * x * x * x; }

  std::vector<BoundaryCondition> all_kinds() {
    return {BoundaryCondition::none(),
            BoundaryCondition::dirichlet(1., 2.),
            BoundaryCondition::biharmonic(1., 0., 2., 0.),
            BoundaryCondition::upper_dirichlet(),
            BoundaryCondition::lower_dirichlet(3.)};
  }

  BOOST_AUTO_TEST_CASE(dirichlet_functions_vanish_at_the_ends) {
    const Interval domain{2., 5.};
    Basis basis{8, domain, BoundaryCondition::dirichlet(0., 0.)};
    BOOST_CHECK_EQUAL(basis.get_nb_free(), 6);
    BOOST_CHECK_EQUAL(basis.get_nb_boundary(), 2);
    BOOST_CHECK(basis.is_boundary_dof(6));
    BOOST_CHECK(not basis.is_boundary_dof(5));

    Vector_t ends(2);
    ends << domain.lower, domain.upper;
    auto && values{basis.evaluate_at(ends)};
    BOOST_CHECK_LE(values.leftCols(6).cwiseAbs().maxCoeff(), tol);
    // lifting functions are dual to the two traces
    const DynMatrix_t identity{DynMatrix_t::Identity(2, 2)};
    BOOST_CHECK_LE(testGoodies::rel_error(values.rightCols(2), identity), tol);
  }

  BOOST_AUTO_TEST_CASE(biharmonic_functions_vanish_with_their_slopes) {
    const Interval domain{0., 2.};
    Basis basis{10, domain, BoundaryCondition::biharmonic(0., 0., 0., 0.)};
    BOOST_CHECK_EQUAL(basis.get_nb_free(), 6);

    Vector_t ends(2);
    ends << domain.lower, domain.upper;
    auto && values{basis.evaluate_at(ends)};
    const DynMatrix_t slopes{basis.evaluate_at(ends, firstOrder) *
                             basis.get_functional_scale(firstOrder)};
    constexpr Real end_tol{1e-11};
    BOOST_CHECK_LE(values.leftCols(6).cwiseAbs().maxCoeff(), end_tol);
    BOOST_CHECK_LE(slopes.leftCols(6).cwiseAbs().maxCoeff(), end_tol);

    // lifting functions, ordered (lower, lower slope, upper, upper slope)
    DynMatrix_t expected_values(2, 4), expected_slopes(2, 4);
    expected_values << 1, 0, 0, 0, 0, 0, 1, 0;
    expected_slopes << 0, 1, 0, 0, 0, 0, 0, 1;
    const DynMatrix_t value_error{values.rightCols(4) - expected_values};
    const DynMatrix_t slope_error{slopes.rightCols(4) - expected_slopes};
    BOOST_CHECK_LE(value_error.cwiseAbs().maxCoeff(), end_tol);
    BOOST_CHECK_LE(slope_error.cwiseAbs().maxCoeff(), end_tol);
  }

  BOOST_AUTO_TEST_CASE(one_sided_bases) {
    const Interval domain{-1., 1.};
    Vector_t ends(2);
    ends << -1., 1.;

    Basis upper{6, domain, BoundaryCondition::upper_dirichlet()};
    BOOST_CHECK_EQUAL(upper.get_nb_free(), 5);
    auto && upper_values{upper.evaluate_at(ends)};
    BOOST_CHECK_LE(upper_values.row(1).head(5).cwiseAbs().maxCoeff(), tol);
    // L_0 - L_1 at -1
    BOOST_CHECK_LE(std::abs(upper_values(0, 0) - 2.), tol);
    BOOST_CHECK_LE(std::abs(upper_values(1, 5) - 1.), tol);

    Basis lower{6, domain, BoundaryCondition::lower_dirichlet()};
    auto && lower_values{lower.evaluate_at(ends)};
    BOOST_CHECK_LE(lower_values.row(0).head(5).cwiseAbs().maxCoeff(), tol);
    BOOST_CHECK_LE(std::abs(lower_values(1, 0) - 2.), tol);
    BOOST_CHECK_LE(std::abs(lower_values(0, 5) - 1.), tol);
  }

  BOOST_AUTO_TEST_CASE(projection_reproduces_polynomials) {
    const Interval domain{-1., 3.};
    for (auto && bc : all_kinds()) {
      Basis basis{7, domain, bc};
      auto && x{basis.get_mesh()};
      const Vector_t values{
          x.unaryExpr([](const Real & xi) { return quartic(xi); })};
      const Vector_t derivatives{
          x.unaryExpr([](const Real & xi) { return quartic_slope(xi); })};

      const Vector_t coefficients{basis.project(values)};
      BOOST_CHECK_LE(testGoodies::rel_error(basis.evaluate() * coefficients,
                                            values),
                     solve_tol);
      BOOST_CHECK_LE(
          testGoodies::rel_error(basis.evaluate(firstOrder) * coefficients,
                                 derivatives),
          solve_tol);

      // boundary coefficients are the (scaled) traces
      auto && functionals{bc.get_functionals()};
      for (size_t b{0}; b < functionals.size(); ++b) {
        const Real at{domain.at(functionals[b].end)};
        const Real trace{functionals[b].derivative == zerothOrder
                             ? quartic(at)
                             : quartic_slope(at) *
                                   basis.get_functional_scale(firstOrder)};
        const Index_t index{basis.get_nb_free() + static_cast<Index_t>(b)};
        BOOST_CHECK_LE(testGoodies::rel_error(coefficients(index), trace),
                       solve_tol);
      }
    }
  }

  BOOST_AUTO_TEST_CASE(mesh_and_weights) {
    Basis basis{5, Interval{1., 4.}};
    BOOST_CHECK_LE(testGoodies::rel_error(basis.get_weights().sum(), 3.), tol);
    BOOST_CHECK_GT(basis.get_mesh().minCoeff(), 1.);
    BOOST_CHECK_LT(basis.get_mesh().maxCoeff(), 4.);
    BOOST_CHECK_LE(testGoodies::rel_error(basis.get_jacobian(), 2. / 3.), tol);
  }

  BOOST_AUTO_TEST_CASE(compatibility_and_equality) {
    const Interval domain{0., 1.};
    Basis plain{6, domain};
    Basis dirichlet{6, domain, BoundaryCondition::dirichlet(0., 1.)};
    Basis coarse{5, domain, BoundaryCondition::dirichlet(0., 1.)};

    BOOST_CHECK(plain.is_orthogonal());
    BOOST_CHECK(not dirichlet.is_orthogonal());
    BOOST_CHECK(dirichlet.has_nonhomogeneous_bcs());
    BOOST_CHECK(plain.is_compatible(dirichlet));
    BOOST_CHECK(not(plain == dirichlet));
    BOOST_CHECK(not coarse.is_compatible(dirichlet));
    BOOST_CHECK(dirichlet.get_orthogonal() == plain);
  }

  BOOST_AUTO_TEST_CASE(invalid_bases) {
    BOOST_CHECK_THROW(Basis(2, Interval{0., 1.},
                            BoundaryCondition::dirichlet(0., 0.)),
                      BasisError);
    BOOST_CHECK_THROW(Basis(4, Interval{0., 1.},
                            BoundaryCondition::biharmonic(0., 0., 0., 0.)),
                      BasisError);
    BOOST_CHECK_THROW(Basis(4, Interval{1., 0.}), BasisError);
    Basis basis{4, Interval{0., 1.}};
    BOOST_CHECK_THROW(basis.project(Vector_t::Zero(3)), BasisError);
  }

  BOOST_AUTO_TEST_CASE(tagged_boundary_conditions) {
    auto && upper{BoundaryCondition::tagged("Upper_Dirichlet", {})};
    BOOST_CHECK(upper.get_kind() == Kind::UpperDirichlet);
    BOOST_CHECK(upper.is_homogeneous());

    auto && lower{BoundaryCondition::tagged("lowerdirichlet", {1., 2.})};
    BOOST_CHECK(lower.get_kind() == Kind::LowerDirichlet);
    BOOST_CHECK_EQUAL(lower.get_nb_constraints(), 1);
    BOOST_CHECK_EQUAL(lower.get_values()[0].get_constant(), 1.);

    BOOST_CHECK_THROW(BoundaryCondition::tagged("sideways", {}), BasisError);
    BOOST_CHECK_THROW(BoundaryCondition::tagged("upperdirichlet", {1.}),
                      BasisError);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muGalerkin
