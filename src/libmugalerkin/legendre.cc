/**
 * @file   legendre.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  Legendre polynomials and Gauss-Legendre quadrature on [-1, 1]
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

#include "legendre.hh"

#include <sstream>

namespace muGalerkin {

  namespace Legendre {

    /* -------------------------------------------------------------------- */
    DynMatrix_t vandermonde(const Index_t & nb_modes,
                            const Eigen::Ref<const Vector_t> & points,
                            const Index_t & derivative) {
      if (nb_modes < 1 or derivative < 0) {
        std::stringstream err{};
        err << "cannot evaluate derivative " << derivative << " of "
            << nb_modes << " Legendre modes";
        throw BasisError(err.str());
      }
      const Index_t nb_pts{points.size()};
      // values of the current derivative order, built up from order zero
      DynMatrix_t current{DynMatrix_t::Zero(nb_pts, nb_modes)};
      current.col(0).setOnes();
      if (nb_modes > 1) {
        current.col(1) = points;
      }
      for (Index_t n{1}; n < nb_modes - 1; ++n) {
        current.col(n + 1) = ((2 * n + 1) * points.array() *
                                  current.col(n).array() -
                              n * current.col(n - 1).array()) /
                             (n + 1);
      }

      for (Index_t k{1}; k <= derivative; ++k) {
        DynMatrix_t next{DynMatrix_t::Zero(nb_pts, nb_modes)};
        for (Index_t n{0}; n < nb_modes - 1; ++n) {
          // L^(k)_{n+1} = L^(k)_{n-1} + (2n+1) L^(k-1)_n
          next.col(n + 1) = (2 * n + 1) * current.col(n);
          if (n > 0) {
            next.col(n + 1) += next.col(n - 1);
          }
        }
        current = std::move(next);
      }
      return current;
    }

    /* -------------------------------------------------------------------- */
    Vector_t endpoint_values(const Index_t & nb_modes, const End & end,
                             const Index_t & derivative) {
      Vector_t point{Vector_t::Constant(1, end == End::Lower ? -1. : 1.)};
      return vandermonde(nb_modes, point, derivative).row(0).transpose();
    }

    /* -------------------------------------------------------------------- */
    Vector_t norms_squared(const Index_t & nb_modes) {
      Vector_t ret_val(nb_modes);
      for (Index_t n{0}; n < nb_modes; ++n) {
        ret_val(n) = 2. / (2. * n + 1.);
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Quadrature gauss_legendre(const Index_t & nb_points) {
      if (nb_points < 1) {
        throw BasisError("a quadrature rule needs at least one point");
      }
      constexpr Uint MaxNewtonIterations{100};
      constexpr Real NewtonTol{1e-15};

      Quadrature rule{Vector_t(nb_points), Vector_t(nb_points)};
      const Real n{static_cast<Real>(nb_points)};
      for (Index_t i{0}; i < nb_points; ++i) {
        // Chebyshev-like initial guess, descending in i
        Real x{std::cos(M_PI * (i + .75) / (n + .5))};
        Real derivative{};
        for (Uint iter{0}; iter < MaxNewtonIterations; ++iter) {
          Real p_prev{1.}, p{x};
          for (Index_t k{1}; k < nb_points; ++k) {
            const Real p_next{((2 * k + 1) * x * p - k * p_prev) / (k + 1)};
            p_prev = p;
            p = p_next;
          }
          derivative = n * (x * p - p_prev) / (x * x - 1.);
          const Real step{p / derivative};
          x -= step;
          if (std::abs(step) < NewtonTol) {
            break;
          }
        }
        const Index_t index{nb_points - 1 - i};
        rule.points(index) = x;
        rule.weights(index) = 2. / ((1. - x * x) * derivative * derivative);
      }
      return rule;
    }

  }  // namespace Legendre

}  // namespace muGalerkin
