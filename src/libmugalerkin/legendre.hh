/**
 * @file   legendre.hh
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

#ifndef SRC_LIBMUGALERKIN_LEGENDRE_HH_
#define SRC_LIBMUGALERKIN_LEGENDRE_HH_

#include "galerkin_common.hh"

namespace muGalerkin {

  namespace Legendre {

    /**
     * Generalised Vandermonde matrix: entry (q, n) is the `derivative`-th
     * derivative of the Legendre polynomial L_n evaluated at `points(q)`,
     * for n = 0, …, nb_modes - 1. Derivatives follow from differentiating
     * Bonnet's identity (2n+1) L_n = L'_{n+1} - L'_{n-1}, which stays
     * stable up to the endpoints ±1.
     */
    DynMatrix_t vandermonde(const Index_t & nb_modes,
                            const Eigen::Ref<const Vector_t> & points,
                            const Index_t & derivative = zerothOrder);

    /**
     * row vector of the `derivative`-th derivative of L_0 … L_{nb_modes-1}
     * at the reference end -1 or +1
     */
    Vector_t endpoint_values(const Index_t & nb_modes, const End & end,
                             const Index_t & derivative = zerothOrder);

    //! L2 norms squared, ∫L_n² = 2/(2n+1)
    Vector_t norms_squared(const Index_t & nb_modes);

    //! nodes and weights of a quadrature rule on [-1, 1]
    struct Quadrature {
      Vector_t points;
      Vector_t weights;
    };

    /**
     * `nb_points`-point Gauss-Legendre rule, exact for polynomials of degree
     * ≤ 2·nb_points − 1. Nodes are in ascending order.
     */
    Quadrature gauss_legendre(const Index_t & nb_points);

  }  // namespace Legendre

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_LEGENDRE_HH_
