/**
 * @file   tests.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  common includes and tolerances for the muGalerkin tests
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

#include <libmugalerkin/galerkin_common.hh>

#include <boost/test/unit_test.hpp>
#include <boost/mpl/list.hpp>

#include <iostream>

#ifndef TESTS_LIBMUGALERKIN_TESTS_HH_
#define TESTS_LIBMUGALERKIN_TESTS_HH_

namespace muGalerkin {

  constexpr Real tol = 1e-14 * 100;  // it's in percent
  //! for quantities that went through a projection or a linear solve
  constexpr Real solve_tol = 1e-10;

}  // namespace muGalerkin

#endif  // TESTS_LIBMUGALERKIN_TESTS_HH_
