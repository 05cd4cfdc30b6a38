/**
 * @file   galerkin_common.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  implementation of small common helpers
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

#include "galerkin_common.hh"

#include <sstream>
#include <type_traits>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  DerivOrder_t dx(const Dim_t & axis, const Index_t & order) {
    if (axis < 0 or axis >= twoD) {
      std::stringstream err{};
      err << "axis " << axis << " out of range for a " << twoD
          << "-dimensional domain";
      throw SpaceError(err.str());
    }
    DerivOrder_t ret_val{NoDerivative};
    ret_val[axis] = order;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  DerivOrder_t operator+(const DerivOrder_t & a, const DerivOrder_t & b) {
    DerivOrder_t ret_val{};
    for (Dim_t i{0}; i < twoD; ++i) {
      ret_val[i] = a[i] + b[i];
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, const Interval & interval) {
    os << "(" << interval.lower << ", " << interval.upper << ")";
    return os;
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, const End & end) {
    switch (end) {
    case End::Lower: {
      os << "lower";
      break;
    }
    case End::Upper: {
      os << "upper";
      break;
    }
    default:
      throw RuntimeError("unknown interval end");
      break;
    }
    return os;
  }

  /* ---------------------------------------------------------------------- */
  bool operator<(const Verbosity v1, const Verbosity v2) {
    using T = std::underlying_type_t<Verbosity>;
    return static_cast<T>(v1) < static_cast<T>(v2);
  }

  bool operator>(const Verbosity v1, const Verbosity v2) {
    using T = std::underlying_type_t<Verbosity>;
    return static_cast<T>(v1) > static_cast<T>(v2);
  }

  bool operator<=(const Verbosity v1, const Verbosity v2) {
    using T = std::underlying_type_t<Verbosity>;
    return static_cast<T>(v1) <= static_cast<T>(v2);
  }

  bool operator>=(const Verbosity v1, const Verbosity v2) {
    using T = std::underlying_type_t<Verbosity>;
    return static_cast<T>(v1) >= static_cast<T>(v2);
  }

}  // namespace muGalerkin
