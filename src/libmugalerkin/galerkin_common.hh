/**
 * @file   galerkin_common.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  Small definitions of commonly used types throughout µGalerkin
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

#include "exception.hh"

#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include <array>
#include <cmath>
#include <ostream>
#include <vector>

#ifndef SRC_LIBMUGALERKIN_GALERKIN_COMMON_HH_
#define SRC_LIBMUGALERKIN_GALERKIN_COMMON_HH_

namespace muGalerkin {

  /**
   * \defgroup Scalars Scalar types
   * @{
   */
  //! signed integer type for spatial dimensions and component indices
  using Dim_t = int;
  //! size-related values, consistent with Eigen
  using Index_t = Eigen::Index;

  using Uint = unsigned int;  //!< type to use in math for unsigned integers
  using Int = int;            //!< type to use in math for signed integers
  using Real = double;        //!< type to use in math for real numbers
  /**@}*/

  constexpr Dim_t oneD{1};  //!< constant for a one-dimensional problem
  constexpr Dim_t twoD{2};  //!< constant for a two-dimensional problem

  constexpr Index_t zerothOrder{0};  //!< no derivative
  constexpr Index_t firstOrder{1};   //!< first derivative
  constexpr Index_t secondOrder{2};  //!< second derivative
  constexpr Index_t thirdOrder{3};   //!< third derivative
  constexpr Index_t fourthOrder{4};  //!< fourth derivative

  //! dynamically sized column vector
  using Vector_t = Eigen::Matrix<Real, Eigen::Dynamic, 1>;
  //! dynamically sized dense matrix (coefficient and grid arrays)
  using DynMatrix_t = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic>;
  //! column-major sparse matrix, as required by Eigen's sparse LU
  using SparseMatrix_t = Eigen::SparseMatrix<Real>;

  //! a point of the (two-dimensional) computational domain
  using Point_t = Eigen::Matrix<Real, twoD, 1>;

  /**
   * multi-index of a partial derivative: entry `d` is the number of
   * derivatives taken along axis `d`
   */
  using DerivOrder_t = std::array<Index_t, twoD>;

  //! the undifferentiated multi-index
  constexpr DerivOrder_t NoDerivative{0, 0};

  /**
   * returns the multi-index for `order` derivatives along `axis`
   */
  DerivOrder_t dx(const Dim_t & axis, const Index_t & order = firstOrder);

  //! multi-index of the composed derivative
  DerivOrder_t operator+(const DerivOrder_t & a, const DerivOrder_t & b);

  //! the ends of a one-dimensional interval
  enum class End { Lower, Upper };

  /**
   * closed one-dimensional interval [lower, upper], one per spatial axis of
   * a rectangular domain
   */
  struct Interval {
    Real lower;
    Real upper;

    Real length() const { return this->upper - this->lower; }
    //! coordinate of the given end
    Real at(const End & end) const {
      return end == End::Lower ? this->lower : this->upper;
    }
    //! interval with both bounds divided by `length_scale`
    Interval scaled(const Real & length_scale) const {
      return Interval{this->lower / length_scale, this->upper / length_scale};
    }
    bool operator==(const Interval & other) const {
      return this->lower == other.lower and this->upper == other.upper;
    }
  };

  std::ostream & operator<<(std::ostream & os, const Interval & interval);
  std::ostream & operator<<(std::ostream & os, const End & end);

  /**
   * Enum class for verbose-flag
   */
  enum class Verbosity { Silent = 0, Some = 1, Detailed = 2, Full = 3 };

  /**
   * comparison operators for Verbosity-class
   */
  bool operator<(const Verbosity v1, const Verbosity v2);
  bool operator>(const Verbosity v1, const Verbosity v2);
  bool operator<=(const Verbosity v1, const Verbosity v2);
  bool operator>=(const Verbosity v1, const Verbosity v2);

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_GALERKIN_COMMON_HH_
