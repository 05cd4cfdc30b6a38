/**
 * @file   scalar_field.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  coordinate-dependent scalar data (boundary values, body forces,
 *         reference solutions)
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

#ifndef SRC_LIBMUGALERKIN_SCALAR_FIELD_HH_
#define SRC_LIBMUGALERKIN_SCALAR_FIELD_HH_

#include "galerkin_common.hh"

#include <functional>
#include <type_traits>
#include <variant>

namespace muGalerkin {

  /**
   * A scalar quantity prescribed on the domain: either a constant or a
   * closure over the position. Constants are kept as such, so that
   * homogeneity of boundary data can be decided without evaluation.
   */
  class ScalarField {
   public:
    //! signature of position-dependent fields
    using Function_t = std::function<Real(const Point_t &)>;

    //! the zero field
    ScalarField();

    //! constant field (implicit, so that plain numbers can be passed)
    ScalarField(const Real & value);  // NOLINT

    //! position-dependent field
    ScalarField(Function_t function);  // NOLINT

    //! position-dependent field from any callable taking a point
    template <typename Callable,
              typename = std::enable_if_t<
                  std::is_invocable_r_v<Real, Callable, const Point_t &> and
                  not std::is_same_v<std::decay_t<Callable>, Function_t> and
                  not std::is_same_v<std::decay_t<Callable>, ScalarField>>>
    ScalarField(Callable && callable)  // NOLINT
        : ScalarField{Function_t{std::forward<Callable>(callable)}} {}

    //! evaluate at a point
    Real operator()(const Point_t & point) const;

    //! evaluate at (x, y)
    Real operator()(const Real & x, const Real & y) const;

    bool is_constant() const;

    //! true only for a constant zero; closures are never considered zero
    bool is_zero() const;

    //! throws if the field is not constant
    const Real & get_constant() const;

    //! returns the field multiplied by `factor`
    ScalarField scaled(const Real & factor) const;

    /**
     * returns p ↦ f(length_scale · p), i.e., the field expressed in
     * coordinates measured in units of `length_scale`
     */
    ScalarField with_rescaled_coordinates(const Real & length_scale) const;

   protected:
    std::variant<Real, Function_t> value;
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_SCALAR_FIELD_HH_
