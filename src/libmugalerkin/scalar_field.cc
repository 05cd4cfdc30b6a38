/**
 * @file   scalar_field.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  coordinate-dependent scalar data
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

#include "scalar_field.hh"

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  ScalarField::ScalarField() : value{Real{0.}} {}

  /* ---------------------------------------------------------------------- */
  ScalarField::ScalarField(const Real & value) : value{value} {}

  /* ---------------------------------------------------------------------- */
  ScalarField::ScalarField(Function_t function) : value{std::move(function)} {
    if (not std::get<Function_t>(this->value)) {
      throw RuntimeError("a position-dependent field needs a callable");
    }
  }

  /* ---------------------------------------------------------------------- */
  Real ScalarField::operator()(const Point_t & point) const {
    if (this->is_constant()) {
      return std::get<Real>(this->value);
    }
    return std::get<Function_t>(this->value)(point);
  }

  /* ---------------------------------------------------------------------- */
  Real ScalarField::operator()(const Real & x, const Real & y) const {
    return this->operator()(Point_t{x, y});
  }

  /* ---------------------------------------------------------------------- */
  bool ScalarField::is_constant() const {
    return std::holds_alternative<Real>(this->value);
  }

  /* ---------------------------------------------------------------------- */
  bool ScalarField::is_zero() const {
    return this->is_constant() and std::get<Real>(this->value) == 0.;
  }

  /* ---------------------------------------------------------------------- */
  const Real & ScalarField::get_constant() const {
    if (not this->is_constant()) {
      throw RuntimeError("this field depends on the position");
    }
    return std::get<Real>(this->value);
  }

  /* ---------------------------------------------------------------------- */
  ScalarField ScalarField::scaled(const Real & factor) const {
    if (this->is_constant()) {
      return ScalarField{std::get<Real>(this->value) * factor};
    }
    Function_t function{std::get<Function_t>(this->value)};
    return ScalarField{Function_t{[function, factor](const Point_t & point) {
      return factor * function(point);
    }}};
  }

  /* ---------------------------------------------------------------------- */
  ScalarField
  ScalarField::with_rescaled_coordinates(const Real & length_scale) const {
    if (this->is_constant()) {
      return *this;
    }
    Function_t function{std::get<Function_t>(this->value)};
    return ScalarField{
        Function_t{[function, length_scale](const Point_t & point) {
          return function(Point_t{length_scale * point});
        }}};
  }

}  // namespace muGalerkin
