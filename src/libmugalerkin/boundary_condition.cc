/**
 * @file   boundary_condition.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  boundary conditions of one displacement component along one axis
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

#include "boundary_condition.hh"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  BoundaryCondition::BoundaryCondition() : kind{Kind::None}, values{} {}

  /* ---------------------------------------------------------------------- */
  BoundaryCondition::BoundaryCondition(const Kind & kind,
                                       std::vector<ScalarField> values)
      : kind{kind}, values{std::move(values)} {}

  /* ---------------------------------------------------------------------- */
  BoundaryCondition BoundaryCondition::none() { return BoundaryCondition{}; }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition BoundaryCondition::dirichlet(const ScalarField & lower,
                                                 const ScalarField & upper) {
    return BoundaryCondition{Kind::Dirichlet, {lower, upper}};
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition
  BoundaryCondition::biharmonic(const ScalarField & lower,
                                const ScalarField & lower_slope,
                                const ScalarField & upper,
                                const ScalarField & upper_slope) {
    return BoundaryCondition{Kind::Biharmonic,
                             {lower, lower_slope, upper, upper_slope}};
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition
  BoundaryCondition::upper_dirichlet(const ScalarField & value) {
    return BoundaryCondition{Kind::UpperDirichlet, {value}};
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition
  BoundaryCondition::lower_dirichlet(const ScalarField & value) {
    return BoundaryCondition{Kind::LowerDirichlet, {value}};
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition
  BoundaryCondition::tagged(const std::string & label,
                            const std::vector<ScalarField> & values) {
    std::string key{label};
    key.erase(std::remove_if(key.begin(), key.end(),
                             [](unsigned char c) {
                               return c == '-' or c == '_' or c == ' ';
                             }),
              key.end());
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (not(values.empty() or values.size() == 2)) {
      std::stringstream err{};
      err << "a tagged boundary condition takes a (lower, upper) value pair, "
          << "but " << values.size() << " values were given for '" << label
          << "'";
      throw BasisError(err.str());
    }
    if (key == "upperdirichlet") {
      return upper_dirichlet(values.empty() ? ScalarField{} : values[1]);
    } else if (key == "lowerdirichlet") {
      return lower_dirichlet(values.empty() ? ScalarField{} : values[0]);
    }
    std::stringstream err{};
    err << "unknown boundary condition label '" << label
        << "', expected 'upperdirichlet' or 'lowerdirichlet'";
    throw BasisError(err.str());
  }

  /* ---------------------------------------------------------------------- */
  auto BoundaryCondition::get_kind() const -> const Kind & {
    return this->kind;
  }

  /* ---------------------------------------------------------------------- */
  const std::vector<ScalarField> & BoundaryCondition::get_values() const {
    return this->values;
  }

  /* ---------------------------------------------------------------------- */
  std::vector<BoundaryFunctional> BoundaryCondition::get_functionals() const {
    switch (this->kind) {
    case Kind::None: {
      return {};
    }
    case Kind::Dirichlet: {
      return {{End::Lower, zerothOrder}, {End::Upper, zerothOrder}};
    }
    case Kind::Biharmonic: {
      return {{End::Lower, zerothOrder},
              {End::Lower, firstOrder},
              {End::Upper, zerothOrder},
              {End::Upper, firstOrder}};
    }
    case Kind::UpperDirichlet: {
      return {{End::Upper, zerothOrder}};
    }
    case Kind::LowerDirichlet: {
      return {{End::Lower, zerothOrder}};
    }
    default:
      throw BasisError("unknown boundary condition kind");
      break;
    }
  }

  /* ---------------------------------------------------------------------- */
  Index_t BoundaryCondition::get_nb_constraints() const {
    return static_cast<Index_t>(this->values.size());
  }

  /* ---------------------------------------------------------------------- */
  bool BoundaryCondition::is_homogeneous() const {
    return std::all_of(this->values.begin(), this->values.end(),
                       [](const ScalarField & val) { return val.is_zero(); });
  }

  /* ---------------------------------------------------------------------- */
  BoundaryCondition BoundaryCondition::transformed(
      const std::function<ScalarField(const ScalarField &,
                                      const BoundaryFunctional &)> & map)
      const {
    auto && functionals{this->get_functionals()};
    std::vector<ScalarField> mapped{};
    mapped.reserve(this->values.size());
    for (size_t i{0}; i < this->values.size(); ++i) {
      mapped.push_back(map(this->values[i], functionals[i]));
    }
    return BoundaryCondition{this->kind, std::move(mapped)};
  }

  /* ---------------------------------------------------------------------- */
  std::string BoundaryCondition::kind_name(const Kind & kind) {
    std::stringstream name{};
    name << kind;
    return name.str();
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os,
                            const BoundaryCondition::Kind & kind) {
    using Kind = BoundaryCondition::Kind;
    switch (kind) {
    case Kind::None: {
      os << "none";
      break;
    }
    case Kind::Dirichlet: {
      os << "Dirichlet";
      break;
    }
    case Kind::Biharmonic: {
      os << "biharmonic";
      break;
    }
    case Kind::UpperDirichlet: {
      os << "upper Dirichlet";
      break;
    }
    case Kind::LowerDirichlet: {
      os << "lower Dirichlet";
      break;
    }
    default:
      throw BasisError("unknown boundary condition kind");
      break;
    }
    return os;
  }

}  // namespace muGalerkin
