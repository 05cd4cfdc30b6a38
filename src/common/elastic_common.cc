/**
 * @file   elastic_common.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  common definitions for the µElastic solvers
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

#include "common/elastic_common.hh"

#include <iostream>
#include <sstream>

namespace muElastic {

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, ElasticityModel model) {
    switch (model) {
    case ElasticityModel::Cauchy: {
      os << "Cauchy";
      break;
    }
    case ElasticityModel::Gradient: {
      os << "gradient";
      break;
    }
    default:
      throw muGalerkin::RuntimeError("unknown elasticity model");
      break;
    }
    return os;
  }

  /* ---------------------------------------------------------------------- */
  void check_domain(const Domain_t & domain) {
    for (Dim_t axis{0}; axis < twoD; ++axis) {
      auto && interval{domain[axis]};
      if (not(interval.lower < interval.upper)) {
        std::stringstream err{};
        err << "The interval " << interval << " along axis " << axis
            << " is empty, its lower bound has to be smaller than its upper "
            << "bound";
        throw InputError(err.str());
      }
    }
  }

  /* ---------------------------------------------------------------------- */
  void check_boundary_conditions(const BoundaryConditions_t & bcs) {
    bool well_shaped{bcs.size() == twoD};
    for (auto && component_bcs : bcs) {
      well_shaped = well_shaped and component_bcs.size() == twoD;
    }
    if (not well_shaped) {
      std::stringstream err{};
      err << "Boundary conditions have to be given as a " << twoD << " × "
          << twoD << " matrix (displacement components × axes), got "
          << bcs.size() << " rows";
      throw InputError(err.str());
    }
  }

  /* ---------------------------------------------------------------------- */
  void banner(std::string name, Uint year, std::string cpy_holder) {
    std::cout << std::endl
              << "µElastic " << name << std::endl
              << "Copyright © " << year << "  " << cpy_holder << std::endl
              << "This program comes with ABSOLUTELY NO WARRANTY." << std::endl
              << "This is free software, and you are welcome to redistribute it"
              << std::endl
              << "under certain conditions, see the license file." << std::endl
              << std::endl;
  }

}  // namespace muElastic
