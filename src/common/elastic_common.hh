/**
 * @file   elastic_common.hh
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

#include <libmugalerkin/boundary_condition.hh>
#include <libmugalerkin/exception.hh>
#include <libmugalerkin/galerkin_common.hh>
#include <libmugalerkin/scalar_field.hh>

#include <array>
#include <ostream>
#include <string>

#ifndef SRC_COMMON_ELASTIC_COMMON_HH_
#define SRC_COMMON_ELASTIC_COMMON_HH_

namespace muElastic {

  using muGalerkin::Dim_t;
  using muGalerkin::Index_t;

  using muGalerkin::Int;
  using muGalerkin::Real;
  using muGalerkin::Uint;

  using muGalerkin::oneD;
  using muGalerkin::twoD;

  using muGalerkin::zerothOrder;
  using muGalerkin::firstOrder;
  using muGalerkin::secondOrder;

  using muGalerkin::DerivOrder_t;
  using muGalerkin::DynMatrix_t;
  using muGalerkin::Point_t;
  using muGalerkin::Vector_t;

  using muGalerkin::BoundaryCondition;
  using muGalerkin::BoundaryConditions_t;
  using muGalerkin::Interval;
  using muGalerkin::ScalarField;
  using muGalerkin::Verbosity;

  //! the rectangle, one interval per axis
  using Domain_t = std::array<Interval, twoD>;

  //! distributed load, one field per displacement component
  using BodyForces_t = std::array<ScalarField, twoD>;

  //! the two elasticity theories solved for
  enum class ElasticityModel {
    Cauchy,   //!< classical isotropic linear elasticity
    Gradient  //!< second-order strain-gradient elasticity
  };

  std::ostream & operator<<(std::ostream & os, ElasticityModel model);

  /**
   * wrong argument shapes, counts, or values, detected before any assembly
   */
  class InputError : public muGalerkin::RuntimeError {
    using muGalerkin::RuntimeError::RuntimeError;
  };

  /**
   * boundary conditions inconsistent with the order of the differential
   * equation
   */
  class AssemblyError : public muGalerkin::RuntimeError {
    using muGalerkin::RuntimeError::RuntimeError;
  };

  /**
   * stresses requested for fields that do not live on an unconstrained space
   */
  class PostprocessingError : public muGalerkin::RuntimeError {
    using muGalerkin::RuntimeError::RuntimeError;
  };

  //! throws an InputError unless lower < upper on both axes
  void check_domain(const Domain_t & domain);

  //! throws an InputError unless `bcs` is a twoD × twoD matrix
  void check_boundary_conditions(const BoundaryConditions_t & bcs);

  /**
   * Copyright banner to be printed to the terminal by executables
   * Arguments are the executable's name, year of writing and the name
   * + address of the copyright holder
   */
  void banner(std::string name, Uint year, std::string cpy_holder);

}  // namespace muElastic

#endif  // SRC_COMMON_ELASTIC_COMMON_HH_
