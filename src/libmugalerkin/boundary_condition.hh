/**
 * @file   boundary_condition.hh
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

#ifndef SRC_LIBMUGALERKIN_BOUNDARY_CONDITION_HH_
#define SRC_LIBMUGALERKIN_BOUNDARY_CONDITION_HH_

#include "galerkin_common.hh"
#include "scalar_field.hh"

#include <functional>
#include <string>
#include <vector>

namespace muGalerkin {

  /**
   * A linear functional closing a basis at one end of its interval: the
   * value (`derivative == 0`) or a derivative of the function at `end`.
   */
  struct BoundaryFunctional {
    End end;
    Index_t derivative;
  };

  /**
   * Constraint of one scalar unknown along one axis. Each constraint kind
   * carries one prescribed ScalarField per boundary functional, in the order
   * of `get_functionals()`; prescribed derivatives are taken with respect to
   * the physical coordinate.
   */
  class BoundaryCondition {
   public:
    enum class Kind {
      None,            //!< no constraint (natural at both ends)
      Dirichlet,       //!< values at both ends
      Biharmonic,      //!< values and slopes at both ends
      UpperDirichlet,  //!< value at the upper end only
      LowerDirichlet   //!< value at the lower end only
    };

    //! unconstrained
    BoundaryCondition();

    //! no constraint at either end
    static BoundaryCondition none();

    //! Dirichlet value pair (lower end, upper end)
    static BoundaryCondition dirichlet(const ScalarField & lower,
                                       const ScalarField & upper);

    //! clamped ends: values and slopes at both ends
    static BoundaryCondition biharmonic(const ScalarField & lower,
                                        const ScalarField & lower_slope,
                                        const ScalarField & upper,
                                        const ScalarField & upper_slope);

    //! value prescribed at the upper end, natural at the lower one
    static BoundaryCondition upper_dirichlet(const ScalarField & value = 0.);

    //! value prescribed at the lower end, natural at the upper one
    static BoundaryCondition lower_dirichlet(const ScalarField & value = 0.);

    /**
     * one-sided condition from a label ("upperdirichlet" or
     * "lowerdirichlet") and an optional (lower, upper) value pair of which
     * only the constrained end is used. Throws BasisError for unknown labels
     * or a value list that is not a pair.
     */
    static BoundaryCondition tagged(const std::string & label,
                                    const std::vector<ScalarField> & values =
                                        std::vector<ScalarField>{});

    const Kind & get_kind() const;

    //! prescribed data, one entry per functional
    const std::vector<ScalarField> & get_values() const;

    //! the functionals the data refer to
    std::vector<BoundaryFunctional> get_functionals() const;

    //! number of constrained boundary functionals
    Index_t get_nb_constraints() const;

    //! true if all prescribed data are constant zeros
    bool is_homogeneous() const;

    /**
     * returns a condition of the same kind whose data are obtained by
     * applying `map` to every (value, functional) pair
     */
    BoundaryCondition
    transformed(const std::function<ScalarField(
                    const ScalarField &, const BoundaryFunctional &)> & map)
        const;

    //! human-readable name of a kind
    static std::string kind_name(const Kind & kind);

   protected:
    BoundaryCondition(const Kind & kind, std::vector<ScalarField> values);

    Kind kind;
    std::vector<ScalarField> values;
  };

  std::ostream & operator<<(std::ostream & os,
                            const BoundaryCondition::Kind & kind);

  /**
   * boundary conditions of a vector-valued unknown: entry [i][j] constrains
   * component i along axis j
   */
  using BoundaryConditions_t = std::vector<std::vector<BoundaryCondition>>;

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_BOUNDARY_CONDITION_HH_
