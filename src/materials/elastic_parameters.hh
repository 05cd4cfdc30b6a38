/**
 * @file   elastic_parameters.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  material constants of Cauchy and strain-gradient elasticity
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

#ifndef SRC_MATERIALS_ELASTIC_PARAMETERS_HH_
#define SRC_MATERIALS_ELASTIC_PARAMETERS_HH_

#include "common/elastic_common.hh"

#include <array>
#include <ostream>
#include <vector>

namespace muElastic {

  /**
   * isotropic linear elastic material, Lamé's first constant λ and the
   * shear modulus µ
   */
  struct CauchyParameters {
    //! number of values in a parameter list
    constexpr static Index_t NbParameters{2};

    Real lambda;
    Real mu;

    //! from the list (λ, µ), throws an InputError for a wrong length
    static CauchyParameters from_values(const std::vector<Real> & values);
    //! from Young's modulus and Poisson's ratio
    static CauchyParameters from_young_poisson(const Real & young,
                                               const Real & poisson);

    std::vector<Real> get_values() const;
  };

  /**
   * isotropic strain-gradient elastic material: the Lamé constants and the
   * five gradient constants c1, …, c5 (modulus × length²). A zero gradient
   * constant removes its terms from the weak form and the hyper-stress.
   */
  struct GradientParameters {
    //! number of values in a parameter list
    constexpr static Index_t NbParameters{7};
    //! number of gradient constants
    constexpr static Index_t NbGradientConstants{5};

    Real lambda;
    Real mu;
    std::array<Real, NbGradientConstants> c;

    //! from the list (λ, µ, c1, …, c5), throws an InputError for a wrong
    //! length
    static GradientParameters from_values(const std::vector<Real> & values);

    //! the Lamé part
    CauchyParameters get_cauchy() const;

    //! gradient constant c_`index`, counted from one as in c1, …, c5
    const Real & get_c(const Index_t & index) const;

    std::vector<Real> get_values() const;
  };

  std::ostream & operator<<(std::ostream & os,
                            const CauchyParameters & parameters);
  std::ostream & operator<<(std::ostream & os,
                            const GradientParameters & parameters);

}  // namespace muElastic

#endif  // SRC_MATERIALS_ELASTIC_PARAMETERS_HH_
