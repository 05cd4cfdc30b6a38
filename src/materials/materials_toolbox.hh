/**
 * @file   materials_toolbox.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  conversions between isotropic elastic moduli
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

#ifndef SRC_MATERIALS_MATERIALS_TOOLBOX_HH_
#define SRC_MATERIALS_MATERIALS_TOOLBOX_HH_

#include "common/elastic_common.hh"

#include <type_traits>

namespace muElastic {

  /**
   * isotropic elastic moduli; any two distinct ones determine all others.
   * See https://en.wikipedia.org/wiki/Lam%C3%A9_parameters
   */
  enum class ElasticModulus {
    Bulk,          //!< Bulk modulus K
    K = Bulk,      //!< alias for ``ElasticModulus::Bulk``
    Young,         //!< Young's modulus E
    E = Young,     //!< alias for ``ElasticModulus::Young``
    lambda,        //!< Lamé's first parameter λ
    Shear,         //!< Shear modulus G or µ
    G = Shear,     //!< alias for ``ElasticModulus::Shear``
    mu = Shear,    //!< alias for ``ElasticModulus::Shear``
    Poisson,       //!< Poisson's ratio ν
    nu = Poisson,  //!< alias for ``ElasticModulus::Poisson``
  };

  namespace MatTB {

    namespace internal {

      //! Base template for elastic modulus conversion
      template <ElasticModulus Out, ElasticModulus In1, ElasticModulus In2>
      struct Converter {
        inline constexpr static Real compute(const Real & /*in1*/,
                                             const Real & /*in2*/) {
          static_assert(
              (In1 == In2),
              "This conversion has not been implemented yet, please add "
              "it here below as a specialisation of this function "
              "template.");
          return 0;
        }
      };

      //! the output is the first input
      template <ElasticModulus Out, ElasticModulus In>
      struct Converter<Out, Out, In> {
        inline constexpr static Real compute(const Real & A,
                                             const Real & /*B*/) {
          return A;
        }
      };

      //! the output is the second input
      template <ElasticModulus Out, ElasticModulus In>
      struct Converter<Out, In, Out> {
        inline constexpr static Real compute(const Real & /*A*/,
                                             const Real & B) {
          return B;
        }
      };

      //! μ(E, ν)
      template <>
      struct Converter<ElasticModulus::Shear, ElasticModulus::Young,
                       ElasticModulus::Poisson> {
        inline constexpr static Real compute(const Real & E, const Real & nu) {
          return E / (2 * (1 + nu));
        }
      };

      //! λ(E, ν)
      template <>
      struct Converter<ElasticModulus::lambda, ElasticModulus::Young,
                       ElasticModulus::Poisson> {
        inline constexpr static Real compute(const Real & E, const Real & nu) {
          return E * nu / ((1 + nu) * (1 - 2 * nu));
        }
      };

      //! E(λ, µ)
      template <>
      struct Converter<ElasticModulus::Young, ElasticModulus::lambda,
                       ElasticModulus::Shear> {
        inline constexpr static Real compute(const Real & lambda,
                                             const Real & G) {
          return G * (3 * lambda + 2 * G) / (lambda + G);
        }
      };

      //! ν(λ, µ)
      template <>
      struct Converter<ElasticModulus::Poisson, ElasticModulus::lambda,
                       ElasticModulus::Shear> {
        inline constexpr static Real compute(const Real & lambda,
                                             const Real & G) {
          return lambda / (2 * (G + lambda));
        }
      };

    }  // namespace internal

    /**
     * allows the conversion from any two distinct input moduli to a
     * chosen output modulus
     */
    template <ElasticModulus Out, ElasticModulus In1, ElasticModulus In2>
    inline constexpr Real convert_elastic_modulus(const Real & in1,
                                                  const Real & in2) {
      static_assert((In1 != In2),
                    "The input modulus types cannot be identical");

      // moduli can be supplied in either order
      constexpr bool inverted{In1 > In2};
      using Converter =
          std::conditional_t<inverted, internal::Converter<Out, In2, In1>,
                             internal::Converter<Out, In1, In2>>;
      if (inverted) {
        return Converter::compute(in2, in1);
      } else {
        return Converter::compute(in1, in2);
      }
    }

    //! Lamé's first constant from Young's modulus and Poisson's ratio
    inline constexpr Real compute_lambda(const Real & young,
                                         const Real & poisson) {
      return convert_elastic_modulus<ElasticModulus::lambda,
                                     ElasticModulus::Young,
                                     ElasticModulus::Poisson>(young, poisson);
    }

    //! shear modulus from Young's modulus and Poisson's ratio
    inline constexpr Real compute_mu(const Real & young,
                                     const Real & poisson) {
      return convert_elastic_modulus<ElasticModulus::Shear,
                                     ElasticModulus::Young,
                                     ElasticModulus::Poisson>(young, poisson);
    }

    //! Poisson's ratio from the Lamé constants
    inline constexpr Real compute_poisson(const Real & lambda,
                                          const Real & mu) {
      return convert_elastic_modulus<ElasticModulus::Poisson,
                                     ElasticModulus::lambda,
                                     ElasticModulus::Shear>(lambda, mu);
    }

    //! Young's modulus from the Lamé constants
    inline constexpr Real compute_young(const Real & lambda, const Real & mu) {
      return convert_elastic_modulus<ElasticModulus::Young,
                                     ElasticModulus::lambda,
                                     ElasticModulus::Shear>(lambda, mu);
    }

  }  // namespace MatTB

}  // namespace muElastic

#endif  // SRC_MATERIALS_MATERIALS_TOOLBOX_HH_
