/**
 * @file   stresses.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  Cauchy stress, hyper-stress and traction of a displacement field
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

#include "postprocessing/stresses.hh"

#include <libmugalerkin/vector_space.hh>

#include <memory>
#include <sstream>

namespace muElastic {

  using muGalerkin::ScalarFunction;
  using muGalerkin::TensorProductSpace;
  using muGalerkin::VectorFunction;
  using muGalerkin::VectorSpace;
  using muGalerkin::dx;
  using muGalerkin::operator+;

  namespace internal {

    //! orthogonal companion of the space of the first displacement component
    ScalarFunction::Space_ptr
    orthogonal_space(const VectorFunction & u) {
      if (u.get_nb_components() != twoD) {
        std::stringstream err{};
        err << "stresses need a displacement field of " << twoD
            << " components, got " << u.get_nb_components();
        throw PostprocessingError(err.str());
      }
      return std::make_shared<const TensorProductSpace>(
          u.get_space().get_space(0).get_orthogonal());
    }

    //! checks that `f` lives on `space`, which has to be orthogonal
    void check_on_orthogonal_space(const ScalarFunction & f,
                                   const TensorProductSpace & space) {
      if (not space.is_orthogonal()) {
        throw PostprocessingError(
            "stress entries have to live on a space without boundary "
            "conditions");
      }
      if (not(f.get_space() == space)) {
        throw PostprocessingError(
            "all stress and hyper-stress entries have to live on the same "
            "orthogonal space");
      }
    }

  }  // namespace internal

  /* ---------------------------------------------------------------------- */
  Rank3Array<ScalarFunction> second_gradient(const VectorFunction & u) {
    auto && orthogonal{internal::orthogonal_space(u)};
    using Tuple_t = Rank3Array<ScalarFunction>::Tuple_t;
    return Rank3Array<ScalarFunction>::generate(
        [&u, &orthogonal](const Tuple_t & index) {
          return muGalerkin::project(u[index[0]], dx(index[1]) + dx(index[2]),
                                     orthogonal);
        });
  }

  /* ---------------------------------------------------------------------- */
  StressTensor_t cauchy_stresses(const CauchyParameters & parameters,
                                 const VectorFunction & u) {
    auto && orthogonal{internal::orthogonal_space(u)};
    using Tuple_t = StressTensor_t::Tuple_t;

    auto && displacement_gradient{StressTensor_t::generate(
        [&u, &orthogonal](const Tuple_t & index) {
          return muGalerkin::project(u[index[0]], dx(index[1]), orthogonal);
        })};
    auto && strain{displacement_gradient.symmetrised_last()};

    ScalarFunction trace{orthogonal};
    for (Dim_t i{0}; i < twoD; ++i) {
      trace += strain(i, i);
    }

    return StressTensor_t::generate([&](const Tuple_t & index) {
      ScalarFunction entry{2. * parameters.mu * strain[index]};
      if (index[0] == index[1]) {
        entry += parameters.lambda * trace;
      }
      return entry;
    });
  }

  /* ---------------------------------------------------------------------- */
  StressTensor_t cauchy_stresses(const std::vector<Real> & material_parameters,
                                 const VectorFunction & u) {
    return cauchy_stresses(CauchyParameters::from_values(material_parameters),
                           u);
  }

  /* ---------------------------------------------------------------------- */
  HyperStressTensor_t hyper_stresses(const GradientParameters & parameters,
                                     const VectorFunction & u) {
    auto && orthogonal{internal::orthogonal_space(u)};
    const Real c1{parameters.get_c(1)}, c2{parameters.get_c(2)},
        c3{parameters.get_c(3)}, c4{parameters.get_c(4)},
        c5{parameters.get_c(5)};
    using Tuple_t = HyperStressTensor_t::Tuple_t;

    // G(i, j, k) = ∂_j ∂_k u_i
    auto && hessians{second_gradient(u)};

    std::vector<ScalarFunction> laplace{}, grad_div{};
    for (Dim_t i{0}; i < twoD; ++i) {
      laplace.emplace_back(orthogonal);
      grad_div.emplace_back(orthogonal);
      for (Dim_t j{0}; j < twoD; ++j) {
        laplace[i] += hessians(i, j, j);
        grad_div[i] += hessians(j, i, j);
      }
    }

    // ½ (∂_i ∂_k u_j + ∂_i ∂_j u_k), i.e. G(j, i, k) symmetrised in (j, k)
    auto && mixed{hessians.transposed_01().symmetrised_last()};

    return HyperStressTensor_t::generate([&](const Tuple_t & index) {
      const Dim_t i{index[0]}, j{index[1]}, k{index[2]};
      ScalarFunction entry{orthogonal};
      if (i == j) {
        if (c2 != 0.) {
          entry += .5 * c2 * laplace[k];
        }
        if (c3 != 0.) {
          entry += .5 * c3 * grad_div[k];
        }
      }
      if (i == k) {
        if (c2 != 0.) {
          entry += .5 * c2 * laplace[j];
        }
        if (c3 != 0.) {
          entry += .5 * c3 * grad_div[j];
        }
      }
      if (j == k and c1 != 0.) {
        entry += c1 * laplace[i];
      }
      if (c4 != 0.) {
        entry += c4 * hessians[index];
      }
      if (c5 != 0.) {
        entry += c5 * mixed[index];
      }
      return entry;
    });
  }

  /* ---------------------------------------------------------------------- */
  HyperStressTensor_t
  hyper_stresses(const std::vector<Real> & gradient_constants,
                 const VectorFunction & u) {
    constexpr auto NbConstants{GradientParameters::NbGradientConstants};
    if (static_cast<Index_t>(gradient_constants.size()) != NbConstants) {
      std::stringstream err{};
      err << "the hyper-stress needs " << NbConstants
          << " gradient constants (c1, …, c5), got "
          << gradient_constants.size();
      throw InputError(err.str());
    }
    GradientParameters parameters{0., 0., {}};
    for (Index_t i{0}; i < NbConstants; ++i) {
      parameters.c[i] = gradient_constants[i];
    }
    return hyper_stresses(parameters, u);
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction
  traction_vector_gradient(const StressTensor_t & cauchy_stresses,
                           const HyperStressTensor_t & hyper_stresses,
                           const Normal_t & normal) {
    auto && orthogonal{(*cauchy_stresses.begin()).get_space_ptr()};
    for (auto && entry : cauchy_stresses) {
      internal::check_on_orthogonal_space(entry, *orthogonal);
    }
    for (auto && entry : hyper_stresses) {
      internal::check_on_orthogonal_space(entry, *orthogonal);
    }

    using Tuple_t = Rank2Array<ScalarFunction>::Tuple_t;
    // ∂_l T3(i, j, k)
    auto && hyper_stress_gradient{TensorArray<ScalarFunction, 4>::generate(
        [&](const TensorArray<ScalarFunction, 4>::Tuple_t & index) {
          return muGalerkin::project(
              hyper_stresses(index[0], index[1], index[2]), dx(index[3]),
              orthogonal);
        })};

    auto && div{Rank2Array<ScalarFunction>::generate([&](const Tuple_t & ij) {
      ScalarFunction entry{orthogonal};
      for (Dim_t k{0}; k < twoD; ++k) {
        entry += hyper_stress_gradient(ij[0], ij[1], k, k);
      }
      return entry;
    })};
    auto && div_normal{
        Rank2Array<ScalarFunction>::generate([&](const Tuple_t & ij) {
          ScalarFunction entry{orthogonal};
          for (Dim_t k{0}; k < twoD; ++k) {
            for (Dim_t l{0}; l < twoD; ++l) {
              entry += normal[k] * normal[l] *
                       hyper_stress_gradient(ij[0], ij[1], k, l);
            }
          }
          return entry;
        })};

    auto && traction_space{std::make_shared<const VectorSpace>(
        std::vector<TensorProductSpace>{*orthogonal, *orthogonal})};
    VectorFunction traction{traction_space};
    for (Dim_t i{0}; i < twoD; ++i) {
      for (Dim_t j{0}; j < twoD; ++j) {
        auto && div_tangential{div(i, j) - div_normal(i, j)};
        traction.get_coefficients(i) +=
            normal[j] * (cauchy_stresses(i, j) - div_normal(i, j) -
                         2. * div_tangential)
                            .get_coefficients();
      }
    }
    return traction;
  }

}  // namespace muElastic
