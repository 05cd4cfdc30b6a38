/**
 * @file   stresses.hh
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

#include "common/elastic_common.hh"
#include "common/tensor_array.hh"
#include "materials/elastic_parameters.hh"

#include <libmugalerkin/function.hh>

#include <array>
#include <vector>

#ifndef SRC_POSTPROCESSING_STRESSES_HH_
#define SRC_POSTPROCESSING_STRESSES_HH_

namespace muElastic {

  //! T[i][j], entries on the orthogonal companion space
  using StressTensor_t = Rank2Array<muGalerkin::ScalarFunction>;
  //! T[i][j][k], entries on the orthogonal companion space
  using HyperStressTensor_t = Rank3Array<muGalerkin::ScalarFunction>;
  using Normal_t = std::array<Real, twoD>;

  /**
   * second gradient G(i, j, k) = ∂_j ∂_k u_i of a displacement field,
   * projected onto the orthogonal companion of the space of u_0
   */
  Rank3Array<muGalerkin::ScalarFunction>
  second_gradient(const muGalerkin::VectorFunction & u);

  /**
   * Cauchy stress T = 2µ E + λ tr(E) I of the linear strain
   * E = ½ (∇u + ∇u^T), with the displacement gradient projected onto the
   * orthogonal companion of the space of u_0. The result is symmetric by
   * construction.
   */
  StressTensor_t cauchy_stresses(const CauchyParameters & parameters,
                                 const muGalerkin::VectorFunction & u);

  //! overload taking the parameter list (λ, µ)
  StressTensor_t cauchy_stresses(const std::vector<Real> & material_parameters,
                                 const muGalerkin::VectorFunction & u);

  /**
   * hyper-stress of isotropic strain-gradient elasticity. With Δu_i and
   * (∇div u)_i projected onto the orthogonal companion space,
   *
   *   T(i, j, k) = δ_ij (½ c2 Δu_k + ½ c3 (∇div u)_k)
   *              + δ_ik (½ c2 Δu_j + ½ c3 (∇div u)_j)
   *              + δ_jk c1 Δu_i
   *              + c4 ∂_j ∂_k u_i
   *              + ½ c5 (∂_i ∂_k u_j + ∂_i ∂_j u_k)
   *
   * Terms of vanishing constants are skipped, all constants zero yield an
   * identically zero tensor. Only the gradient constants of `parameters`
   * are used.
   */
  HyperStressTensor_t hyper_stresses(const GradientParameters & parameters,
                                     const muGalerkin::VectorFunction & u);

  //! overload taking the gradient constants (c1, …, c5)
  HyperStressTensor_t
  hyper_stresses(const std::vector<Real> & gradient_constants,
                 const muGalerkin::VectorFunction & u);

  /**
   * traction of second-gradient elasticity on a boundary of normal `n`:
   *
   *   t_i = Σ_j (T2(i, j) - divn(T3)(i, j) - 2 divt(T3)(i, j)) n_j
   *
   * with div(T3)(i, j) = Σ_k ∂_k T3(i, j, k), the normal part
   * divn(T3)(i, j) = Σ_kl ∂_l T3(i, j, k) n_k n_l and the tangential part
   * divt(T3) = div(T3) - divn(T3). All entries of `T2` and `T3` have to live
   * on the same orthogonal space, else a PostprocessingError is thrown. The
   * result lives on the vector space of two copies of that space.
   */
  muGalerkin::VectorFunction
  traction_vector_gradient(const StressTensor_t & cauchy_stresses,
                           const HyperStressTensor_t & hyper_stresses,
                           const Normal_t & normal);

}  // namespace muElastic

#endif  // SRC_POSTPROCESSING_STRESSES_HH_
