/**
 * @file   weak_form.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  bilinear forms of Cauchy and strain-gradient elasticity
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
#include "materials/elastic_parameters.hh"

#include <libmugalerkin/forms.hh>

#include <functional>
#include <string>
#include <vector>

#ifndef SRC_SOLVER_WEAK_FORM_HH_
#define SRC_SOLVER_WEAK_FORM_HH_

namespace muElastic {

  //! what the terms of a weak form may depend on
  struct WeakFormContext {
    //! (dimensionless) material constants, zero gradient constants for
    //! Cauchy elasticity
    GradientParameters parameters;
    //! whether all bases are of the closed kind of the model
    bool only_dirichlet;
  };

  /**
   * one entry of a weak form: its terms are assembled if `is_active` holds
   * for the context
   */
  struct FormContribution {
    std::string label;
    std::function<bool(const WeakFormContext &)> is_active;
    std::function<muGalerkin::Form_t(const WeakFormContext &)> generate;
  };

  using Contributions_t = std::vector<FormContribution>;

  /**
   * Cauchy elasticity, ∫ σ(u) : ∇v. With Dirichlet bases on all boundaries
   * this reduces to µ ∇u:∇v + (λ+µ) div u div v, otherwise the transposed
   * gradient pairing µ ∂_j u_i ∂_i v_j and λ div u div v are assembled.
   */
  const Contributions_t & cauchy_contributions();

  /**
   * strain-gradient elasticity: the gradient terms c1 Δu·Δv,
   * c2 Δu·∇div v, c3 ∇div u·∇div v, c4 ∂_jk u_i ∂_jk v_i,
   * c5 ∂_ik u_j ∂_jk v_i, followed by the Cauchy terms. Gradient terms of
   * vanishing constants are not assembled.
   */
  const Contributions_t & gradient_contributions();

  //! concatenated terms of all active contributions, in list order
  muGalerkin::Form_t collect_terms(const Contributions_t & contributions,
                                   const WeakFormContext & context);

  //! labels of the active contributions, in list order
  std::vector<std::string>
  active_labels(const Contributions_t & contributions,
                const WeakFormContext & context);

  muGalerkin::Form_t cauchy_weak_form(const CauchyParameters & parameters,
                                      const bool & only_dirichlet);

  muGalerkin::Form_t gradient_weak_form(const GradientParameters & parameters,
                                        const bool & only_dirichlet);

}  // namespace muElastic

#endif  // SRC_SOLVER_WEAK_FORM_HH_
