/**
 * @file   weak_form.cc
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

#include "solver/weak_form.hh"

namespace muElastic {

  namespace Forms = muGalerkin::Forms;
  using muGalerkin::Form_t;

  namespace internal {

    //! terms shared by both models
    Contributions_t lame_contributions() {
      return Contributions_t{
          {"mu grad(u):grad(v)",
           [](const WeakFormContext &) { return true; },
           [](const WeakFormContext & ctx) {
             return Forms::grad_grad(ctx.parameters.mu);
           }},
          {"(lambda + mu) div(u) div(v)",
           [](const WeakFormContext & ctx) { return ctx.only_dirichlet; },
           [](const WeakFormContext & ctx) {
             return Forms::div_div(ctx.parameters.lambda +
                                   ctx.parameters.mu);
           }},
          {"mu d_j(u_i) d_i(v_j)",
           [](const WeakFormContext & ctx) { return not ctx.only_dirichlet; },
           [](const WeakFormContext & ctx) {
             return Forms::transposed_grad_grad(ctx.parameters.mu);
           }},
          {"lambda div(u) div(v)",
           [](const WeakFormContext & ctx) { return not ctx.only_dirichlet; },
           [](const WeakFormContext & ctx) {
             return Forms::div_div(ctx.parameters.lambda);
           }}};
    }

    //! contribution of gradient constant c_`index` assembled by `generator`
    FormContribution gradient_term(const std::string & label,
                                   const Index_t & index,
                                   Form_t (*generator)(const Real &,
                                                       const Dim_t &)) {
      return FormContribution{
          label,
          [index](const WeakFormContext & ctx) {
            return ctx.parameters.get_c(index) != 0.;
          },
          [index, generator](const WeakFormContext & ctx) {
            return generator(ctx.parameters.get_c(index), twoD);
          }};
    }

  }  // namespace internal

  /* ---------------------------------------------------------------------- */
  const Contributions_t & cauchy_contributions() {
    static const Contributions_t contributions{internal::lame_contributions()};
    return contributions;
  }

  /* ---------------------------------------------------------------------- */
  const Contributions_t & gradient_contributions() {
    static const Contributions_t contributions{[] {
      Contributions_t ret_val{
          internal::gradient_term("c1 lapl(u) lapl(v)", 1,
                                  Forms::laplace_laplace),
          internal::gradient_term("c2 lapl(u) grad(div(v))", 2,
                                  Forms::laplace_grad_div),
          internal::gradient_term("c3 grad(div(u)) grad(div(v))", 3,
                                  Forms::grad_div_grad_div),
          internal::gradient_term("c4 d_jk(u_i) d_jk(v_i)", 4,
                                  Forms::hessian_hessian),
          internal::gradient_term("c5 d_ik(u_j) d_jk(v_i)", 5,
                                  Forms::transposed_hessian_hessian)};
      auto && lame{internal::lame_contributions()};
      ret_val.insert(ret_val.end(), lame.begin(), lame.end());
      return ret_val;
    }()};
    return contributions;
  }

  /* ---------------------------------------------------------------------- */
  Form_t collect_terms(const Contributions_t & contributions,
                       const WeakFormContext & context) {
    Form_t ret_val{};
    for (auto && contribution : contributions) {
      if (contribution.is_active(context)) {
        auto && terms{contribution.generate(context)};
        ret_val.insert(ret_val.end(), terms.begin(), terms.end());
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  std::vector<std::string>
  active_labels(const Contributions_t & contributions,
                const WeakFormContext & context) {
    std::vector<std::string> ret_val{};
    for (auto && contribution : contributions) {
      if (contribution.is_active(context)) {
        ret_val.push_back(contribution.label);
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  Form_t cauchy_weak_form(const CauchyParameters & parameters,
                          const bool & only_dirichlet) {
    const WeakFormContext context{
        GradientParameters{parameters.lambda, parameters.mu, {}},
        only_dirichlet};
    return collect_terms(cauchy_contributions(), context);
  }

  /* ---------------------------------------------------------------------- */
  Form_t gradient_weak_form(const GradientParameters & parameters,
                            const bool & only_dirichlet) {
    return collect_terms(gradient_contributions(),
                         WeakFormContext{parameters, only_dirichlet});
  }

}  // namespace muElastic
