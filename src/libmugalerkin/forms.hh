/**
 * @file   forms.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  differential bilinear forms between trial and test functions
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

#ifndef SRC_LIBMUGALERKIN_FORMS_HH_
#define SRC_LIBMUGALERKIN_FORMS_HH_

#include "galerkin_common.hh"

#include <ostream>
#include <vector>

namespace muGalerkin {

  /**
   * One term c ∫ ∂^α u_a ∂^β v_b of a bilinear form, where u is the trial
   * and v the test vector function, a and b are components, and α and β
   * are derivative multi-indices.
   */
  struct FormTerm {
    Real coefficient;
    Dim_t trial_component;
    DerivOrder_t trial_derivative;
    Dim_t test_component;
    DerivOrder_t test_derivative;
  };

  std::ostream & operator<<(std::ostream & os, const FormTerm & term);

  //! list of terms, their sum is the bilinear form
  using Form_t = std::vector<FormTerm>;

  namespace Forms {

    //! c ∫ ∂^α u_a ∂^β v_b
    Form_t pairing(const Real & coefficient, const Dim_t & trial_component,
                   const DerivOrder_t & trial_derivative,
                   const Dim_t & test_component,
                   const DerivOrder_t & test_derivative);

    //! c ∫ ∇u : ∇v
    Form_t grad_grad(const Real & coefficient, const Dim_t & dim = twoD);

    //! c ∫ (∇·u)(∇·v)
    Form_t div_div(const Real & coefficient, const Dim_t & dim = twoD);

    //! c ∫ ∂_j u_i ∂_i v_j for all ordered (i, j)
    Form_t transposed_grad_grad(const Real & coefficient,
                                const Dim_t & dim = twoD);

    //! c ∫ Δu · Δv
    Form_t laplace_laplace(const Real & coefficient,
                           const Dim_t & dim = twoD);

    //! c ∫ Δu · ∇(∇·v)
    Form_t laplace_grad_div(const Real & coefficient,
                            const Dim_t & dim = twoD);

    //! c ∫ ∇(∇·u) · ∇(∇·v)
    Form_t grad_div_grad_div(const Real & coefficient,
                             const Dim_t & dim = twoD);

    //! c ∫ ∂_j∂_k u_i ∂_j∂_k v_i for all ordered (i, j, k)
    Form_t hessian_hessian(const Real & coefficient,
                           const Dim_t & dim = twoD);

    //! c ∫ ∂_i∂_k u_j ∂_j∂_k v_i for all ordered (i, j, k)
    Form_t transposed_hessian_hessian(const Real & coefficient,
                                      const Dim_t & dim = twoD);

  }  // namespace Forms

  //! concatenation of forms
  Form_t operator+(const Form_t & a, const Form_t & b);

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_FORMS_HH_
