/**
 * @file   forms.cc
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

#include "forms.hh"

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os, const FormTerm & term) {
    os << term.coefficient << " * (d^(" << term.trial_derivative[0] << ", "
       << term.trial_derivative[1] << ") u_" << term.trial_component
       << ", d^(" << term.test_derivative[0] << ", "
       << term.test_derivative[1] << ") v_" << term.test_component << ")";
    return os;
  }

  namespace Forms {

    /* -------------------------------------------------------------------- */
    Form_t pairing(const Real & coefficient, const Dim_t & trial_component,
                   const DerivOrder_t & trial_derivative,
                   const Dim_t & test_component,
                   const DerivOrder_t & test_derivative) {
      return Form_t{FormTerm{coefficient, trial_component, trial_derivative,
                             test_component, test_derivative}};
    }

    /* -------------------------------------------------------------------- */
    Form_t grad_grad(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          ret_val.push_back({coefficient, i, dx(j), i, dx(j)});
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t div_div(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          ret_val.push_back({coefficient, i, dx(i), j, dx(j)});
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t transposed_grad_grad(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          ret_val.push_back({coefficient, i, dx(j), j, dx(i)});
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t laplace_laplace(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          for (Dim_t k{0}; k < dim; ++k) {
            ret_val.push_back(
                {coefficient, i, dx(j, secondOrder), i, dx(k, secondOrder)});
          }
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t laplace_grad_div(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          for (Dim_t k{0}; k < dim; ++k) {
            ret_val.push_back(
                {coefficient, i, dx(j, secondOrder), k, dx(i) + dx(k)});
          }
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t grad_div_grad_div(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          for (Dim_t k{0}; k < dim; ++k) {
            ret_val.push_back(
                {coefficient, j, dx(i) + dx(j), k, dx(i) + dx(k)});
          }
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t hessian_hessian(const Real & coefficient, const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          for (Dim_t k{0}; k < dim; ++k) {
            ret_val.push_back(
                {coefficient, i, dx(j) + dx(k), i, dx(j) + dx(k)});
          }
        }
      }
      return ret_val;
    }

    /* -------------------------------------------------------------------- */
    Form_t transposed_hessian_hessian(const Real & coefficient,
                                      const Dim_t & dim) {
      Form_t ret_val{};
      for (Dim_t i{0}; i < dim; ++i) {
        for (Dim_t j{0}; j < dim; ++j) {
          for (Dim_t k{0}; k < dim; ++k) {
            ret_val.push_back(
                {coefficient, j, dx(i) + dx(k), i, dx(j) + dx(k)});
          }
        }
      }
      return ret_val;
    }

  }  // namespace Forms

  /* ---------------------------------------------------------------------- */
  Form_t operator+(const Form_t & a, const Form_t & b) {
    Form_t ret_val{a};
    ret_val.insert(ret_val.end(), b.begin(), b.end());
    return ret_val;
  }

}  // namespace muGalerkin
