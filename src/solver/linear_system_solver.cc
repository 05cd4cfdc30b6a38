/**
 * @file   linear_system_solver.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  assembly and solution of the Galerkin system with lifted boundary data
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

#include "solver/linear_system_solver.hh"

#include <libmugalerkin/operators.hh>

#include <iostream>

namespace muElastic {

  using muGalerkin::BlockMatrix;
  using muGalerkin::VectorFunction;

  /* ---------------------------------------------------------------------- */
  LinearSystemSolver::LinearSystemSolver(const Discretisation & discretisation,
                                         const Verbosity & verbosity)
      : discretisation{discretisation}, verbosity{verbosity} {}

  /* ---------------------------------------------------------------------- */
  Vector_t
  LinearSystemSolver::assemble_rhs(const BodyForces_t & body_forces) const {
    auto && orthogonal{*this->discretisation.orthogonal};
    std::vector<DynMatrix_t> values{};
    for (Dim_t i{0}; i < orthogonal.get_nb_components(); ++i) {
      values.push_back(orthogonal.get_space(i).sample(body_forces[i]));
    }
    return muGalerkin::inner_rhs(*this->discretisation.space, values);
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction
  LinearSystemSolver::solve(const muGalerkin::Form_t & form,
                            const BodyForces_t & body_forces) const {
    auto && space{this->discretisation.space};
    auto && matrices{muGalerkin::inner(form, *space)};
    const Vector_t rhs{this->assemble_rhs(body_forces)};

    if (this->verbosity >= Verbosity::Detailed) {
      std::cout << "assembled " << matrices.size()
                << " tensor-product operators on " << space->get_nb_free()
                << " free and " << space->get_nb_boundary()
                << " boundary dofs" << std::endl;
    }

    const BlockMatrix M{matrices, space};
    if (not this->discretisation.nonhomogeneous) {
      return M.solve(rhs);
    }

    auto && bc_mats{muGalerkin::extract_bc_matrices(matrices)};
    const BlockMatrix BM{bc_mats, space, BlockMatrix::Columns::Boundary};

    VectorFunction uh_hat{space};
    uh_hat.set_boundary_dofs();

    // boundary contributions move to the right-hand side
    const Vector_t b_add{BM.matvec(-uh_hat)};
    if (this->verbosity >= Verbosity::Full) {
      std::cout << "|b| = " << rhs.norm()
                << ", |b_add| = " << b_add.norm() << std::endl;
    }

    VectorFunction u_hat{M.solve(rhs + b_add)};
    u_hat += uh_hat;
    return u_hat;
  }

}  // namespace muElastic
