/**
 * @file   operators.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tensor-product operators and their block assembly
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

#include "operators.hh"

#include <Eigen/SparseLU>
#include <unsupported/Eigen/KroneckerProduct>

#include <sstream>

namespace muGalerkin {

  namespace internal {

    //! relative threshold below which quadrature entries count as zero
    constexpr Real PruneTol{1e-13};

    /**
     * A(i, j) = ∫ ∂^k test_i ∂^l trial_j along one axis, exact by quadrature
     */
    SparseMatrix_t one_d_matrix(const Basis & test_basis,
                                const Index_t & test_derivative,
                                const Basis & trial_basis,
                                const Index_t & trial_derivative) {
      const DynMatrix_t dense{
          test_basis.evaluate(test_derivative).transpose() *
          test_basis.get_weights().asDiagonal() *
          trial_basis.evaluate(trial_derivative)};
      const Real reference{dense.cwiseAbs().maxCoeff()};
      return dense.sparseView(reference, PruneTol);
    }

    /**
     * map from the flat dofs of `space` to their position in the global
     * numbering of free (resp. boundary) dofs, -1 for dofs of the other
     * kind
     */
    std::vector<Index_t> dof_map(const VectorSpace & space,
                                 const Dim_t & component,
                                 const bool & boundary) {
      auto && tp_space{space.get_space(component)};
      std::vector<Index_t> ret_val(tp_space.size(), -1);
      Index_t position{boundary ? space.get_boundary_offset(component)
                                : space.get_free_offset(component)};
      for (auto && dof : boundary ? tp_space.get_boundary_dofs()
                                  : tp_space.get_free_dofs()) {
        ret_val[dof] = position++;
      }
      return ret_val;
    }

  }  // namespace internal

  /* ---------------------------------------------------------------------- */
  TPMatrix::TPMatrix(const FormTerm & term, const VectorSpace & space)
      : scale{term.coefficient}, test_component{term.test_component},
        trial_component{term.trial_component} {
    auto && test_space{space.get_space(term.test_component)};
    auto && trial_space{space.get_space(term.trial_component)};
    this->trial_has_boundary_dofs = trial_space.get_nb_free() <
                                    trial_space.size();
    for (Dim_t axis{0}; axis < twoD; ++axis) {
      this->factors[axis] = internal::one_d_matrix(
          test_space.get_basis(axis), term.test_derivative[axis],
          trial_space.get_basis(axis), term.trial_derivative[axis]);
    }
  }

  /* ---------------------------------------------------------------------- */
  const Real & TPMatrix::get_scale() const { return this->scale; }

  /* ---------------------------------------------------------------------- */
  const Dim_t & TPMatrix::get_test_component() const {
    return this->test_component;
  }

  /* ---------------------------------------------------------------------- */
  const Dim_t & TPMatrix::get_trial_component() const {
    return this->trial_component;
  }

  /* ---------------------------------------------------------------------- */
  const SparseMatrix_t & TPMatrix::get_factor(const Dim_t & axis) const {
    if (axis < 0 or axis >= twoD) {
      std::stringstream err{};
      err << "axis " << axis << " out of range";
      throw SpaceError(err.str());
    }
    return this->factors[axis];
  }

  /* ---------------------------------------------------------------------- */
  SparseMatrix_t TPMatrix::kron() const {
    SparseMatrix_t ret_val{
        Eigen::kroneckerProduct(this->factors[0], this->factors[1])};
    ret_val *= this->scale;
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  bool TPMatrix::acts_on_boundary_dofs() const {
    return this->trial_has_boundary_dofs;
  }

  /* ---------------------------------------------------------------------- */
  std::vector<TPMatrix> inner(const Form_t & form, const VectorSpace & space) {
    std::vector<TPMatrix> ret_val{};
    ret_val.reserve(form.size());
    for (auto && term : form) {
      ret_val.emplace_back(term, space);
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  std::vector<TPMatrix>
  extract_bc_matrices(const std::vector<TPMatrix> & matrices) {
    std::vector<TPMatrix> ret_val{};
    for (auto && matrix : matrices) {
      if (matrix.acts_on_boundary_dofs()) {
        ret_val.push_back(matrix);
      }
    }
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  BlockMatrix::BlockMatrix(const std::vector<TPMatrix> & matrices,
                           std::shared_ptr<const VectorSpace> space,
                           const Columns & columns)
      : space{std::move(space)}, columns{columns} {
    const bool boundary_columns{columns == Columns::Boundary};
    const Index_t nb_rows{this->space->get_nb_free()};
    const Index_t nb_cols{boundary_columns ? this->space->get_nb_boundary()
                                           : this->space->get_nb_free()};

    std::vector<std::vector<Index_t>> row_maps{}, col_maps{};
    for (Dim_t i{0}; i < this->space->get_nb_components(); ++i) {
      row_maps.push_back(internal::dof_map(*this->space, i, false));
      col_maps.push_back(
          internal::dof_map(*this->space, i, boundary_columns));
    }

    std::vector<Eigen::Triplet<Real>> triplets{};
    for (auto && tp_matrix : matrices) {
      auto && row_map{row_maps[tp_matrix.get_test_component()]};
      auto && col_map{col_maps[tp_matrix.get_trial_component()]};
      const SparseMatrix_t full{tp_matrix.kron()};
      for (Index_t k{0}; k < full.outerSize(); ++k) {
        for (SparseMatrix_t::InnerIterator it(full, k); it; ++it) {
          const Index_t row{row_map[it.row()]};
          const Index_t col{col_map[it.col()]};
          if (row >= 0 and col >= 0) {
            triplets.emplace_back(row, col, it.value());
          }
        }
      }
    }
    this->matrix.resize(nb_rows, nb_cols);
    this->matrix.setFromTriplets(triplets.begin(), triplets.end());
    this->matrix.makeCompressed();
  }

  /* ---------------------------------------------------------------------- */
  const SparseMatrix_t & BlockMatrix::get_matrix() const {
    return this->matrix;
  }

  /* ---------------------------------------------------------------------- */
  auto BlockMatrix::get_columns() const -> const Columns & {
    return this->columns;
  }

  /* ---------------------------------------------------------------------- */
  VectorFunction
  BlockMatrix::solve(const Eigen::Ref<const Vector_t> & rhs) const {
    if (this->columns != Columns::Free) {
      throw SolverError("only the block operator over the free dofs can be "
                        "solved for");
    }
    if (rhs.size() != this->matrix.rows()) {
      std::stringstream err{};
      err << "right-hand side of size " << rhs.size()
          << " does not match the operator with " << this->matrix.rows()
          << " rows";
      throw SolverError(err.str());
    }
    Eigen::SparseLU<SparseMatrix_t, Eigen::COLAMDOrdering<int>> solver{};
    solver.analyzePattern(this->matrix);
    solver.factorize(this->matrix);
    if (solver.info() != Eigen::Success) {
      std::stringstream err{};
      err << "factorisation of the " << this->matrix.rows() << " × "
          << this->matrix.cols()
          << " block operator failed: " << solver.lastErrorMessage();
      throw SolverError(err.str());
    }
    const Vector_t free_dofs{solver.solve(Vector_t{rhs})};
    if (solver.info() != Eigen::Success or not free_dofs.allFinite()) {
      throw SolverError("the block system could not be solved to a finite "
                        "solution");
    }
    VectorFunction ret_val{this->space};
    ret_val.set_free_dofs(free_dofs);
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  Vector_t BlockMatrix::matvec(const VectorFunction & u) const {
    if (not(u.get_space() == *this->space)) {
      throw SpaceError("the function does not live on the space of the "
                       "block operator");
    }
    switch (this->columns) {
    case Columns::Free: {
      return this->matrix * u.get_free_dofs();
    }
    case Columns::Boundary: {
      return this->matrix * u.get_boundary_dofs();
    }
    default:
      throw SolverError("unknown column selection");
      break;
    }
  }

  /* ---------------------------------------------------------------------- */
  Vector_t inner_rhs(const VectorSpace & space,
                     const std::vector<DynMatrix_t> & values) {
    if (static_cast<Dim_t>(values.size()) != space.get_nb_components()) {
      std::stringstream err{};
      err << "expected grid values of " << space.get_nb_components()
          << " components, got " << values.size();
      throw SpaceError(err.str());
    }
    Vector_t ret_val(space.get_nb_free());
    for (Dim_t i{0}; i < space.get_nb_components(); ++i) {
      auto && tp_space{space.get_space(i)};
      auto && basis0{tp_space.get_basis(0)};
      auto && basis1{tp_space.get_basis(1)};
      const DynMatrix_t weighted{
          basis0.get_weights().asDiagonal() * values[i] *
          basis1.get_weights().asDiagonal()};
      const Vector_t flat{tp_space.flatten(basis0.evaluate().transpose() *
                                           weighted * basis1.evaluate())};
      Index_t position{space.get_free_offset(i)};
      for (auto && dof : tp_space.get_free_dofs()) {
        ret_val(position++) = flat(dof);
      }
    }
    return ret_val;
  }

}  // namespace muGalerkin
