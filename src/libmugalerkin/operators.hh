/**
 * @file   operators.hh
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

#ifndef SRC_LIBMUGALERKIN_OPERATORS_HH_
#define SRC_LIBMUGALERKIN_OPERATORS_HH_

#include "forms.hh"
#include "function.hh"
#include "vector_space.hh"

#include <vector>

namespace muGalerkin {

  /**
   * Matrix of one form term, factorised into one-dimensional matrices: entry
   * ((i0, i1), (j0, j1)) of the operator is
   * scale · A0(i0, j0) · A1(i1, j1) with
   * A_d(i, j) = ∫ ∂^β_d test_i ∂^α_d trial_j along axis d. The integrals are
   * evaluated with the Gauss rule of the bases, which is exact for the
   * polynomial integrands.
   */
  class TPMatrix {
   public:
    //! Default constructor
    TPMatrix() = delete;

    //! assemble the one-dimensional factors of `term` on `space`
    TPMatrix(const FormTerm & term, const VectorSpace & space);

    //! Copy constructor
    TPMatrix(const TPMatrix & other) = default;

    //! Move constructor
    TPMatrix(TPMatrix && other) = default;

    //! Destructor
    virtual ~TPMatrix() = default;

    //! Copy assignment operator
    TPMatrix & operator=(const TPMatrix & other) = default;

    //! Move assignment operator
    TPMatrix & operator=(TPMatrix && other) = default;

    const Real & get_scale() const;
    const Dim_t & get_test_component() const;
    const Dim_t & get_trial_component() const;
    const SparseMatrix_t & get_factor(const Dim_t & axis) const;

    //! full matrix over all test and trial dofs (flat dof numbering)
    SparseMatrix_t kron() const;

    //! whether the trial component has any boundary dofs
    bool acts_on_boundary_dofs() const;

   protected:
    Real scale;
    Dim_t test_component;
    Dim_t trial_component;
    bool trial_has_boundary_dofs;
    std::array<SparseMatrix_t, twoD> factors;
  };

  //! one matrix per term of `form`, on the vector space `space`
  std::vector<TPMatrix> inner(const Form_t & form, const VectorSpace & space);

  /**
   * the matrices of `matrices` that couple test functions to boundary dofs,
   * i.e., the part of the operator moved to the right-hand side by a
   * lifting of the boundary data
   */
  std::vector<TPMatrix>
  extract_bc_matrices(const std::vector<TPMatrix> & matrices);

  /**
   * Sum of a list of tensor-product matrices as one sparse operator. Rows
   * are the free test dofs of the vector space, columns either its free or
   * its boundary trial dofs (both in the global numbering of
   * `VectorSpace`).
   */
  class BlockMatrix {
   public:
    //! which trial dofs the columns refer to
    enum class Columns { Free, Boundary };

    //! Default constructor
    BlockMatrix() = delete;

    //! assemble `matrices` on `space`
    BlockMatrix(const std::vector<TPMatrix> & matrices,
                std::shared_ptr<const VectorSpace> space,
                const Columns & columns = Columns::Free);

    //! Copy constructor
    BlockMatrix(const BlockMatrix & other) = delete;

    //! Move constructor
    BlockMatrix(BlockMatrix && other) = default;

    //! Destructor
    virtual ~BlockMatrix() = default;

    //! Copy assignment operator
    BlockMatrix & operator=(const BlockMatrix & other) = delete;

    //! Move assignment operator
    BlockMatrix & operator=(BlockMatrix && other) = default;

    const SparseMatrix_t & get_matrix() const;
    const Columns & get_columns() const;

    /**
     * solves for the free coefficients; throws a `SolverError` if the
     * operator is singular or the solution is not finite. The returned
     * function has zero boundary coefficients.
     */
    VectorFunction solve(const Eigen::Ref<const Vector_t> & rhs) const;

    /**
     * action on the free (resp. boundary) coefficients of `u`, as a vector
     * over the free test dofs
     */
    Vector_t matvec(const VectorFunction & u) const;

   protected:
    std::shared_ptr<const VectorSpace> space;
    Columns columns;
    SparseMatrix_t matrix{};
  };

  /**
   * ∫ v · f for all free test functions v of `space`, with f given by its
   * values on the grid, one array per component
   */
  Vector_t inner_rhs(const VectorSpace & space,
                     const std::vector<DynMatrix_t> & values);

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_OPERATORS_HH_
