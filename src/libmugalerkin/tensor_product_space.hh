/**
 * @file   tensor_product_space.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  two-dimensional tensor-product spaces of Legendre bases
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

#ifndef SRC_LIBMUGALERKIN_TENSOR_PRODUCT_SPACE_HH_
#define SRC_LIBMUGALERKIN_TENSOR_PRODUCT_SPACE_HH_

#include "basis.hh"
#include "galerkin_common.hh"
#include "scalar_field.hh"

#include <array>
#include <memory>
#include <vector>

namespace muGalerkin {

  /**
   * Space spanned by φ_i(x) ψ_j(y) for two one-dimensional bases φ (axis 0)
   * and ψ (axis 1). Coefficients are stored as an N0 × N1 matrix, grid
   * values as a Q0 × Q1 matrix on the tensor-product Gauss grid. Where
   * coefficients are flattened, the dof (i, j) maps to i·N1 + j.
   *
   * A dof is free if it is free in both bases; all other dofs are boundary
   * dofs, determined by the boundary data through `boundary_coefficients`.
   */
  class TensorProductSpace {
   public:
    using Shape_t = std::array<Index_t, twoD>;

    //! Default constructor
    TensorProductSpace() = delete;

    //! Constructor from the bases along axis 0 and 1
    TensorProductSpace(const Basis & basis0, const Basis & basis1);

    //! Copy constructor
    TensorProductSpace(const TensorProductSpace & other) = default;

    //! Move constructor
    TensorProductSpace(TensorProductSpace && other) = default;

    //! Destructor
    virtual ~TensorProductSpace() = default;

    //! Copy assignment operator
    TensorProductSpace & operator=(const TensorProductSpace & other) = default;

    //! Move assignment operator
    TensorProductSpace & operator=(TensorProductSpace && other) = default;

    const Basis & get_basis(const Dim_t & axis) const;
    //! number of coefficients per axis
    Shape_t get_shape() const;
    //! total number of coefficients
    Index_t size() const;
    //! flat position of dof (i, j)
    Index_t flat_index(const Index_t & i, const Index_t & j) const;

    bool is_boundary_dof(const Index_t & i, const Index_t & j) const;
    //! flat indices of the free dofs, ascending
    std::vector<Index_t> get_free_dofs() const;
    //! flat indices of the boundary dofs, ascending
    std::vector<Index_t> get_boundary_dofs() const;
    Index_t get_nb_free() const;

    bool has_nonhomogeneous_bcs() const;
    bool is_orthogonal() const;
    //! the unconstrained space on the same grid
    TensorProductSpace get_orthogonal() const;
    //! true if both spaces live on the same grid
    bool is_compatible(const TensorProductSpace & other) const;
    bool operator==(const TensorProductSpace & other) const;

    //! grid coordinates along `axis`
    const Vector_t & get_mesh(const Dim_t & axis) const;
    //! tensor-product quadrature weights on the grid
    DynMatrix_t get_weights() const;

    //! values of `field` on the grid
    DynMatrix_t sample(const ScalarField & field) const;

    //! grid values of the `derivative` of the expansion `coefficients`
    DynMatrix_t backward(const DynMatrix_t & coefficients,
                         const DerivOrder_t & derivative = NoDerivative) const;
    /**
     * coefficients of grid values, one-dimensional projections applied
     * along both axes (plain L2 projection for an orthogonal space)
     */
    DynMatrix_t forward(const DynMatrix_t & values) const;

    //! quadrature of grid values over the domain
    Real integrate(const DynMatrix_t & values) const;

    /**
     * Lifting of the boundary data: coefficients of all boundary dofs, free
     * dofs zero. Edge data along axis 0 fill complete coefficient rows
     * (their traces set the corner dofs), edge data along axis 1 fill the
     * remaining entries of the boundary columns.
     */
    DynMatrix_t boundary_coefficients() const;

    //! flat coefficient vector (row-major dof numbering)
    Vector_t flatten(const DynMatrix_t & coefficients) const;
    //! inverse of `flatten`
    DynMatrix_t unflatten(const Eigen::Ref<const Vector_t> & flat) const;

   protected:
    std::array<Basis, twoD> bases;
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_TENSOR_PRODUCT_SPACE_HH_
