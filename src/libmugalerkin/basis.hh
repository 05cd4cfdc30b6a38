/**
 * @file   basis.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  one-dimensional Legendre bases satisfying boundary conditions
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

#ifndef SRC_LIBMUGALERKIN_BASIS_HH_
#define SRC_LIBMUGALERKIN_BASIS_HH_

#include "boundary_condition.hh"
#include "galerkin_common.hh"
#include "legendre.hh"

namespace muGalerkin {

  /**
   * Global polynomial basis of size N on an interval, composed of Legendre
   * polynomials through a stencil matrix (row k holds the Legendre
   * coefficients of basis function k). The first `get_nb_free()` functions
   * satisfy the homogeneous version of the boundary condition:
   *
   * - none:            L_k
   * - Dirichlet:       L_k − L_{k+2}
   * - biharmonic:      L_k − 2(2k+5)/(2k+7) L_{k+2} + (2k+3)/(2k+7) L_{k+4}
   * - upper Dirichlet: L_k − L_{k+1}
   * - lower Dirichlet: L_k + L_{k+1}
   *
   * The remaining functions lift the boundary data: they are the lowest
   * degree polynomials that are dual to the boundary functionals in
   * reference coordinates, so that the coefficient of a boundary function
   * equals the prescribed value (or the prescribed slope times half the
   * interval length).
   *
   * The basis carries an N-point Gauss-Legendre rule mapped to its
   * interval, which is also its physical grid.
   */
  class Basis {
   public:
    //! Default constructor
    Basis() = delete;

    //! Construct a basis of `size` functions on `domain`
    Basis(const Index_t & size, const Interval & domain,
          const BoundaryCondition & bc = BoundaryCondition{});

    //! Copy constructor
    Basis(const Basis & other) = default;

    //! Move constructor
    Basis(Basis && other) = default;

    //! Destructor
    virtual ~Basis() = default;

    //! Copy assignment operator
    Basis & operator=(const Basis & other) = default;

    //! Move assignment operator
    Basis & operator=(Basis && other) = default;

    //! total number of basis functions (free and boundary)
    const Index_t & size() const;
    //! number of functions vanishing under the homogeneous condition
    Index_t get_nb_free() const;
    //! number of lifting functions
    Index_t get_nb_boundary() const;
    bool is_boundary_dof(const Index_t & index) const;

    const BoundaryCondition & get_boundary_condition() const;
    const BoundaryCondition::Kind & get_kind() const;
    bool is_orthogonal() const;
    //! whether any boundary datum is not identically zero
    bool has_nonhomogeneous_bcs() const;

    const Interval & get_domain() const;
    //! quadrature points in physical coordinates (the grid of this basis)
    const Vector_t & get_mesh() const;
    //! quadrature weights including the interval Jacobian
    const Vector_t & get_weights() const;
    //! dξ/dx for the affine map onto the reference interval
    Real get_jacobian() const;
    /**
     * factor converting a prescribed physical derivative of order
     * `derivative` into the coefficient of the matching lifting function
     */
    Real get_functional_scale(const Index_t & derivative) const;

    const DynMatrix_t & get_stencil() const;

    /**
     * `derivative`-th physical derivative of all basis functions on the
     * grid, one row per grid point, one column per function
     */
    DynMatrix_t evaluate(const Index_t & derivative = zerothOrder) const;
    //! same as `evaluate`, at arbitrary physical points
    DynMatrix_t evaluate_at(const Eigen::Ref<const Vector_t> & points,
                            const Index_t & derivative = zerothOrder) const;

    /**
     * Expand grid values of a polynomial g into this basis. The boundary
     * coefficients are the boundary functionals applied to g (traces),
     * the free coefficients follow from a Galerkin projection of the
     * remainder. Exact for polynomials of degree < size().
     */
    Vector_t project(const Eigen::Ref<const Vector_t> & values) const;

    //! matrix form of `project`, mapping grid values to coefficients
    DynMatrix_t get_projection() const;

    //! unconstrained Legendre basis of the same size on the same interval
    Basis get_orthogonal() const;

    //! true if both bases share their grid (size and interval)
    bool is_compatible(const Basis & other) const;
    //! same grid and same kind of boundary condition
    bool operator==(const Basis & other) const;

   protected:
    void build_stencil();

    Index_t nb_functions;
    Interval domain;
    BoundaryCondition bc;
    DynMatrix_t stencil{};
    Vector_t reference_mesh{};
    Vector_t reference_weights{};
    Vector_t mesh{};
    Vector_t weights{};
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_BASIS_HH_
