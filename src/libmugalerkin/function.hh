/**
 * @file   function.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  scalar and vector expansions in spectral spaces
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

#ifndef SRC_LIBMUGALERKIN_FUNCTION_HH_
#define SRC_LIBMUGALERKIN_FUNCTION_HH_

#include "scalar_field.hh"
#include "tensor_product_space.hh"
#include "vector_space.hh"

#include <memory>
#include <vector>

namespace muGalerkin {

  /**
   * Expansion coefficients bound to a tensor-product space. Linear
   * combinations are only defined between functions of equal spaces.
   */
  class ScalarFunction {
   public:
    using Space_ptr = std::shared_ptr<const TensorProductSpace>;

    //! Default constructor
    ScalarFunction() = delete;

    //! the zero function of `space`
    explicit ScalarFunction(Space_ptr space);

    //! function with given coefficients
    ScalarFunction(Space_ptr space, DynMatrix_t coefficients);

    //! Copy constructor
    ScalarFunction(const ScalarFunction & other) = default;

    //! Move constructor
    ScalarFunction(ScalarFunction && other) = default;

    //! Destructor
    virtual ~ScalarFunction() = default;

    //! Copy assignment operator
    ScalarFunction & operator=(const ScalarFunction & other) = default;

    //! Move assignment operator
    ScalarFunction & operator=(ScalarFunction && other) = default;

    const TensorProductSpace & get_space() const;
    const Space_ptr & get_space_ptr() const;

    DynMatrix_t & get_coefficients();
    const DynMatrix_t & get_coefficients() const;

    //! grid values of a derivative of the function
    DynMatrix_t backward(const DerivOrder_t & derivative = NoDerivative) const;

    ScalarFunction & operator+=(const ScalarFunction & other);
    ScalarFunction & operator-=(const ScalarFunction & other);
    ScalarFunction & operator*=(const Real & factor);

    ScalarFunction operator+(const ScalarFunction & other) const;
    ScalarFunction operator-(const ScalarFunction & other) const;
    ScalarFunction operator-() const;

   protected:
    void check_same_space(const ScalarFunction & other) const;

    Space_ptr space;
    DynMatrix_t coefficients;
  };

  ScalarFunction operator*(const Real & factor, const ScalarFunction & u);

  /**
   * Projection of a derivative of `u` onto `target`, which has to live on
   * the same grid as `u`. Exact whenever the derivative lies in `target`,
   * in particular for an unconstrained target.
   */
  ScalarFunction project(const ScalarFunction & u,
                         const DerivOrder_t & derivative,
                         const ScalarFunction::Space_ptr & target);

  //! projection of a field sampled on the grid of `target`
  ScalarFunction project(const ScalarField & field,
                         const ScalarFunction::Space_ptr & target);

  /**
   * Expansion of a vector field, one coefficient array per component. The
   * free coefficients can be viewed as one flat vector in the global free
   * dof numbering of the vector space.
   */
  class VectorFunction {
   public:
    using VectorSpace_ptr = std::shared_ptr<const VectorSpace>;

    //! Default constructor
    VectorFunction() = delete;

    //! the zero function of `space`
    explicit VectorFunction(VectorSpace_ptr space);

    //! Copy constructor
    VectorFunction(const VectorFunction & other) = default;

    //! Move constructor
    VectorFunction(VectorFunction && other) = default;

    //! Destructor
    virtual ~VectorFunction() = default;

    //! Copy assignment operator
    VectorFunction & operator=(const VectorFunction & other) = default;

    //! Move assignment operator
    VectorFunction & operator=(VectorFunction && other) = default;

    const VectorSpace & get_space() const;
    const VectorSpace_ptr & get_space_ptr() const;
    Dim_t get_nb_components() const;

    //! copy of component `i` as a scalar function
    ScalarFunction operator[](const Dim_t & component) const;

    DynMatrix_t & get_coefficients(const Dim_t & component);
    const DynMatrix_t & get_coefficients(const Dim_t & component) const;

    //! flat vector of all free coefficients
    Vector_t get_free_dofs() const;
    //! overwrite all free coefficients, boundary coefficients untouched
    void set_free_dofs(const Eigen::Ref<const Vector_t> & free_dofs);
    //! flat vector of all boundary coefficients
    Vector_t get_boundary_dofs() const;

    /**
     * overwrites the boundary coefficients with the lifting of the
     * boundary data of the space and zeroes the free ones
     */
    VectorFunction & set_boundary_dofs();

    /**
     * component-wise copy of the coefficients of `other`, whose space may
     * differ (e.g., by domain and boundary data) but has to have the same
     * shape
     */
    void assign_coefficients(const VectorFunction & other);

    //! grid values of all components
    std::vector<DynMatrix_t> backward() const;

    VectorFunction & operator+=(const VectorFunction & other);
    VectorFunction & operator-=(const VectorFunction & other);
    VectorFunction & operator*=(const Real & factor);

    VectorFunction operator+(const VectorFunction & other) const;
    VectorFunction operator-(const VectorFunction & other) const;
    VectorFunction operator-() const;

   protected:
    void check_same_space(const VectorFunction & other) const;
    void check_component(const Dim_t & component) const;

    VectorSpace_ptr space;
    std::vector<DynMatrix_t> coefficients{};
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_FUNCTION_HH_
