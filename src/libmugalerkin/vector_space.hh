/**
 * @file   vector_space.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  vector-valued spaces composed of tensor-product spaces
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

#ifndef SRC_LIBMUGALERKIN_VECTOR_SPACE_HH_
#define SRC_LIBMUGALERKIN_VECTOR_SPACE_HH_

#include "tensor_product_space.hh"

#include <memory>
#include <vector>

namespace muGalerkin {

  /**
   * One tensor-product space per vector component, all on the same grid.
   * Free dofs are numbered globally component after component, each block
   * in the order of `TensorProductSpace::get_free_dofs()`.
   */
  class VectorSpace {
   public:
    using Space_ptr = std::shared_ptr<const TensorProductSpace>;

    //! Default constructor
    VectorSpace() = delete;

    //! Constructor from the component spaces
    explicit VectorSpace(const std::vector<TensorProductSpace> & spaces);

    //! Copy constructor
    VectorSpace(const VectorSpace & other) = default;

    //! Move constructor
    VectorSpace(VectorSpace && other) = default;

    //! Destructor
    virtual ~VectorSpace() = default;

    //! Copy assignment operator
    VectorSpace & operator=(const VectorSpace & other) = default;

    //! Move assignment operator
    VectorSpace & operator=(VectorSpace && other) = default;

    Dim_t get_nb_components() const;
    const TensorProductSpace & get_space(const Dim_t & component) const;
    const Space_ptr & get_space_ptr(const Dim_t & component) const;

    //! total number of free dofs
    Index_t get_nb_free() const;
    //! position of the first free dof of `component` in the global numbering
    Index_t get_free_offset(const Dim_t & component) const;
    //! total number of boundary dofs
    Index_t get_nb_boundary() const;
    //! position of the first boundary dof of `component`
    Index_t get_boundary_offset(const Dim_t & component) const;

    bool has_nonhomogeneous_bcs() const;
    //! vector space of the unconstrained companions of all components
    VectorSpace get_orthogonal() const;
    bool operator==(const VectorSpace & other) const;

   protected:
    void check_component(const Dim_t & component) const;

    std::vector<Space_ptr> spaces{};
    std::vector<Index_t> free_offsets{};
    std::vector<Index_t> boundary_offsets{};
  };

}  // namespace muGalerkin

#endif  // SRC_LIBMUGALERKIN_VECTOR_SPACE_HH_
