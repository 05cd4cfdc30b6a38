/**
 * @file   vector_space.cc
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

#include "vector_space.hh"

#include <sstream>

namespace muGalerkin {

  /* ---------------------------------------------------------------------- */
  VectorSpace::VectorSpace(const std::vector<TensorProductSpace> & spaces) {
    if (spaces.empty()) {
      throw SpaceError("a vector space needs at least one component");
    }
    Index_t free_offset{0}, boundary_offset{0};
    for (auto && space : spaces) {
      if (not space.is_compatible(spaces.front())) {
        throw SpaceError(
            "all components of a vector space have to share their grid");
      }
      this->spaces.push_back(std::make_shared<const TensorProductSpace>(space));
      this->free_offsets.push_back(free_offset);
      this->boundary_offsets.push_back(boundary_offset);
      free_offset += space.get_nb_free();
      boundary_offset += space.size() - space.get_nb_free();
    }
    this->free_offsets.push_back(free_offset);
    this->boundary_offsets.push_back(boundary_offset);
  }

  /* ---------------------------------------------------------------------- */
  Dim_t VectorSpace::get_nb_components() const {
    return static_cast<Dim_t>(this->spaces.size());
  }

  /* ---------------------------------------------------------------------- */
  const TensorProductSpace &
  VectorSpace::get_space(const Dim_t & component) const {
    return *this->get_space_ptr(component);
  }

  /* ---------------------------------------------------------------------- */
  auto VectorSpace::get_space_ptr(const Dim_t & component) const
      -> const Space_ptr & {
    this->check_component(component);
    return this->spaces[component];
  }

  /* ---------------------------------------------------------------------- */
  Index_t VectorSpace::get_nb_free() const {
    return this->free_offsets.back();
  }

  /* ---------------------------------------------------------------------- */
  Index_t VectorSpace::get_free_offset(const Dim_t & component) const {
    this->check_component(component);
    return this->free_offsets[component];
  }

  /* ---------------------------------------------------------------------- */
  Index_t VectorSpace::get_nb_boundary() const {
    return this->boundary_offsets.back();
  }

  /* ---------------------------------------------------------------------- */
  Index_t VectorSpace::get_boundary_offset(const Dim_t & component) const {
    this->check_component(component);
    return this->boundary_offsets[component];
  }

  /* ---------------------------------------------------------------------- */
  bool VectorSpace::has_nonhomogeneous_bcs() const {
    for (auto && space : this->spaces) {
      if (space->has_nonhomogeneous_bcs()) {
        return true;
      }
    }
    return false;
  }

  /* ---------------------------------------------------------------------- */
  VectorSpace VectorSpace::get_orthogonal() const {
    std::vector<TensorProductSpace> orthogonal{};
    for (auto && space : this->spaces) {
      orthogonal.push_back(space->get_orthogonal());
    }
    return VectorSpace{orthogonal};
  }

  /* ---------------------------------------------------------------------- */
  void VectorSpace::check_component(const Dim_t & component) const {
    if (component < 0 or component >= this->get_nb_components()) {
      std::stringstream err{};
      err << "component " << component << " out of range for a vector space "
          << "of " << this->get_nb_components() << " components";
      throw SpaceError(err.str());
    }
  }

  /* ---------------------------------------------------------------------- */
  bool VectorSpace::operator==(const VectorSpace & other) const {
    if (this->get_nb_components() != other.get_nb_components()) {
      return false;
    }
    for (Dim_t i{0}; i < this->get_nb_components(); ++i) {
      if (not(*this->spaces[i] == *other.spaces[i])) {
        return false;
      }
    }
    return true;
  }

}  // namespace muGalerkin
