/**
 * @file   tensor_array.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  small fixed-size tensor arrays of fields with index operations
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

#include "common/elastic_common.hh"

#include <array>
#include <utility>
#include <vector>

#ifndef SRC_COMMON_TENSOR_ARRAY_HH_
#define SRC_COMMON_TENSOR_ARRAY_HH_

namespace muElastic {

  /**
   * Dense rank-`Rank` array of `Dim`^`Rank` entries of type `T` (typically a
   * field), addressed by index tuples. Entries are stored in row-major
   * order. `T` needs not be default constructible, arrays are created from
   * a generator callable that receives the index tuple.
   */
  template <typename T, Dim_t Rank, Dim_t Dim = twoD>
  class TensorArray {
   public:
    using Tuple_t = std::array<Dim_t, Rank>;

    //! Default constructor
    TensorArray() = delete;

    //! Copy constructor
    TensorArray(const TensorArray & other) = default;

    //! Move constructor
    TensorArray(TensorArray && other) = default;

    //! Destructor
    virtual ~TensorArray() = default;

    //! Copy assignment operator
    TensorArray & operator=(const TensorArray & other) = default;

    //! Move assignment operator
    TensorArray & operator=(TensorArray && other) = default;

    //! array with entry `index` set to `generator(index)`
    template <typename Generator>
    static TensorArray generate(Generator && generator) {
      std::vector<T> entries{};
      entries.reserve(nb_entries());
      for (Index_t flat{0}; flat < nb_entries(); ++flat) {
        entries.push_back(generator(unravel(flat)));
      }
      return TensorArray{std::move(entries)};
    }

    //! array with all entries equal to `value`
    static TensorArray constant(const T & value) {
      return TensorArray{std::vector<T>(nb_entries(), value)};
    }

    static constexpr Index_t nb_entries() {
      Index_t ret_val{1};
      for (Dim_t r{0}; r < Rank; ++r) {
        ret_val *= Dim;
      }
      return ret_val;
    }

    T & operator[](const Tuple_t & index) {
      return this->entries[ravel(index)];
    }
    const T & operator[](const Tuple_t & index) const {
      return this->entries[ravel(index)];
    }

    //! entry access by individual indices
    template <typename... Indices>
    T & operator()(Indices... indices) {
      static_assert(sizeof...(Indices) == Rank, "wrong number of indices");
      return (*this)[Tuple_t{static_cast<Dim_t>(indices)...}];
    }
    template <typename... Indices>
    const T & operator()(Indices... indices) const {
      static_assert(sizeof...(Indices) == Rank, "wrong number of indices");
      return (*this)[Tuple_t{static_cast<Dim_t>(indices)...}];
    }

    //! entry (i, j, …) = this(j, i, …)
    TensorArray transposed_01() const {
      return generate([this](Tuple_t index) {
        std::swap(index[0], index[1]);
        return (*this)[index];
      });
    }

    //! entry (…, j, k) = ½ (this(…, j, k) + this(…, k, j))
    TensorArray symmetrised_last() const {
      return generate([this](const Tuple_t & index) {
        Tuple_t swapped{index};
        std::swap(swapped[Rank - 2], swapped[Rank - 1]);
        return .5 * ((*this)[index] + (*this)[swapped]);
      });
    }

    //! row-major flat position of an index tuple
    static Index_t ravel(const Tuple_t & index) {
      Index_t ret_val{0};
      for (Dim_t r{0}; r < Rank; ++r) {
        if (index[r] < 0 or index[r] >= Dim) {
          throw muGalerkin::RuntimeError("tensor index out of range");
        }
        ret_val = ret_val * Dim + index[r];
      }
      return ret_val;
    }

    //! index tuple of a row-major flat position
    static Tuple_t unravel(Index_t flat) {
      Tuple_t ret_val{};
      for (Dim_t r{Rank - 1}; r >= 0; --r) {
        ret_val[r] = static_cast<Dim_t>(flat % Dim);
        flat /= Dim;
      }
      return ret_val;
    }

    typename std::vector<T>::const_iterator begin() const {
      return this->entries.begin();
    }
    typename std::vector<T>::const_iterator end() const {
      return this->entries.end();
    }

   protected:
    explicit TensorArray(std::vector<T> entries)
        : entries{std::move(entries)} {}

    std::vector<T> entries;
  };

  //! matrix of fields
  template <typename T, Dim_t Dim = twoD>
  using Rank2Array = TensorArray<T, 2, Dim>;

  //! rank-3 array of fields
  template <typename T, Dim_t Dim = twoD>
  using Rank3Array = TensorArray<T, 3, Dim>;

}  // namespace muElastic

#endif  // SRC_COMMON_TENSOR_ARRAY_HH_
