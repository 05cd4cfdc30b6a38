/**
 * @file   options_dictionary.hh
 *
 * @date   19 Oct 2026
 *
 * @brief  Runtime options dictionary for solver settings
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

#include <map>
#include <memory>
#include <string>
#include <variant>

#ifndef SRC_COMMON_OPTIONS_DICTIONARY_HH_
#define SRC_COMMON_OPTIONS_DICTIONARY_HH_

namespace muElastic {
  /* ---------------------------------------------------------------------- */
  class DictionaryError : public muGalerkin::RuntimeError {
    using muGalerkin::RuntimeError::RuntimeError;
  };

  /* ---------------------------------------------------------------------- */
  class ValueError : public DictionaryError {
    using DictionaryError::DictionaryError;
  };

  /* ---------------------------------------------------------------------- */
  class KeyError : public DictionaryError {
    using DictionaryError::DictionaryError;
  };

  /**
   * this class holds the dictionary tree structure and protects acccess to the
   * variant holding the actual data
   */
  class RuntimeValue final {
   public:
    /**
     * The types an options dictionary can hold are integers, real numbers,
     * strings and nested dictionaries to which these restrictions also apply
     */
    enum class ValueType { Dictionary, Int, Real, String };
    using Map_t = std::map<std::string, std::shared_ptr<RuntimeValue>>;

    //! constructors from values
    explicit RuntimeValue(const Int & value);
    explicit RuntimeValue(const Real & value);
    explicit RuntimeValue(const std::string & value);
    explicit RuntimeValue(const Map_t & value);

    //! assignment operators
    RuntimeValue & operator=(const Int & value);
    RuntimeValue & operator=(const Real & value);
    RuntimeValue & operator=(const std::string & value);
    RuntimeValue & operator=(const Map_t & value);

    /**
     * add a new dictionary entry. throws a ValueError if this RuntimeValue
     * isn't of `ValueType::Dictionary`
     */
    void add(const std::string & key, std::shared_ptr<RuntimeValue> other);

    //! safely recover a typed value, throws ValueError if types mismatch
    const Int & get_int() const;
    const Real & get_real() const;
    const std::string & get_string() const;
    std::shared_ptr<RuntimeValue> & get_value(const std::string & key);
    bool has_key(const std::string & key) const;

    const ValueType & get_value_type() const;

   protected:
    ValueType value_type;
    std::variant<Map_t, Int, Real, std::string> variant;
  };

  /**
   * The Dictionary class holds a smart pointer to a RuntimeValue and provides
   * the interface to assign, modify and get typed values out of that
   * RuntimeValue. It behaves like a subset of the python dict class
   */
  class Dictionary {
    explicit Dictionary(std::shared_ptr<RuntimeValue> ptr);

   public:
    //! default constructor
    Dictionary();
    //! move constructor
    Dictionary(Dictionary &&) = default;
    Dictionary(const Dictionary & other) = default;

    //! constructor with a single key-value pair
    Dictionary(const std::string & key, const Real & value);
    Dictionary(const std::string & key, const Int & value);
    Dictionary(const std::string & key, const std::string & value);
    ~Dictionary() = default;

    //! copy operator
    Dictionary & operator=(const Dictionary & other) = default;

    //! assignment to a single runtime value (rather than a dict)
    Dictionary & operator=(const Int & value);
    Dictionary & operator=(const Real & value);
    Dictionary & operator=(const std::string & value);

    //! get a typed value, throws DictionaryError if the type is mismatched
    const Int & get_int() const;
    const Real & get_real() const;
    const std::string & get_string() const;

    /**
     * index operator returns a modifiable sub-dictionary (modifications
     * propagate back into the original dictionary), throws a KeyError for
     * unknown keys
     */
    Dictionary operator[](const std::string & name) const;

    //! whether `key` is an entry of this dictionary
    bool has_key(const std::string & key) const;

    //! add a value to the dictionary
    void add(const std::string & key, const Dictionary & other);
    void add(const std::string & key, const Int & value);
    void add(const std::string & key, const Real & value);
    void add(const std::string & key, const std::string & value);
    const RuntimeValue::ValueType & get_value_type() const;

   protected:
    std::shared_ptr<RuntimeValue> ptr;
  };

}  // namespace muElastic

#endif  // SRC_COMMON_OPTIONS_DICTIONARY_HH_
