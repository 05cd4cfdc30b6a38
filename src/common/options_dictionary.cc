/**
 * @file   options_dictionary.cc
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

#include "common/options_dictionary.hh"

#include <sstream>

namespace muElastic {
  /* ---------------------------------------------------------------------- */
  Dictionary::Dictionary(std::shared_ptr<RuntimeValue> ptr)
      : ptr{std::move(ptr)} {}

  /* ---------------------------------------------------------------------- */
  Dictionary::Dictionary()
      : ptr{std::make_shared<RuntimeValue>(RuntimeValue::Map_t{})} {}

  /* ---------------------------------------------------------------------- */
  Dictionary::Dictionary(const std::string & key, const Real & value)
      : Dictionary{} {
    this->add(key, value);
  }

  /* ---------------------------------------------------------------------- */
  Dictionary::Dictionary(const std::string & key, const Int & value)
      : Dictionary{} {
    this->add(key, value);
  }

  /* ---------------------------------------------------------------------- */
  Dictionary::Dictionary(const std::string & key, const std::string & value)
      : Dictionary{} {
    this->add(key, value);
  }

  /* ---------------------------------------------------------------------- */
  Dictionary Dictionary::operator[](const std::string & key) const {
    return Dictionary{this->ptr->get_value(key)};
  }

  /* ---------------------------------------------------------------------- */
  bool Dictionary::has_key(const std::string & key) const {
    return this->ptr->has_key(key);
  }

  /* ---------------------------------------------------------------------- */
  void Dictionary::add(const std::string & key, const Dictionary & other) {
    this->ptr->add(key, other.ptr);
  }

  /* ---------------------------------------------------------------------- */
  void Dictionary::add(const std::string & key, const Int & value) {
    this->ptr->add(key, std::make_shared<RuntimeValue>(value));
  }

  /* ---------------------------------------------------------------------- */
  void Dictionary::add(const std::string & key, const Real & value) {
    this->ptr->add(key, std::make_shared<RuntimeValue>(value));
  }

  /* ---------------------------------------------------------------------- */
  void Dictionary::add(const std::string & key, const std::string & value) {
    this->ptr->add(key, std::make_shared<RuntimeValue>(value));
  }

  /* ---------------------------------------------------------------------- */
  const RuntimeValue::ValueType & Dictionary::get_value_type() const {
    return this->ptr->get_value_type();
  }

  /* ---------------------------------------------------------------------- */
  const Int & Dictionary::get_int() const { return this->ptr->get_int(); }

  /* ---------------------------------------------------------------------- */
  const Real & Dictionary::get_real() const { return this->ptr->get_real(); }

  /* ---------------------------------------------------------------------- */
  const std::string & Dictionary::get_string() const {
    return this->ptr->get_string();
  }

  /* ---------------------------------------------------------------------- */
  Dictionary & Dictionary::operator=(const Int & value) {
    *this->ptr = value;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  Dictionary & Dictionary::operator=(const Real & value) {
    *this->ptr = value;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  Dictionary & Dictionary::operator=(const std::string & value) {
    *this->ptr = value;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  RuntimeValue::RuntimeValue(const Int & value)
      : value_type{ValueType::Int}, variant{value} {}

  /* ---------------------------------------------------------------------- */
  RuntimeValue::RuntimeValue(const Real & value)
      : value_type{ValueType::Real}, variant{value} {}

  /* ---------------------------------------------------------------------- */
  RuntimeValue::RuntimeValue(const std::string & value)
      : value_type{ValueType::String}, variant{value} {}

  /* ---------------------------------------------------------------------- */
  RuntimeValue::RuntimeValue(const Map_t & value)
      : value_type{ValueType::Dictionary}, variant{value} {}

  /* ---------------------------------------------------------------------- */
  RuntimeValue & RuntimeValue::operator=(const Int & value) {
    this->variant = value;
    this->value_type = ValueType::Int;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  RuntimeValue & RuntimeValue::operator=(const Real & value) {
    this->variant = value;
    this->value_type = ValueType::Real;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  RuntimeValue & RuntimeValue::operator=(const std::string & value) {
    this->variant = value;
    this->value_type = ValueType::String;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  RuntimeValue & RuntimeValue::operator=(const Map_t & value) {
    this->variant = value;
    this->value_type = ValueType::Dictionary;
    return *this;
  }

  /* ---------------------------------------------------------------------- */
  void RuntimeValue::add(const std::string & key,
                         std::shared_ptr<RuntimeValue> other) {
    if (this->value_type != ValueType::Dictionary) {
      throw ValueError("This is not a Dictionary value");
    }
    auto & dictionary{std::get<Map_t>(this->variant)};
    if (dictionary.count(key) != 0) {
      std::stringstream error_stream{};
      error_stream << "The key '" << key
                   << "' is already present in this dictionary. did you mean "
                      "to assign rather than add?";
      throw KeyError(error_stream.str());
    }
    dictionary.insert(std::make_pair(key, std::move(other)));
  }

  /* ---------------------------------------------------------------------- */
  const Int & RuntimeValue::get_int() const {
    if (this->value_type != ValueType::Int) {
      throw ValueError{"This is not an integer value"};
    }
    return std::get<Int>(this->variant);
  }

  /* ---------------------------------------------------------------------- */
  const Real & RuntimeValue::get_real() const {
    if (this->value_type != ValueType::Real) {
      throw ValueError{"This is not a real value"};
    }
    return std::get<Real>(this->variant);
  }

  /* ---------------------------------------------------------------------- */
  const std::string & RuntimeValue::get_string() const {
    if (this->value_type != ValueType::String) {
      throw ValueError{"This is not a string value"};
    }
    return std::get<std::string>(this->variant);
  }

  /* ---------------------------------------------------------------------- */
  std::shared_ptr<RuntimeValue> &
  RuntimeValue::get_value(const std::string & key) {
    if (this->value_type != ValueType::Dictionary) {
      throw ValueError{"This isn't a Dictionary value"};
    }
    auto & dictionary{std::get<Map_t>(this->variant)};
    auto && entry{dictionary.find(key)};
    if (entry == dictionary.end()) {
      std::stringstream error_stream{};
      error_stream << "The key '" << key
                   << "' is not present in this dictionary";
      throw KeyError(error_stream.str());
    }
    return entry->second;
  }

  /* ---------------------------------------------------------------------- */
  bool RuntimeValue::has_key(const std::string & key) const {
    if (this->value_type != ValueType::Dictionary) {
      throw ValueError{"This isn't a Dictionary value"};
    }
    return std::get<Map_t>(this->variant).count(key) != 0;
  }

  /* ---------------------------------------------------------------------- */
  auto RuntimeValue::get_value_type() const -> const ValueType & {
    return this->value_type;
  }

}  // namespace muElastic
