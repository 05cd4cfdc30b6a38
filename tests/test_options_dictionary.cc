/**
 * @file   test_options_dictionary.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  tests for the options dictionary
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

#include "tests.hh"
#include "test_goodies.hh"

#include "common/options_dictionary.hh"

namespace muElastic {

  BOOST_AUTO_TEST_SUITE(option_tests)

  BOOST_AUTO_TEST_CASE(runtime_value_conversion) {
    RuntimeValue int_val(Int{2});
    RuntimeValue real_val(2.5);
    RuntimeValue string_val(std::string{"cauchy"});
    Int recovered_int(int_val.get_int());
    Real recovered_real(real_val.get_real());
    BOOST_CHECK_EQUAL(recovered_int, 2);
    BOOST_CHECK_EQUAL(recovered_real, 2.5);
    BOOST_CHECK_EQUAL(string_val.get_string(), "cauchy");

    BOOST_CHECK_THROW(int_val.get_real(), ValueError);
    BOOST_CHECK_THROW(real_val.get_string(), ValueError);
  }

  BOOST_AUTO_TEST_CASE(construction) {
    const Int int_val{5};
    const Int sub_int_val(3);
    const Real real_val{3.5};
    const std::string string_val{"gradient"};
    Dictionary dict_int{"N", int_val};
    Dictionary dict_real{"nondim_length", real_val};
    Dictionary dict_string{"model", string_val};

    BOOST_CHECK_THROW(dict_int.get_int(), std::runtime_error);
    auto check_val{dict_int["N"].get_int()};
    BOOST_CHECK_EQUAL(int_val, check_val);
    BOOST_CHECK_THROW(dict_real["nondim_length"].get_int(),
                      std::runtime_error);
    BOOST_CHECK_THROW(dict_string["model"].get_int(), std::runtime_error);
    BOOST_CHECK_EQUAL(dict_string["model"].get_string(), string_val);

    BOOST_CHECK_THROW(dict_int["N"].get_real(), std::runtime_error);
    BOOST_CHECK_THROW(dict_int["nondim_disp"], KeyError);

    // adding new members
    dict_int.add("nondim_length", real_val);
    BOOST_CHECK_EQUAL(dict_int["nondim_length"].get_real(), real_val);
    BOOST_CHECK(dict_int.has_key("nondim_length"));
    BOOST_CHECK(not dict_int.has_key("nondim_disp"));
    // complain if a member gets added twice
    BOOST_CHECK_THROW(dict_int.add("nondim_length", real_val), KeyError);
    // change a value's type
    dict_int["nondim_length"] = int_val;
    BOOST_CHECK_EQUAL(int_val, dict_int["nondim_length"].get_int());

    // nested dictionary
    dict_int.add("subdictionary", Dictionary("sub_int_val", sub_int_val));
    BOOST_CHECK_EQUAL(dict_int["subdictionary"]["sub_int_val"].get_int(),
                      sub_int_val);
  }

  BOOST_AUTO_TEST_CASE(construction_of_empty_dict) {
    const Int int_val{5};
    Dictionary dict{};
    const std::string key{"integer value"};
    dict.add(key, int_val);
    BOOST_CHECK_EQUAL(dict[key].get_int(), int_val);
  }

  BOOST_AUTO_TEST_CASE(assignment) {
    const Int int_val{5};
    const Real real_val{3.2};
    const std::string string_val{"verbose"};
    Dictionary dict{};
    const std::string key{"int"};

    dict.add(key, int_val);
    BOOST_CHECK(dict[key].get_value_type() == RuntimeValue::ValueType::Int);
    BOOST_CHECK_EQUAL(dict[key].get_int(), int_val);

    dict[key] = real_val;
    BOOST_CHECK(dict[key].get_value_type() == RuntimeValue::ValueType::Real);
    BOOST_CHECK_EQUAL(dict[key].get_real(), real_val);

    dict[key] = string_val;
    BOOST_CHECK(dict[key].get_value_type() ==
                RuntimeValue::ValueType::String);
    BOOST_CHECK_EQUAL(dict[key].get_string(), string_val);
  }

  BOOST_AUTO_TEST_CASE(mut_access) {
    Int initial{2};
    Int clone_modification{3};

    const std::string key{"int"};
    Dictionary dict{key, initial};
    Dictionary clone{dict[key]};

    clone = clone_modification;
    BOOST_CHECK_EQUAL(clone.get_int(), clone_modification);
    BOOST_CHECK_EQUAL(dict[key].get_int(), clone_modification);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace muElastic
