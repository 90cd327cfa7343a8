/*
  Copyright (c) DataStax, Inc.

  Licensed under the Apache License, Version 2.0 (the "License");
  you may not use this file except in compliance with the License.
  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

#ifndef CEQUEL_INTERNAL_OPTIONS_HPP
#define CEQUEL_INTERNAL_OPTIONS_HPP

#include "error.hpp"
#include "load_balancing.hpp"
#include "map.hpp"
#include "string.hpp"

#include <stdint.h>

namespace cequel { namespace internal { namespace core {

class OptionValue {
public:
  enum Type { STRING, INT, BOOL, POLICY };

  OptionValue()
      : type_(STRING)
      , int_value_(0) {}

  static OptionValue string(const String& value);
  static OptionValue integer(int64_t value);
  static OptionValue boolean(bool value);
  static OptionValue policy(const LoadBalancingPolicy::Ptr& value);

  Type type() const { return type_; }

  const String& as_string() const { return string_value_; }
  int64_t as_int() const { return int_value_; }
  bool as_bool() const { return int_value_ != 0; }
  const LoadBalancingPolicy::Ptr& as_policy() const { return policy_value_; }

  String to_string() const;

private:
  Type type_;
  String string_value_;
  int64_t int_value_;
  LoadBalancingPolicy::Ptr policy_value_;
};

const char* option_type_string(OptionValue::Type type);

/**
 * The raw connect-time configuration: named, typed values as supplied by the
 * caller. Validation and defaults happen in ConnectionConfig.
 */
class Options {
public:
  typedef Map<String, OptionValue> ValueMap;
  typedef ValueMap::const_iterator const_iterator;

  Options& set_string(const String& name, const String& value);
  Options& set_int(const String& name, int64_t value);
  Options& set_bool(const String& name, bool value);
  Options& set_policy(const String& name, const LoadBalancingPolicy::Ptr& policy);

  // Returns NULL when the option is not set.
  const OptionValue* find(const String& name) const;

  bool contains(const String& name) const { return values_.find(name) != values_.end(); }
  void erase(const String& name) { values_.erase(name); }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }
  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  /**
   * Parse options from a JSON object. Strings, integers and booleans map
   * directly, null leaves the option unset, and "load_balancing_policy" is a
   * policy object such as
   * {"type": "token_aware", "child": {"type": "dc_aware", "local_dc": "dc1"}}.
   *
   * @return CEQUEL_OK or CEQUEL_ERROR_LIB_INVALID_CONFIGURATION
   */
  static CequelError from_json(const String& json, Options* options, Error* error = NULL);

  // Same as from_json(), reading the document from a file.
  static CequelError from_json_file(const String& path, Options* options, Error* error = NULL);

private:
  ValueMap values_;
};

}}} // namespace cequel::internal::core

#endif
