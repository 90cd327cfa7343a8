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

#ifndef CEQUEL_INTERNAL_VALUE_HPP
#define CEQUEL_INTERNAL_VALUE_HPP

#include "cequel.h"
#include "string.hpp"
#include "vector.hpp"

#include <stdint.h>

namespace cequel { namespace internal { namespace core {

/**
 * A positional bind value. The statement builder that produces CQL decides
 * the types; this layer only carries them to the transport.
 */
class Value {
public:
  enum Type { NULL_VALUE, BOOLEAN, INT32, INT64, DOUBLE, TEXT, BLOB };

  Value()
      : type_(NULL_VALUE)
      , int_value_(0)
      , double_value_(0.0) {}

  static Value null() { return Value(); }
  static Value boolean(bool value);
  static Value int32(int32_t value);
  static Value int64(int64_t value);
  static Value dbl(double value);
  static Value text(const String& value);
  static Value blob(const String& bytes);

  Type type() const { return type_; }
  bool is_null() const { return type_ == NULL_VALUE; }

  bool as_bool() const { return int_value_ != 0; }
  int32_t as_int32() const { return static_cast<int32_t>(int_value_); }
  int64_t as_int64() const { return int_value_; }
  double as_double() const { return double_value_; }
  const String& as_string() const { return string_value_; }

  // CQL literal form, used when statements are logged.
  String to_string() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !operator==(other); }

private:
  Type type_;
  int64_t int_value_;
  double double_value_;
  String string_value_;
};

typedef Vector<Value> ValueVec;

String values_to_string(const ValueVec& values);

}}} // namespace cequel::internal::core

#endif
