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

#include "value.hpp"

#include <stdio.h>

using namespace cequel::internal;
using namespace cequel::internal::core;

Value Value::boolean(bool value) {
  Value v;
  v.type_ = BOOLEAN;
  v.int_value_ = value ? 1 : 0;
  return v;
}

Value Value::int32(int32_t value) {
  Value v;
  v.type_ = INT32;
  v.int_value_ = value;
  return v;
}

Value Value::int64(int64_t value) {
  Value v;
  v.type_ = INT64;
  v.int_value_ = value;
  return v;
}

Value Value::dbl(double value) {
  Value v;
  v.type_ = DOUBLE;
  v.double_value_ = value;
  return v;
}

Value Value::text(const String& value) {
  Value v;
  v.type_ = TEXT;
  v.string_value_ = value;
  return v;
}

Value Value::blob(const String& bytes) {
  Value v;
  v.type_ = BLOB;
  v.string_value_ = bytes;
  return v;
}

String Value::to_string() const {
  OStringStream ss;
  switch (type_) {
    case NULL_VALUE:
      ss << "NULL";
      break;
    case BOOLEAN:
      ss << (int_value_ != 0 ? "true" : "false");
      break;
    case INT32:
    case INT64:
      ss << int_value_;
      break;
    case DOUBLE:
      ss << double_value_;
      break;
    case TEXT:
      ss << '\'';
      for (String::const_iterator it = string_value_.begin(), end = string_value_.end();
           it != end; ++it) {
        if (*it == '\'') ss << '\'';
        ss << *it;
      }
      ss << '\'';
      break;
    case BLOB: {
      ss << "0x";
      char hex[3];
      for (String::const_iterator it = string_value_.begin(), end = string_value_.end();
           it != end; ++it) {
        snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned int>(static_cast<uint8_t>(*it)));
        ss << hex;
      }
      break;
    }
  }
  return ss.str();
}

bool Value::operator==(const Value& other) const {
  if (type_ != other.type_) return false;
  switch (type_) {
    case NULL_VALUE:
      return true;
    case DOUBLE:
      return double_value_ == other.double_value_;
    case TEXT:
    case BLOB:
      return string_value_ == other.string_value_;
    default:
      return int_value_ == other.int_value_;
  }
}

namespace cequel { namespace internal { namespace core {

String values_to_string(const ValueVec& values) {
  String result("[");
  for (ValueVec::const_iterator it = values.begin(), end = values.end(); it != end; ++it) {
    if (it != values.begin()) result.append(", ");
    result.append(it->to_string());
  }
  result.push_back(']');
  return result;
}

}}} // namespace cequel::internal::core
