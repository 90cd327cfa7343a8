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

#ifndef CEQUEL_INTERNAL_NULLABLE_HPP
#define CEQUEL_INTERNAL_NULLABLE_HPP

namespace cequel { namespace internal {

/**
 * A value that is either set or explicitly unset. Used for settings where
 * "not provided" must be distinguishable from a zero or empty value.
 */
template <typename T>
class Nullable {
public:
  /**
   * Constructor for an unset value
   */
  Nullable()
      : is_null_(true)
      , value_() {}

  explicit Nullable(const T& value)
      : is_null_(false)
      , value_(value) {}

  bool is_null() const { return is_null_; }

  /**
   * Get the wrapped value; only meaningful when !is_null()
   */
  const T& value() const { return value_; }

  const T& value_or(const T& other) const { return is_null_ ? other : value_; }

  void set(const T& value) {
    is_null_ = false;
    value_ = value;
  }

  void reset() {
    is_null_ = true;
    value_ = T();
  }

  bool operator==(const Nullable<T>& rhs) const {
    if (is_null_ || rhs.is_null_) return is_null_ == rhs.is_null_;
    return value_ == rhs.value_;
  }

  bool operator!=(const Nullable<T>& rhs) const { return !operator==(rhs); }

private:
  bool is_null_;
  T value_;
};

}} // namespace cequel::internal

#endif
