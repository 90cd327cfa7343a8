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

#ifndef CEQUEL_INTERNAL_VECTOR_HPP
#define CEQUEL_INTERNAL_VECTOR_HPP

#include <stddef.h>
#include <vector>

namespace cequel { namespace internal {

template <class T>
class Vector : public std::vector<T> {
public:
  Vector() {}

  explicit Vector(size_t count, const T& value = T())
      : std::vector<T>(count, value) {}

  Vector(const Vector& other)
      : std::vector<T>(other) {}

  Vector& operator=(const Vector& other) {
    std::vector<T>::operator=(other);
    return *this;
  }

  template <class InputIt>
  Vector(InputIt first, InputIt last)
      : std::vector<T>(first, last) {}
};

}} // namespace cequel::internal

#endif
