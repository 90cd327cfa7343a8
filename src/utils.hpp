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

#ifndef CEQUEL_INTERNAL_UTILS_HPP
#define CEQUEL_INTERNAL_UTILS_HPP

#include "string.hpp"
#include "vector.hpp"

#include <stddef.h>

namespace cequel { namespace internal {

template <class T, size_t N>
inline size_t num_elements(T (&)[N]) {
  return N;
}

void explode(const String& str, Vector<String>& vec, const char delimiter = ',');

String implode(const Vector<String>& vec, const char delimiter = ' ');

String& trim(String& str);

String& to_upper(String& str);

bool iequals(const String& lhs, const String& rhs);

}} // namespace cequel::internal

#endif
