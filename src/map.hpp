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

#ifndef CEQUEL_INTERNAL_MAP_HPP
#define CEQUEL_INTERNAL_MAP_HPP

#include <functional>
#include <map>

namespace cequel { namespace internal {

template <class K, class V, class Compare = std::less<K> >
class Map : public std::map<K, V, Compare> {
public:
  explicit Map(const Compare& compare = Compare())
      : std::map<K, V, Compare>(compare) {}

  Map(const Map& other)
      : std::map<K, V, Compare>(other) {}

  Map& operator=(const Map& other) {
    std::map<K, V, Compare>::operator=(other);
    return *this;
  }

  template <class InputIt>
  Map(InputIt first, InputIt last, const Compare& compare = Compare())
      : std::map<K, V, Compare>(first, last, compare) {}
};

}} // namespace cequel::internal

#endif
