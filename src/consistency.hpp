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

#ifndef CEQUEL_INTERNAL_CONSISTENCY_HPP
#define CEQUEL_INTERNAL_CONSISTENCY_HPP

#include "cequel.h"
#include "string.hpp"

namespace cequel { namespace internal { namespace core {

// Accepts the names produced by cequel_consistency_string(), in any case
// (e.g. "local_quorum"). "UNKNOWN" is not a valid name.
bool consistency_from_string(const String& name, CequelConsistency* consistency);

inline bool is_consistency_set(CequelConsistency consistency) {
  return consistency != CEQUEL_CONSISTENCY_UNKNOWN;
}

}}} // namespace cequel::internal::core

#endif
