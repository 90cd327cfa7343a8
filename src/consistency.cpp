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

#include "consistency.hpp"

#include "utils.hpp"

namespace cequel { namespace internal { namespace core {

bool consistency_from_string(const String& name, CequelConsistency* consistency) {
  static const CequelConsistency levels[] = {
    CEQUEL_CONSISTENCY_ANY,          CEQUEL_CONSISTENCY_ONE,          CEQUEL_CONSISTENCY_TWO,
    CEQUEL_CONSISTENCY_THREE,        CEQUEL_CONSISTENCY_QUORUM,       CEQUEL_CONSISTENCY_ALL,
    CEQUEL_CONSISTENCY_LOCAL_QUORUM, CEQUEL_CONSISTENCY_EACH_QUORUM,  CEQUEL_CONSISTENCY_SERIAL,
    CEQUEL_CONSISTENCY_LOCAL_SERIAL, CEQUEL_CONSISTENCY_LOCAL_ONE
  };

  for (size_t i = 0; i < num_elements(levels); ++i) {
    if (iequals(name, cequel_consistency_string(levels[i]))) {
      *consistency = levels[i];
      return true;
    }
  }
  return false;
}

}}} // namespace cequel::internal::core
