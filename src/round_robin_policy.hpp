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

#ifndef CEQUEL_INTERNAL_ROUND_ROBIN_POLICY_HPP
#define CEQUEL_INTERNAL_ROUND_ROBIN_POLICY_HPP

#include "load_balancing.hpp"

namespace cequel { namespace internal { namespace core {

class RoundRobinPolicy : public LoadBalancingPolicy {
public:
  RoundRobinPolicy()
      : LoadBalancingPolicy(ROUND_ROBIN) {}

  virtual String to_string() const { return "RoundRobin"; }
};

}}} // namespace cequel::internal::core

#endif
