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

#include "policy_builder.hpp"

#include "dc_aware_policy.hpp"
#include "logger.hpp"
#include "token_aware_policy.hpp"

using namespace cequel::internal;
using namespace cequel::internal::core;

LoadBalancingPolicy::Ptr PolicyBuilder::build(const Nullable<String>& datacenter,
                                              const LoadBalancingPolicy::Ptr& explicit_policy) {
  if (explicit_policy) {
    if (!datacenter.is_null()) {
      LOG_DEBUG("Ignoring datacenter '%s' in favor of the explicit load balancing policy %s",
                datacenter.value().c_str(), explicit_policy->to_string().c_str());
    }
    return explicit_policy;
  }

  if (!datacenter.is_null()) {
    return LoadBalancingPolicy::Ptr(new TokenAwarePolicy(new DCAwarePolicy(datacenter.value())));
  }

  return LoadBalancingPolicy::Ptr();
}
