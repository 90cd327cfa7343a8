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

#ifndef CEQUEL_INTERNAL_POLICY_BUILDER_HPP
#define CEQUEL_INTERNAL_POLICY_BUILDER_HPP

#include "load_balancing.hpp"
#include "nullable.hpp"

namespace cequel { namespace internal { namespace core {

class PolicyBuilder {
public:
  /**
   * Compose the load balancing policy used for a cluster build.
   *
   * @param datacenter Local datacenter hint; unset when not configured.
   * @param explicit_policy Caller supplied policy; returned unchanged when
   * present, regardless of the datacenter hint.
   * @return A token-aware policy wrapping a DC-aware policy scoped to
   * the datacenter, the explicit policy, or a null pointer when neither is
   * configured (the transport's default applies).
   */
  static LoadBalancingPolicy::Ptr build(const Nullable<String>& datacenter,
                                        const LoadBalancingPolicy::Ptr& explicit_policy);

private:
  PolicyBuilder();
};

}}} // namespace cequel::internal::core

#endif
