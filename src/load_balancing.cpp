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

#include "load_balancing.hpp"

namespace cequel { namespace internal { namespace core {

String ChainedLoadBalancingPolicy::child_to_string() const {
  return child_policy_ ? child_policy_->to_string() : String("null");
}

const char* load_balancing_type_string(LoadBalancingPolicy::Type type) {
  switch (type) {
    case LoadBalancingPolicy::ROUND_ROBIN:
      return "round_robin";
    case LoadBalancingPolicy::DC_AWARE:
      return "dc_aware";
    case LoadBalancingPolicy::TOKEN_AWARE:
      return "token_aware";
    case LoadBalancingPolicy::WHITELIST:
      return "whitelist";
  }
  return "";
}

}}} // namespace cequel::internal::core
