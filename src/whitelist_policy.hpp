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

#ifndef CEQUEL_INTERNAL_WHITELIST_POLICY_HPP
#define CEQUEL_INTERNAL_WHITELIST_POLICY_HPP

#include "load_balancing.hpp"
#include "utils.hpp"

namespace cequel { namespace internal { namespace core {

typedef Vector<String> ContactPointList;

class WhitelistPolicy : public ChainedLoadBalancingPolicy {
public:
  WhitelistPolicy(LoadBalancingPolicy* child_policy, const ContactPointList& hosts)
      : ChainedLoadBalancingPolicy(WHITELIST, child_policy)
      , hosts_(hosts) {}

  const ContactPointList& hosts() const { return hosts_; }

  virtual String to_string() const {
    return "Whitelist(hosts=" + implode(hosts_, ',') + ", " + child_to_string() + ")";
  }

private:
  ContactPointList hosts_;
};

}}} // namespace cequel::internal::core

#endif
