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

#ifndef CEQUEL_INTERNAL_LOAD_BALANCING_HPP
#define CEQUEL_INTERNAL_LOAD_BALANCING_HPP

#include "macros.hpp"
#include "ref_counted.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * Describes how the transport should route requests. Host selection itself
 * happens inside the transport; these objects only carry the settings to it
 * and are never mutated after construction.
 */
class LoadBalancingPolicy : public RefCounted<LoadBalancingPolicy> {
public:
  typedef SharedRefPtr<LoadBalancingPolicy> Ptr;
  typedef Vector<Ptr> Vec;

  enum Type { ROUND_ROBIN, DC_AWARE, TOKEN_AWARE, WHITELIST };

  LoadBalancingPolicy(Type type)
      : type_(type) {}

  virtual ~LoadBalancingPolicy() {}

  Type type() const { return type_; }

  // e.g. "TokenAware(DCAware(local_dc=dc1))"
  virtual String to_string() const = 0;

private:
  Type type_;

private:
  DISALLOW_COPY_AND_ASSIGN(LoadBalancingPolicy);
};

class ChainedLoadBalancingPolicy : public LoadBalancingPolicy {
public:
  ChainedLoadBalancingPolicy(Type type, LoadBalancingPolicy* child_policy)
      : LoadBalancingPolicy(type)
      , child_policy_(child_policy) {}

  virtual ~ChainedLoadBalancingPolicy() {}

  const LoadBalancingPolicy::Ptr& child_policy() const { return child_policy_; }

protected:
  String child_to_string() const;

protected:
  LoadBalancingPolicy::Ptr child_policy_;
};

const char* load_balancing_type_string(LoadBalancingPolicy::Type type);

}}} // namespace cequel::internal::core

#endif
