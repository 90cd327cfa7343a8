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

#ifndef CEQUEL_INTERNAL_DC_AWARE_POLICY_HPP
#define CEQUEL_INTERNAL_DC_AWARE_POLICY_HPP

#include "load_balancing.hpp"

#include <stddef.h>

namespace cequel { namespace internal { namespace core {

class DCAwarePolicy : public LoadBalancingPolicy {
public:
  DCAwarePolicy(const String& local_dc = "", size_t used_hosts_per_remote_dc = 0,
                bool skip_remote_dcs_for_local_cl = true)
      : LoadBalancingPolicy(DC_AWARE)
      , local_dc_(local_dc)
      , used_hosts_per_remote_dc_(used_hosts_per_remote_dc)
      , skip_remote_dcs_for_local_cl_(skip_remote_dcs_for_local_cl) {}

  const String& local_dc() const { return local_dc_; }
  size_t used_hosts_per_remote_dc() const { return used_hosts_per_remote_dc_; }
  bool skip_remote_dcs_for_local_cl() const { return skip_remote_dcs_for_local_cl_; }

  virtual String to_string() const {
    OStringStream ss;
    ss << "DCAware(local_dc=" << local_dc_;
    if (used_hosts_per_remote_dc_ > 0) {
      ss << ", used_hosts_per_remote_dc=" << used_hosts_per_remote_dc_;
    }
    if (!skip_remote_dcs_for_local_cl_) {
      ss << ", allow_remote_dcs_for_local_cl=true";
    }
    ss << ")";
    return ss.str();
  }

private:
  String local_dc_;
  size_t used_hosts_per_remote_dc_;
  bool skip_remote_dcs_for_local_cl_;
};

}}} // namespace cequel::internal::core

#endif
