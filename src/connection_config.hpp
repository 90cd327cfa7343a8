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

#ifndef CEQUEL_INTERNAL_CONNECTION_CONFIG_HPP
#define CEQUEL_INTERNAL_CONNECTION_CONFIG_HPP

#include "cequel.h"
#include "error.hpp"
#include "load_balancing.hpp"
#include "nullable.hpp"
#include "options.hpp"
#include "string.hpp"
#include "vector.hpp"

#include <stdint.h>

#define CEQUEL_DEFAULT_HOST "127.0.0.1"
#define CEQUEL_DEFAULT_PORT 9042

namespace cequel { namespace internal { namespace core {

/**
 * TLS settings exactly as configured. The paths are only meaningful when
 * ssl is true; unset fields stay unset.
 */
struct SslConfig {
  SslConfig()
      : ssl(false) {}

  bool ssl;
  Nullable<String> server_cert;
  Nullable<String> client_cert;
  Nullable<String> private_key;
  Nullable<String> passphrase;

  bool operator==(const SslConfig& other) const {
    return ssl == other.ssl && server_cert == other.server_cert &&
           client_cert == other.client_cert && private_key == other.private_key &&
           passphrase == other.passphrase;
  }
};

/**
 * Everything a transport needs to build a cluster object. Unset settings are
 * left null so the transport's own defaults apply.
 */
struct ClusterSettings {
  ClusterSettings()
      : port(CEQUEL_DEFAULT_PORT) {}

  Vector<String> hosts;
  int port;
  Nullable<String> keyspace;
  Nullable<String> username;
  Nullable<String> password;
  SslConfig ssl;
  Nullable<String> datacenter;
  Nullable<int> connections_per_remote_node;
  LoadBalancingPolicy::Ptr load_balancing_policy;
  Options passthrough;
};

class ConnectionConfig {
public:
  ConnectionConfig();

  /**
   * Resolve and validate connect-time options. Unrecognized options are
   * kept as passthrough options for the transport.
   *
   * @return CEQUEL_OK or CEQUEL_ERROR_LIB_INVALID_CONFIGURATION with a
   * message naming the offending option.
   */
  static CequelError from_options(const Options& options, ConnectionConfig* config,
                                  Error* error = NULL);

  static CequelError from_json(const String& json, ConnectionConfig* config,
                               Error* error = NULL);

  const String& host() const { return host_; }
  const Vector<String>& hosts() const { return hosts_; }
  int port() const { return port_; }
  const Nullable<String>& keyspace() const { return keyspace_; }
  const Nullable<String>& username() const { return username_; }
  const Nullable<String>& password() const { return password_; }
  const SslConfig& ssl_config() const { return ssl_config_; }
  const Nullable<String>& datacenter() const { return datacenter_; }
  const Nullable<int>& connections_per_remote_node() const {
    return connections_per_remote_node_;
  }
  const LoadBalancingPolicy::Ptr& load_balancing_policy() const {
    return load_balancing_policy_;
  }
  CequelConsistency default_consistency() const { return default_consistency_; }
  const Nullable<int64_t>& slowlog_threshold_ms() const { return slowlog_threshold_ms_; }
  const Options& passthrough() const { return passthrough_; }

  // Builds a fresh policy descriptor on every call.
  ClusterSettings cluster_settings() const;

private:
  String host_;
  Vector<String> hosts_;
  int port_;
  Nullable<String> keyspace_;
  Nullable<String> username_;
  Nullable<String> password_;
  SslConfig ssl_config_;
  Nullable<String> datacenter_;
  Nullable<int> connections_per_remote_node_;
  LoadBalancingPolicy::Ptr load_balancing_policy_;
  CequelConsistency default_consistency_;
  Nullable<int64_t> slowlog_threshold_ms_;
  Options passthrough_;
};

}}} // namespace cequel::internal::core

#endif
