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

#ifndef CEQUEL_INTERNAL_CASSANDRA_DRIVER_HPP
#define CEQUEL_INTERNAL_CASSANDRA_DRIVER_HPP

#include "driver.hpp"
#include "load_balancing.hpp"
#include "ssl.hpp"

#include <cassandra.h>
#include <uv.h>

namespace cequel { namespace internal { namespace core {

class CassandraResponse : public Response {
public:
  typedef SharedRefPtr<CassandraResponse> Ptr;

  explicit CassandraResponse(const CassResult* result)
      : result_(result) {}

  ~CassandraResponse() {
    if (result_ != NULL) cass_result_free(result_);
  }

  const CassResult* result() const { return result_; }

  size_t row_count() const { return result_ != NULL ? cass_result_row_count(result_) : 0; }

private:
  const CassResult* result_;
};

class CassandraSession : public Session {
public:
  explicit CassandraSession(CassSession* session)
      : session_(session) {
    uv_rwlock_init(&rwlock_);
  }

  ~CassandraSession();

  virtual Response::Ptr execute(const Request& request, CequelConsistency consistency,
                                Error* error);

  virtual void close();

private:
  uv_rwlock_t rwlock_;
  CassSession* session_;
};

class CassandraCluster : public Cluster {
public:
  CassandraCluster(CassCluster* cluster, CassSsl* ssl)
      : cluster_(cluster)
      , ssl_(ssl)
      , metadata_session_(NULL) {
    uv_mutex_init(&mutex_);
  }

  ~CassandraCluster();

  virtual Session::Ptr connect(const Nullable<String>& keyspace, Error* error);

  virtual CequelError has_keyspace(const String& name, bool* exists, Error* error);

  virtual void close();

private:
  uv_mutex_t mutex_;
  CassCluster* cluster_;
  CassSsl* ssl_;
  CassSession* metadata_session_;
};

/**
 * Transport backed by the DataStax C/C++ driver.
 */
class CassandraDriver : public Driver {
public:
  CassandraDriver() {}

  virtual Cluster::Ptr build_cluster(const ClusterSettings& settings, Error* error);

  // Route the driver's own log messages through the cequel logger.
  static void forward_logging();

  // Map a driver error code onto the cequel error taxonomy.
  static CequelError translate_error(CassError rc);

private:
  static CequelError apply_policy(CassCluster* cluster, const LoadBalancingPolicy::Ptr& policy,
                                  Error* error);
  static CequelError apply_child_policy(CassCluster* cluster,
                                        const LoadBalancingPolicy::Ptr& policy, Error* error);
  static CequelError apply_passthrough(CassCluster* cluster, const Options& options,
                                       Error* error);
  static CequelError apply_ssl(CassCluster* cluster, const SslConfig& config, CassSsl** ssl,
                               Error* error);
};

}}} // namespace cequel::internal::core

#endif
