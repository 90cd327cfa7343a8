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

#ifndef CEQUEL_INTERNAL_KEYSPACE_HPP
#define CEQUEL_INTERNAL_KEYSPACE_HPP

#include "batch.hpp"
#include "cluster_client.hpp"
#include "connection_config.hpp"
#include "driver.hpp"
#include "executor.hpp"
#include "macros.hpp"
#include "ref_counted.hpp"
#include "statement.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * A handle on one keyspace of a cluster. It owns the configuration and the
 * cached connection; every statement and batch goes through it.
 */
class Keyspace : public RefCounted<Keyspace> {
public:
  typedef SharedRefPtr<Keyspace> Ptr;

  /**
   * Validate the options and create a handle. No connection is made until
   * the first request.
   */
  static CequelError connect(const Driver::Ptr& driver, const Options& options,
                             Keyspace::Ptr* keyspace, Error* error = NULL);

  static Keyspace::Ptr connect(const Driver::Ptr& driver, const ConnectionConfig& config);

  ~Keyspace();

  const Nullable<String>& name() const { return config_.keyspace(); }
  const ConnectionConfig& config() const { return config_; }
  const Nullable<String>& datacenter() const { return config_.datacenter(); }
  const Nullable<int>& connections_per_remote_node() const {
    return config_.connections_per_remote_node();
  }
  const LoadBalancingPolicy::Ptr& load_balancing_policy() const {
    return config_.load_balancing_policy();
  }
  const SslConfig& ssl_config() const { return config_.ssl_config(); }
  CequelConsistency default_consistency() const { return config_.default_consistency(); }

  // The current session, connecting if needed.
  Session::Ptr client(Error* error) { return client_.current_handle(error); }

  Response::Ptr execute(const Statement::ConstPtr& statement, Error* error) {
    return executor_.execute(*statement, CEQUEL_CONSISTENCY_UNKNOWN, error);
  }

  Response::Ptr execute(const Statement::ConstPtr& statement, CequelConsistency consistency,
                        Error* error) {
    return executor_.execute(*statement, consistency, error);
  }

  /**
   * Check whether the configured keyspace exists on the cluster. A missing
   * keyspace is a normal false result.
   */
  CequelError exists(bool* exists, Error* error);

  /**
   * Run body(Batch*) and apply the batch when it returns CEQUEL_OK. When the
   * body fails (returns an error or throws), statements still buffered are
   * discarded.
   *
   * @return CEQUEL_OK, the body's error, or the error of a flush.
   */
  template <class Body>
  CequelError batch(const BatchOptions& options, Body body, Error* error);

  void clear_active_connections() { client_.clear_active_connections(); }

  void close() { client_.close(); }

  ClusterClient& cluster_client() { return client_; }

private:
  Keyspace(const Driver::Ptr& driver, const ConnectionConfig& config);

private:
  ConnectionConfig config_;
  ClusterClient client_;
  Executor executor_;

private:
  DISALLOW_COPY_AND_ASSIGN(Keyspace);
};

template <class Body>
CequelError Keyspace::batch(const BatchOptions& options, Body body, Error* error) {
  CequelError rc = Batch::validate(options, error);
  if (rc != CEQUEL_OK) return rc;

  Batch batch(&executor_, options);
  ScopedBatch scoped(&batch);

  rc = body(scoped.get());
  if (rc != CEQUEL_OK) {
    if (error != NULL && error->code != rc) {
      set_error(error, rc, "Batch body failed");
    }
    return rc;
  }

  return scoped.commit(error);
}

}}} // namespace cequel::internal::core

#endif
