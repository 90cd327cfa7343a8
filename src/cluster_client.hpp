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

#ifndef CEQUEL_INTERNAL_CLUSTER_CLIENT_HPP
#define CEQUEL_INTERNAL_CLUSTER_CLIENT_HPP

#include "connection_config.hpp"
#include "driver.hpp"
#include "macros.hpp"

#include <uv.h>

namespace cequel { namespace internal { namespace core {

/**
 * The cached connection of one keyspace handle. Callers borrow the current
 * session per call; a connection failure invalidates it and the next borrow
 * rebuilds the cluster and session from the same configuration.
 *
 * Borrowing takes a read lock on the slot. Rebuilds are serialized by a
 * separate mutex and re-check the slot, so concurrent callers that all saw
 * the same failed session share a single rebuild.
 */
class ClusterClient {
public:
  ClusterClient(const Driver::Ptr& driver, const ConnectionConfig& config);
  ~ClusterClient();

  /**
   * The live session, built on first use or after invalidation.
   *
   * @return The session, or a null pointer with error filled when the
   * cluster could not be built or connected.
   */
  Session::Ptr current_handle(Error* error);

  /**
   * Drop the cached handle if it is still the given session. Ignored when
   * another caller already replaced it.
   *
   * @return true if the handle was dropped by this call.
   */
  bool invalidate(const Session::Ptr& failed);

  /**
   * Check that a keyspace exists using the cluster object only; the session
   * is not needed (and cannot be bound to a keyspace that doesn't exist).
   */
  CequelError exists(const String& keyspace, bool* exists, Error* error);

  // Drop the cached cluster and session unconditionally.
  void clear_active_connections();

  void close();

  // Number of completed cluster builds, for diagnostics.
  unsigned build_count() const;

private:
  Cluster::Ptr current_cluster(Error* error);
  CequelError rebuild(Error* error);
  void reset(Cluster::Ptr* cluster, Session::Ptr* session);

private:
  Driver::Ptr driver_;
  const ConnectionConfig& config_;

  mutable uv_rwlock_t rwlock_;
  uv_mutex_t build_mutex_;

  Cluster::Ptr cluster_;
  Session::Ptr session_;
  unsigned build_count_;

private:
  DISALLOW_COPY_AND_ASSIGN(ClusterClient);
};

}}} // namespace cequel::internal::core

#endif
