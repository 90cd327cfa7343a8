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

#include "cluster_client.hpp"

#include "logger.hpp"
#include "scoped_lock.hpp"
#include "utils.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

ClusterClient::ClusterClient(const Driver::Ptr& driver, const ConnectionConfig& config)
    : driver_(driver)
    , config_(config)
    , build_count_(0) {
  uv_rwlock_init(&rwlock_);
  uv_mutex_init(&build_mutex_);
}

ClusterClient::~ClusterClient() {
  close();
  uv_mutex_destroy(&build_mutex_);
  uv_rwlock_destroy(&rwlock_);
}

Session::Ptr ClusterClient::current_handle(Error* error) {
  { // Fast path: borrow the current session
    ScopedReadLock rl(&rwlock_);
    if (session_) return session_;
  }

  ScopedMutex l(&build_mutex_);
  { // Another caller may have finished a rebuild while we waited
    ScopedReadLock rl(&rwlock_);
    if (session_) return session_;
  }

  if (rebuild(error) != CEQUEL_OK) {
    return Session::Ptr();
  }

  ScopedReadLock rl(&rwlock_);
  return session_;
}

Cluster::Ptr ClusterClient::current_cluster(Error* error) {
  {
    ScopedReadLock rl(&rwlock_);
    if (cluster_) return cluster_;
  }

  ScopedMutex l(&build_mutex_);
  {
    ScopedReadLock rl(&rwlock_);
    if (cluster_) return cluster_;
  }

  ClusterSettings settings(config_.cluster_settings());
  Cluster::Ptr cluster(driver_->build_cluster(settings, error));
  if (!cluster) {
    return Cluster::Ptr();
  }

  ScopedWriteLock wl(&rwlock_);
  cluster_ = cluster;
  ++build_count_;
  return cluster_;
}

// Must be called with build_mutex_ held.
CequelError ClusterClient::rebuild(Error* error) {
  Cluster::Ptr cluster;
  {
    ScopedReadLock rl(&rwlock_);
    cluster = cluster_;
  }

  bool is_new_cluster = false;
  if (!cluster) {
    ClusterSettings settings(config_.cluster_settings());
    LOG_DEBUG("Building cluster for %s:%d (load balancing: %s)",
              implode(settings.hosts, ',').c_str(), settings.port,
              settings.load_balancing_policy
                  ? settings.load_balancing_policy->to_string().c_str()
                  : "default");
    Error build_error;
    cluster = driver_->build_cluster(settings, &build_error);
    if (!cluster) {
      LOG_ERROR("Unable to build cluster: %s", build_error.to_string().c_str());
      return set_error(error, build_error);
    }
    is_new_cluster = true;
  }

  Error connect_error;
  Session::Ptr session(cluster->connect(config_.keyspace(), &connect_error));
  if (!session) {
    LOG_ERROR("Unable to connect session: %s", connect_error.to_string().c_str());
    // A cluster whose session can't connect is rebuilt from scratch next time
    cluster->close();
    ScopedWriteLock wl(&rwlock_);
    if (cluster_ == cluster) cluster_.reset();
    return set_error(error, connect_error);
  }

  LOG_INFO("Connected session%s%s", config_.keyspace().is_null() ? "" : " to keyspace ",
           config_.keyspace().value_or("").c_str());

  ScopedWriteLock wl(&rwlock_);
  cluster_ = cluster;
  session_ = session;
  if (is_new_cluster) ++build_count_;
  return CEQUEL_OK;
}

bool ClusterClient::invalidate(const Session::Ptr& failed) {
  Cluster::Ptr cluster;
  Session::Ptr session;
  {
    ScopedWriteLock wl(&rwlock_);
    if (!session_ || session_ != failed) {
      LOG_DEBUG("Ignoring invalidation of a session that is no longer current");
      return false;
    }
    reset(&cluster, &session);
  }

  LOG_INFO("Invalidated cluster connection; it will be rebuilt on next use");
  if (session) session->close();
  if (cluster) cluster->close();
  return true;
}

CequelError ClusterClient::exists(const String& keyspace, bool* exists, Error* error) {
  Error build_error;
  Cluster::Ptr cluster(current_cluster(&build_error));
  if (!cluster) {
    LOG_ERROR("Unable to build cluster: %s", build_error.to_string().c_str());
    return set_error(error, build_error);
  }
  return cluster->has_keyspace(keyspace, exists, error);
}

void ClusterClient::clear_active_connections() {
  Cluster::Ptr cluster;
  Session::Ptr session;
  {
    ScopedMutex l(&build_mutex_);
    ScopedWriteLock wl(&rwlock_);
    reset(&cluster, &session);
  }
  if (session) session->close();
  if (cluster) cluster->close();
}

void ClusterClient::close() { clear_active_connections(); }

unsigned ClusterClient::build_count() const {
  ScopedReadLock rl(&rwlock_);
  return build_count_;
}

// Must be called with rwlock_ held for writing. The handles are closed by the
// caller after the lock is released.
void ClusterClient::reset(Cluster::Ptr* cluster, Session::Ptr* session) {
  *cluster = cluster_;
  *session = session_;
  cluster_.reset();
  session_.reset();
}
