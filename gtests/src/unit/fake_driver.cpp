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

#include "fake_driver.hpp"

#include "scoped_lock.hpp"

#include <time.h>

using namespace cequel::internal;
using namespace cequel::internal::core;
using namespace fake;

static void msleep(unsigned int milliseconds) {
  struct timespec requested;
  requested.tv_sec = static_cast<time_t>(milliseconds / 1000);
  requested.tv_nsec = static_cast<long>((milliseconds % 1000) * 1000000);
  while (nanosleep(&requested, &requested) == -1) {
  }
}

Response::Ptr FakeSession::execute(const Request& request, CequelConsistency consistency,
                                   Error* error) {
  if (is_closed_) {
    set_error(error, CEQUEL_ERROR_CONNECTION_CLOSED, "Session is closed");
    return Response::Ptr();
  }
  return driver_->on_execute(id_, request, consistency, error);
}

void FakeSession::close() {
  if (!is_closed_.exchange(true)) {
    driver_->on_close();
  }
}

Session::Ptr FakeCluster::connect(const Nullable<String>& keyspace, Error* error) {
  return driver_->on_connect(keyspace, error);
}

CequelError FakeCluster::has_keyspace(const String& name, bool* exists, Error* error) {
  *exists = false;
  return driver_->on_has_keyspace(name, exists);
}

void FakeCluster::close() { driver_->on_close(); }

bool FakeDriver::Failure::take(Error* error, const char* operation) {
  if (count <= 0) return false;
  --count;
  set_error(error, code, String("Injected ") + operation + " failure");
  return true;
}

FakeDriver::FakeDriver()
    : broken_through_session_id_(0)
    , execute_delay_ms_(0)
    , connect_count_(0)
    , execute_count_(0)
    , close_count_(0) {
  uv_mutex_init(&mutex_);
}

FakeDriver::~FakeDriver() { uv_mutex_destroy(&mutex_); }

Cluster::Ptr FakeDriver::build_cluster(const ClusterSettings& settings, Error* error) {
  ScopedMutex l(&mutex_);
  if (build_failure_.take(error, "build")) {
    return Cluster::Ptr();
  }
  builds_.push_back(settings);
  return Cluster::Ptr(new FakeCluster(this, settings));
}

void FakeDriver::fail_next_builds(int count, CequelError code) {
  ScopedMutex l(&mutex_);
  build_failure_.count = count;
  build_failure_.code = code;
}

void FakeDriver::fail_next_connects(int count, CequelError code) {
  ScopedMutex l(&mutex_);
  connect_failure_.count = count;
  connect_failure_.code = code;
}

void FakeDriver::fail_next_executes(int count, CequelError code) {
  ScopedMutex l(&mutex_);
  execute_failure_.count = count;
  execute_failure_.code = code;
}

void FakeDriver::break_existing_sessions() {
  ScopedMutex l(&mutex_);
  broken_through_session_id_ = connect_count_;
}

void FakeDriver::set_execute_delay_ms(unsigned delay_ms) {
  ScopedMutex l(&mutex_);
  execute_delay_ms_ = delay_ms;
}

void FakeDriver::add_keyspace(const String& name) {
  ScopedMutex l(&mutex_);
  keyspaces_[name] = true;
}

int FakeDriver::build_count() {
  ScopedMutex l(&mutex_);
  return static_cast<int>(builds_.size());
}

int FakeDriver::connect_count() {
  ScopedMutex l(&mutex_);
  return connect_count_;
}

int FakeDriver::execute_count() {
  ScopedMutex l(&mutex_);
  return execute_count_;
}

int FakeDriver::close_count() {
  ScopedMutex l(&mutex_);
  return close_count_;
}

Vector<ClusterSettings> FakeDriver::builds() {
  ScopedMutex l(&mutex_);
  return builds_;
}

Vector<ExecutedRequest> FakeDriver::executed() {
  ScopedMutex l(&mutex_);
  return executed_;
}

ClusterSettings FakeDriver::last_settings() {
  ScopedMutex l(&mutex_);
  return builds_.empty() ? ClusterSettings() : builds_.back();
}

Session::Ptr FakeDriver::on_connect(const Nullable<String>& keyspace, Error* error) {
  ScopedMutex l(&mutex_);
  if (connect_failure_.take(error, "connect")) {
    return Session::Ptr();
  }
  return Session::Ptr(new FakeSession(this, ++connect_count_, keyspace));
}

Response::Ptr FakeDriver::on_execute(int session_id, const Request& request,
                                     CequelConsistency consistency, Error* error) {
  unsigned delay_ms;
  {
    ScopedMutex l(&mutex_);
    ++execute_count_;
    delay_ms = execute_delay_ms_;
  }

  if (delay_ms > 0) msleep(delay_ms);

  ScopedMutex l(&mutex_);
  if (session_id <= broken_through_session_id_) {
    set_error(error, CEQUEL_ERROR_CONNECTION_CLOSED, "Connection reset by peer");
    return Response::Ptr();
  }
  if (execute_failure_.take(error, "execute")) {
    return Response::Ptr();
  }

  ExecutedRequest executed;
  executed.request.reset(&request);
  executed.consistency = consistency;
  executed.session_id = session_id;
  executed_.push_back(executed);

  return Response::Ptr(new FakeResponse(request.to_cql()));
}

CequelError FakeDriver::on_has_keyspace(const String& name, bool* exists) {
  ScopedMutex l(&mutex_);
  *exists = keyspaces_.find(name) != keyspaces_.end();
  return CEQUEL_OK;
}

void FakeDriver::on_close() {
  ScopedMutex l(&mutex_);
  ++close_count_;
}
