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

#ifndef UNIT_FAKE_DRIVER_HPP
#define UNIT_FAKE_DRIVER_HPP

#include "driver.hpp"
#include "map.hpp"
#include "string.hpp"
#include "vector.hpp"

#include <atomic>
#include <uv.h>

namespace fake {

using cequel::internal::Map;
using cequel::internal::Nullable;
using cequel::internal::String;
using cequel::internal::Vector;
using cequel::internal::core::Cluster;
using cequel::internal::core::ClusterSettings;
using cequel::internal::core::Error;
using cequel::internal::core::Request;
using cequel::internal::core::Response;
using cequel::internal::core::Session;

class FakeDriver;

/**
 * One request as the fake transport received it.
 */
struct ExecutedRequest {
  Request::ConstPtr request;
  CequelConsistency consistency;
  int session_id;
};

class FakeResponse : public Response {
public:
  explicit FakeResponse(const String& cql)
      : cql_(cql) {}

  const String& cql() const { return cql_; }

private:
  String cql_;
};

class FakeSession : public Session {
public:
  typedef cequel::internal::SharedRefPtr<FakeSession> Ptr;

  FakeSession(FakeDriver* driver, int id, const Nullable<String>& keyspace)
      : driver_(driver)
      , id_(id)
      , keyspace_(keyspace)
      , is_closed_(false) {}

  virtual Response::Ptr execute(const Request& request, CequelConsistency consistency,
                                Error* error);

  virtual void close();

  int id() const { return id_; }
  const Nullable<String>& keyspace() const { return keyspace_; }

private:
  FakeDriver* driver_;
  int id_;
  Nullable<String> keyspace_;
  std::atomic<bool> is_closed_;
};

class FakeCluster : public Cluster {
public:
  FakeCluster(FakeDriver* driver, const ClusterSettings& settings)
      : driver_(driver)
      , settings_(settings) {}

  virtual Session::Ptr connect(const Nullable<String>& keyspace, Error* error);

  virtual CequelError has_keyspace(const String& name, bool* exists, Error* error);

  virtual void close();

  const ClusterSettings& settings() const { return settings_; }

private:
  FakeDriver* driver_;
  ClusterSettings settings_;
};

/**
 * An in-memory transport. It records every cluster build, session connect
 * and executed request, and can be told to fail the next few operations
 * with a given error. All methods are safe to call from several threads.
 */
class FakeDriver : public cequel::internal::core::Driver {
public:
  typedef cequel::internal::SharedRefPtr<FakeDriver> Ptr;

  FakeDriver();
  virtual ~FakeDriver();

  virtual Cluster::Ptr build_cluster(const ClusterSettings& settings, Error* error);

  void fail_next_builds(int count, CequelError code);
  void fail_next_connects(int count, CequelError code);
  void fail_next_executes(int count, CequelError code);

  // Every session connected so far fails all further requests with
  // CEQUEL_ERROR_CONNECTION_CLOSED. Sessions connected later are healthy.
  void break_existing_sessions();

  // Sleep inside each execute() to widen race windows.
  void set_execute_delay_ms(unsigned delay_ms);

  void add_keyspace(const String& name);

  int build_count();
  int connect_count();
  int execute_count();
  int close_count();
  Vector<ClusterSettings> builds();
  Vector<ExecutedRequest> executed();
  ClusterSettings last_settings();

private:
  friend class FakeSession;
  friend class FakeCluster;

  struct Failure {
    Failure()
        : count(0)
        , code(CEQUEL_OK) {}

    bool take(Error* error, const char* operation);

    int count;
    CequelError code;
  };

  Session::Ptr on_connect(const Nullable<String>& keyspace, Error* error);
  Response::Ptr on_execute(int session_id, const Request& request,
                           CequelConsistency consistency, Error* error);
  CequelError on_has_keyspace(const String& name, bool* exists);
  void on_close();

private:
  uv_mutex_t mutex_;
  Failure build_failure_;
  Failure connect_failure_;
  Failure execute_failure_;
  int broken_through_session_id_;
  unsigned execute_delay_ms_;
  Vector<ClusterSettings> builds_;
  Vector<ExecutedRequest> executed_;
  Map<String, bool> keyspaces_;
  int connect_count_;
  int execute_count_;
  int close_count_;
};

} // namespace fake

#endif // UNIT_FAKE_DRIVER_HPP
