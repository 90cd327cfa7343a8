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

#ifndef CEQUEL_INTERNAL_DRIVER_HPP
#define CEQUEL_INTERNAL_DRIVER_HPP

#include "cequel.h"
#include "connection_config.hpp"
#include "error.hpp"
#include "macros.hpp"
#include "nullable.hpp"
#include "ref_counted.hpp"
#include "request.hpp"
#include "response.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * A connected session bound to (at most) one keyspace. Sessions must allow
 * concurrent execute() calls.
 */
class Session : public RefCounted<Session> {
public:
  typedef SharedRefPtr<Session> Ptr;

  Session() {}
  virtual ~Session() {}

  /**
   * Execute one request as a blocking round trip.
   *
   * @param request A statement or a batch.
   * @param consistency The level to use, or CEQUEL_CONSISTENCY_UNKNOWN
   * for the session default.
   * @param error Filled when a null response is returned.
   * @return The transport's response or a null pointer on failure.
   */
  virtual Response::Ptr execute(const Request& request, CequelConsistency consistency,
                                Error* error) = 0;

  virtual void close() = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(Session);
};

class Cluster : public RefCounted<Cluster> {
public:
  typedef SharedRefPtr<Cluster> Ptr;

  Cluster() {}
  virtual ~Cluster() {}

  // Connect a session, bound to the keyspace when one is given.
  virtual Session::Ptr connect(const Nullable<String>& keyspace, Error* error) = 0;

  /**
   * Check the cluster's schema for a keyspace. An unknown keyspace is not an
   * error.
   *
   * @return CEQUEL_OK with *exists filled, or the failure that prevented
   * the check.
   */
  virtual CequelError has_keyspace(const String& name, bool* exists, Error* error) = 0;

  virtual void close() = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(Cluster);
};

class Driver : public RefCounted<Driver> {
public:
  typedef SharedRefPtr<Driver> Ptr;

  Driver() {}
  virtual ~Driver() {}

  // Returns a null pointer and fills error when the settings are rejected.
  virtual Cluster::Ptr build_cluster(const ClusterSettings& settings, Error* error) = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(Driver);
};

}}} // namespace cequel::internal::core

#endif
