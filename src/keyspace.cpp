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

#include "keyspace.hpp"

#include "logger.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

Keyspace::Keyspace(const Driver::Ptr& driver, const ConnectionConfig& config)
    : config_(config)
    , client_(driver, config_)
    , executor_(&client_, config_) {}

Keyspace::~Keyspace() { close(); }

CequelError Keyspace::connect(const Driver::Ptr& driver, const Options& options,
                              Keyspace::Ptr* keyspace, Error* error) {
  ConnectionConfig config;
  CequelError rc = ConnectionConfig::from_options(options, &config, error);
  if (rc != CEQUEL_OK) return rc;
  *keyspace = connect(driver, config);
  return CEQUEL_OK;
}

Keyspace::Ptr Keyspace::connect(const Driver::Ptr& driver, const ConnectionConfig& config) {
  return Keyspace::Ptr(new Keyspace(driver, config));
}

CequelError Keyspace::exists(bool* exists, Error* error) {
  if (config_.keyspace().is_null()) {
    return set_error(error, CEQUEL_ERROR_LIB_BAD_PARAMS, "No keyspace configured");
  }
  return client_.exists(config_.keyspace().value(), exists, error);
}
