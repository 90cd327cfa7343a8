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

#include "executor.hpp"

#include "batch_request.hpp"
#include "get_time.hpp"
#include "logger.hpp"
#include "statement.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

const int Executor::MAX_RETRIES;

static ValueVec request_values(const Request& request) {
  if (request.type() == Request::BATCH) {
    return static_cast<const BatchRequest&>(request).values();
  }
  return static_cast<const Statement&>(request).values();
}

CequelConsistency Executor::resolve_consistency(const Request& request,
                                                CequelConsistency consistency) const {
  if (request.has_consistency()) return request.consistency();
  if (is_consistency_set(consistency)) return consistency;
  return config_.default_consistency();
}

Response::Ptr Executor::execute(const Request& request, CequelConsistency consistency,
                                Error* error) {
  CequelConsistency resolved = resolve_consistency(request, consistency);

  Error last_error;
  for (int attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
    if (attempt > 0) {
      LOG_WARN("Retrying request after connection error: %s", last_error.to_string().c_str());
    }
    last_error.reset();

    Session::Ptr session(client_->current_handle(&last_error));
    if (!session) {
      if (last_error.ok()) {
        last_error = Error(CEQUEL_ERROR_CONNECTION_UNABLE_TO_CONNECT, "No session available");
      }
      if (!last_error.is_connection_error()) break;
      continue;
    }

    uint64_t start = get_time_monotonic_ns();
    Response::Ptr response(session->execute(request, resolved, &last_error));
    uint64_t elapsed = get_time_monotonic_ns() - start;

    if (response) {
      log_request(request, resolved, elapsed);
      return response;
    }

    if (last_error.ok()) {
      last_error = Error(CEQUEL_ERROR_LIB_DRIVER_ERROR, "Transport returned no response");
    }
    if (!last_error.is_connection_error()) break;

    client_->invalidate(session);
  }

  LOG_ERROR("Request failed: %s (%s)", last_error.to_string().c_str(),
            request.to_cql().c_str());
  set_error(error, last_error);
  return Response::Ptr();
}

void Executor::log_request(const Request& request, CequelConsistency consistency,
                           uint64_t elapsed_ns) const {
  uint64_t elapsed_ms = elapsed_ns / NANOSECONDS_PER_MILLISECOND;
  const Nullable<int64_t>& threshold = config_.slowlog_threshold_ms();

  if (!threshold.is_null() && elapsed_ms >= static_cast<uint64_t>(threshold.value())) {
    LOG_WARN("Slow query (%llu ms) at consistency %s: %s %s",
             static_cast<unsigned long long>(elapsed_ms), cequel_consistency_string(consistency),
             request.to_cql().c_str(), values_to_string(request_values(request)).c_str());
  } else if (Logger::log_level() >= CEQUEL_LOG_DEBUG) {
    LOG_DEBUG("%s %s at consistency %s (%.1f ms)", request.to_cql().c_str(),
              values_to_string(request_values(request)).c_str(),
              cequel_consistency_string(consistency),
              static_cast<double>(elapsed_ns) / NANOSECONDS_PER_MILLISECOND);
  }
}
