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

#ifndef CEQUEL_INTERNAL_EXECUTOR_HPP
#define CEQUEL_INTERNAL_EXECUTOR_HPP

#include "cluster_client.hpp"
#include "connection_config.hpp"
#include "error.hpp"
#include "macros.hpp"
#include "request.hpp"
#include "response.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * Sends requests through the cluster client. A connection error invalidates
 * the session it happened on and the request is sent once more on a rebuilt
 * session; any other error is returned as is.
 */
class Executor {
public:
  static const int MAX_RETRIES = 1;

  Executor(ClusterClient* client, const ConnectionConfig& config)
      : client_(client)
      , config_(config) {}

  /**
   * @param consistency The batch or caller level; CEQUEL_CONSISTENCY_UNKNOWN
   * if there is none.
   * @return The transport's response, or a null pointer with error filled.
   */
  Response::Ptr execute(const Request& request, CequelConsistency consistency, Error* error);

  // Request level, then the given level, then the configured default.
  CequelConsistency resolve_consistency(const Request& request,
                                        CequelConsistency consistency) const;

private:
  void log_request(const Request& request, CequelConsistency consistency,
                   uint64_t elapsed_ns) const;

private:
  ClusterClient* client_;
  const ConnectionConfig& config_;

private:
  DISALLOW_COPY_AND_ASSIGN(Executor);
};

}}} // namespace cequel::internal::core

#endif
