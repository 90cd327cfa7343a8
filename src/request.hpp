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

#ifndef CEQUEL_INTERNAL_REQUEST_HPP
#define CEQUEL_INTERNAL_REQUEST_HPP

#include "cequel.h"
#include "consistency.hpp"
#include "macros.hpp"
#include "ref_counted.hpp"
#include "string.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * A unit sent to the cluster in one round trip: a single statement or a
 * batch of write statements. Requests are immutable once built.
 */
class Request : public RefCounted<Request> {
public:
  typedef SharedRefPtr<const Request> ConstPtr;

  enum Type { STATEMENT, BATCH };

  Request(Type type, CequelConsistency consistency)
      : type_(type)
      , consistency_(consistency) {}

  virtual ~Request() {}

  Type type() const { return type_; }

  // CEQUEL_CONSISTENCY_UNKNOWN when no level was attached
  CequelConsistency consistency() const { return consistency_; }

  bool has_consistency() const { return is_consistency_set(consistency_); }

  virtual String to_cql() const = 0;

private:
  Type type_;
  CequelConsistency consistency_;

private:
  DISALLOW_COPY_AND_ASSIGN(Request);
};

}}} // namespace cequel::internal::core

#endif
