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

#ifndef CEQUEL_INTERNAL_BATCH_REQUEST_HPP
#define CEQUEL_INTERNAL_BATCH_REQUEST_HPP

#include "request.hpp"
#include "statement.hpp"
#include "vector.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * The wire unit produced by one batch flush. Statements keep their append
 * order; the batch-wide consistency (if any) applies to the whole batch.
 */
class BatchRequest : public Request {
public:
  typedef SharedRefPtr<const BatchRequest> ConstPtr;
  typedef Vector<Statement::ConstPtr> StatementVec;

  BatchRequest(CequelBatchType type, CequelConsistency consistency,
               const StatementVec& statements)
      : Request(BATCH, consistency)
      , type_(type)
      , statements_(statements) {}

  CequelBatchType type() const { return type_; }

  bool is_unlogged() const { return type_ == CEQUEL_BATCH_TYPE_UNLOGGED; }

  const StatementVec& statements() const { return statements_; }

  // All bind values in statement order, as a single CQL batch string binds them.
  ValueVec values() const;

  virtual String to_cql() const;

private:
  CequelBatchType type_;
  StatementVec statements_;
};

}}} // namespace cequel::internal::core

#endif
