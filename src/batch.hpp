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

#ifndef CEQUEL_INTERNAL_BATCH_HPP
#define CEQUEL_INTERNAL_BATCH_HPP

#include "batch_request.hpp"
#include "cequel.h"
#include "error.hpp"
#include "executor.hpp"
#include "macros.hpp"
#include "nullable.hpp"
#include "statement.hpp"
#include "vector.hpp"

#include <stddef.h>

namespace cequel { namespace internal { namespace core {

struct BatchOptions {
  BatchOptions()
      : consistency(CEQUEL_CONSISTENCY_UNKNOWN)
      , unlogged(false) {}

  // Applies to the whole batch; CEQUEL_CONSISTENCY_UNKNOWN for the default
  CequelConsistency consistency;
  bool unlogged;
  // Flush whenever this many statements are buffered; must be positive
  Nullable<unsigned> auto_apply;
};

/**
 * Buffers write statements and sends them as batch requests.
 *
 * A batch starts OPEN. apply() flushes what is left and ends in FLUSHED;
 * discard() drops the buffer and ends in ABORTED. A consistency conflict or a
 * failed flush also aborts the batch. Statements flushed earlier by
 * auto-apply are not undone.
 */
class Batch {
public:
  enum State { OPEN, FLUSHED, ABORTED };

  static CequelError validate(const BatchOptions& options, Error* error);

  Batch(Executor* executor, const BatchOptions& options)
      : executor_(executor)
      , options_(options)
      , state_(OPEN)
      , flush_count_(0) {}

  /**
   * Buffer a write statement, flushing if the auto-apply threshold is
   * reached.
   *
   * @return CEQUEL_OK, CEQUEL_ERROR_LIB_INVALID_STATE if the batch is no
   * longer open, CEQUEL_ERROR_LIB_INVALID_STATEMENT_TYPE for reads,
   * CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY if the statement carries a
   * consistency other than the batch's (the batch is aborted), or the
   * error of a failed auto-apply flush.
   */
  CequelError append(const Statement::ConstPtr& statement, Error* error);

  // Flush any buffered statements and close the batch. An empty buffer
  // makes no round trip.
  CequelError apply(Error* error);

  void discard();

  State state() const { return state_; }
  bool is_open() const { return state_ == OPEN; }
  const BatchOptions& options() const { return options_; }
  CequelBatchType type() const {
    return options_.unlogged ? CEQUEL_BATCH_TYPE_UNLOGGED : CEQUEL_BATCH_TYPE_LOGGED;
  }

  size_t buffered_count() const { return statements_.size(); }
  unsigned flush_count() const { return flush_count_; }

private:
  CequelError flush(Error* error);
  CequelError fail(Error* error, CequelError code, const String& message);

private:
  Executor* executor_;
  BatchOptions options_;
  State state_;
  BatchRequest::StatementVec statements_;
  unsigned flush_count_;

private:
  DISALLOW_COPY_AND_ASSIGN(Batch);
};

/**
 * Discards the batch on scope exit unless commit() ran, so an early return
 * or an exception never sends buffered statements.
 */
class ScopedBatch {
public:
  explicit ScopedBatch(Batch* batch)
      : batch_(batch)
      , committed_(false) {}

  ~ScopedBatch() {
    if (!committed_ && batch_->is_open()) {
      batch_->discard();
    }
  }

  Batch* get() const { return batch_; }
  Batch* operator->() const { return batch_; }

  CequelError append(const Statement::ConstPtr& statement, Error* error) {
    return batch_->append(statement, error);
  }

  CequelError commit(Error* error) {
    committed_ = true;
    return batch_->apply(error);
  }

private:
  Batch* batch_;
  bool committed_;

private:
  DISALLOW_COPY_AND_ASSIGN(ScopedBatch);
};

}}} // namespace cequel::internal::core

#endif
