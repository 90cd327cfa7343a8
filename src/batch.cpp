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

#include "batch.hpp"

#include "logger.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

CequelError Batch::validate(const BatchOptions& options, Error* error) {
  if (!options.auto_apply.is_null() && options.auto_apply.value() == 0) {
    return set_error(error, CEQUEL_ERROR_LIB_BAD_PARAMS, "auto_apply must be a positive integer");
  }
  return CEQUEL_OK;
}

CequelError Batch::append(const Statement::ConstPtr& statement, Error* error) {
  if (state_ != OPEN) {
    return set_error(error, CEQUEL_ERROR_LIB_INVALID_STATE,
                     state_ == FLUSHED ? "Batch has already been applied"
                                       : "Batch has been aborted");
  }

  if (!statement->is_write()) {
    return set_error(error, CEQUEL_ERROR_LIB_INVALID_STATEMENT_TYPE,
                     "Only write statements can be added to a batch");
  }

  if (statement->has_consistency() && statement->consistency() != options_.consistency) {
    OStringStream ss;
    ss << "Statement consistency " << cequel_consistency_string(statement->consistency())
       << " conflicts with batch consistency "
       << (is_consistency_set(options_.consistency)
               ? cequel_consistency_string(options_.consistency)
               : "(unset)")
       << "; set the consistency on the batch instead";
    return fail(error, CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY, ss.str());
  }

  statements_.push_back(statement);

  if (!options_.auto_apply.is_null() && statements_.size() >= options_.auto_apply.value()) {
    LOG_TRACE("Auto-applying batch of %u statements", static_cast<unsigned>(statements_.size()));
    return flush(error);
  }

  return CEQUEL_OK;
}

CequelError Batch::apply(Error* error) {
  if (state_ != OPEN) {
    return set_error(error, CEQUEL_ERROR_LIB_INVALID_STATE,
                     state_ == FLUSHED ? "Batch has already been applied"
                                       : "Batch has been aborted");
  }

  if (!statements_.empty()) {
    CequelError rc = flush(error);
    if (rc != CEQUEL_OK) return rc;
  }

  state_ = FLUSHED;
  return CEQUEL_OK;
}

void Batch::discard() {
  if (!statements_.empty()) {
    LOG_DEBUG("Discarding %u buffered batch statements",
              static_cast<unsigned>(statements_.size()));
  }
  statements_.clear();
  state_ = ABORTED;
}

CequelError Batch::flush(Error* error) {
  BatchRequest::ConstPtr request(new BatchRequest(type(), options_.consistency, statements_));
  statements_.clear();

  Error flush_error;
  Response::Ptr response(
      executor_->execute(*request, CEQUEL_CONSISTENCY_UNKNOWN, &flush_error));
  if (!response) {
    return fail(error, flush_error.code, flush_error.message);
  }

  ++flush_count_;
  return CEQUEL_OK;
}

CequelError Batch::fail(Error* error, CequelError code, const String& message) {
  LOG_ERROR("Aborting batch: %s", message.c_str());
  statements_.clear();
  state_ = ABORTED;
  return set_error(error, code, message);
}
