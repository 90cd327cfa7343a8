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

#include <gtest/gtest.h>

#include "batch.hpp"
#include "fake_driver.hpp"
#include "unit.hpp"

using namespace cequel::internal;
using namespace cequel::internal::core;

class BatchUnitTest : public Unit {
public:
  BatchUnitTest()
      : driver_(new fake::FakeDriver())
      , client_(driver_, config_)
      , executor_(&client_, config_) {}

  static Statement::ConstPtr insert(int id) {
    return Statement::write("INSERT INTO posts (id) VALUES (?)", ValueVec(1, Value::int32(id)));
  }

  // The batch requests received by the transport, in order.
  Vector<const BatchRequest*> batches() {
    Vector<const BatchRequest*> result;
    Vector<fake::ExecutedRequest> executed(driver_->executed());
    for (Vector<fake::ExecutedRequest>::const_iterator it = executed.begin(),
                                                       end = executed.end();
         it != end; ++it) {
      EXPECT_EQ(Request::BATCH, it->request->type());
      result.push_back(static_cast<const BatchRequest*>(it->request.get()));
    }
    return result;
  }

protected:
  fake::FakeDriver::Ptr driver_;
  ConnectionConfig config_;
  ClusterClient client_;
  Executor executor_;
};

TEST_F(BatchUnitTest, SingleRoundTrip) {
  Batch batch(&executor_, BatchOptions());
  Error error;

  for (int i = 0; i < 3; ++i) {
    ASSERT_EQ(CEQUEL_OK, batch.append(insert(i), &error)) << error.to_string();
  }
  EXPECT_EQ(3u, batch.buffered_count());
  EXPECT_EQ(0, driver_->execute_count());

  ASSERT_EQ(CEQUEL_OK, batch.apply(&error)) << error.to_string();
  EXPECT_EQ(Batch::FLUSHED, batch.state());
  EXPECT_EQ(1u, batch.flush_count());

  Vector<const BatchRequest*> requests(batches());
  ASSERT_EQ(1u, requests.size());
  EXPECT_EQ(CEQUEL_BATCH_TYPE_LOGGED, requests[0]->type());
  ASSERT_EQ(3u, requests[0]->statements().size());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(Value::int32(i), requests[0]->statements()[i]->values()[0])
        << "Statements should keep their append order";
  }
  EXPECT_EQ("BEGIN BATCH\n"
            "INSERT INTO posts (id) VALUES (?)\n"
            "INSERT INTO posts (id) VALUES (?)\n"
            "INSERT INTO posts (id) VALUES (?)\n"
            "APPLY BATCH",
            requests[0]->to_cql());
}

TEST_F(BatchUnitTest, EmptyBatchMakesNoRoundTrip) {
  Batch batch(&executor_, BatchOptions());
  Error error;

  EXPECT_EQ(CEQUEL_OK, batch.apply(&error));
  EXPECT_EQ(Batch::FLUSHED, batch.state());
  EXPECT_EQ(0, driver_->execute_count());
  EXPECT_EQ(0, driver_->build_count());
}

TEST_F(BatchUnitTest, Unlogged) {
  BatchOptions options;
  options.unlogged = true;
  Batch batch(&executor_, options);
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));

  Vector<const BatchRequest*> requests(batches());
  ASSERT_EQ(1u, requests.size());
  EXPECT_TRUE(requests[0]->is_unlogged());
  EXPECT_EQ(0u, requests[0]->to_cql().find("BEGIN UNLOGGED BATCH\n"));
}

TEST_F(BatchUnitTest, AutoApply) {
  BatchOptions options;
  options.auto_apply.set(2);
  Batch batch(&executor_, options);
  Error error;

  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(CEQUEL_OK, batch.append(insert(i), &error)) << error.to_string();
  }
  EXPECT_EQ(2u, batch.flush_count());
  EXPECT_EQ(1u, batch.buffered_count());
  EXPECT_TRUE(batch.is_open());

  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));

  Vector<const BatchRequest*> requests(batches());
  ASSERT_EQ(3u, requests.size());
  EXPECT_EQ(2u, requests[0]->statements().size());
  EXPECT_EQ(2u, requests[1]->statements().size());
  EXPECT_EQ(1u, requests[2]->statements().size());
  EXPECT_EQ(Value::int32(4), requests[2]->statements()[0]->values()[0]);
}

TEST_F(BatchUnitTest, AutoApplyExactMultiple) {
  BatchOptions options;
  options.auto_apply.set(2);
  Batch batch(&executor_, options);
  Error error;

  for (int i = 0; i < 4; ++i) {
    ASSERT_EQ(CEQUEL_OK, batch.append(insert(i), &error));
  }
  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));

  // Nothing was left for the final apply
  EXPECT_EQ(2, driver_->execute_count());
}

TEST_F(BatchUnitTest, AutoApplyZeroRejected) {
  BatchOptions options;
  options.auto_apply.set(0);
  Error error;

  EXPECT_EQ(CEQUEL_ERROR_LIB_BAD_PARAMS, Batch::validate(options, &error));
  EXPECT_EQ("auto_apply must be a positive integer", error.message);

  options.auto_apply.set(1);
  EXPECT_EQ(CEQUEL_OK, Batch::validate(options, NULL));
}

TEST_F(BatchUnitTest, BatchConsistency) {
  BatchOptions options;
  options.consistency = CEQUEL_CONSISTENCY_QUORUM;
  Batch batch(&executor_, options);
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  // The same level as the batch is not a conflict
  ASSERT_EQ(CEQUEL_OK,
            batch.append(insert(2)->with_consistency(CEQUEL_CONSISTENCY_QUORUM), &error));
  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(1u, executed.size());
  EXPECT_EQ(CEQUEL_CONSISTENCY_QUORUM, executed[0].consistency);
}

TEST_F(BatchUnitTest, ConflictingConsistency) {
  add_logging_critera("Aborting batch", CEQUEL_LOG_ERROR);

  BatchOptions options;
  options.consistency = CEQUEL_CONSISTENCY_QUORUM;
  Batch batch(&executor_, options);
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY,
            batch.append(insert(2)->with_consistency(CEQUEL_CONSISTENCY_ONE), &error));
  EXPECT_NE(String::npos, error.message.find("ONE")) << error.message;
  EXPECT_NE(String::npos, error.message.find("QUORUM")) << error.message;

  EXPECT_EQ(Batch::ABORTED, batch.state());
  EXPECT_EQ(0u, batch.buffered_count());
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATE, batch.apply(&error));
  EXPECT_EQ(0, driver_->execute_count()) << "Nothing should be sent";
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(BatchUnitTest, StatementConsistencyWithoutBatchConsistency) {
  Batch batch(&executor_, BatchOptions());
  Error error;

  EXPECT_EQ(CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY,
            batch.append(insert(1)->with_consistency(CEQUEL_CONSISTENCY_ALL), &error));
  EXPECT_EQ(Batch::ABORTED, batch.state());
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(BatchUnitTest, ConflictAfterAutoApply) {
  BatchOptions options;
  options.auto_apply.set(2);
  Batch batch(&executor_, options);
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  ASSERT_EQ(CEQUEL_OK, batch.append(insert(2), &error));
  ASSERT_EQ(CEQUEL_OK, batch.append(insert(3), &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY,
            batch.append(insert(4)->with_consistency(CEQUEL_CONSISTENCY_ONE), &error));

  // The flushed statements stay applied; the buffered one is dropped
  EXPECT_EQ(1, driver_->execute_count());
  EXPECT_EQ(0u, batch.buffered_count());
}

TEST_F(BatchUnitTest, ReadRejected) {
  Batch batch(&executor_, BatchOptions());
  Error error;

  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATEMENT_TYPE,
            batch.append(Statement::read("SELECT * FROM posts"), &error));
  // A rejected read leaves the batch usable
  EXPECT_TRUE(batch.is_open());
  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));
  EXPECT_EQ(1, driver_->execute_count());
}

TEST_F(BatchUnitTest, InvalidState) {
  Batch batch(&executor_, BatchOptions());
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.apply(&error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATE, batch.append(insert(1), &error));
  EXPECT_EQ("Batch has already been applied", error.message);
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATE, batch.apply(&error));

  Batch discarded(&executor_, BatchOptions());
  ASSERT_EQ(CEQUEL_OK, discarded.append(insert(1), &error));
  discarded.discard();
  EXPECT_EQ(Batch::ABORTED, discarded.state());
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATE, discarded.append(insert(2), &error));
  EXPECT_EQ("Batch has been aborted", error.message);
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(BatchUnitTest, FlushFailureAborts) {
  driver_->fail_next_executes(1, CEQUEL_ERROR_SERVER_UNAVAILABLE);
  Batch batch(&executor_, BatchOptions());
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  EXPECT_EQ(CEQUEL_ERROR_SERVER_UNAVAILABLE, batch.apply(&error));
  EXPECT_EQ(Batch::ABORTED, batch.state());
  EXPECT_EQ(0u, batch.flush_count());
}

TEST_F(BatchUnitTest, FlushRetriedOnConnectionError) {
  driver_->fail_next_executes(1, CEQUEL_ERROR_CONNECTION_CLOSED);
  Batch batch(&executor_, BatchOptions());
  Error error;

  ASSERT_EQ(CEQUEL_OK, batch.append(insert(1), &error));
  ASSERT_EQ(CEQUEL_OK, batch.apply(&error)) << error.to_string();
  EXPECT_EQ(2, driver_->execute_count());
  EXPECT_EQ(1u, batches().size());
}

TEST_F(BatchUnitTest, ScopedBatchDiscards) {
  Batch batch(&executor_, BatchOptions());
  Error error;
  {
    ScopedBatch scoped(&batch);
    ASSERT_EQ(CEQUEL_OK, scoped.append(insert(1), &error));
  }
  EXPECT_EQ(Batch::ABORTED, batch.state());
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(BatchUnitTest, ScopedBatchCommit) {
  Batch batch(&executor_, BatchOptions());
  Error error;
  {
    ScopedBatch scoped(&batch);
    ASSERT_EQ(CEQUEL_OK, scoped.append(insert(1), &error));
    ASSERT_EQ(CEQUEL_OK, scoped.commit(&error));
  }
  EXPECT_EQ(Batch::FLUSHED, batch.state());
  EXPECT_EQ(1, driver_->execute_count());
}
