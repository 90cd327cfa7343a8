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

#include "batch_request.hpp"
#include "executor.hpp"
#include "fake_driver.hpp"
#include "statement.hpp"
#include "unit.hpp"

using namespace cequel::internal;
using namespace cequel::internal::core;

class ExecutorUnitTest : public Unit {
public:
  ExecutorUnitTest()
      : driver_(new fake::FakeDriver())
      , statement_(Statement::write("UPDATE posts SET title = ? WHERE id = ?",
                                    values(Value::text("Hello"), Value::int32(1)))) {}

  static ValueVec values(const Value& first, const Value& second) {
    ValueVec result;
    result.push_back(first);
    result.push_back(second);
    return result;
  }

  void configure(const Options& options) {
    Error error;
    ASSERT_EQ(CEQUEL_OK, ConnectionConfig::from_options(options, &config_, &error))
        << error.to_string();
  }

protected:
  fake::FakeDriver::Ptr driver_;
  ConnectionConfig config_;
  Statement::ConstPtr statement_;
};

TEST_F(ExecutorUnitTest, Simple) {
  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  Response::Ptr response(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  ASSERT_TRUE(response) << error.to_string();
  EXPECT_EQ(statement_->query(), static_cast<fake::FakeResponse*>(response.get())->cql());

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(1u, executed.size());
  EXPECT_TRUE(executed[0].request.get() == statement_.get());
  EXPECT_EQ(CEQUEL_CONSISTENCY_UNKNOWN, executed[0].consistency);
}

TEST_F(ExecutorUnitTest, RetryOnceAfterConnectionError) {
  add_logging_critera("Retrying request after connection error", CEQUEL_LOG_WARN);
  driver_->fail_next_executes(1, CEQUEL_ERROR_CONNECTION_CLOSED);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error))
      << error.to_string();
  EXPECT_TRUE(error.ok());

  EXPECT_EQ(2, driver_->execute_count());
  EXPECT_EQ(2, driver_->build_count()) << "The failed connection should be rebuilt";
  EXPECT_EQ(1, logging_criteria_count());

  // The successful attempt ran on the rebuilt session
  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(1u, executed.size());
  EXPECT_EQ(2, executed[0].session_id);
}

TEST_F(ExecutorUnitTest, SecondConnectionErrorPropagates) {
  add_logging_critera("Request failed", CEQUEL_LOG_ERROR);
  driver_->fail_next_executes(2, CEQUEL_ERROR_CONNECTION_WRITE_ERROR);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_FALSE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(CEQUEL_ERROR_CONNECTION_WRITE_ERROR, error.code);
  EXPECT_EQ(1 + Executor::MAX_RETRIES, driver_->execute_count());
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(ExecutorUnitTest, ServerErrorNotRetried) {
  driver_->fail_next_executes(1, CEQUEL_ERROR_SERVER_INVALID_QUERY);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_FALSE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(CEQUEL_ERROR_SERVER_INVALID_QUERY, error.code);
  EXPECT_EQ(1, driver_->execute_count());
  EXPECT_EQ(1, driver_->build_count());
}

TEST_F(ExecutorUnitTest, TimeoutNotRetried) {
  driver_->fail_next_executes(1, CEQUEL_ERROR_LIB_REQUEST_TIMED_OUT);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_FALSE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_REQUEST_TIMED_OUT, error.code);
  EXPECT_EQ(1, driver_->execute_count());
}

TEST_F(ExecutorUnitTest, ConnectFailureRetried) {
  driver_->fail_next_connects(1, CEQUEL_ERROR_CONNECTION_NO_HOSTS_AVAILABLE);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error))
      << error.to_string();
  EXPECT_EQ(1, driver_->execute_count());
}

TEST_F(ExecutorUnitTest, BuildFailureNotRetried) {
  driver_->fail_next_builds(2, CEQUEL_ERROR_LIB_INVALID_CONFIGURATION);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  EXPECT_FALSE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION, error.code);
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(ExecutorUnitTest, ConsistencyResolution) {
  Options options;
  options.set_string("default_consistency", "LOCAL_ONE");
  configure(options);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  // Configured default
  EXPECT_EQ(CEQUEL_CONSISTENCY_LOCAL_ONE,
            executor.resolve_consistency(*statement_, CEQUEL_CONSISTENCY_UNKNOWN));
  // Caller level beats the default
  EXPECT_EQ(CEQUEL_CONSISTENCY_QUORUM,
            executor.resolve_consistency(*statement_, CEQUEL_CONSISTENCY_QUORUM));
  // The statement's own level beats both
  Statement::ConstPtr with_all(statement_->with_consistency(CEQUEL_CONSISTENCY_ALL));
  EXPECT_EQ(CEQUEL_CONSISTENCY_ALL,
            executor.resolve_consistency(*with_all, CEQUEL_CONSISTENCY_QUORUM));

  Error error;
  ASSERT_TRUE(executor.execute(*with_all, CEQUEL_CONSISTENCY_QUORUM, &error));
  ASSERT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(2u, executed.size());
  EXPECT_EQ(CEQUEL_CONSISTENCY_ALL, executed[0].consistency);
  EXPECT_EQ(CEQUEL_CONSISTENCY_LOCAL_ONE, executed[1].consistency);
}

TEST_F(ExecutorUnitTest, DebugLogging) {
  add_logging_critera("UPDATE posts SET title = ? WHERE id = ? ['Hello', 1] at consistency ONE",
                      CEQUEL_LOG_DEBUG);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  ASSERT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_ONE, &error));
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(ExecutorUnitTest, SlowQueryLogging) {
  add_logging_critera("Slow query", CEQUEL_LOG_WARN);

  Options options;
  options.set_int("slowlog_threshold_ms", 10);
  configure(options);
  driver_->set_execute_delay_ms(25);

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  ASSERT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(1, logging_criteria_count());

  driver_->set_execute_delay_ms(0);
  ASSERT_TRUE(executor.execute(*statement_, CEQUEL_CONSISTENCY_UNKNOWN, &error));
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(ExecutorUnitTest, BatchRequest) {
  BatchRequest::StatementVec statements;
  statements.push_back(statement_);
  statements.push_back(Statement::write("DELETE FROM posts WHERE id = ?",
                                        ValueVec(1, Value::int32(2))));
  BatchRequest::ConstPtr batch(
      new BatchRequest(CEQUEL_BATCH_TYPE_LOGGED, CEQUEL_CONSISTENCY_QUORUM, statements));

  ClusterClient client(driver_, config_);
  Executor executor(&client, config_);

  Error error;
  ASSERT_TRUE(executor.execute(*batch, CEQUEL_CONSISTENCY_UNKNOWN, &error));

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(1u, executed.size());
  EXPECT_EQ(Request::BATCH, executed[0].request->type());
  EXPECT_EQ(CEQUEL_CONSISTENCY_QUORUM, executed[0].consistency);
  EXPECT_EQ(3u, batch->values().size());
}
