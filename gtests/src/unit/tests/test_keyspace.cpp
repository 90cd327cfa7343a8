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

#include "fake_driver.hpp"
#include "keyspace.hpp"
#include "unit.hpp"

#include <stdexcept>

using namespace cequel::internal;
using namespace cequel::internal::core;

class KeyspaceUnitTest : public Unit {
public:
  KeyspaceUnitTest()
      : driver_(new fake::FakeDriver()) {}

  Keyspace::Ptr connect(const Options& options) {
    Keyspace::Ptr keyspace;
    Error error;
    EXPECT_EQ(CEQUEL_OK, Keyspace::connect(driver_, options, &keyspace, &error))
        << error.to_string();
    return keyspace;
  }

  static Statement::ConstPtr insert(int id) {
    return Statement::write("INSERT INTO posts (id) VALUES (?)", ValueVec(1, Value::int32(id)));
  }

protected:
  fake::FakeDriver::Ptr driver_;
};

TEST_F(KeyspaceUnitTest, Accessors) {
  Options options;
  options.set_string("keyspace", "blog")
      .set_string("datacenter", "dc1")
      .set_int("connections_per_remote_node", 0)
      .set_bool("ssl", true)
      .set_string("default_consistency", "QUORUM");
  Keyspace::Ptr keyspace(connect(options));
  ASSERT_TRUE(keyspace);

  EXPECT_EQ("blog", keyspace->name().value());
  EXPECT_EQ("dc1", keyspace->datacenter().value());
  EXPECT_EQ(0, keyspace->connections_per_remote_node().value());
  EXPECT_FALSE(keyspace->load_balancing_policy());
  EXPECT_TRUE(keyspace->ssl_config().ssl);
  EXPECT_EQ(CEQUEL_CONSISTENCY_QUORUM, keyspace->default_consistency());

  // Connecting is lazy
  EXPECT_EQ(0, driver_->build_count());
}

TEST_F(KeyspaceUnitTest, InvalidOptions) {
  Options options;
  options.set_string("port", "9042");

  Keyspace::Ptr keyspace;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
            Keyspace::connect(driver_, options, &keyspace, &error));
  EXPECT_FALSE(keyspace);
}

TEST_F(KeyspaceUnitTest, Execute) {
  Options options;
  options.set_string("keyspace", "blog");
  Keyspace::Ptr keyspace(connect(options));

  Error error;
  ASSERT_TRUE(keyspace->execute(Statement::read("SELECT * FROM posts"), &error))
      << error.to_string();
  ASSERT_TRUE(keyspace->execute(insert(1), CEQUEL_CONSISTENCY_ALL, &error));

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(2u, executed.size());
  EXPECT_EQ(Request::STATEMENT, executed[0].request->type());
  EXPECT_EQ(CEQUEL_CONSISTENCY_ALL, executed[1].consistency);
  EXPECT_EQ(1, driver_->build_count());

  Session::Ptr session(keyspace->client(&error));
  ASSERT_TRUE(session);
  EXPECT_EQ("blog", static_cast<fake::FakeSession*>(session.get())->keyspace().value());
}

TEST_F(KeyspaceUnitTest, Exists) {
  driver_->add_keyspace("blog");

  Options options;
  options.set_string("keyspace", "blog");
  Keyspace::Ptr keyspace(connect(options));

  bool exists = false;
  Error error;
  EXPECT_EQ(CEQUEL_OK, keyspace->exists(&exists, &error)) << error.to_string();
  EXPECT_TRUE(exists);

  options.set_string("keyspace", "missing");
  Keyspace::Ptr missing(connect(options));
  EXPECT_EQ(CEQUEL_OK, missing->exists(&exists, &error));
  EXPECT_FALSE(exists);
}

TEST_F(KeyspaceUnitTest, ExistsWithoutKeyspace) {
  Keyspace::Ptr keyspace(connect(Options()));

  bool exists = false;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_LIB_BAD_PARAMS, keyspace->exists(&exists, &error));
  EXPECT_EQ(0, driver_->build_count());
}

TEST_F(KeyspaceUnitTest, Batch) {
  Keyspace::Ptr keyspace(connect(Options()));

  BatchOptions options;
  options.consistency = CEQUEL_CONSISTENCY_LOCAL_QUORUM;
  Error error;
  ASSERT_EQ(CEQUEL_OK, keyspace->batch(options,
                                       [](Batch* batch) -> CequelError {
                                         CequelError rc = batch->append(insert(1), NULL);
                                         if (rc != CEQUEL_OK) return rc;
                                         return batch->append(insert(2), NULL);
                                       },
                                       &error))
      << error.to_string();

  Vector<fake::ExecutedRequest> executed(driver_->executed());
  ASSERT_EQ(1u, executed.size());
  EXPECT_EQ(Request::BATCH, executed[0].request->type());
  EXPECT_EQ(CEQUEL_CONSISTENCY_LOCAL_QUORUM, executed[0].consistency);
}

TEST_F(KeyspaceUnitTest, BatchBodyErrorDiscards) {
  Keyspace::Ptr keyspace(connect(Options()));

  Error error;
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_STATEMENT_TYPE,
            keyspace->batch(BatchOptions(),
                            [&error](Batch* batch) -> CequelError {
                              CequelError rc = batch->append(insert(1), &error);
                              if (rc != CEQUEL_OK) return rc;
                              return batch->append(Statement::read("SELECT * FROM posts"),
                                                   &error);
                            },
                            &error));
  EXPECT_EQ("Only write statements can be added to a batch", error.message);
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(KeyspaceUnitTest, BatchBodyThrowDiscards) {
  Keyspace::Ptr keyspace(connect(Options()));

  BatchOptions options;
  Error error;
  EXPECT_THROW(keyspace->batch(options,
                               [](Batch* batch) -> CequelError {
                                 EXPECT_EQ(CEQUEL_OK, batch->append(insert(1), NULL));
                                 throw std::runtime_error("body failed");
                               },
                               &error),
               std::runtime_error);
  EXPECT_EQ(0, driver_->execute_count());
}

TEST_F(KeyspaceUnitTest, BatchAutoApply) {
  Keyspace::Ptr keyspace(connect(Options()));

  BatchOptions options;
  options.auto_apply.set(3);
  Error error;
  ASSERT_EQ(CEQUEL_OK, keyspace->batch(options,
                                       [](Batch* batch) -> CequelError {
                                         for (int i = 0; i < 7; ++i) {
                                           CequelError rc = batch->append(insert(i), NULL);
                                           if (rc != CEQUEL_OK) return rc;
                                         }
                                         return CEQUEL_OK;
                                       },
                                       &error));
  EXPECT_EQ(3, driver_->execute_count());
}

TEST_F(KeyspaceUnitTest, BatchInvalidAutoApply) {
  Keyspace::Ptr keyspace(connect(Options()));

  BatchOptions options;
  options.auto_apply.set(0);
  bool called = false;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_LIB_BAD_PARAMS, keyspace->batch(options,
                                                         [&called](Batch*) -> CequelError {
                                                           called = true;
                                                           return CEQUEL_OK;
                                                         },
                                                         &error));
  EXPECT_FALSE(called);
}

TEST_F(KeyspaceUnitTest, ClearActiveConnections) {
  Keyspace::Ptr keyspace(connect(Options()));

  Error error;
  ASSERT_TRUE(keyspace->execute(insert(1), &error));
  keyspace->clear_active_connections();
  ASSERT_TRUE(keyspace->execute(insert(2), &error));
  EXPECT_EQ(2, driver_->build_count());
}
