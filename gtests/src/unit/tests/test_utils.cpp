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

#include "consistency.hpp"
#include "error.hpp"
#include "macros.hpp"
#include "utils.hpp"

using namespace cequel::internal;
using namespace cequel::internal::core;

TEST(UtilsUnitTest, Explode) {
  Vector<String> hosts;
  explode(" 127.0.0.1 ,127.0.0.2,,  ", hosts);
  ASSERT_EQ(2u, hosts.size());
  EXPECT_EQ("127.0.0.1", hosts[0]);
  EXPECT_EQ("127.0.0.2", hosts[1]);

  Vector<String> empty;
  explode("", empty);
  EXPECT_TRUE(empty.empty());
}

TEST(UtilsUnitTest, Implode) {
  Vector<String> hosts;
  EXPECT_EQ("", implode(hosts));
  hosts.push_back("a");
  hosts.push_back("b");
  EXPECT_EQ("a b", implode(hosts));
  EXPECT_EQ("a,b", implode(hosts, ','));
}

TEST(UtilsUnitTest, Trim) {
  String s = "  abc \t\n";
  EXPECT_EQ("abc", trim(s));
  s = "   ";
  EXPECT_EQ("", trim(s));
  s = " \xC3\xA9t\xC3\xA9 ";
  EXPECT_EQ("\xC3\xA9t\xC3\xA9", trim(s));
}

TEST(UtilsUnitTest, CaseInsensitive) {
  String s = "local_quorum";
  EXPECT_EQ("LOCAL_QUORUM", to_upper(s));
  EXPECT_TRUE(iequals("Local_Quorum", "LOCAL_QUORUM"));
  EXPECT_FALSE(iequals("ONE", "ONE "));
  EXPECT_TRUE(iequals("dc\xFF", "DC\xFF"));
  s = "qu\xE9rum";
  EXPECT_EQ("QU\xE9RUM", to_upper(s));
}

TEST(UtilsUnitTest, ConsistencyFromString) {
  CequelConsistency consistency = CEQUEL_CONSISTENCY_UNKNOWN;
  EXPECT_TRUE(consistency_from_string("quorum", &consistency));
  EXPECT_EQ(CEQUEL_CONSISTENCY_QUORUM, consistency);
  EXPECT_TRUE(consistency_from_string("LOCAL_SERIAL", &consistency));
  EXPECT_EQ(CEQUEL_CONSISTENCY_LOCAL_SERIAL, consistency);

  EXPECT_FALSE(consistency_from_string("UNKNOWN", &consistency));
  EXPECT_FALSE(consistency_from_string("", &consistency));
  EXPECT_EQ(CEQUEL_CONSISTENCY_LOCAL_SERIAL, consistency);

  EXPECT_FALSE(is_consistency_set(CEQUEL_CONSISTENCY_UNKNOWN));
  EXPECT_TRUE(is_consistency_set(CEQUEL_CONSISTENCY_ANY));
}

TEST(UtilsUnitTest, ErrorDescriptions) {
  EXPECT_STREQ("Ok", cequel_error_desc(CEQUEL_OK));
  EXPECT_STREQ("Conflicting consistency levels in batch",
               cequel_error_desc(CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY));
  EXPECT_STREQ("Invalid query", cequel_error_desc(CEQUEL_ERROR_SERVER_INVALID_QUERY));

  EXPECT_EQ(CEQUEL_ERROR_SOURCE_NONE, cequel_error_source(CEQUEL_OK));
  EXPECT_EQ(CEQUEL_ERROR_SOURCE_LIB, cequel_error_source(CEQUEL_ERROR_LIB_BAD_PARAMS));
  EXPECT_EQ(CEQUEL_ERROR_SOURCE_CONNECTION,
            cequel_error_source(CEQUEL_ERROR_CONNECTION_NO_HOSTS_AVAILABLE));
  EXPECT_EQ(CEQUEL_ERROR_SOURCE_SSL, cequel_error_source(CEQUEL_ERROR_SSL_INVALID_CERT));

  EXPECT_STREQ("LOCAL_ONE", cequel_consistency_string(CEQUEL_CONSISTENCY_LOCAL_ONE));
  EXPECT_STREQ("WARN", cequel_log_level_string(CEQUEL_LOG_WARN));
}

TEST(UtilsUnitTest, Error) {
  Error error;
  EXPECT_TRUE(error.ok());
  EXPECT_EQ("Ok", error.to_string());

  EXPECT_EQ(CEQUEL_ERROR_CONNECTION_CLOSED,
            set_error(&error, CEQUEL_ERROR_CONNECTION_CLOSED, "Connection reset by peer"));
  EXPECT_TRUE(error.is_connection_error());
  EXPECT_EQ("Connection closed: Connection reset by peer", error.to_string());

  EXPECT_EQ(CEQUEL_ERROR_SERVER_OVERLOADED,
            set_error(NULL, CEQUEL_ERROR_SERVER_OVERLOADED, "Ignored"));

  error.reset();
  EXPECT_TRUE(error.ok());
  EXPECT_TRUE(error.message.empty());
}
