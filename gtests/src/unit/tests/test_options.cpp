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

#include "dc_aware_policy.hpp"
#include "options.hpp"
#include "token_aware_policy.hpp"
#include "unit.hpp"
#include "whitelist_policy.hpp"

#include <stdio.h>
#include <stdlib.h>

using namespace cequel::internal;
using namespace cequel::internal::core;

class OptionsUnitTest : public Unit {};

TEST_F(OptionsUnitTest, ScalarValues) {
  Options options;
  Error error;
  ASSERT_EQ(CEQUEL_OK, Options::from_json("{\"host\": \"127.0.0.2\", \"port\": 9043, "
                                          "\"ssl\": true, \"keyspace\": null}",
                                          &options, &error))
      << error.to_string();

  EXPECT_EQ(3u, options.size());
  ASSERT_TRUE(options.find("host") != NULL);
  EXPECT_EQ(OptionValue::STRING, options.find("host")->type());
  EXPECT_EQ("127.0.0.2", options.find("host")->as_string());
  EXPECT_EQ(OptionValue::INT, options.find("port")->type());
  EXPECT_EQ(9043, options.find("port")->as_int());
  EXPECT_EQ(OptionValue::BOOL, options.find("ssl")->type());
  EXPECT_TRUE(options.find("ssl")->as_bool());
  EXPECT_FALSE(options.contains("keyspace"));
}

TEST_F(OptionsUnitTest, NestedPolicy) {
  Options options;
  Error error;
  ASSERT_EQ(CEQUEL_OK,
            Options::from_json("{\"load_balancing_policy\": {\"type\": \"token_aware\", "
                               "\"child\": {\"type\": \"dc_aware\", \"local_dc\": \"dc1\", "
                               "\"used_hosts_per_remote_dc\": 2}}}",
                               &options, &error))
      << error.to_string();

  const OptionValue* value = options.find("load_balancing_policy");
  ASSERT_TRUE(value != NULL);
  ASSERT_EQ(OptionValue::POLICY, value->type());

  const LoadBalancingPolicy::Ptr& policy = value->as_policy();
  ASSERT_EQ(LoadBalancingPolicy::TOKEN_AWARE, policy->type());
  EXPECT_EQ("TokenAware(DCAware(local_dc=dc1, used_hosts_per_remote_dc=2))", policy->to_string());

  const TokenAwarePolicy* token_aware = static_cast<const TokenAwarePolicy*>(policy.get());
  EXPECT_TRUE(token_aware->shuffle_replicas());
  ASSERT_EQ(LoadBalancingPolicy::DC_AWARE, token_aware->child_policy()->type());
  const DCAwarePolicy* dc_aware =
      static_cast<const DCAwarePolicy*>(token_aware->child_policy().get());
  EXPECT_EQ("dc1", dc_aware->local_dc());
  EXPECT_EQ(2u, dc_aware->used_hosts_per_remote_dc());
  EXPECT_TRUE(dc_aware->skip_remote_dcs_for_local_cl());
}

TEST_F(OptionsUnitTest, WhitelistPolicyDefaultsToRoundRobinChild) {
  Options options;
  Error error;
  ASSERT_EQ(CEQUEL_OK, Options::from_json("{\"load_balancing_policy\": {\"type\": \"whitelist\", "
                                          "\"hosts\": [\"10.0.0.1\", \"10.0.0.2\"]}}",
                                          &options, &error))
      << error.to_string();

  const LoadBalancingPolicy::Ptr& policy = options.find("load_balancing_policy")->as_policy();
  ASSERT_EQ(LoadBalancingPolicy::WHITELIST, policy->type());
  EXPECT_EQ(2u, static_cast<const WhitelistPolicy*>(policy.get())->hosts().size());
  EXPECT_EQ("Whitelist(hosts=10.0.0.1,10.0.0.2, RoundRobin)", policy->to_string());
}

TEST_F(OptionsUnitTest, InvalidPolicy) {
  const char* documents[] = {
    "{\"load_balancing_policy\": \"dc_aware\"}",
    "{\"load_balancing_policy\": {\"local_dc\": \"dc1\"}}",
    "{\"load_balancing_policy\": {\"type\": \"dc_aware\"}}",
    "{\"load_balancing_policy\": {\"type\": \"latency_aware\"}}",
    "{\"load_balancing_policy\": {\"type\": \"whitelist\", \"hosts\": []}}",
    "{\"load_balancing_policy\": {\"type\": \"token_aware\", \"child\": {\"type\": \"x\"}}}"
  };

  for (size_t i = 0; i < sizeof(documents) / sizeof(documents[0]); ++i) {
    Options options;
    Error error;
    EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
              Options::from_json(documents[i], &options, &error))
        << "Document " << documents[i] << " should be rejected";
    EXPECT_FALSE(error.message.empty());
  }
}

TEST_F(OptionsUnitTest, InvalidDocument) {
  add_logging_critera("Unable to load configuration", CEQUEL_LOG_ERROR);

  Options options;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
            Options::from_json("{\"host\": ", &options, &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
            Options::from_json("[1, 2]", &options, &error));
  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
            Options::from_json("{\"port\": 9042.5}", &options, &error));
  EXPECT_TRUE(options.empty());
  EXPECT_EQ(3, logging_criteria_count());
}

TEST_F(OptionsUnitTest, FromFile) {
  char path[] = "/tmp/cequel-options-XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(-1, fd);
  FILE* file = fdopen(fd, "w");
  ASSERT_TRUE(file != NULL);
  fputs("{\"keyspace\": \"from_file\"}", file);
  fclose(file);

  Options options;
  Error error;
  EXPECT_EQ(CEQUEL_OK, Options::from_json_file(path, &options, &error)) << error.to_string();
  EXPECT_EQ("from_file", options.find("keyspace")->as_string());
  remove(path);

  EXPECT_EQ(CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
            Options::from_json_file(path, &options, &error));
}
