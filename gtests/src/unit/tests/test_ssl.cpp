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

#include "ssl.hpp"
#include "ssl_certificates.hpp"
#include "unit.hpp"

#include <stdio.h>

using namespace cequel::internal;
using namespace cequel::internal::core;

class SslUnitTest : public Unit {
public:
  virtual void SetUp() {
    client_pem_path_ = SslCertificates::write_temp_file(SslCertificates::client_pem());
    client_key_path_ = SslCertificates::write_temp_file(SslCertificates::client_key());
    other_pem_path_ = SslCertificates::write_temp_file(SslCertificates::other_pem());
    ASSERT_FALSE(client_pem_path_.empty());
    ASSERT_FALSE(client_key_path_.empty());
    ASSERT_FALSE(other_pem_path_.empty());
  }

  virtual void TearDown() {
    remove(client_pem_path_.c_str());
    remove(client_key_path_.c_str());
    remove(other_pem_path_.c_str());
  }

  SslConfig client_config() {
    SslConfig config;
    config.ssl = true;
    config.server_cert.set(client_pem_path_);
    config.client_cert.set(client_pem_path_);
    config.private_key.set(client_key_path_);
    config.passphrase.set(SslCertificates::client_key_passphrase());
    return config;
  }

protected:
  String client_pem_path_;
  String client_key_path_;
  String other_pem_path_;
};

TEST_F(SslUnitTest, CountCertificates) {
  EXPECT_EQ(1, SslMaterial::count_certificates(SslCertificates::client_pem()));

  String combined(SslCertificates::client_pem());
  combined.append(SslCertificates::other_pem());
  EXPECT_EQ(2, SslMaterial::count_certificates(combined));

  EXPECT_EQ(0, SslMaterial::count_certificates("not a certificate"));
  EXPECT_EQ(0, SslMaterial::count_certificates(SslCertificates::client_key()));
}

TEST_F(SslUnitTest, Load) {
  SslMaterial material;
  Error error;
  ASSERT_EQ(CEQUEL_OK, SslMaterial::load(client_config(), &material, &error))
      << error.to_string();

  EXPECT_TRUE(material.verify_peer());
  EXPECT_EQ(SslCertificates::client_pem(), material.trusted_cert);
  EXPECT_EQ(SslCertificates::client_pem(), material.cert);
  EXPECT_EQ(SslCertificates::client_key(), material.private_key);
  EXPECT_EQ("cequel", material.passphrase);
}

TEST_F(SslUnitTest, ServerCertOnly) {
  SslConfig config;
  config.ssl = true;
  config.server_cert.set(client_pem_path_);

  SslMaterial material;
  Error error;
  ASSERT_EQ(CEQUEL_OK, SslMaterial::load(config, &material, &error)) << error.to_string();
  EXPECT_TRUE(material.verify_peer());
  EXPECT_TRUE(material.cert.empty());
  EXPECT_TRUE(material.private_key.empty());
}

TEST_F(SslUnitTest, NoVerification) {
  SslConfig config;
  config.ssl = true;

  SslMaterial material;
  ASSERT_EQ(CEQUEL_OK, SslMaterial::load(config, &material));
  EXPECT_FALSE(material.verify_peer());
}

TEST_F(SslUnitTest, MissingFile) {
  SslConfig config(client_config());
  config.server_cert.set("/nonexistent/cequel/ca.pem");

  SslMaterial material;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_SSL_UNABLE_TO_READ_FILE, SslMaterial::load(config, &material, &error));
  EXPECT_NE(String::npos, error.message.find("/nonexistent/cequel/ca.pem"));
}

TEST_F(SslUnitTest, InvalidCertificate) {
  SslConfig config(client_config());
  config.client_cert.set(client_key_path_);

  SslMaterial material;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_SSL_INVALID_CERT, SslMaterial::load(config, &material, &error));
}

TEST_F(SslUnitTest, WrongPassphrase) {
  add_logging_critera("Unable to load private key", CEQUEL_LOG_ERROR);

  SslConfig config(client_config());
  config.passphrase.set("wrong");

  SslMaterial material;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, SslMaterial::load(config, &material, &error));
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(SslUnitTest, PassphraseLongerThanKeyBuffer) {
  SslConfig config(client_config());
  config.passphrase.set(String(4096, 'x'));

  SslMaterial material;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, SslMaterial::load(config, &material, &error));
}

TEST_F(SslUnitTest, KeyDoesNotMatchCertificate) {
  add_logging_critera("Private key does not match", CEQUEL_LOG_ERROR);

  SslConfig config(client_config());
  config.client_cert.set(other_pem_path_);

  SslMaterial material;
  Error error;
  EXPECT_EQ(CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, SslMaterial::load(config, &material, &error));
  EXPECT_EQ(1, logging_criteria_count());
}

TEST_F(SslUnitTest, ClientCertWithoutKey) {
  add_logging_critera("without a private key", CEQUEL_LOG_WARN);

  SslConfig config(client_config());
  config.private_key.reset();

  SslMaterial material;
  ASSERT_EQ(CEQUEL_OK, SslMaterial::load(config, &material));
  EXPECT_EQ(1, logging_criteria_count());
}
