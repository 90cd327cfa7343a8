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

#include "connection_config.hpp"

#include "consistency.hpp"
#include "logger.hpp"
#include "policy_builder.hpp"
#include "utils.hpp"

#include <limits.h>

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

namespace {

class OptionReader {
public:
  OptionReader(const Options& options, Error* error)
      : options_(options)
      , error_(error)
      , rc_(CEQUEL_OK) {}

  CequelError rc() const { return rc_; }

  const OptionValue* get(const char* name, OptionValue::Type type) {
    const OptionValue* value = options_.find(name);
    if (value == NULL || rc_ != CEQUEL_OK) return NULL;
    if (value->type() != type) {
      fail(name, String("expected ") + option_type_string(type) + ", got " +
                     option_type_string(value->type()));
      return NULL;
    }
    return value;
  }

  void read(const char* name, Nullable<String>* result) {
    const OptionValue* value = get(name, OptionValue::STRING);
    if (value != NULL) result->set(value->as_string());
  }

  void read(const char* name, bool* result) {
    const OptionValue* value = get(name, OptionValue::BOOL);
    if (value != NULL) *result = value->as_bool();
  }

  void read(const char* name, int64_t min, int64_t max, Nullable<int64_t>* result) {
    const OptionValue* value = get(name, OptionValue::INT);
    if (value == NULL) return;
    if (value->as_int() < min || value->as_int() > max) {
      OStringStream ss;
      ss << "value " << value->as_int() << " is out of range [" << min << ", " << max << "]";
      fail(name, ss.str());
      return;
    }
    result->set(value->as_int());
  }

  void fail(const char* name, const String& reason) {
    if (rc_ != CEQUEL_OK) return;
    String message = String("Invalid option '") + name + "': " + reason;
    LOG_ERROR("%s", message.c_str());
    rc_ = set_error(error_, CEQUEL_ERROR_LIB_INVALID_CONFIGURATION, message);
  }

private:
  const Options& options_;
  Error* error_;
  CequelError rc_;
};

const char* recognized_options[] = { "host",
                                     "port",
                                     "keyspace",
                                     "username",
                                     "password",
                                     "ssl",
                                     "server_cert",
                                     "client_cert",
                                     "private_key",
                                     "passphrase",
                                     "datacenter",
                                     "connections_per_remote_node",
                                     "load_balancing_policy",
                                     "default_consistency",
                                     "slowlog_threshold_ms" };

bool is_recognized(const String& name) {
  for (size_t i = 0; i < num_elements(recognized_options); ++i) {
    if (name == recognized_options[i]) return true;
  }
  return false;
}

} // namespace

ConnectionConfig::ConnectionConfig()
    : host_(CEQUEL_DEFAULT_HOST)
    , port_(CEQUEL_DEFAULT_PORT)
    , default_consistency_(CEQUEL_CONSISTENCY_UNKNOWN) {
  hosts_.push_back(host_);
}

CequelError ConnectionConfig::from_options(const Options& options, ConnectionConfig* config,
                                           Error* error) {
  ConnectionConfig result;
  OptionReader reader(options, error);

  Nullable<String> host;
  reader.read("host", &host);
  if (!host.is_null()) {
    Vector<String> hosts;
    explode(host.value(), hosts);
    if (hosts.empty()) {
      reader.fail("host", "at least one contact point is required");
    }
    result.host_ = host.value();
    result.hosts_ = hosts;
  }

  Nullable<int64_t> port;
  reader.read("port", 1, 65535, &port);
  if (!port.is_null()) result.port_ = static_cast<int>(port.value());

  reader.read("keyspace", &result.keyspace_);
  reader.read("username", &result.username_);
  reader.read("password", &result.password_);
  if (reader.rc() == CEQUEL_OK && result.username_.is_null() != result.password_.is_null()) {
    reader.fail(result.username_.is_null() ? "username" : "password",
                "username and password must be provided together");
  }

  reader.read("ssl", &result.ssl_config_.ssl);
  reader.read("server_cert", &result.ssl_config_.server_cert);
  reader.read("client_cert", &result.ssl_config_.client_cert);
  reader.read("private_key", &result.ssl_config_.private_key);
  reader.read("passphrase", &result.ssl_config_.passphrase);

  reader.read("datacenter", &result.datacenter_);

  Nullable<int64_t> connections_per_remote_node;
  reader.read("connections_per_remote_node", 0, INT_MAX, &connections_per_remote_node);
  if (!connections_per_remote_node.is_null()) {
    result.connections_per_remote_node_.set(
        static_cast<int>(connections_per_remote_node.value()));
  }

  const OptionValue* policy = reader.get("load_balancing_policy", OptionValue::POLICY);
  if (policy != NULL) result.load_balancing_policy_ = policy->as_policy();

  Nullable<String> consistency;
  reader.read("default_consistency", &consistency);
  if (!consistency.is_null() &&
      !consistency_from_string(consistency.value(), &result.default_consistency_)) {
    reader.fail("default_consistency", "unknown consistency '" + consistency.value() + "'");
  }

  reader.read("slowlog_threshold_ms", 0, LLONG_MAX, &result.slowlog_threshold_ms_);

  if (reader.rc() != CEQUEL_OK) return reader.rc();

  for (Options::const_iterator it = options.begin(), end = options.end(); it != end; ++it) {
    if (!is_recognized(it->first)) {
      const OptionValue& value = it->second;
      switch (value.type()) {
        case OptionValue::STRING:
          result.passthrough_.set_string(it->first, value.as_string());
          break;
        case OptionValue::INT:
          result.passthrough_.set_int(it->first, value.as_int());
          break;
        case OptionValue::BOOL:
          result.passthrough_.set_bool(it->first, value.as_bool());
          break;
        case OptionValue::POLICY:
          result.passthrough_.set_policy(it->first, value.as_policy());
          break;
      }
    }
  }

  if (!result.ssl_config_.ssl &&
      (!result.ssl_config_.server_cert.is_null() || !result.ssl_config_.client_cert.is_null() ||
       !result.ssl_config_.private_key.is_null())) {
    LOG_WARN("TLS certificate options are set but 'ssl' is false; they will not be used");
  }

  *config = result;
  return CEQUEL_OK;
}

CequelError ConnectionConfig::from_json(const String& json, ConnectionConfig* config,
                                        Error* error) {
  Options options;
  CequelError rc = Options::from_json(json, &options, error);
  if (rc != CEQUEL_OK) return rc;
  return from_options(options, config, error);
}

ClusterSettings ConnectionConfig::cluster_settings() const {
  ClusterSettings settings;
  settings.hosts = hosts_;
  settings.port = port_;
  settings.keyspace = keyspace_;
  settings.username = username_;
  settings.password = password_;
  settings.ssl = ssl_config_;
  settings.datacenter = datacenter_;
  settings.connections_per_remote_node = connections_per_remote_node_;
  settings.load_balancing_policy = PolicyBuilder::build(datacenter_, load_balancing_policy_);
  settings.passthrough = passthrough_;
  return settings;
}
