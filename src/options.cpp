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

#include "options.hpp"

#include "dc_aware_policy.hpp"
#include "json.hpp"
#include "logger.hpp"
#include "round_robin_policy.hpp"
#include "token_aware_policy.hpp"
#include "whitelist_policy.hpp"

#include <fstream>

#define CONFIG_ERROR "Unable to load configuration: "

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

OptionValue OptionValue::string(const String& value) {
  OptionValue v;
  v.type_ = STRING;
  v.string_value_ = value;
  return v;
}

OptionValue OptionValue::integer(int64_t value) {
  OptionValue v;
  v.type_ = INT;
  v.int_value_ = value;
  return v;
}

OptionValue OptionValue::boolean(bool value) {
  OptionValue v;
  v.type_ = BOOL;
  v.int_value_ = value ? 1 : 0;
  return v;
}

OptionValue OptionValue::policy(const LoadBalancingPolicy::Ptr& value) {
  OptionValue v;
  v.type_ = POLICY;
  v.policy_value_ = value;
  return v;
}

String OptionValue::to_string() const {
  OStringStream ss;
  switch (type_) {
    case STRING:
      ss << string_value_;
      break;
    case INT:
      ss << int_value_;
      break;
    case BOOL:
      ss << (int_value_ != 0 ? "true" : "false");
      break;
    case POLICY:
      ss << (policy_value_ ? policy_value_->to_string() : String("null"));
      break;
  }
  return ss.str();
}

namespace cequel { namespace internal { namespace core {

const char* option_type_string(OptionValue::Type type) {
  switch (type) {
    case OptionValue::STRING:
      return "string";
    case OptionValue::INT:
      return "integer";
    case OptionValue::BOOL:
      return "boolean";
    case OptionValue::POLICY:
      return "load balancing policy";
  }
  return "";
}

}}} // namespace cequel::internal::core

Options& Options::set_string(const String& name, const String& value) {
  values_[name] = OptionValue::string(value);
  return *this;
}

Options& Options::set_int(const String& name, int64_t value) {
  values_[name] = OptionValue::integer(value);
  return *this;
}

Options& Options::set_bool(const String& name, bool value) {
  values_[name] = OptionValue::boolean(value);
  return *this;
}

Options& Options::set_policy(const String& name, const LoadBalancingPolicy::Ptr& policy) {
  values_[name] = OptionValue::policy(policy);
  return *this;
}

const OptionValue* Options::find(const String& name) const {
  ValueMap::const_iterator it = values_.find(name);
  if (it == values_.end()) return NULL;
  return &it->second;
}

static CequelError invalid(Error* error, const String& message) {
  LOG_ERROR(CONFIG_ERROR "%s", message.c_str());
  return set_error(error, CEQUEL_ERROR_LIB_INVALID_CONFIGURATION, message);
}

static CequelError parse_policy(const json::Value& value, const String& path,
                                LoadBalancingPolicy::Ptr* policy, Error* error);

// A missing or null child defaults to round-robin, as the transport does.
static CequelError parse_child_policy(const json::Value& value, const String& path,
                                      LoadBalancingPolicy::Ptr* child, Error* error) {
  if (!value.HasMember("child") || value["child"].IsNull()) {
    child->reset(new RoundRobinPolicy());
    return CEQUEL_OK;
  }
  return parse_policy(value["child"], path + ".child", child, error);
}

static CequelError parse_policy(const json::Value& value, const String& path,
                                LoadBalancingPolicy::Ptr* policy, Error* error) {
  if (!value.IsObject()) {
    return invalid(error, "'" + path + "' must be an object");
  }
  if (!value.HasMember("type") || !value["type"].IsString()) {
    return invalid(error, "'" + path + "' is missing a string 'type'");
  }

  String type(value["type"].GetString());

  if (type == "round_robin") {
    policy->reset(new RoundRobinPolicy());
  } else if (type == "dc_aware") {
    if (!value.HasMember("local_dc") || !value["local_dc"].IsString()) {
      return invalid(error, "'" + path + "' is missing a string 'local_dc'");
    }
    unsigned used_hosts_per_remote_dc = 0;
    if (value.HasMember("used_hosts_per_remote_dc")) {
      if (!value["used_hosts_per_remote_dc"].IsUint()) {
        return invalid(error,
                       "'" + path + ".used_hosts_per_remote_dc' must be a non-negative integer");
      }
      used_hosts_per_remote_dc = value["used_hosts_per_remote_dc"].GetUint();
    }
    bool allow_remote_dcs_for_local_cl = false;
    if (value.HasMember("allow_remote_dcs_for_local_cl")) {
      if (!value["allow_remote_dcs_for_local_cl"].IsBool()) {
        return invalid(error, "'" + path + ".allow_remote_dcs_for_local_cl' must be a boolean");
      }
      allow_remote_dcs_for_local_cl = value["allow_remote_dcs_for_local_cl"].GetBool();
    }
    policy->reset(new DCAwarePolicy(value["local_dc"].GetString(), used_hosts_per_remote_dc,
                                    !allow_remote_dcs_for_local_cl));
  } else if (type == "token_aware") {
    bool shuffle_replicas = true;
    if (value.HasMember("shuffle_replicas")) {
      if (!value["shuffle_replicas"].IsBool()) {
        return invalid(error, "'" + path + ".shuffle_replicas' must be a boolean");
      }
      shuffle_replicas = value["shuffle_replicas"].GetBool();
    }
    LoadBalancingPolicy::Ptr child;
    CequelError rc = parse_child_policy(value, path, &child, error);
    if (rc != CEQUEL_OK) return rc;
    policy->reset(new TokenAwarePolicy(child.get(), shuffle_replicas));
  } else if (type == "whitelist") {
    ContactPointList hosts;
    if (value.HasMember("hosts") && value["hosts"].IsString()) {
      explode(value["hosts"].GetString(), hosts);
    } else if (value.HasMember("hosts") && value["hosts"].IsArray()) {
      const json::Value& array = value["hosts"];
      for (rapidjson::SizeType i = 0; i < array.Size(); ++i) {
        if (!array[i].IsString()) {
          return invalid(error, "'" + path + ".hosts' must only contain strings");
        }
        hosts.push_back(array[i].GetString());
      }
    }
    if (hosts.empty()) {
      return invalid(error, "'" + path + "' requires at least one host in 'hosts'");
    }
    LoadBalancingPolicy::Ptr child;
    CequelError rc = parse_child_policy(value, path, &child, error);
    if (rc != CEQUEL_OK) return rc;
    policy->reset(new WhitelistPolicy(child.get(), hosts));
  } else {
    return invalid(error, "'" + path + "' has an unsupported type '" + type + "'");
  }

  return CEQUEL_OK;
}

CequelError Options::from_json(const String& json, Options* options, Error* error) {
  json::Document document;
  document.Parse(json.c_str());
  if (document.HasParseError()) {
    OStringStream ss;
    ss << "Invalid JSON at offset " << document.GetErrorOffset() << ": "
       << rapidjson::GetParseError_En(document.GetParseError());
    return invalid(error, ss.str());
  }
  if (!document.IsObject()) {
    return invalid(error, "The configuration document must be a JSON object");
  }

  Options result;
  for (json::Value::ConstMemberIterator it = document.MemberBegin(), end = document.MemberEnd();
       it != end; ++it) {
    String name(it->name.GetString(), it->name.GetStringLength());
    const json::Value& value = it->value;

    if (value.IsNull()) {
      continue;
    } else if (name == "load_balancing_policy") {
      LoadBalancingPolicy::Ptr policy;
      CequelError rc = parse_policy(value, name, &policy, error);
      if (rc != CEQUEL_OK) return rc;
      result.set_policy(name, policy);
    } else if (value.IsString()) {
      result.set_string(name, String(value.GetString(), value.GetStringLength()));
    } else if (value.IsBool()) {
      result.set_bool(name, value.GetBool());
    } else if (value.IsInt64()) {
      result.set_int(name, value.GetInt64());
    } else {
      return invalid(error, "'" + name + "' has an unsupported value type");
    }
  }

  *options = result;
  return CEQUEL_OK;
}

CequelError Options::from_json_file(const String& path, Options* options, Error* error) {
  std::ifstream file(path.c_str());
  if (!file.good()) {
    return invalid(error, "Unable to open configuration file '" + path + "'");
  }
  OStringStream contents;
  contents << file.rdbuf();
  return from_json(contents.str(), options, error);
}
