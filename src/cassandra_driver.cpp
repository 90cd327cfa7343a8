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

#include "cassandra_driver.hpp"

#include "batch_request.hpp"
#include "dc_aware_policy.hpp"
#include "logger.hpp"
#include "scoped_lock.hpp"
#include "statement.hpp"
#include "token_aware_policy.hpp"
#include "utils.hpp"
#include "whitelist_policy.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

static void forward_log_callback(const CassLogMessage* message, void* data) {
  CequelLogLevel severity = static_cast<CequelLogLevel>(message->severity);
  if (severity <= Logger::log_level()) {
    Logger::log(severity, message->file, message->line, message->function, "[driver] %s",
                message->message);
  }
}

static CequelError future_error(CassFuture* future, Error* error) {
  CassError rc = cass_future_error_code(future);
  if (rc == CASS_OK) return CEQUEL_OK;

  const char* message;
  size_t message_length;
  cass_future_error_message(future, &message, &message_length);
  return set_error(error, CassandraDriver::translate_error(rc), String(message, message_length));
}

static CequelError check(CassError rc, const String& context, Error* error) {
  if (rc == CASS_OK) return CEQUEL_OK;
  String message = context + ": " + cass_error_desc(rc);
  LOG_ERROR("%s", message.c_str());
  unsigned source = (static_cast<unsigned>(rc) >> 24) & 0xFF;
  return set_error(error,
                   source == CASS_ERROR_SOURCE_SSL ? CassandraDriver::translate_error(rc)
                                                   : CEQUEL_ERROR_LIB_INVALID_CONFIGURATION,
                   message);
}

static void close_session(CassSession* session) {
  CassFuture* future = cass_session_close(session);
  cass_future_wait(future);
  cass_future_free(future);
  cass_session_free(session);
}

static CassError bind_value(CassStatement* statement, size_t index, const Value& value) {
  switch (value.type()) {
    case Value::NULL_VALUE:
      return cass_statement_bind_null(statement, index);
    case Value::BOOLEAN:
      return cass_statement_bind_bool(statement, index, value.as_bool() ? cass_true : cass_false);
    case Value::INT32:
      return cass_statement_bind_int32(statement, index, value.as_int32());
    case Value::INT64:
      return cass_statement_bind_int64(statement, index, value.as_int64());
    case Value::DOUBLE:
      return cass_statement_bind_double(statement, index, value.as_double());
    case Value::TEXT:
      return cass_statement_bind_string_n(statement, index, value.as_string().data(),
                                          value.as_string().size());
    case Value::BLOB:
      return cass_statement_bind_bytes(
          statement, index, reinterpret_cast<const cass_byte_t*>(value.as_string().data()),
          value.as_string().size());
  }
  return CASS_ERROR_LIB_BAD_PARAMS;
}

static CassStatement* new_statement(const Statement& statement, Error* error) {
  const ValueVec& values = statement.values();
  CassStatement* result =
      cass_statement_new_n(statement.query().data(), statement.query().size(), values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    CassError rc = bind_value(result, i, values[i]);
    if (rc != CASS_OK) {
      OStringStream ss;
      ss << "Unable to bind value " << i << " (" << values[i].to_string()
         << "): " << cass_error_desc(rc);
      set_error(error, CEQUEL_ERROR_LIB_BAD_PARAMS, ss.str());
      cass_statement_free(result);
      return NULL;
    }
  }
  return result;
}

CassandraSession::~CassandraSession() {
  close();
  uv_rwlock_destroy(&rwlock_);
}

Response::Ptr CassandraSession::execute(const Request& request, CequelConsistency consistency,
                                        Error* error) {
  ScopedReadLock rl(&rwlock_);
  if (session_ == NULL) {
    set_error(error, CEQUEL_ERROR_CONNECTION_CLOSED, "Session has been closed");
    return Response::Ptr();
  }

  CassFuture* future = NULL;
  if (request.type() == Request::BATCH) {
    const BatchRequest& batch_request = static_cast<const BatchRequest&>(request);
    CassBatch* batch = cass_batch_new(batch_request.is_unlogged() ? CASS_BATCH_TYPE_UNLOGGED
                                                                  : CASS_BATCH_TYPE_LOGGED);
    const BatchRequest::StatementVec& statements = batch_request.statements();
    for (BatchRequest::StatementVec::const_iterator it = statements.begin(),
                                                    end = statements.end();
         it != end; ++it) {
      CassStatement* statement = new_statement(**it, error);
      if (statement == NULL) {
        cass_batch_free(batch);
        return Response::Ptr();
      }
      cass_batch_add_statement(batch, statement);
      cass_statement_free(statement);
    }
    if (is_consistency_set(consistency)) {
      cass_batch_set_consistency(batch, static_cast<CassConsistency>(consistency));
    }
    future = cass_session_execute_batch(session_, batch);
    cass_batch_free(batch);
  } else {
    CassStatement* statement = new_statement(static_cast<const Statement&>(request), error);
    if (statement == NULL) {
      return Response::Ptr();
    }
    if (is_consistency_set(consistency)) {
      cass_statement_set_consistency(statement, static_cast<CassConsistency>(consistency));
    }
    future = cass_session_execute(session_, statement);
    cass_statement_free(statement);
  }

  Response::Ptr response;
  if (future_error(future, error) == CEQUEL_OK) {
    response.reset(new CassandraResponse(cass_future_get_result(future)));
  }
  cass_future_free(future);
  return response;
}

void CassandraSession::close() {
  CassSession* session;
  { // Waits for in-flight requests
    ScopedWriteLock wl(&rwlock_);
    session = session_;
    session_ = NULL;
  }
  if (session != NULL) {
    close_session(session);
  }
}

CassandraCluster::~CassandraCluster() {
  close();
  uv_mutex_destroy(&mutex_);
}

Session::Ptr CassandraCluster::connect(const Nullable<String>& keyspace, Error* error) {
  ScopedMutex l(&mutex_);
  if (cluster_ == NULL) {
    set_error(error, CEQUEL_ERROR_CONNECTION_CLOSED, "Cluster has been closed");
    return Session::Ptr();
  }

  CassSession* session = cass_session_new();
  CassFuture* future;
  if (keyspace.is_null()) {
    future = cass_session_connect(session, cluster_);
  } else {
    future = cass_session_connect_keyspace_n(session, cluster_, keyspace.value().data(),
                                             keyspace.value().size());
  }

  CequelError rc = future_error(future, error);
  cass_future_free(future);
  if (rc != CEQUEL_OK) {
    cass_session_free(session);
    return Session::Ptr();
  }

  return Session::Ptr(new CassandraSession(session));
}

CequelError CassandraCluster::has_keyspace(const String& name, bool* exists, Error* error) {
  ScopedMutex l(&mutex_);
  if (cluster_ == NULL) {
    return set_error(error, CEQUEL_ERROR_CONNECTION_CLOSED, "Cluster has been closed");
  }

  if (metadata_session_ == NULL) {
    CassSession* session = cass_session_new();
    CassFuture* future = cass_session_connect(session, cluster_);
    CequelError rc = future_error(future, error);
    cass_future_free(future);
    if (rc != CEQUEL_OK) {
      cass_session_free(session);
      return rc;
    }
    metadata_session_ = session;
  }

  const CassSchemaMeta* schema_meta = cass_session_get_schema_meta(metadata_session_);
  const CassKeyspaceMeta* keyspace_meta =
      cass_schema_meta_keyspace_by_name_n(schema_meta, name.data(), name.size());
  *exists = keyspace_meta != NULL;
  cass_schema_meta_free(schema_meta);
  return CEQUEL_OK;
}

void CassandraCluster::close() {
  ScopedMutex l(&mutex_);
  if (metadata_session_ != NULL) {
    close_session(metadata_session_);
    metadata_session_ = NULL;
  }
  if (cluster_ != NULL) {
    cass_cluster_free(cluster_);
    cluster_ = NULL;
  }
  if (ssl_ != NULL) {
    cass_ssl_free(ssl_);
    ssl_ = NULL;
  }
}

void CassandraDriver::forward_logging() {
  cass_log_set_level(static_cast<CassLogLevel>(Logger::log_level()));
  cass_log_set_callback(forward_log_callback, NULL);
}

CequelError CassandraDriver::translate_error(CassError rc) {
  switch (rc) {
    case CASS_OK:
      return CEQUEL_OK;
    case CASS_ERROR_LIB_NO_HOSTS_AVAILABLE:
      return CEQUEL_ERROR_CONNECTION_NO_HOSTS_AVAILABLE;
    case CASS_ERROR_LIB_UNABLE_TO_CONNECT:
      return CEQUEL_ERROR_CONNECTION_UNABLE_TO_CONNECT;
    case CASS_ERROR_LIB_WRITE_ERROR:
      return CEQUEL_ERROR_CONNECTION_WRITE_ERROR;
    case CASS_ERROR_LIB_REQUEST_TIMED_OUT:
      return CEQUEL_ERROR_LIB_REQUEST_TIMED_OUT;
    case CASS_ERROR_SSL_INVALID_CERT:
      return CEQUEL_ERROR_SSL_INVALID_CERT;
    case CASS_ERROR_SSL_INVALID_PRIVATE_KEY:
      return CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY;
    default:
      break;
  }

  unsigned source = (static_cast<unsigned>(rc) >> 24) & 0xFF;
  if (source == CASS_ERROR_SOURCE_SERVER) {
    return static_cast<CequelError>(
        CEQUEL_ERROR(CEQUEL_ERROR_SOURCE_SERVER, (static_cast<unsigned>(rc) & 0xFFFFFF)));
  } else if (source == CASS_ERROR_SOURCE_SSL) {
    return CEQUEL_ERROR_SSL_PROTOCOL_ERROR;
  }
  return CEQUEL_ERROR_LIB_DRIVER_ERROR;
}

Cluster::Ptr CassandraDriver::build_cluster(const ClusterSettings& settings, Error* error) {
  CassCluster* cluster = cass_cluster_new();
  CassSsl* ssl = NULL;

  String contact_points = implode(settings.hosts, ',');
  CequelError rc = check(
      cass_cluster_set_contact_points_n(cluster, contact_points.data(), contact_points.size()),
      "Unable to set contact points '" + contact_points + "'", error);

  if (rc == CEQUEL_OK) {
    rc = check(cass_cluster_set_port(cluster, settings.port), "Unable to set port", error);
  }

  if (rc == CEQUEL_OK && !settings.username.is_null()) {
    const String& username = settings.username.value();
    String password = settings.password.value_or("");
    cass_cluster_set_credentials_n(cluster, username.data(), username.size(), password.data(),
                                   password.size());
  }

  if (rc == CEQUEL_OK && settings.ssl.ssl) {
    rc = apply_ssl(cluster, settings.ssl, &ssl, error);
  }

  if (rc == CEQUEL_OK && !settings.connections_per_remote_node.is_null()) {
    LOG_WARN("connections_per_remote_node (%d) is not supported by the driver and is ignored",
             settings.connections_per_remote_node.value());
  }

  if (rc == CEQUEL_OK) {
    rc = apply_policy(cluster, settings.load_balancing_policy, error);
  }

  if (rc == CEQUEL_OK) {
    rc = apply_passthrough(cluster, settings.passthrough, error);
  }

  if (rc != CEQUEL_OK) {
    if (ssl != NULL) cass_ssl_free(ssl);
    cass_cluster_free(cluster);
    return Cluster::Ptr();
  }

  return Cluster::Ptr(new CassandraCluster(cluster, ssl));
}

CequelError CassandraDriver::apply_policy(CassCluster* cluster,
                                          const LoadBalancingPolicy::Ptr& policy, Error* error) {
  if (!policy) return CEQUEL_OK; // Driver defaults

  LOG_DEBUG("Using load balancing policy %s", policy->to_string().c_str());

  if (policy->type() != LoadBalancingPolicy::TOKEN_AWARE) {
    cass_cluster_set_token_aware_routing(cluster, cass_false);
  }
  return apply_child_policy(cluster, policy, error);
}

CequelError CassandraDriver::apply_child_policy(CassCluster* cluster,
                                                const LoadBalancingPolicy::Ptr& policy,
                                                Error* error) {
  if (!policy) {
    cass_cluster_set_load_balance_round_robin(cluster);
    return CEQUEL_OK;
  }

  switch (policy->type()) {
    case LoadBalancingPolicy::ROUND_ROBIN:
      cass_cluster_set_load_balance_round_robin(cluster);
      return CEQUEL_OK;

    case LoadBalancingPolicy::DC_AWARE: {
      const DCAwarePolicy* dc_aware = static_cast<const DCAwarePolicy*>(policy.get());
      return check(cass_cluster_set_load_balance_dc_aware_n(
                       cluster, dc_aware->local_dc().data(), dc_aware->local_dc().size(),
                       static_cast<unsigned>(dc_aware->used_hosts_per_remote_dc()),
                       dc_aware->skip_remote_dcs_for_local_cl() ? cass_false : cass_true),
                   "Unable to set DC-aware load balancing for '" + dc_aware->local_dc() + "'",
                   error);
    }

    case LoadBalancingPolicy::TOKEN_AWARE: {
      const TokenAwarePolicy* token_aware = static_cast<const TokenAwarePolicy*>(policy.get());
      cass_cluster_set_token_aware_routing(cluster, cass_true);
      cass_cluster_set_token_aware_routing_shuffle_replicas(
          cluster, token_aware->shuffle_replicas() ? cass_true : cass_false);
      return apply_child_policy(cluster, token_aware->child_policy(), error);
    }

    case LoadBalancingPolicy::WHITELIST: {
      const WhitelistPolicy* whitelist = static_cast<const WhitelistPolicy*>(policy.get());
      String hosts = implode(whitelist->hosts(), ',');
      cass_cluster_set_whitelist_filtering_n(cluster, hosts.data(), hosts.size());
      return apply_child_policy(cluster, whitelist->child_policy(), error);
    }
  }

  return CEQUEL_OK;
}

CequelError CassandraDriver::apply_passthrough(CassCluster* cluster, const Options& options,
                                               Error* error) {
  for (Options::const_iterator it = options.begin(), end = options.end(); it != end; ++it) {
    const String& name = it->first;
    const OptionValue& value = it->second;

    bool is_tunable = name == "connect_timeout_ms" || name == "request_timeout_ms" ||
                      name == "protocol_version" || name == "num_threads_io" ||
                      name == "core_connections_per_host" || name == "heartbeat_interval_secs";
    if (!is_tunable) {
      LOG_WARN("Ignoring unsupported option '%s' (%s)", name.c_str(), value.to_string().c_str());
      continue;
    }

    if (value.type() != OptionValue::INT || value.as_int() < 0) {
      String message = "Invalid option '" + name + "': expected a non-negative integer";
      LOG_ERROR("%s", message.c_str());
      return set_error(error, CEQUEL_ERROR_LIB_INVALID_CONFIGURATION, message);
    }

    unsigned number = static_cast<unsigned>(value.as_int());
    CequelError rc = CEQUEL_OK;
    if (name == "connect_timeout_ms") {
      cass_cluster_set_connect_timeout(cluster, number);
    } else if (name == "request_timeout_ms") {
      cass_cluster_set_request_timeout(cluster, number);
    } else if (name == "protocol_version") {
      rc = check(cass_cluster_set_protocol_version(cluster, static_cast<int>(number)),
                 "Unable to set protocol_version", error);
    } else if (name == "num_threads_io") {
      rc = check(cass_cluster_set_num_threads_io(cluster, number), "Unable to set num_threads_io",
                 error);
    } else if (name == "core_connections_per_host") {
      rc = check(cass_cluster_set_core_connections_per_host(cluster, number),
                 "Unable to set core_connections_per_host", error);
    } else if (name == "heartbeat_interval_secs") {
      cass_cluster_set_connection_heartbeat_interval(cluster, number);
    }
    if (rc != CEQUEL_OK) return rc;
  }
  return CEQUEL_OK;
}

CequelError CassandraDriver::apply_ssl(CassCluster* cluster, const SslConfig& config,
                                       CassSsl** ssl, Error* error) {
  SslMaterial material;
  CequelError rc = SslMaterial::load(config, &material, error);
  if (rc != CEQUEL_OK) return rc;

  CassSsl* result = cass_ssl_new();
  if (material.verify_peer()) {
    cass_ssl_set_verify_flags(result, CASS_SSL_VERIFY_PEER_CERT);
    rc = check(cass_ssl_add_trusted_cert_n(result, material.trusted_cert.data(),
                                           material.trusted_cert.size()),
               "Unable to add server certificate", error);
  } else {
    cass_ssl_set_verify_flags(result, CASS_SSL_VERIFY_NONE);
  }

  if (rc == CEQUEL_OK && !material.cert.empty() && !material.private_key.empty()) {
    rc = check(cass_ssl_set_cert_n(result, material.cert.data(), material.cert.size()),
               "Unable to set client certificate", error);
    if (rc == CEQUEL_OK) {
      rc = check(cass_ssl_set_private_key_n(result, material.private_key.data(),
                                            material.private_key.size(),
                                            material.passphrase.c_str(),
                                            material.passphrase.size()),
                 "Unable to set private key", error);
    }
  }

  if (rc != CEQUEL_OK) {
    cass_ssl_free(result);
    return rc;
  }

  cass_cluster_set_ssl(cluster, result);
  *ssl = result;
  return CEQUEL_OK;
}
