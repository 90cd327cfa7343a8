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

#ifndef __CEQUEL_H_INCLUDED__
#define __CEQUEL_H_INCLUDED__

#include <stddef.h>

#if !defined(CEQUEL_STATIC)
#  if (defined(WIN32) || defined(_WIN32))
#    if defined(CEQUEL_BUILDING)
#      define CEQUEL_EXPORT __declspec(dllexport)
#    else
#      define CEQUEL_EXPORT __declspec(dllimport)
#    endif
#  elif (defined(__GNUC__) && __GNUC__ >= 4) || defined(__INTEL_COMPILER)
#    define CEQUEL_EXPORT __attribute__ ((visibility("default")))
#  endif
#else
#define CEQUEL_EXPORT
#endif

/**
 * @file include/cequel.h
 *
 * Statement batching and execution layer for Apache Cassandra. Statements are
 * sent through a cluster transport (the DataStax C/C++ driver by default) with
 * a resolved consistency level, optionally grouped into logged or unlogged
 * batches, and retried once when the connection is lost.
 */

#define CEQUEL_VERSION_MAJOR 1
#define CEQUEL_VERSION_MINOR 0
#define CEQUEL_VERSION_PATCH 0
#define CEQUEL_VERSION_SUFFIX ""

#ifdef __cplusplus
extern "C" {
#endif

typedef enum { cequel_false = 0, cequel_true = 1 } cequel_bool_t;

#if defined(__INT64_TYPE__) && defined(__UINT64_TYPE__)
typedef __INT64_TYPE__ cequel_int64_t;
typedef __UINT64_TYPE__ cequel_uint64_t;
#else
typedef long long cequel_int64_t;
typedef unsigned long long cequel_uint64_t;
#endif

/***********************************************************************************
 *
 * Consistency
 *
 ***********************************************************************************/

typedef enum CequelConsistency_ {
  CEQUEL_CONSISTENCY_UNKNOWN      = 0xFFFF,
  CEQUEL_CONSISTENCY_ANY          = 0x0000,
  CEQUEL_CONSISTENCY_ONE          = 0x0001,
  CEQUEL_CONSISTENCY_TWO          = 0x0002,
  CEQUEL_CONSISTENCY_THREE        = 0x0003,
  CEQUEL_CONSISTENCY_QUORUM       = 0x0004,
  CEQUEL_CONSISTENCY_ALL          = 0x0005,
  CEQUEL_CONSISTENCY_LOCAL_QUORUM = 0x0006,
  CEQUEL_CONSISTENCY_EACH_QUORUM  = 0x0007,
  CEQUEL_CONSISTENCY_SERIAL       = 0x0008,
  CEQUEL_CONSISTENCY_LOCAL_SERIAL = 0x0009,
  CEQUEL_CONSISTENCY_LOCAL_ONE    = 0x000A
} CequelConsistency;

#define CEQUEL_CONSISTENCY_MAPPING(XX) \
  XX(CEQUEL_CONSISTENCY_UNKNOWN, "UNKNOWN") \
  XX(CEQUEL_CONSISTENCY_ANY, "ANY") \
  XX(CEQUEL_CONSISTENCY_ONE, "ONE") \
  XX(CEQUEL_CONSISTENCY_TWO, "TWO") \
  XX(CEQUEL_CONSISTENCY_THREE, "THREE") \
  XX(CEQUEL_CONSISTENCY_QUORUM, "QUORUM") \
  XX(CEQUEL_CONSISTENCY_ALL, "ALL") \
  XX(CEQUEL_CONSISTENCY_LOCAL_QUORUM, "LOCAL_QUORUM") \
  XX(CEQUEL_CONSISTENCY_EACH_QUORUM, "EACH_QUORUM") \
  XX(CEQUEL_CONSISTENCY_SERIAL, "SERIAL") \
  XX(CEQUEL_CONSISTENCY_LOCAL_SERIAL, "LOCAL_SERIAL") \
  XX(CEQUEL_CONSISTENCY_LOCAL_ONE, "LOCAL_ONE")

/***********************************************************************************
 *
 * Batch
 *
 ***********************************************************************************/

typedef enum CequelBatchType_ {
  CEQUEL_BATCH_TYPE_LOGGED   = 0x00,
  CEQUEL_BATCH_TYPE_UNLOGGED = 0x01
} CequelBatchType;

/***********************************************************************************
 *
 * Log
 *
 ***********************************************************************************/

#define CEQUEL_LOG_LEVEL_MAPPING(XX) \
  XX(CEQUEL_LOG_DISABLED, "") \
  XX(CEQUEL_LOG_CRITICAL, "CRITICAL") \
  XX(CEQUEL_LOG_ERROR, "ERROR") \
  XX(CEQUEL_LOG_WARN, "WARN") \
  XX(CEQUEL_LOG_INFO, "INFO") \
  XX(CEQUEL_LOG_DEBUG, "DEBUG") \
  XX(CEQUEL_LOG_TRACE, "TRACE")

typedef enum CequelLogLevel_ {
#define XX_LOG(log_level, _) log_level,
  CEQUEL_LOG_LEVEL_MAPPING(XX_LOG)
#undef XX_LOG
  /* @cond IGNORE */
  CEQUEL_LOG_LAST_ENTRY
  /* @endcond */
} CequelLogLevel;

/***********************************************************************************
 *
 * Error
 *
 ***********************************************************************************/

typedef enum CequelErrorSource_ {
  CEQUEL_ERROR_SOURCE_NONE,
  CEQUEL_ERROR_SOURCE_LIB,
  CEQUEL_ERROR_SOURCE_CONNECTION,
  CEQUEL_ERROR_SOURCE_SERVER,
  CEQUEL_ERROR_SOURCE_SSL
} CequelErrorSource;

#define CEQUEL_ERROR_MAPPING(XX) \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_BAD_PARAMS, 1, "Bad parameters") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_INVALID_CONFIGURATION, 2, "Invalid configuration") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_CONFLICTING_CONSISTENCY, 3, "Conflicting consistency levels in batch") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_INVALID_STATE, 4, "Invalid state") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_INVALID_STATEMENT_TYPE, 5, "Invalid statement type") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_REQUEST_TIMED_OUT, 6, "Request timed out") \
  XX(CEQUEL_ERROR_SOURCE_LIB, CEQUEL_ERROR_LIB_DRIVER_ERROR, 7, "Driver error") \
  XX(CEQUEL_ERROR_SOURCE_CONNECTION, CEQUEL_ERROR_CONNECTION_CLOSED, 1, "Connection closed") \
  XX(CEQUEL_ERROR_SOURCE_CONNECTION, CEQUEL_ERROR_CONNECTION_UNABLE_TO_CONNECT, 2, "Unable to connect") \
  XX(CEQUEL_ERROR_SOURCE_CONNECTION, CEQUEL_ERROR_CONNECTION_NO_HOSTS_AVAILABLE, 3, "No hosts available") \
  XX(CEQUEL_ERROR_SOURCE_CONNECTION, CEQUEL_ERROR_CONNECTION_WRITE_ERROR, 4, "Write error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_SERVER_ERROR, 0x0000, "Server error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_PROTOCOL_ERROR, 0x000A, "Protocol error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_BAD_CREDENTIALS, 0x0100, "Bad credentials") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_UNAVAILABLE, 0x1000, "Unavailable") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_OVERLOADED, 0x1001, "Overloaded") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_IS_BOOTSTRAPPING, 0x1002, "Is bootstrapping") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_TRUNCATE_ERROR, 0x1003, "Truncate error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_WRITE_TIMEOUT, 0x1100, "Write timeout") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_READ_TIMEOUT, 0x1200, "Read timeout") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_READ_FAILURE, 0x1300, "Read failure") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_FUNCTION_FAILURE, 0x1400, "Function failure") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_WRITE_FAILURE, 0x1500, "Write failure") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_SYNTAX_ERROR, 0x2000, "Syntax error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_UNAUTHORIZED, 0x2100, "Unauthorized") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_INVALID_QUERY, 0x2200, "Invalid query") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_CONFIG_ERROR, 0x2300, "Configuration error") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_ALREADY_EXISTS, 0x2400, "Already exists") \
  XX(CEQUEL_ERROR_SOURCE_SERVER, CEQUEL_ERROR_SERVER_UNPREPARED, 0x2500, "Unprepared") \
  XX(CEQUEL_ERROR_SOURCE_SSL, CEQUEL_ERROR_SSL_INVALID_CERT, 1, "Unable to load certificate") \
  XX(CEQUEL_ERROR_SOURCE_SSL, CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, 2, "Unable to load private key") \
  XX(CEQUEL_ERROR_SOURCE_SSL, CEQUEL_ERROR_SSL_UNABLE_TO_READ_FILE, 3, "Unable to read file") \
  XX(CEQUEL_ERROR_SOURCE_SSL, CEQUEL_ERROR_SSL_PROTOCOL_ERROR, 4, "Protocol error")

#define CEQUEL_ERROR(source, code) ((source << 24) | code)

#define CEQUEL_ERROR_SOURCE_OF(error) \
  ((CequelErrorSource)(((unsigned)(error) >> 24) & 0xFF))

typedef enum CequelError_ {
  CEQUEL_OK = 0,
#define XX_ERROR(source, name, code, _) name = CEQUEL_ERROR(source, code),
  CEQUEL_ERROR_MAPPING(XX_ERROR)
#undef XX_ERROR
  /* @cond IGNORE */
  CEQUEL_ERROR_LAST_ENTRY
  /* @endcond*/
} CequelError;

/**
 * Maximum size of a log message
 */
#define CEQUEL_LOG_MAX_MESSAGE_SIZE 1024

/**
 * A log message.
 */
typedef struct CequelLogMessage_ {
  /**
   * The millisecond timestamp (since the Epoch) when the message was logged
   */
  cequel_uint64_t time_ms;
  CequelLogLevel severity; /**< The severity of the log message */
  const char* file; /**< The file where the message was logged */
  int line; /**< The line in the file where the message was logged */
  const char* function; /**< The function where the message was logged */
  char message[CEQUEL_LOG_MAX_MESSAGE_SIZE]; /**< The message */
} CequelLogMessage;

/**
 * A callback that's used to handle logging.
 *
 * @param[in] message
 * @param[in] data user defined data provided when the callback
 * was registered.
 *
 * @see cequel_log_set_callback();
 */
typedef void (*CequelLogCallback)(const CequelLogMessage* message,
                                  void* data);

/***********************************************************************************
 *
 * Consistency
 *
 ***********************************************************************************/

/**
 * Gets the string for a consistency.
 *
 * @param[in] consistency
 * @return A null-terminated string for the consistency.
 * Example: "ALL", "ONE", "QUORUM", etc.
 */
CEQUEL_EXPORT const char*
cequel_consistency_string(CequelConsistency consistency);

/***********************************************************************************
 *
 * Error
 *
 ***********************************************************************************/

/**
 * Gets a description for an error code.
 *
 * @param[in] error
 * @return A null-terminated string describing the error.
 */
CEQUEL_EXPORT const char*
cequel_error_desc(CequelError error);

/**
 * Gets the source of an error code. Only errors from
 * CEQUEL_ERROR_SOURCE_CONNECTION are retried.
 *
 * @param[in] error
 * @return The error source.
 */
CEQUEL_EXPORT CequelErrorSource
cequel_error_source(CequelError error);

/***********************************************************************************
 *
 * Log
 *
 ***********************************************************************************/

/**
 * Sets the log level.
 *
 * <b>Default:</b> CEQUEL_LOG_WARN
 *
 * @param[in] log_level
 */
CEQUEL_EXPORT void
cequel_log_set_level(CequelLogLevel log_level);

/**
 * Sets a callback for handling logging events.
 *
 * <b>Default:</b> An internal callback that prints to stderr
 *
 * @param[in] callback A callback that handles logging events. This is
 * called from the thread that logged, so access to shared data must be
 * synchronized.
 * @param[in] data An opaque data object passed to the callback.
 */
CEQUEL_EXPORT void
cequel_log_set_callback(CequelLogCallback callback,
                        void* data);

/**
 * Gets the string for a log level.
 *
 * @param[in] log_level
 * @return A null-terminated string for the log level.
 * Example: "ERROR", "WARN", "INFO", etc.
 */
CEQUEL_EXPORT const char*
cequel_log_level_string(CequelLogLevel log_level);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* __CEQUEL_H_INCLUDED__ */
