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

#ifndef CEQUEL_INTERNAL_ERROR_HPP
#define CEQUEL_INTERNAL_ERROR_HPP

#include "cequel.h"
#include "string.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * An error code plus the message reported where it was raised. Fallible
 * operations return the code and fill an optional Error out-parameter.
 */
struct Error {
  Error()
      : code(CEQUEL_OK) {}

  Error(CequelError code, const String& message)
      : code(code)
      , message(message) {}

  bool ok() const { return code == CEQUEL_OK; }

  CequelErrorSource source() const { return cequel_error_source(code); }

  bool is_connection_error() const { return source() == CEQUEL_ERROR_SOURCE_CONNECTION; }

  // "<description>: <message>"
  String to_string() const;

  void reset() {
    code = CEQUEL_OK;
    message.clear();
  }

  CequelError code;
  String message;
};

inline CequelError set_error(Error* error, CequelError code, const String& message) {
  if (error != NULL) {
    error->code = code;
    error->message = message;
  }
  return code;
}

inline CequelError set_error(Error* error, const Error& other) {
  return set_error(error, other.code, other.message);
}

}}} // namespace cequel::internal::core

#endif
