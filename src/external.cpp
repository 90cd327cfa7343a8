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

#include "cequel.h"

extern "C" {

const char* cequel_error_desc(CequelError error) {
  switch (error) {
    case CEQUEL_OK:
      return "Ok";
#define XX(source, _, code, desc)  \
  case CEQUEL_ERROR(source, code): \
    return desc;
      CEQUEL_ERROR_MAPPING(XX)
#undef XX
    default:
      return "";
  }
}

CequelErrorSource cequel_error_source(CequelError error) {
  if (error == CEQUEL_OK) return CEQUEL_ERROR_SOURCE_NONE;
  return static_cast<CequelErrorSource>(CEQUEL_ERROR_SOURCE_OF(error));
}

const char* cequel_log_level_string(CequelLogLevel log_level) {
  switch (log_level) {
#define XX(log_level, desc) \
  case log_level:           \
    return desc;
    CEQUEL_LOG_LEVEL_MAPPING(XX)
#undef XX
    default:
      return "";
  }
}

const char* cequel_consistency_string(CequelConsistency consistency) {
  switch (consistency) {
#define XX(consistency, desc) \
  case consistency:           \
    return desc;
    CEQUEL_CONSISTENCY_MAPPING(XX)
#undef XX
    default:
      return "";
  }
}

} // extern "C"
