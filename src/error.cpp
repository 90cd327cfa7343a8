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

#include "error.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

String Error::to_string() const {
  String result(cequel_error_desc(code));
  if (!message.empty()) {
    result.append(": ");
    result.append(message);
  }
  return result;
}
