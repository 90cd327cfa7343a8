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

#ifndef CEQUEL_INTERNAL_STRING_HPP
#define CEQUEL_INTERNAL_STRING_HPP

#include <sstream>
#include <string>

namespace cequel { namespace internal {

typedef std::string String;
typedef std::ostringstream OStringStream;
typedef std::istringstream IStringStream;

}} // namespace cequel::internal

#endif
