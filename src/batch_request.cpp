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

#include "batch_request.hpp"

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

ValueVec BatchRequest::values() const {
  ValueVec values;
  for (StatementVec::const_iterator it = statements_.begin(), end = statements_.end(); it != end;
       ++it) {
    const ValueVec& statement_values = (*it)->values();
    values.insert(values.end(), statement_values.begin(), statement_values.end());
  }
  return values;
}

String BatchRequest::to_cql() const {
  String cql(is_unlogged() ? "BEGIN UNLOGGED BATCH\n" : "BEGIN BATCH\n");
  for (StatementVec::const_iterator it = statements_.begin(), end = statements_.end(); it != end;
       ++it) {
    cql.append((*it)->query());
    cql.push_back('\n');
  }
  cql.append("APPLY BATCH");
  return cql;
}
