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

#ifndef CEQUEL_INTERNAL_STATEMENT_HPP
#define CEQUEL_INTERNAL_STATEMENT_HPP

#include "request.hpp"
#include "value.hpp"

namespace cequel { namespace internal { namespace core {

class Statement : public Request {
public:
  typedef SharedRefPtr<const Statement> ConstPtr;

  enum Kind { READ, WRITE };

  Statement(Kind kind, const String& query, const ValueVec& values = ValueVec(),
            CequelConsistency consistency = CEQUEL_CONSISTENCY_UNKNOWN)
      : Request(STATEMENT, consistency)
      , kind_(kind)
      , query_(query)
      , values_(values) {}

  static ConstPtr read(const String& query, const ValueVec& values = ValueVec());
  static ConstPtr write(const String& query, const ValueVec& values = ValueVec());

  Kind kind() const { return kind_; }
  bool is_write() const { return kind_ == WRITE; }
  const String& query() const { return query_; }
  const ValueVec& values() const { return values_; }

  // Copy of this statement carrying its own consistency level.
  ConstPtr with_consistency(CequelConsistency consistency) const;

  virtual String to_cql() const { return query_; }

private:
  Kind kind_;
  String query_;
  ValueVec values_;
};

}}} // namespace cequel::internal::core

#endif
