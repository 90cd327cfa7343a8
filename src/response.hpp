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

#ifndef CEQUEL_INTERNAL_RESPONSE_HPP
#define CEQUEL_INTERNAL_RESPONSE_HPP

#include "macros.hpp"
#include "ref_counted.hpp"

namespace cequel { namespace internal { namespace core {

// The transport's result for one request. Its shape belongs to the transport.
class Response : public RefCounted<Response> {
public:
  typedef SharedRefPtr<Response> Ptr;

  Response() {}
  virtual ~Response() {}

private:
  DISALLOW_COPY_AND_ASSIGN(Response);
};

}}} // namespace cequel::internal::core

#endif
