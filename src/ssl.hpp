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

#ifndef CEQUEL_INTERNAL_SSL_HPP
#define CEQUEL_INTERNAL_SSL_HPP

#include "cequel.h"
#include "connection_config.hpp"
#include "error.hpp"
#include "string.hpp"

namespace cequel { namespace internal { namespace core {

/**
 * TLS material read from the configured PEM files and checked before it is
 * handed to a transport.
 */
struct SslMaterial {
  String trusted_cert; // Server certificate(s); peer verification when present
  String cert;         // Client certificate chain
  String private_key;  // Client private key, possibly encrypted
  String passphrase;

  bool verify_peer() const { return !trusted_cert.empty(); }

  /**
   * Read every configured path and validate the contents.
   *
   * @return CEQUEL_OK, CEQUEL_ERROR_SSL_UNABLE_TO_READ_FILE,
   * CEQUEL_ERROR_SSL_INVALID_CERT or CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY
   */
  static CequelError load(const SslConfig& config, SslMaterial* material, Error* error = NULL);

  // Number of PEM X.509 certificates in the buffer; zero if none parse.
  static int count_certificates(const String& pem);

  // Decrypt and parse a PEM private key, optionally checking it against
  // the first certificate of cert.
  static CequelError check_private_key(const String& pem, const String& passphrase,
                                       const String& cert, Error* error = NULL);
};

}}} // namespace cequel::internal::core

#endif
