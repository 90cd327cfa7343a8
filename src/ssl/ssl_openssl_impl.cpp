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

#include "ssl.hpp"

#include "logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <fstream>
#include <string.h>

using namespace cequel;
using namespace cequel::internal;
using namespace cequel::internal::core;

static String ssl_error_string() {
  const char* data;
  int flags;
  unsigned long err;
  String error;
  while ((err =
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
              ERR_get_error_all(NULL, NULL, NULL, &data, &flags)
#else
              ERR_get_error_line_data(NULL, NULL, &data, &flags)
#endif
              ) != 0) {
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    if (!error.empty()) error.push_back(',');
    error.append(buf);
    if (flags & ERR_TXT_STRING) {
      error.push_back(':');
      error.append(data);
    }
  }
  return error;
}

static int pem_password_callback(char* buf, int size, int rwflag, void* u) {
  if (u == NULL) return 0;

  int len = strlen(static_cast<const char*>(u));
  if (len == 0) return 0;

  int to_copy = size;
  if (len < to_copy) {
    to_copy = len;
  }
  memcpy(buf, u, to_copy);

  return to_copy;
}

static X509* load_first_cert(const String& pem) {
  BIO* bio = BIO_new_mem_buf(const_cast<char*>(pem.data()), static_cast<int>(pem.size()));
  if (bio == NULL) return NULL;
  X509* cert = PEM_read_bio_X509(bio, NULL, pem_password_callback, NULL);
  BIO_free_all(bio);
  return cert;
}

static EVP_PKEY* load_key(const String& key, const char* password) {
  BIO* bio = BIO_new_mem_buf(const_cast<char*>(key.data()), static_cast<int>(key.size()));
  if (bio == NULL) {
    return NULL;
  }

  EVP_PKEY* pkey =
      PEM_read_bio_PrivateKey(bio, NULL, pem_password_callback, const_cast<char*>(password));

  BIO_free_all(bio);

  return pkey;
}

static CequelError read_file(const char* option, const String& path, String* contents,
                             Error* error) {
  std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
  if (!file.good()) {
    String message = "Unable to read " + String(option) + " file '" + path + "'";
    LOG_ERROR("%s", message.c_str());
    return set_error(error, CEQUEL_ERROR_SSL_UNABLE_TO_READ_FILE, message);
  }
  OStringStream ss;
  ss << file.rdbuf();
  *contents = ss.str();
  return CEQUEL_OK;
}

int SslMaterial::count_certificates(const String& pem) {
  BIO* bio = BIO_new_mem_buf(const_cast<char*>(pem.data()), static_cast<int>(pem.size()));
  if (bio == NULL) {
    return 0;
  }

  int num_certs = 0;

  // Iterate over the bio, reading out as many certificates as possible.
  for (X509* cert = PEM_read_bio_X509(bio, NULL, pem_password_callback, NULL); cert != NULL;
       cert = PEM_read_bio_X509(bio, NULL, pem_password_callback, NULL)) {
    X509_free(cert);
    num_certs++;
  }

  // Discard the error that terminated the loop so it doesn't leak into the
  // next PEM operation.
  ERR_clear_error();

  BIO_free_all(bio);

  return num_certs;
}

CequelError SslMaterial::check_private_key(const String& pem, const String& passphrase,
                                           const String& cert, Error* error) {
  EVP_PKEY* pkey = load_key(pem, passphrase.empty() ? NULL : passphrase.c_str());
  if (pkey == NULL) {
    String message = "Unable to load private key: " + ssl_error_string();
    LOG_ERROR("%s", message.c_str());
    return set_error(error, CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, message);
  }

  CequelError rc = CEQUEL_OK;
  if (!cert.empty()) {
    X509* x509 = load_first_cert(cert);
    if (x509 == NULL) {
      ERR_clear_error();
      rc = set_error(error, CEQUEL_ERROR_SSL_INVALID_CERT, "Unable to load client certificate");
    } else {
      if (X509_check_private_key(x509, pkey) != 1) {
        String message = "Private key does not match the client certificate: " +
                         ssl_error_string();
        LOG_ERROR("%s", message.c_str());
        rc = set_error(error, CEQUEL_ERROR_SSL_INVALID_PRIVATE_KEY, message);
      }
      X509_free(x509);
    }
  }

  EVP_PKEY_free(pkey);
  return rc;
}

CequelError SslMaterial::load(const SslConfig& config, SslMaterial* material, Error* error) {
  SslMaterial result;
  CequelError rc;

  if (!config.server_cert.is_null()) {
    rc = read_file("server_cert", config.server_cert.value(), &result.trusted_cert, error);
    if (rc != CEQUEL_OK) return rc;
    if (count_certificates(result.trusted_cert) == 0) {
      String message = "Unable to load server certificate(s) from '" +
                       config.server_cert.value() + "'";
      LOG_ERROR("%s", message.c_str());
      return set_error(error, CEQUEL_ERROR_SSL_INVALID_CERT, message);
    }
  }

  if (!config.client_cert.is_null()) {
    rc = read_file("client_cert", config.client_cert.value(), &result.cert, error);
    if (rc != CEQUEL_OK) return rc;
    if (count_certificates(result.cert) == 0) {
      String message = "Unable to load client certificate from '" +
                       config.client_cert.value() + "'";
      LOG_ERROR("%s", message.c_str());
      return set_error(error, CEQUEL_ERROR_SSL_INVALID_CERT, message);
    }
  }

  result.passphrase = config.passphrase.value_or("");

  if (!config.private_key.is_null()) {
    rc = read_file("private_key", config.private_key.value(), &result.private_key, error);
    if (rc != CEQUEL_OK) return rc;
    rc = check_private_key(result.private_key, result.passphrase, result.cert, error);
    if (rc != CEQUEL_OK) return rc;
  } else if (!result.cert.empty()) {
    LOG_WARN("A client certificate was configured without a private key; it will not be used");
  }

  *material = result;
  return CEQUEL_OK;
}
