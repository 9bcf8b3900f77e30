#pragma once

#include <string>

#include <openssl/err.h>

#include "tw/error.h"

namespace tw::crypto::detail {

inline std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] inline void ThrowCryptoError(const std::string& message) {
  throw Error{ErrorDomain::Crypto, 0, message};
}

}  // namespace tw::crypto::detail
