#include "tw/crypto/sha256.h"

#include <openssl/evp.h>

#include "openssl_util.h"

namespace tw::crypto {

Sha256Digest SHA256_Hash(std::span<const uint8_t> data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    detail::ThrowCryptoError(detail::BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    detail::ThrowCryptoError("EVP_Digest(EVP_sha256): unexpected digest length");
  }
  return out;
}

Sha256Digest SHA256_Hash(std::string_view data) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
  return SHA256_Hash(std::span<const uint8_t>(bytes, data.size()));
}

}  // namespace tw::crypto
