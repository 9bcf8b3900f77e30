#include "tw/crypto/random.h"

#include <algorithm>
#include <climits>

#include <openssl/rand.h>

#include "openssl_util.h"

namespace tw::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  size_t offset = 0;
  while (offset < out.size()) {
    const size_t chunk = std::min<size_t>(out.size() - offset, static_cast<size_t>(INT_MAX));
    if (RAND_bytes(out.data() + offset, static_cast<int>(chunk)) != 1) {
      detail::ThrowCryptoError(detail::BuildOpenSSLErrorMessage("RAND_bytes"));
    }
    offset += chunk;
  }
}

}  // namespace tw::crypto
