#pragma once

#include <cstdint>
#include <span>

namespace tw::crypto {

// Fills |out| from the OpenSSL CSPRNG. Throws tw::Error (Crypto) on failure.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace tw::crypto
