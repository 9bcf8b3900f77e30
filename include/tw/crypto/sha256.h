#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace tw::crypto {
using Sha256Digest = std::array<uint8_t, 32>;

Sha256Digest SHA256_Hash(std::span<const uint8_t> data);
Sha256Digest SHA256_Hash(std::string_view data);
} // namespace tw::crypto
