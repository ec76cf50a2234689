#pragma once

#include <string>
#include <string_view>

namespace blueshare::crypto {

// Lowercase hex SHA-256 digest of `data` (64 characters).
// Throws util::CryptoFailure when libcrypto cannot produce it.
std::string Sha256Hex(std::string_view data);

} // namespace blueshare::crypto
