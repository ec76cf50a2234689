#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace blueshare::util {

/*
  Session identifiers

  A session without a configured id gets a random RFC4122 v4 UUID in
  canonical lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

// Throws EntropyUnavailable when the CSPRNG cannot be read.
UUID        GenerateUUID();
std::string ToString(const UUID& id);

std::string NewSessionId();

} // namespace blueshare::util
