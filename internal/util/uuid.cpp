#include "internal/util/uuid.hpp"

#include <openssl/rand.h>

#include "internal/util/errors.hpp"

namespace blueshare::util {

UUID GenerateUUID() {
  UUID id{};
  if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
    throw EntropyUnavailable("RAND_bytes failed while generating a session id");
  }

  // version 4, RFC4122 variant
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string text;
  text.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      text.push_back('-');
    }
    text.push_back(kHex[id[i] >> 4]);
    text.push_back(kHex[id[i] & 0x0F]);
  }
  return text;
}

std::string NewSessionId() {
  return ToString(GenerateUUID());
}

} // namespace blueshare::util
