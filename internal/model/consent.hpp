#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace blueshare::model {

enum class ConsentState : std::uint8_t {
  kAccept = 0,
  kReject = 1,
  kAmbiguous = 2,
};

constexpr std::string_view ToString(ConsentState state) {
  switch (state) {
    case ConsentState::kAccept:
      return "accept";
    case ConsentState::kReject:
      return "reject";
    case ConsentState::kAmbiguous:
    default:
      return "ambiguous";
  }
}

/*
  Outcome of one consent round for one device.

  entropy_bits is present only for kAmbiguous. A record is never edited; a new
  round replaces it.
*/
struct ConsentRecord {
  ConsentState                          state = ConsentState::kReject;
  std::optional<double>                 entropy_bits;
  std::chrono::system_clock::time_point captured_at{};
};

} // namespace blueshare::model
