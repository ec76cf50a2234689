#pragma once

#include <cstdint>
#include <string_view>

namespace blueshare::model {

enum class PaymentState : std::uint8_t {
  kPending = 0,
  kAuthorized = 1,
  kProcessing = 2,
  kSettled = 3,
  kFailed = 4,
};

constexpr std::string_view ToString(PaymentState state) {
  switch (state) {
    case PaymentState::kPending:
      return "pending";
    case PaymentState::kAuthorized:
      return "authorized";
    case PaymentState::kProcessing:
      return "processing";
    case PaymentState::kSettled:
      return "settled";
    case PaymentState::kFailed:
    default:
      return "failed";
  }
}

constexpr bool IsTerminal(PaymentState state) {
  return state == PaymentState::kSettled || state == PaymentState::kFailed;
}

constexpr bool CanTransition(PaymentState from, PaymentState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == PaymentState::kFailed) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

// Throws util::InvalidState when the table forbids the move.
void Transition(PaymentState& current, PaymentState next);

} // namespace blueshare::model
