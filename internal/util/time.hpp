#pragma once

#include <chrono>
#include <cstdint>

namespace blueshare::util {

/*
  Wall-clock helpers. Session, consent and payment timestamps all come from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t ToUnixNanos(TimePoint tp);

} // namespace blueshare::util
