#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace blueshare::crypto {

/*
  Source of channel entropy samples for ambiguous consent decisions.

  A sample is 64 independent byte values, uniform over [0, 255]. The returned
  value is Shannon-style: for each sample s with p = s / 255 and p > 0, the sum
  of -p * log2(p). Each term is at most 1 / (e * ln 2), so a 64-value sample
  lies in [0, kMaxEntropyBits]. The value carries no meaning beyond being a
  non-deterministic tie-break signal.
*/
class EntropySource {
 public:
  static constexpr std::size_t kSampleSize = 64;
  static constexpr double      kMaxEntropyBits = kSampleSize * 0.5307378455;

  using Sample = std::array<uint8_t, kSampleSize>;

  virtual ~EntropySource() = default;

  virtual Sample DrawSample() = 0;

  double Measure();
};

double ShannonEntropyBits(const EntropySource::Sample& sample);

// Draws samples from OpenSSL's CSPRNG. Safe to share across threads.
class SecureEntropySource final : public EntropySource {
 public:
  Sample DrawSample() override;
};

} // namespace blueshare::crypto
