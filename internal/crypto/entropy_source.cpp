#include "internal/crypto/entropy_source.hpp"

#include <cmath>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "internal/util/errors.hpp"

namespace blueshare::crypto {

double EntropySource::Measure() {
  return ShannonEntropyBits(DrawSample());
}

double ShannonEntropyBits(const EntropySource::Sample& sample) {
  double entropy = 0.0;
  for (const auto value : sample) {
    const double p = static_cast<double>(value) / 255.0;
    if (p > 0.0) {
      entropy -= p * std::log2(p);
    }
  }
  return entropy;
}

EntropySource::Sample SecureEntropySource::DrawSample() {
  Sample sample{};
  if (RAND_bytes(sample.data(), static_cast<int>(sample.size())) != 1) {
    char reason[256] = {0};
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw blueshare::util::EntropyUnavailable(std::string("RAND_bytes failed: ") + reason);
  }
  return sample;
}

} // namespace blueshare::crypto
