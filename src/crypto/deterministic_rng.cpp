#include "crypto/deterministic_rng.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace wrapfwd::crypto {

DeterministicOqsRng::DeterministicOqsRng(std::span<const std::uint8_t> seed)
    : prev_instance_(Instance()) {
  std::array<std::uint8_t, 32> material{};
  const auto copy_len = std::min(seed.size(), material.size());
  std::copy_n(seed.begin(), copy_len, material.begin());
  seed_material_ = Sha3_256(std::span<const std::uint8_t>(material.data(), material.size()));
  util::SecureWipe(material);
  counter_ = 0;
  Refill();
  Instance() = this;
}

DeterministicOqsRng::~DeterministicOqsRng() {
  Instance() = prev_instance_;
  util::SecureWipe(buffer_);
  util::SecureWipe(seed_material_);
}

DeterministicOqsRng* DeterministicOqsRng::CurrentInstance() { return Instance(); }

DeterministicOqsRng*& DeterministicOqsRng::Instance() {
  thread_local DeterministicOqsRng* instance = nullptr;
  return instance;
}

void DeterministicOqsRng::Generate(std::uint8_t* out, std::size_t len) {
  if (out == nullptr || len == 0) {
    return;
  }
  for (std::size_t i = 0; i < len; ++i) {
    if (buffer_index_ == buffer_.size()) {
      Refill();
    }
    out[i] = buffer_[buffer_index_++];
  }
}

void DeterministicOqsRng::Refill() {
  std::array<std::uint8_t, 40> input{};
  std::copy(seed_material_.begin(), seed_material_.end(), input.begin());
  for (int i = 0; i < 8; ++i) {
    input[32 + static_cast<std::size_t>(i)] =
        static_cast<std::uint8_t>((counter_ >> (8 * i)) & 0xFFu);
  }
  buffer_ = Sha3_256(std::span<const std::uint8_t>(input.data(), input.size()));
  buffer_index_ = 0;
  ++counter_;
}

}  // namespace wrapfwd::crypto
