#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace wrapfwd::crypto {

// SHA3-256 counter-mode byte stream. While an instance is alive on the
// current thread, liboqs key generation and signing draw from it instead of
// the system RNG, which makes test keys reproducible.
class DeterministicOqsRng {
 public:
  explicit DeterministicOqsRng(std::span<const std::uint8_t> seed);
  DeterministicOqsRng(const DeterministicOqsRng&) = delete;
  DeterministicOqsRng& operator=(const DeterministicOqsRng&) = delete;
  ~DeterministicOqsRng();

  static DeterministicOqsRng* CurrentInstance();

  void Generate(std::uint8_t* out, std::size_t len);

 private:
  static DeterministicOqsRng*& Instance();
  void Refill();

  DeterministicOqsRng* prev_instance_{nullptr};
  std::array<std::uint8_t, 32> buffer_{};
  std::size_t buffer_index_{0};
  std::array<std::uint8_t, 32> seed_material_{};
  std::uint64_t counter_{0};
};

}  // namespace wrapfwd::crypto
