#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace wrapfwd::primitives {

using Hash256 = std::array<std::uint8_t, 32>;

[[nodiscard]] inline bool IsZero(const Hash256& hash) noexcept {
  return std::all_of(hash.begin(), hash.end(), [](std::uint8_t b) { return b == 0; });
}

// Folds the four 64-bit lanes through a multiply-xorshift mix so that keys
// chosen by callers (nullifiers, nonce words) still spread across buckets.
struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::uint64_t result = 0x9e3779b97f4a7c15ULL;
    for (std::size_t lane = 0; lane < hash.size(); lane += 8) {
      std::uint64_t word = 0;
      for (std::size_t i = 0; i < 8; ++i) {
        word = (word << 8) | hash[lane + i];
      }
      result ^= word;
      result ^= result >> 30;
      result *= 0xbf58476d1ce4e5b9ULL;
      result ^= result >> 27;
      result *= 0x94d049bb133111ebULL;
      result ^= result >> 31;
    }
    return static_cast<std::size_t>(result);
  }
};

}  // namespace wrapfwd::primitives
