#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives/hash.hpp"

namespace wrapfwd::primitives {

// 20-byte account identifier, the trailing bytes of a 32-byte word.
using Address = std::array<std::uint8_t, 20>;

[[nodiscard]] inline bool IsZero(const Address& address) noexcept {
  return std::all_of(address.begin(), address.end(), [](std::uint8_t b) { return b == 0; });
}

struct AddressHasher {
  std::size_t operator()(const Address& address) const noexcept {
    std::size_t result = 0;
    for (auto byte : address) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

// Lower-case, 0x-prefixed.
std::string AddressToHex(const Address& address);
std::string HashToHex(const Hash256& hash);

// Accepts an optional 0x prefix. Returns nullopt on bad length or digits.
std::optional<Address> AddressFromHex(std::string_view hex);
std::optional<Hash256> HashFromHex(std::string_view hex);

}  // namespace wrapfwd::primitives
