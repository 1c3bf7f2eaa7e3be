#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wrapfwd::primitives {

// Unsigned 128-bit token quantity. Comparison is lexicographic on
// (high, low), which matches numeric order.
class Uint128 {
 public:
  constexpr Uint128() = default;
  constexpr Uint128(std::uint64_t low) : low_(low) {}  // NOLINT(google-explicit-constructor)
  constexpr Uint128(std::uint64_t high, std::uint64_t low) : high_(high), low_(low) {}

  static constexpr Uint128 Max() { return Uint128(~0ULL, ~0ULL); }

  constexpr std::uint64_t High() const noexcept { return high_; }
  constexpr std::uint64_t Low() const noexcept { return low_; }
  constexpr bool IsZero() const noexcept { return high_ == 0 && low_ == 0; }

  constexpr auto operator<=>(const Uint128& other) const = default;

  // Decimal rendering.
  std::string ToString() const;
  static std::optional<Uint128> FromString(std::string_view decimal);

  void WriteBigEndian(std::span<std::uint8_t, 16> out) const noexcept;
  static Uint128 ReadBigEndian(std::span<const std::uint8_t, 16> in) noexcept;

 private:
  std::uint64_t high_{0};
  std::uint64_t low_{0};
};

bool CheckedAdd(const Uint128& a, const Uint128& b, Uint128* out) noexcept;
bool CheckedSub(const Uint128& a, const Uint128& b, Uint128* out) noexcept;

}  // namespace wrapfwd::primitives
