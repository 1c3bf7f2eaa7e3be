#include "primitives/uint128.hpp"

#include <algorithm>
#include <array>

namespace wrapfwd::primitives {

namespace {

// Divides the value held in four big-endian 32-bit limbs by `divisor` in
// place and returns the remainder.
std::uint32_t DivModLimbs(std::array<std::uint32_t, 4>* limbs, std::uint32_t divisor) {
  std::uint64_t remainder = 0;
  for (auto& limb : *limbs) {
    const std::uint64_t current = (remainder << 32) | limb;
    limb = static_cast<std::uint32_t>(current / divisor);
    remainder = current % divisor;
  }
  return static_cast<std::uint32_t>(remainder);
}

bool MulAddSmall(Uint128* value, std::uint32_t mul, std::uint32_t add) {
  std::array<std::uint32_t, 4> limbs{
      static_cast<std::uint32_t>(value->High() >> 32), static_cast<std::uint32_t>(value->High()),
      static_cast<std::uint32_t>(value->Low() >> 32), static_cast<std::uint32_t>(value->Low())};
  std::uint64_t carry = add;
  for (auto it = limbs.rbegin(); it != limbs.rend(); ++it) {
    const std::uint64_t current = static_cast<std::uint64_t>(*it) * mul + carry;
    *it = static_cast<std::uint32_t>(current);
    carry = current >> 32;
  }
  if (carry != 0) {
    return false;
  }
  *value = Uint128((static_cast<std::uint64_t>(limbs[0]) << 32) | limbs[1],
                   (static_cast<std::uint64_t>(limbs[2]) << 32) | limbs[3]);
  return true;
}

}  // namespace

std::string Uint128::ToString() const {
  if (IsZero()) {
    return "0";
  }
  std::array<std::uint32_t, 4> limbs{
      static_cast<std::uint32_t>(high_ >> 32), static_cast<std::uint32_t>(high_),
      static_cast<std::uint32_t>(low_ >> 32), static_cast<std::uint32_t>(low_)};
  std::string digits;
  while (std::any_of(limbs.begin(), limbs.end(), [](std::uint32_t l) { return l != 0; })) {
    digits.push_back(static_cast<char>('0' + DivModLimbs(&limbs, 10)));
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::optional<Uint128> Uint128::FromString(std::string_view decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }
  Uint128 value;
  for (char c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    if (!MulAddSmall(&value, 10, static_cast<std::uint32_t>(c - '0'))) {
      return std::nullopt;
    }
  }
  return value;
}

void Uint128::WriteBigEndian(std::span<std::uint8_t, 16> out) const noexcept {
  for (int i = 0; i < 8; ++i) {
    out[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((high_ >> (56 - 8 * i)) & 0xFF);
    out[static_cast<std::size_t>(8 + i)] =
        static_cast<std::uint8_t>((low_ >> (56 - 8 * i)) & 0xFF);
  }
}

Uint128 Uint128::ReadBigEndian(std::span<const std::uint8_t, 16> in) noexcept {
  std::uint64_t high = 0;
  std::uint64_t low = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    high = (high << 8) | in[i];
    low = (low << 8) | in[8 + i];
  }
  return Uint128(high, low);
}

bool CheckedAdd(const Uint128& a, const Uint128& b, Uint128* out) noexcept {
  const std::uint64_t low = a.Low() + b.Low();
  const std::uint64_t carry = low < a.Low() ? 1 : 0;
  if (a.High() > ~0ULL - b.High() || a.High() + b.High() > ~0ULL - carry) {
    return false;
  }
  if (out) {
    *out = Uint128(a.High() + b.High() + carry, low);
  }
  return true;
}

bool CheckedSub(const Uint128& a, const Uint128& b, Uint128* out) noexcept {
  if (b > a) {
    return false;
  }
  if (out) {
    const std::uint64_t borrow = a.Low() < b.Low() ? 1 : 0;
    *out = Uint128(a.High() - b.High() - borrow, a.Low() - b.Low());
  }
  return true;
}

}  // namespace wrapfwd::primitives
