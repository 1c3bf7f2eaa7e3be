#include "primitives/address.hpp"

#include <span>
#include <vector>

#include "util/hex.hpp"

namespace wrapfwd::primitives {

namespace {

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> FixedFromHex(std::string_view hex) {
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(util::StripHexPrefix(hex), &bytes) || bytes.size() != N) {
    return std::nullopt;
  }
  std::array<std::uint8_t, N> out{};
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

}  // namespace

std::string AddressToHex(const Address& address) {
  return "0x" + util::HexEncode(std::span<const std::uint8_t>(address.data(), address.size()));
}

std::string HashToHex(const Hash256& hash) {
  return "0x" + util::HexEncode(std::span<const std::uint8_t>(hash.data(), hash.size()));
}

std::optional<Address> AddressFromHex(std::string_view hex) { return FixedFromHex<20>(hex); }

std::optional<Hash256> HashFromHex(std::string_view hex) { return FixedFromHex<32>(hex); }

}  // namespace wrapfwd::primitives
