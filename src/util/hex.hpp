#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wrapfwd::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Drops a leading "0x"/"0X" if present.
std::string_view StripHexPrefix(std::string_view hex);

}  // namespace wrapfwd::util
