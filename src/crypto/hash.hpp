#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace wrapfwd::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

// Hash of the concatenation of `parts`, without materializing it.
Sha3_256Hash Sha3_256Concat(std::initializer_list<std::span<const std::uint8_t>> parts);

}  // namespace wrapfwd::crypto
