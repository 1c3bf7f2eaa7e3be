#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace wrapfwd::util {

// Fills `out` with bytes from the kernel CSPRNG.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Key generation cannot proceed without secure randomness; aborts instead of
// returning weak material.
void FillSecureRandomBytesOrAbort(std::span<std::uint8_t> out);

}  // namespace wrapfwd::util
