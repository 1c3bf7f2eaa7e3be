#pragma once

#include <cstddef>

namespace wrapfwd::crypto {

// Fixed ML-DSA-65 (Dilithium3) parameter sizes.
inline constexpr std::size_t kMldsa65PublicKeyBytes = 1952;
inline constexpr std::size_t kMldsa65SecretKeyBytes = 4032;
inline constexpr std::size_t kMldsa65SignatureBytes = 3309;

}  // namespace wrapfwd::crypto
