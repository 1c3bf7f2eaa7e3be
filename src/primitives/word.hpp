#pragma once

#include <cstdint>

#include "primitives/address.hpp"
#include "primitives/hash.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::primitives {

// 32-byte big-endian words, the unit of the forwarder wire format and of
// the permit digests. Narrower values are left-padded with zeros.
using Word = Hash256;

Word WordFromAddress(const Address& address);
Word WordFromUint128(const Uint128& value);
Word WordFromUint64(std::uint64_t value);

// Each returns false when the padding bytes are not all zero.
bool WordToAddress(const Word& word, Address* out);
bool WordToUint128(const Word& word, Uint128* out);
bool WordToUint64(const Word& word, std::uint64_t* out);

}  // namespace wrapfwd::primitives
