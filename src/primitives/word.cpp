#include "primitives/word.hpp"

#include <algorithm>
#include <span>

namespace wrapfwd::primitives {

namespace {

bool PaddingIsZero(const Word& word, std::size_t width) {
  return std::all_of(word.begin(), word.end() - static_cast<std::ptrdiff_t>(width),
                     [](std::uint8_t b) { return b == 0; });
}

}  // namespace

Word WordFromAddress(const Address& address) {
  Word word{};
  std::copy(address.begin(), address.end(), word.begin() + (word.size() - address.size()));
  return word;
}

Word WordFromUint128(const Uint128& value) {
  Word word{};
  value.WriteBigEndian(std::span<std::uint8_t, 16>(word.data() + 16, 16));
  return word;
}

Word WordFromUint64(std::uint64_t value) {
  Word word{};
  for (std::size_t i = 0; i < 8; ++i) {
    word[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
  }
  return word;
}

bool WordToAddress(const Word& word, Address* out) {
  if (!PaddingIsZero(word, out->size())) {
    return false;
  }
  std::copy(word.end() - static_cast<std::ptrdiff_t>(out->size()), word.end(), out->begin());
  return true;
}

bool WordToUint128(const Word& word, Uint128* out) {
  if (!PaddingIsZero(word, 16)) {
    return false;
  }
  *out = Uint128::ReadBigEndian(std::span<const std::uint8_t, 16>(word.data() + 16, 16));
  return true;
}

bool WordToUint64(const Word& word, std::uint64_t* out) {
  if (!PaddingIsZero(word, 8)) {
    return false;
  }
  std::uint64_t value = 0;
  for (std::size_t i = 24; i < 32; ++i) {
    value = (value << 8) | word[i];
  }
  *out = value;
  return true;
}

}  // namespace wrapfwd::primitives
