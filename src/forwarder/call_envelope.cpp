#include "forwarder/call_envelope.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "crypto/hash.hpp"
#include "host/errors.hpp"
#include "primitives/word.hpp"

namespace wrapfwd::forwarder {

namespace {

using host::ErrorCode;
using host::ForwarderError;
using primitives::Word;

class WordReader {
 public:
  explicit WordReader(std::span<const std::uint8_t> input) : input_(input) {}

  Word Next() {
    Word word{};
    std::copy_n(input_.begin() + static_cast<std::ptrdiff_t>(offset_), kWordSize, word.begin());
    offset_ += kWordSize;
    return word;
  }

  primitives::Address NextAddress() {
    const auto word = Next();
    primitives::Address address{};
    if (!primitives::WordToAddress(word, &address)) {
      throw ForwarderError(ErrorCode::kInvalidAddressEncoding, {}, primitives::HashToHex(word));
    }
    return address;
  }

  std::span<const std::uint8_t> Remaining() const { return input_.subspan(offset_); }

 private:
  std::span<const std::uint8_t> input_;
  std::size_t offset_{0};
};

void RequireLength(std::span<const std::uint8_t> input, std::size_t expected) {
  if (input.size() != expected) {
    throw ForwarderError(ErrorCode::kInvalidInputLength, std::to_string(expected),
                         std::to_string(input.size()));
  }
}

std::size_t PaddedLength(std::size_t length) {
  return (length + kWordSize - 1) / kWordSize * kWordSize;
}

void AppendWord(std::vector<std::uint8_t>& out, const Word& word) {
  out.insert(out.end(), word.begin(), word.end());
}

std::vector<std::uint8_t> EncodePrefix(CallType call_type, const primitives::Address& token,
                                       const primitives::Uint128& amount) {
  std::vector<std::uint8_t> out;
  out.reserve(kMigrateCallSize);
  AppendWord(out, primitives::WordFromUint64(static_cast<std::uint64_t>(call_type)));
  AppendWord(out, primitives::WordFromAddress(token));
  AppendWord(out, primitives::WordFromUint128(amount));
  return out;
}

WrapPayload DecodeWrapTail(std::span<const std::uint8_t> input, WordReader& reader) {
  if (input.size() < kWrapCallFixedSize) {
    throw ForwarderError(ErrorCode::kInvalidInputLength, std::to_string(kWrapCallFixedSize),
                         std::to_string(input.size()));
  }
  WrapPayload payload;
  payload.nonce = reader.Next();
  payload.deadline = reader.Next();
  payload.owner = reader.NextAddress();
  payload.action_tree_root = reader.Next();
  const auto length_word = reader.Next();
  std::uint64_t signature_length = 0;
  if (!primitives::WordToUint64(length_word, &signature_length) ||
      signature_length > input.size()) {
    throw ForwarderError(ErrorCode::kInvalidInputLength,
                         "signatureLength <= " + std::to_string(input.size()),
                         primitives::HashToHex(length_word));
  }
  const auto length = static_cast<std::size_t>(signature_length);
  RequireLength(input, kWrapCallFixedSize + PaddedLength(length));
  const auto signature = reader.Remaining().first(length);
  const auto padding = reader.Remaining().subspan(length);
  const auto dirty = std::find_if(padding.begin(), padding.end(),
                                  [](std::uint8_t b) { return b != 0; });
  if (dirty != padding.end()) {
    // Only zero bytes may fill the signature out to a word boundary.
    throw ForwarderError(ErrorCode::kInvalidInputLength, "zero signature padding",
                         "non-zero byte at offset " +
                             std::to_string(kWrapCallFixedSize + length +
                                            static_cast<std::size_t>(dirty - padding.begin())));
  }
  payload.signature.assign(signature.begin(), signature.end());
  return payload;
}

MigratePayload DecodeMigrateTail(CallType call_type, WordReader& reader) {
  MigratePayload payload;
  payload.source =
      call_type == CallType::kMigrateV1 ? MigrationSource::kV1 : MigrationSource::kV2;
  payload.nullifier = reader.Next();
  payload.commitment_tree_root = reader.Next();
  payload.logic_ref = reader.Next();
  payload.forwarder = reader.NextAddress();
  return payload;
}

}  // namespace

std::string_view CallTypeName(CallType type) {
  switch (type) {
    case CallType::kWrap:
      return "Wrap";
    case CallType::kUnwrap:
      return "Unwrap";
    case CallType::kMigrateV1:
      return "MigrateV1";
    case CallType::kMigrateV2:
      return "MigrateV2";
  }
  return "Unknown";
}

CallEnvelope DecodeCall(std::span<const std::uint8_t> input, CallType max_call_type) {
  if (input.size() < kPrefixSize) {
    throw ForwarderError(ErrorCode::kInvalidInputLength, std::to_string(kPrefixSize),
                         std::to_string(input.size()));
  }
  WordReader reader(input);
  const auto type_word = reader.Next();
  std::uint64_t raw_type = 0;
  if (!primitives::WordToUint64(type_word, &raw_type) ||
      raw_type > static_cast<std::uint64_t>(max_call_type)) {
    throw ForwarderError(ErrorCode::kInvalidCallType,
                         std::to_string(static_cast<unsigned>(max_call_type)),
                         primitives::HashToHex(type_word));
  }

  CallEnvelope envelope;
  envelope.call_type = static_cast<CallType>(raw_type);
  envelope.token = reader.NextAddress();
  const auto amount_word = reader.Next();
  if (!primitives::WordToUint128(amount_word, &envelope.amount)) {
    throw ForwarderError(ErrorCode::kAmountOverflow, primitives::Uint128::Max().ToString(),
                         primitives::HashToHex(amount_word));
  }

  switch (envelope.call_type) {
    case CallType::kWrap:
      envelope.payload = DecodeWrapTail(input, reader);
      return envelope;
    case CallType::kUnwrap:
      RequireLength(input, kUnwrapCallSize);
      envelope.payload = UnwrapPayload{reader.NextAddress()};
      return envelope;
    case CallType::kMigrateV1:
    case CallType::kMigrateV2:
      RequireLength(input, kMigrateCallSize);
      envelope.payload = DecodeMigrateTail(envelope.call_type, reader);
      return envelope;
  }
  throw ForwarderError(ErrorCode::kInvalidCallType, {}, std::to_string(raw_type));
}

std::vector<std::uint8_t> EncodeWrapCall(const primitives::Address& token,
                                         const primitives::Uint128& amount,
                                         const WrapPayload& payload) {
  auto out = EncodePrefix(CallType::kWrap, token, amount);
  AppendWord(out, payload.nonce);
  AppendWord(out, payload.deadline);
  AppendWord(out, primitives::WordFromAddress(payload.owner));
  AppendWord(out, payload.action_tree_root);
  AppendWord(out, primitives::WordFromUint64(payload.signature.size()));
  out.insert(out.end(), payload.signature.begin(), payload.signature.end());
  out.resize(kWrapCallFixedSize + PaddedLength(payload.signature.size()), 0);
  return out;
}

std::vector<std::uint8_t> EncodeUnwrapCall(const primitives::Address& token,
                                           const primitives::Uint128& amount,
                                           const primitives::Address& receiver) {
  auto out = EncodePrefix(CallType::kUnwrap, token, amount);
  AppendWord(out, primitives::WordFromAddress(receiver));
  return out;
}

std::vector<std::uint8_t> EncodeMigrateCall(CallType call_type, const primitives::Address& token,
                                            const primitives::Uint128& amount,
                                            const primitives::Hash256& nullifier,
                                            const primitives::Hash256& commitment_tree_root,
                                            const primitives::Hash256& logic_ref,
                                            const primitives::Address& forwarder) {
  if (call_type != CallType::kMigrateV1 && call_type != CallType::kMigrateV2) {
    throw std::invalid_argument("EncodeMigrateCall requires a migrate call type");
  }
  auto out = EncodePrefix(call_type, token, amount);
  AppendWord(out, nullifier);
  AppendWord(out, commitment_tree_root);
  AppendWord(out, logic_ref);
  AppendWord(out, primitives::WordFromAddress(forwarder));
  return out;
}

primitives::Hash256 ComputeLabelRef(const primitives::Address& forwarder,
                                    const primitives::Address& token) {
  return crypto::Sha3_256Concat({std::span<const std::uint8_t>(forwarder),
                                 std::span<const std::uint8_t>(token)});
}

}  // namespace wrapfwd::forwarder
