#include "permit/signature_transfer.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "crypto/hash.hpp"
#include "host/environment.hpp"
#include "host/errors.hpp"
#include "primitives/word.hpp"
#include "token/safe_transfer.hpp"
#include "util/log.hpp"

namespace wrapfwd::permit {

namespace {

using host::ErrorCode;
using host::ForwarderError;
using primitives::Hash256;

constexpr std::string_view kDomainTypeString =
    "EIP712Domain(string name,uint256 chainId,address verifyingContract)";
constexpr std::string_view kDomainName = "Permit2";
constexpr std::string_view kTokenPermissionsTypeString =
    "TokenPermissions(address token,uint256 amount)";
constexpr std::string_view kPermitWitnessTypeStub =
    "PermitWitnessTransferFrom(TokenPermissions permitted,address spender,uint256 nonce,"
    "uint256 deadline,";

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

std::span<const std::uint8_t> AsBytes(const Hash256& hash) {
  return {hash.data(), hash.size()};
}

bool DeadlinePassed(const Hash256& deadline, std::uint64_t now) {
  std::uint64_t value = 0;
  if (!primitives::WordToUint64(deadline, &value)) {
    // Wider than 64 bits: beyond any representable timestamp.
    return false;
  }
  return now > value;
}

Hash256 WordPosition(const Hash256& nonce) {
  Hash256 word_pos{};
  std::copy(nonce.begin(), nonce.end() - 1, word_pos.begin() + 1);
  return word_pos;
}

}  // namespace

std::size_t PermitSignatureSize() {
  return crypto::SignaturePublicKeySize() + crypto::SignatureSize();
}

primitives::Address AddressFromPublicKey(std::span<const std::uint8_t> public_key) {
  const auto digest = crypto::Sha3_256(public_key);
  primitives::Address address{};
  std::copy(digest.end() - static_cast<std::ptrdiff_t>(address.size()), digest.end(),
            address.begin());
  return address;
}

std::vector<std::uint8_t> SignPermitDigest(const crypto::SigningKey& key, const Hash256& digest) {
  const auto public_key = key.PublicKey();
  const auto signature = key.Sign(AsBytes(digest));
  std::vector<std::uint8_t> blob;
  blob.reserve(public_key.size() + signature.size());
  blob.insert(blob.end(), public_key.begin(), public_key.end());
  blob.insert(blob.end(), signature.begin(), signature.end());
  return blob;
}

std::size_t SignatureTransfer::NonceWordHasher::operator()(const NonceWord& word) const noexcept {
  std::size_t result = primitives::AddressHasher{}(word.owner);
  result ^= primitives::Hash256Hasher{}(word.word_pos) + 0x9e3779b97f4a7c15ULL + (result << 6) +
            (result >> 2);
  return result;
}

SignatureTransfer::SignatureTransfer(host::Environment& env, const primitives::Address& address,
                                     std::uint64_t chain_id)
    : host::Contract(env, address), chain_id_(chain_id) {}

Hash256 SignatureTransfer::DomainSeparator() const {
  const auto type_hash = crypto::Sha3_256(AsBytes(kDomainTypeString));
  const auto name_hash = crypto::Sha3_256(AsBytes(kDomainName));
  const auto chain_word = primitives::WordFromUint64(chain_id_);
  const auto contract_word = primitives::WordFromAddress(GetAddress());
  return crypto::Sha3_256Concat({AsBytes(type_hash), AsBytes(name_hash), AsBytes(chain_word),
                                 AsBytes(contract_word)});
}

Hash256 SignatureTransfer::PermitWitnessDigest(const PermitTransferFrom& permit,
                                               const primitives::Address& spender,
                                               const Hash256& witness,
                                               std::string_view witness_type_string) const {
  const std::string type_string = std::string(kPermitWitnessTypeStub) +
                                  std::string(witness_type_string);
  const auto type_hash = crypto::Sha3_256(AsBytes(type_string));

  const auto permissions_type_hash = crypto::Sha3_256(AsBytes(kTokenPermissionsTypeString));
  const auto token_word = primitives::WordFromAddress(permit.permitted.token);
  const auto amount_word = primitives::WordFromUint128(permit.permitted.amount);
  const auto permissions_hash = crypto::Sha3_256Concat(
      {AsBytes(permissions_type_hash), AsBytes(token_word), AsBytes(amount_word)});

  const auto spender_word = primitives::WordFromAddress(spender);
  const auto struct_hash = crypto::Sha3_256Concat(
      {AsBytes(type_hash), AsBytes(permissions_hash), AsBytes(spender_word),
       AsBytes(permit.nonce), AsBytes(permit.deadline), AsBytes(witness)});

  static constexpr std::array<std::uint8_t, 2> kPrefix{0x19, 0x01};
  const auto domain = DomainSeparator();
  return crypto::Sha3_256Concat(
      {std::span<const std::uint8_t>(kPrefix), AsBytes(domain), AsBytes(struct_hash)});
}

void SignatureTransfer::PermitWitnessTransferFrom(const PermitTransferFrom& permit,
                                                  const SignatureTransferDetails& details,
                                                  const primitives::Address& owner,
                                                  const Hash256& witness,
                                                  std::string_view witness_type_string,
                                                  std::span<const std::uint8_t> signature) {
  const auto spender = env().Sender();
  if (details.requested_amount > permit.permitted.amount) {
    throw ForwarderError(ErrorCode::kInvalidAmount, permit.permitted.amount.ToString(),
                         details.requested_amount.ToString());
  }
  if (DeadlinePassed(permit.deadline, env().Timestamp())) {
    throw ForwarderError(ErrorCode::kSignatureExpired, primitives::HashToHex(permit.deadline),
                         std::to_string(env().Timestamp()));
  }
  UseUnorderedNonce(owner, permit.nonce);

  const auto digest = PermitWitnessDigest(permit, spender, witness, witness_type_string);
  VerifyOwnerSignature(digest, owner, signature);

  token::SafeTransferFrom(env(), GetAddress(), permit.permitted.token, owner, details.to,
                          details.requested_amount);
  util::LogDebug("permit", "pulled " + details.requested_amount.ToString() + " of " +
                               primitives::AddressToHex(permit.permitted.token) + " from " +
                               primitives::AddressToHex(owner));
}

void SignatureTransfer::InvalidateUnorderedNonces(const Hash256& word_pos, const Hash256& mask) {
  const NonceWord key{env().Sender(), word_pos};
  auto& bits = nonce_bitmap_[key];
  const auto previous = bits;
  for (std::size_t bit = 0; bit < 256; ++bit) {
    // mask is big-endian: bit 0 is the least significant bit of the last byte.
    if ((mask[31 - bit / 8] >> (bit % 8)) & 1u) {
      bits.set(bit);
    }
  }
  env().Record([this, key, previous] { nonce_bitmap_[key] = previous; });
}

bool SignatureTransfer::IsNonceUsed(const primitives::Address& owner, const Hash256& nonce) const {
  auto it = nonce_bitmap_.find(NonceWord{owner, WordPosition(nonce)});
  if (it == nonce_bitmap_.end()) {
    return false;
  }
  return it->second.test(nonce[31]);
}

void SignatureTransfer::UseUnorderedNonce(const primitives::Address& owner, const Hash256& nonce) {
  const NonceWord key{owner, WordPosition(nonce)};
  const std::size_t bit = nonce[31];
  auto& bits = nonce_bitmap_[key];
  if (bits.test(bit)) {
    throw ForwarderError(ErrorCode::kInvalidNonce, {}, primitives::HashToHex(nonce));
  }
  bits.set(bit);
  env().Record([this, key, bit] { nonce_bitmap_[key].reset(bit); });
}

void SignatureTransfer::VerifyOwnerSignature(const Hash256& digest,
                                             const primitives::Address& owner,
                                             std::span<const std::uint8_t> signature) const {
  const std::size_t key_size = crypto::SignaturePublicKeySize();
  if (signature.size() != PermitSignatureSize()) {
    throw ForwarderError(ErrorCode::kInvalidSignatureLength, std::to_string(PermitSignatureSize()),
                         std::to_string(signature.size()));
  }
  const auto public_key = signature.first(key_size);
  const auto signer = AddressFromPublicKey(public_key);
  if (signer != owner) {
    throw ForwarderError(ErrorCode::kInvalidSigner, primitives::AddressToHex(owner),
                         primitives::AddressToHex(signer));
  }
  // A signature that does not verify under the owner's key was produced by
  // someone else or over different data.
  if (!crypto::VerifySignature(AsBytes(digest), signature.subspan(key_size), public_key)) {
    throw ForwarderError(ErrorCode::kInvalidSigner, primitives::AddressToHex(owner),
                         primitives::HashToHex(digest));
  }
}

}  // namespace wrapfwd::permit
