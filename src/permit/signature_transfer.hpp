#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "crypto/pq_engine.hpp"
#include "host/contract.hpp"
#include "primitives/address.hpp"
#include "primitives/hash.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::permit {

struct TokenPermissions {
  primitives::Address token{};
  primitives::Uint128 amount{};
};

struct PermitTransferFrom {
  TokenPermissions permitted{};
  // Unordered nonce: the high 248 bits select a bitmap word, the low byte
  // a bit inside it.
  primitives::Hash256 nonce{};
  // Big-endian uint256 compared against the environment timestamp.
  primitives::Hash256 deadline{};
};

struct SignatureTransferDetails {
  primitives::Address to{};
  primitives::Uint128 requested_amount{};
};

// Owner signatures are the ML-DSA-65 public key followed by the signature
// over PermitWitnessDigest. The owner address is derived from the key.
std::size_t PermitSignatureSize();
primitives::Address AddressFromPublicKey(std::span<const std::uint8_t> public_key);
std::vector<std::uint8_t> SignPermitDigest(const crypto::SigningKey& key,
                                           const primitives::Hash256& digest);

// Signature-authorized pull. Owners approve this contract once on the token;
// afterwards any spender holding a valid owner signature can pull up to the
// permitted amount to the destination of its choice, once per nonce.
class SignatureTransfer : public host::Contract {
 public:
  SignatureTransfer(host::Environment& env, const primitives::Address& address,
                    std::uint64_t chain_id);

  // The spender is the environment sender. The witness and its type string
  // are folded into the signed digest so a signature produced for one
  // application cannot be replayed through another.
  void PermitWitnessTransferFrom(const PermitTransferFrom& permit,
                                 const SignatureTransferDetails& details,
                                 const primitives::Address& owner,
                                 const primitives::Hash256& witness,
                                 std::string_view witness_type_string,
                                 std::span<const std::uint8_t> signature);

  // Burns the sender's nonces in `word_pos` selected by `mask`.
  void InvalidateUnorderedNonces(const primitives::Hash256& word_pos,
                                 const primitives::Hash256& mask);

  bool IsNonceUsed(const primitives::Address& owner, const primitives::Hash256& nonce) const;

  primitives::Hash256 DomainSeparator() const;
  primitives::Hash256 PermitWitnessDigest(const PermitTransferFrom& permit,
                                          const primitives::Address& spender,
                                          const primitives::Hash256& witness,
                                          std::string_view witness_type_string) const;

  std::uint64_t ChainId() const noexcept { return chain_id_; }

 private:
  struct NonceWord {
    primitives::Address owner{};
    primitives::Hash256 word_pos{};
    bool operator==(const NonceWord& other) const = default;
  };

  struct NonceWordHasher {
    std::size_t operator()(const NonceWord& word) const noexcept;
  };

  void UseUnorderedNonce(const primitives::Address& owner, const primitives::Hash256& nonce);
  void VerifyOwnerSignature(const primitives::Hash256& digest, const primitives::Address& owner,
                            std::span<const std::uint8_t> signature) const;

  std::uint64_t chain_id_;
  std::unordered_map<NonceWord, std::bitset<256>, NonceWordHasher> nonce_bitmap_;
};

}  // namespace wrapfwd::permit
