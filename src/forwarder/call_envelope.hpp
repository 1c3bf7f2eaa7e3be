#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/hash.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::forwarder {

// Values are stable across generations: a later generation only extends the
// accepted range.
enum class CallType : std::uint8_t {
  kWrap = 0,
  kUnwrap = 1,
  kMigrateV1 = 2,
  kMigrateV2 = 3,
};

std::string_view CallTypeName(CallType type);

enum class MigrationSource {
  kV1,
  kV2,
};

struct WrapPayload {
  primitives::Hash256 nonce{};
  primitives::Hash256 deadline{};
  primitives::Address owner{};
  primitives::Hash256 action_tree_root{};
  std::vector<std::uint8_t> signature;
};

struct UnwrapPayload {
  primitives::Address receiver{};
};

struct MigratePayload {
  MigrationSource source{MigrationSource::kV1};
  primitives::Hash256 nullifier{};
  primitives::Hash256 commitment_tree_root{};
  primitives::Hash256 logic_ref{};
  primitives::Address forwarder{};
};

using CallPayload = std::variant<WrapPayload, UnwrapPayload, MigratePayload>;

template <typename... Handlers>
struct Overloaded : Handlers... {
  using Handlers::operator()...;
};
template <typename... Handlers>
Overloaded(Handlers...) -> Overloaded<Handlers...>;

struct CallEnvelope {
  CallType call_type{CallType::kWrap};
  primitives::Address token{};
  primitives::Uint128 amount{};
  CallPayload payload;
};

// Wire layout, in 32-byte big-endian words:
//   prefix:  callType | token | amount
//   Unwrap:  receiver
//   Migrate: nullifier | commitmentTreeRoot | logicRef | forwarder
//   Wrap:    nonce | deadline | owner | actionTreeRoot | signatureLength |
//            signature (zero-padded to a word boundary)
constexpr std::size_t kWordSize = 32;
constexpr std::size_t kPrefixSize = 3 * kWordSize;
constexpr std::size_t kUnwrapCallSize = kPrefixSize + kWordSize;
constexpr std::size_t kMigrateCallSize = kPrefixSize + 4 * kWordSize;
constexpr std::size_t kWrapCallFixedSize = kPrefixSize + 5 * kWordSize;

// Call types above `max_call_type` are rejected with kInvalidCallType.
// Length, address and amount violations throw kInvalidInputLength,
// kInvalidAddressEncoding and kAmountOverflow respectively.
CallEnvelope DecodeCall(std::span<const std::uint8_t> input, CallType max_call_type);

std::vector<std::uint8_t> EncodeWrapCall(const primitives::Address& token,
                                         const primitives::Uint128& amount,
                                         const WrapPayload& payload);
std::vector<std::uint8_t> EncodeUnwrapCall(const primitives::Address& token,
                                           const primitives::Uint128& amount,
                                           const primitives::Address& receiver);
// `call_type` selects the source generation and must be kMigrateV1 or
// kMigrateV2.
std::vector<std::uint8_t> EncodeMigrateCall(CallType call_type, const primitives::Address& token,
                                            const primitives::Uint128& amount,
                                            const primitives::Hash256& nullifier,
                                            const primitives::Hash256& commitment_tree_root,
                                            const primitives::Hash256& logic_ref,
                                            const primitives::Address& forwarder);

// Resource label binding `token` to the forwarder that custodies it.
primitives::Hash256 ComputeLabelRef(const primitives::Address& forwarder,
                                    const primitives::Address& token);

}  // namespace wrapfwd::forwarder
