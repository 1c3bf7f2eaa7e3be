#include "forwarder/wrap_engine.hpp"

#include <string>
#include <utility>

#include "host/environment.hpp"
#include "host/errors.hpp"
#include "permit/signature_transfer.hpp"
#include "token/safe_transfer.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

namespace {

using host::ErrorCode;
using host::ForwarderError;
using primitives::Uint128;

std::string SignedDelta(const Uint128& from, const Uint128& to) {
  Uint128 delta;
  if (to >= from) {
    return primitives::CheckedSub(to, from, &delta) ? delta.ToString() : std::string{};
  }
  return primitives::CheckedSub(from, to, &delta) ? "-" + delta.ToString() : std::string{};
}

}  // namespace

void VerifyBalanceIncrease(const Uint128& before, const Uint128& after, const Uint128& amount) {
  Uint128 delta;
  if (!primitives::CheckedSub(after, before, &delta) || delta != amount) {
    throw ForwarderError(ErrorCode::kBalanceMismatch, amount.ToString(), SignedDelta(before, after));
  }
}

void VerifyBalanceDecrease(const Uint128& before, const Uint128& after, const Uint128& amount) {
  Uint128 delta;
  if (!primitives::CheckedSub(before, after, &delta) || delta != amount) {
    throw ForwarderError(ErrorCode::kBalanceMismatch, amount.ToString(), SignedDelta(after, before));
  }
}

WrapUnwrapEngine::WrapUnwrapEngine(host::Environment& env, const primitives::Address& self,
                                   const primitives::Address& signature_transfer,
                                   std::string witness_type_string)
    : env_(env),
      self_(self),
      signature_transfer_(signature_transfer),
      witness_type_string_(std::move(witness_type_string)) {
  if (primitives::IsZero(signature_transfer_)) {
    throw ForwarderError(ErrorCode::kZeroNotAllowed, {}, "signatureTransfer");
  }
}

void WrapUnwrapEngine::Wrap(const primitives::Address& token, const Uint128& amount,
                            const WrapPayload& payload) {
  const auto before = token::BalanceOf(env_, token, self_);
  if (!amount.IsZero()) {
    auto& transfer = env_.Resolve<permit::SignatureTransfer>(signature_transfer_);
    const permit::PermitTransferFrom request{{token, amount}, payload.nonce, payload.deadline};
    const permit::SignatureTransferDetails details{self_, amount};
    env_.Invoke(self_, [&] {
      transfer.PermitWitnessTransferFrom(request, details, payload.owner,
                                         payload.action_tree_root, witness_type_string_,
                                         payload.signature);
    });
  }
  VerifyBalanceIncrease(before, token::BalanceOf(env_, token, self_), amount);

  env_.Emit(host::Event{host::EventKind::kWrapped, self_, token, payload.owner, amount});
  util::LogInfo("forwarder", "wrapped " + amount.ToString() + " of " +
                                 primitives::AddressToHex(token) + " from " +
                                 primitives::AddressToHex(payload.owner));
}

void WrapUnwrapEngine::Unwrap(const primitives::Address& token, const Uint128& amount,
                              const primitives::Address& receiver) {
  const auto before = token::BalanceOf(env_, token, self_);
  if (!amount.IsZero()) {
    token::SafeTransfer(env_, self_, token, receiver, amount);
  }
  VerifyBalanceDecrease(before, token::BalanceOf(env_, token, self_), amount);

  env_.Emit(host::Event{host::EventKind::kUnwrapped, self_, token, receiver, amount});
  util::LogInfo("forwarder", "unwrapped " + amount.ToString() + " of " +
                                 primitives::AddressToHex(token) + " to " +
                                 primitives::AddressToHex(receiver));
}

}  // namespace wrapfwd::forwarder
