#pragma once

#include <string>
#include <string_view>

#include "forwarder/call_envelope.hpp"
#include "primitives/address.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

// Witness type the wrap path signs over: the action tree root of the
// resource being created.
inline constexpr std::string_view kDefaultWitnessTypeString =
    "Witness witness)TokenPermissions(address token,uint256 amount)Witness(bytes32 actionTreeRoot)";

// Throws ForwarderError(kBalanceMismatch) unless `after - before` equals
// `amount`. A negative delta is reported with a leading '-'.
void VerifyBalanceIncrease(const primitives::Uint128& before, const primitives::Uint128& after,
                           const primitives::Uint128& amount);
void VerifyBalanceDecrease(const primitives::Uint128& before, const primitives::Uint128& after,
                           const primitives::Uint128& amount);

// Moves tokens between users and the forwarder that custodies them. Deposits
// are pulled through the signature-transfer contract; withdrawals are plain
// transfers. Every movement is checked against the forwarder's own balance.
class WrapUnwrapEngine {
 public:
  WrapUnwrapEngine(host::Environment& env, const primitives::Address& self,
                   const primitives::Address& signature_transfer,
                   std::string witness_type_string = std::string(kDefaultWitnessTypeString));

  void Wrap(const primitives::Address& token, const primitives::Uint128& amount,
            const WrapPayload& payload);
  void Unwrap(const primitives::Address& token, const primitives::Uint128& amount,
              const primitives::Address& receiver);

  const primitives::Address& SignatureTransferAddress() const noexcept {
    return signature_transfer_;
  }

 private:
  host::Environment& env_;
  primitives::Address self_;
  primitives::Address signature_transfer_;
  std::string witness_type_string_;
};

}  // namespace wrapfwd::forwarder
