#pragma once

#include <optional>

#include "host/contract.hpp"
#include "primitives/address.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::token {

// Fungible token collaborator. Mutating calls act on behalf of the
// environment's current sender. A std::nullopt result models a token whose
// transfer functions return no value at all; callers go through
// SafeTransfer/SafeTransferFrom rather than inspecting it themselves.
class Token : public host::Contract {
 public:
  using host::Contract::Contract;

  virtual primitives::Uint128 BalanceOf(const primitives::Address& owner) const = 0;
  virtual primitives::Uint128 Allowance(const primitives::Address& owner,
                                        const primitives::Address& spender) const = 0;

  virtual std::optional<bool> Transfer(const primitives::Address& to,
                                       const primitives::Uint128& amount) = 0;
  virtual std::optional<bool> TransferFrom(const primitives::Address& from,
                                           const primitives::Address& to,
                                           const primitives::Uint128& amount) = 0;
  virtual std::optional<bool> Approve(const primitives::Address& spender,
                                      const primitives::Uint128& amount) = 0;
};

}  // namespace wrapfwd::token
