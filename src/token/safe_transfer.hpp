#pragma once

#include "host/environment.hpp"
#include "primitives/address.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::token {

// Calls into the token at `token` as `caller`. A missing return value is
// accepted; an explicit `false` throws ForwarderError(kTransferFailed).
void SafeTransfer(host::Environment& env, const primitives::Address& caller,
                  const primitives::Address& token, const primitives::Address& to,
                  const primitives::Uint128& amount);

void SafeTransferFrom(host::Environment& env, const primitives::Address& caller,
                      const primitives::Address& token, const primitives::Address& from,
                      const primitives::Address& to, const primitives::Uint128& amount);

primitives::Uint128 BalanceOf(const host::Environment& env, const primitives::Address& token,
                              const primitives::Address& owner);

}  // namespace wrapfwd::token
