#include "token/safe_transfer.hpp"

#include <optional>

#include "host/errors.hpp"
#include "token/token.hpp"

namespace wrapfwd::token {

namespace {

void RequireSuccess(const std::optional<bool>& result, const primitives::Address& token) {
  if (result.has_value() && !*result) {
    throw host::ForwarderError(host::ErrorCode::kTransferFailed, {},
                               primitives::AddressToHex(token));
  }
}

}  // namespace

void SafeTransfer(host::Environment& env, const primitives::Address& caller,
                  const primitives::Address& token, const primitives::Address& to,
                  const primitives::Uint128& amount) {
  auto& contract = env.Resolve<Token>(token);
  env.Invoke(caller, [&] { RequireSuccess(contract.Transfer(to, amount), token); });
}

void SafeTransferFrom(host::Environment& env, const primitives::Address& caller,
                      const primitives::Address& token, const primitives::Address& from,
                      const primitives::Address& to, const primitives::Uint128& amount) {
  auto& contract = env.Resolve<Token>(token);
  env.Invoke(caller, [&] { RequireSuccess(contract.TransferFrom(from, to, amount), token); });
}

primitives::Uint128 BalanceOf(const host::Environment& env, const primitives::Address& token,
                              const primitives::Address& owner) {
  return env.Resolve<Token>(token).BalanceOf(owner);
}

}  // namespace wrapfwd::token
