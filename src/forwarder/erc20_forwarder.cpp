#include "forwarder/erc20_forwarder.hpp"

#include <string>

#include "host/environment.hpp"
#include "host/errors.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

ERC20Forwarder::ERC20Forwarder(host::Environment& env, const primitives::Address& address,
                               const ForwarderBinding& binding,
                               const primitives::Address& signature_transfer)
    : Forwarder(env, address),
      core_(env, address, binding),
      gate_(env),
      engine_(env, address, signature_transfer) {}

std::vector<std::uint8_t> ERC20Forwarder::ForwardCall(const primitives::Hash256& logic_ref,
                                                      std::span<const std::uint8_t> input) {
  return core_.Forward(logic_ref, [&] { return Execute(input); });
}

std::vector<std::uint8_t> ERC20Forwarder::ForwardEmergencyCall(
    std::span<const std::uint8_t> input) {
  gate_.CheckEmergencyCaller();
  return core_.RunGuarded([&] { return Execute(input); });
}

void ERC20Forwarder::SetEmergencyCaller(const primitives::Address& caller) {
  gate_.SetEmergencyCaller(core_, caller);
}

std::vector<std::uint8_t> ERC20Forwarder::Execute(std::span<const std::uint8_t> input) {
  const auto call = DecodeCall(input, CallType::kUnwrap);
  util::LogDebug("forwarder", std::string(kVersion) + " dispatch " +
                                  std::string(CallTypeName(call.call_type)));
  std::visit(Overloaded{
                 [&](const WrapPayload& wrap) { engine_.Wrap(call.token, call.amount, wrap); },
                 [&](const UnwrapPayload& unwrap) {
                   engine_.Unwrap(call.token, call.amount, unwrap.receiver);
                 },
                 [&](const MigratePayload&) {
                   throw host::ForwarderError(host::ErrorCode::kInvalidCallType,
                                              std::string(CallTypeName(CallType::kUnwrap)),
                                              std::string(CallTypeName(call.call_type)));
                 },
             },
             call.payload);
  return {};
}

}  // namespace wrapfwd::forwarder
