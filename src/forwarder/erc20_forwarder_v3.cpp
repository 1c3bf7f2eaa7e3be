#include "forwarder/erc20_forwarder_v3.hpp"

#include <string>

#include "host/environment.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

ERC20ForwarderV3::ERC20ForwarderV3(host::Environment& env, const primitives::Address& address,
                                   const ForwarderBinding& binding,
                                   const primitives::Address& signature_transfer,
                                   const Forwarder& forwarder_v1, const Forwarder& forwarder_v2)
    : Forwarder(env, address),
      core_(env, address, binding),
      gate_(env),
      engine_(env, address, signature_transfer),
      from_v1_(env, address, forwarder_v1),
      from_v2_(env, address, forwarder_v2) {}

std::vector<std::uint8_t> ERC20ForwarderV3::ForwardCall(const primitives::Hash256& logic_ref,
                                                        std::span<const std::uint8_t> input) {
  return core_.Forward(logic_ref, [&] { return Execute(input); });
}

std::vector<std::uint8_t> ERC20ForwarderV3::ForwardEmergencyCall(
    std::span<const std::uint8_t> input) {
  gate_.CheckEmergencyCaller();
  return core_.RunGuarded([&] { return Execute(input); });
}

void ERC20ForwarderV3::SetEmergencyCaller(const primitives::Address& caller) {
  gate_.SetEmergencyCaller(core_, caller);
}

std::vector<std::uint8_t> ERC20ForwarderV3::Execute(std::span<const std::uint8_t> input) {
  const auto call = DecodeCall(input, CallType::kMigrateV2);
  util::LogDebug("forwarder", std::string(kVersion) + " dispatch " +
                                  std::string(CallTypeName(call.call_type)));
  std::visit(Overloaded{
                 [&](const WrapPayload& wrap) { engine_.Wrap(call.token, call.amount, wrap); },
                 [&](const UnwrapPayload& unwrap) {
                   engine_.Unwrap(call.token, call.amount, unwrap.receiver);
                 },
                 [&](const MigratePayload& migrate) {
                   switch (migrate.source) {
                     case MigrationSource::kV1:
                       from_v1_.Migrate(call.token, call.amount, migrate);
                       return;
                     case MigrationSource::kV2:
                       from_v2_.Migrate(call.token, call.amount, migrate);
                       return;
                   }
                 },
             },
             call.payload);
  return {};
}

}  // namespace wrapfwd::forwarder
