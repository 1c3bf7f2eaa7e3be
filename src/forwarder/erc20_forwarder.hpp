#pragma once

#include "forwarder/emergency_gate.hpp"
#include "forwarder/forwarder.hpp"
#include "forwarder/forwarder_core.hpp"
#include "forwarder/wrap_engine.hpp"

namespace wrapfwd::forwarder {

// First generation: wrap and unwrap only.
class ERC20Forwarder : public Forwarder {
 public:
  static constexpr std::string_view kVersion = "1.0.0";

  ERC20Forwarder(host::Environment& env, const primitives::Address& address,
                 const ForwarderBinding& binding, const primitives::Address& signature_transfer);

  std::vector<std::uint8_t> ForwardCall(const primitives::Hash256& logic_ref,
                                        std::span<const std::uint8_t> input) override;
  std::vector<std::uint8_t> ForwardEmergencyCall(std::span<const std::uint8_t> input) override;
  void SetEmergencyCaller(const primitives::Address& caller) override;

  const primitives::Address& GetProtocolAdapter() const override {
    return core_.ProtocolAdapter();
  }
  const primitives::Hash256& GetLogicRef() const override { return core_.LogicRef(); }
  const primitives::Address& GetEmergencyCommittee() const override {
    return core_.EmergencyCommittee();
  }
  std::optional<primitives::Address> GetEmergencyCaller() const override {
    return gate_.Caller();
  }
  std::string_view GetVersion() const override { return kVersion; }

 private:
  std::vector<std::uint8_t> Execute(std::span<const std::uint8_t> input);

  ForwarderCore core_;
  EmergencyGate gate_;
  WrapUnwrapEngine engine_;
};

}  // namespace wrapfwd::forwarder
