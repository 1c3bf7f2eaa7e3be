#pragma once

#include "forwarder/emergency_gate.hpp"
#include "forwarder/forwarder.hpp"
#include "forwarder/forwarder_core.hpp"
#include "forwarder/migration.hpp"
#include "forwarder/wrap_engine.hpp"

namespace wrapfwd::forwarder {

// Second generation: adds migration of funds out of a halted first
// generation forwarder.
class ERC20ForwarderV2 : public Forwarder {
 public:
  static constexpr std::string_view kVersion = "2.0.0";

  // `forwarder_v1` must already be bound to a halted adapter.
  ERC20ForwarderV2(host::Environment& env, const primitives::Address& address,
                   const ForwarderBinding& binding, const primitives::Address& signature_transfer,
                   const Forwarder& forwarder_v1);

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

  const MigrationAnchor& GetMigrationAnchorV1() const noexcept { return from_v1_.Anchor(); }
  bool IsNullifierContained(const primitives::Hash256& nullifier) const {
    return from_v1_.Ledger().IsContained(nullifier);
  }

 private:
  std::vector<std::uint8_t> Execute(std::span<const std::uint8_t> input);

  ForwarderCore core_;
  EmergencyGate gate_;
  WrapUnwrapEngine engine_;
  MigrationPath from_v1_;
};

}  // namespace wrapfwd::forwarder
