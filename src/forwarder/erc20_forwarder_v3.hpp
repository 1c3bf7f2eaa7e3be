#pragma once

#include "forwarder/emergency_gate.hpp"
#include "forwarder/forwarder.hpp"
#include "forwarder/forwarder_core.hpp"
#include "forwarder/migration.hpp"
#include "forwarder/wrap_engine.hpp"

namespace wrapfwd::forwarder {

// Third generation: migrates from both earlier generations, each through its
// own ledger and anchors.
class ERC20ForwarderV3 : public Forwarder {
 public:
  static constexpr std::string_view kVersion = "3.0.0";

  // Both predecessors must already be bound to halted adapters.
  ERC20ForwarderV3(host::Environment& env, const primitives::Address& address,
                   const ForwarderBinding& binding, const primitives::Address& signature_transfer,
                   const Forwarder& forwarder_v1, const Forwarder& forwarder_v2);

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
  const MigrationAnchor& GetMigrationAnchorV2() const noexcept { return from_v2_.Anchor(); }
  bool IsNullifierContainedV1(const primitives::Hash256& nullifier) const {
    return from_v1_.Ledger().IsContained(nullifier);
  }
  bool IsNullifierContainedV2(const primitives::Hash256& nullifier) const {
    return from_v2_.Ledger().IsContained(nullifier);
  }

 private:
  std::vector<std::uint8_t> Execute(std::span<const std::uint8_t> input);

  ForwarderCore core_;
  EmergencyGate gate_;
  WrapUnwrapEngine engine_;
  MigrationPath from_v1_;
  MigrationPath from_v2_;
};

}  // namespace wrapfwd::forwarder
