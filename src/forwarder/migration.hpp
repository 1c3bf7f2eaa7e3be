#pragma once

#include "forwarder/call_envelope.hpp"
#include "forwarder/nullifier_ledger.hpp"
#include "primitives/address.hpp"
#include "primitives/hash.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

class Forwarder;

// Values frozen from the predecessor when the path is built.
struct MigrationAnchor {
  primitives::Address forwarder{};
  primitives::Address protocol_adapter{};
  primitives::Hash256 commitment_tree_root{};
  primitives::Hash256 logic_ref{};
};

// Moves custodied funds out of a halted predecessor forwarder, recording
// each migrated resource in a ledger of its own.
class MigrationPath {
 public:
  // Throws ForwarderError(kProtocolAdapterNotStopped) if the predecessor's
  // adapter is still live.
  MigrationPath(host::Environment& env, const primitives::Address& self,
                const Forwarder& predecessor);

  // Requires the predecessor to have this forwarder set as its emergency
  // caller. The nullifier is recorded before any external call is made.
  void Migrate(const primitives::Address& token, const primitives::Uint128& amount,
               const MigratePayload& payload);

  const MigrationAnchor& Anchor() const noexcept { return anchor_; }
  const NullifierLedger& Ledger() const noexcept { return ledger_; }

 private:
  host::Environment& env_;
  primitives::Address self_;
  MigrationAnchor anchor_;
  NullifierLedger ledger_;
};

}  // namespace wrapfwd::forwarder
