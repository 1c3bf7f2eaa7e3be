#include "forwarder/migration.hpp"

#include "adapter/protocol_adapter.hpp"
#include "forwarder/forwarder.hpp"
#include "forwarder/wrap_engine.hpp"
#include "host/environment.hpp"
#include "host/errors.hpp"
#include "token/safe_transfer.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

namespace {

using host::ErrorCode;
using host::ForwarderError;

MigrationAnchor CaptureAnchor(const host::Environment& env, const Forwarder& predecessor) {
  const auto& halted = env.Resolve<adapter::ProtocolAdapter>(predecessor.GetProtocolAdapter());
  if (!halted.IsHalted()) {
    throw ForwarderError(ErrorCode::kProtocolAdapterNotStopped, {},
                         primitives::AddressToHex(halted.GetAddress()));
  }
  MigrationAnchor anchor;
  anchor.forwarder = predecessor.GetAddress();
  anchor.protocol_adapter = halted.GetAddress();
  anchor.commitment_tree_root = halted.LatestCommitmentRoot();
  anchor.logic_ref = predecessor.GetLogicRef();
  return anchor;
}

}  // namespace

MigrationPath::MigrationPath(host::Environment& env, const primitives::Address& self,
                             const Forwarder& predecessor)
    : env_(env), self_(self), anchor_(CaptureAnchor(env, predecessor)), ledger_(env) {}

void MigrationPath::Migrate(const primitives::Address& token, const primitives::Uint128& amount,
                            const MigratePayload& payload) {
  const auto& source = env_.Resolve<adapter::ProtocolAdapter>(anchor_.protocol_adapter);
  if (source.IsContained(payload.nullifier)) {
    throw ForwarderError(ErrorCode::kResourceAlreadyConsumed, {},
                         primitives::HashToHex(payload.nullifier));
  }
  ledger_.AddNullifier(payload.nullifier);

  if (payload.commitment_tree_root != anchor_.commitment_tree_root) {
    throw ForwarderError(ErrorCode::kInvalidMigrationCommitmentTreeRoot,
                         primitives::HashToHex(anchor_.commitment_tree_root),
                         primitives::HashToHex(payload.commitment_tree_root));
  }
  if (payload.logic_ref != anchor_.logic_ref) {
    throw ForwarderError(ErrorCode::kInvalidMigrationLogicRef,
                         primitives::HashToHex(anchor_.logic_ref),
                         primitives::HashToHex(payload.logic_ref));
  }
  if (payload.forwarder != anchor_.forwarder) {
    throw ForwarderError(ErrorCode::kInvalidForwarder, primitives::AddressToHex(anchor_.forwarder),
                         primitives::AddressToHex(payload.forwarder));
  }

  env_.Emit(host::Event{host::EventKind::kWrapped, self_, token, anchor_.forwarder, amount});

  const auto before = token::BalanceOf(env_, token, self_);
  auto& predecessor = env_.Resolve<Forwarder>(anchor_.forwarder);
  const auto request = EncodeUnwrapCall(token, amount, self_);
  env_.Invoke(self_, [&] { return predecessor.ForwardEmergencyCall(request); });
  VerifyBalanceIncrease(before, token::BalanceOf(env_, token, self_), amount);

  util::LogInfo("forwarder", "migrated " + amount.ToString() + " of " +
                                 primitives::AddressToHex(token) + " from " +
                                 primitives::AddressToHex(anchor_.forwarder));
}

}  // namespace wrapfwd::forwarder
