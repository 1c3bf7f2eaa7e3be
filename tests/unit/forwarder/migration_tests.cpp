#include <cstdlib>
#include <iostream>
#include <memory>

#include "forwarder/erc20_forwarder.hpp"
#include "forwarder/erc20_forwarder_v2.hpp"
#include "tests/unit/util/forwarder_fixture.hpp"

namespace {

using namespace wrapfwd;
using forwarder::CallType;
using forwarder::ERC20Forwarder;
using forwarder::ERC20ForwarderV2;
using primitives::Uint128;
using test::MakeAddress;
using test::MakeHash;

const primitives::Address kCommittee = MakeAddress(0xC0);
const primitives::Hash256 kLogicRefV1 = MakeHash(0x71);
const primitives::Hash256 kLogicRefV2 = MakeHash(0x72);
const primitives::Hash256 kRootV1 = MakeHash(0xE1);

// A first generation forwarder holding 1000 tokens behind a halted adapter,
// and a second generation forwarder set up to migrate out of it.
template <typename TokenT>
struct BasicMigrationSetup {
  test::TestWorld world;
  TokenT& token = world.DeployToken<TokenT>(10);
  test::MockProtocolAdapter& adapter_v1 = world.DeployAdapter(0x20);
  test::MockProtocolAdapter& adapter_v2 = world.DeployAdapter(0x21);
  ERC20Forwarder& fwd_v1 = world.DeployForwarder<ERC20Forwarder>(
      0x30, forwarder::ForwarderBinding{adapter_v1.GetAddress(), kLogicRefV1, kCommittee});
  ERC20ForwarderV2* fwd_v2{nullptr};

  BasicMigrationSetup() {
    token.Mint(fwd_v1.GetAddress(), 1000);
    adapter_v1.SetCommitmentRoot(kRootV1);
    adapter_v1.Halt();
    fwd_v2 = &world.DeployForwarder<ERC20ForwarderV2>(
        0x31, forwarder::ForwarderBinding{adapter_v2.GetAddress(), kLogicRefV2, kCommittee},
        fwd_v1);
  }

  void AuthorizeSuccessor() {
    world.env.Invoke(kCommittee, [&] { fwd_v1.SetEmergencyCaller(fwd_v2->GetAddress()); });
  }

  void Migrate(const Uint128& amount, const primitives::Hash256& nullifier,
               const primitives::Hash256& root = kRootV1,
               const primitives::Hash256& logic_ref = kLogicRefV1,
               const primitives::Address* source = nullptr) {
    const auto from = source ? *source : fwd_v1.GetAddress();
    world.CallFromAdapter(*fwd_v2,
                          forwarder::EncodeMigrateCall(CallType::kMigrateV1, token.GetAddress(),
                                                       amount, nullifier, root, logic_ref, from));
  }

  bool BalancesAre(const Uint128& old_custody, const Uint128& new_custody) const {
    return token.BalanceOf(fwd_v1.GetAddress()) == old_custody &&
           token.BalanceOf(fwd_v2->GetAddress()) == new_custody;
  }
};

using MigrationSetup = BasicMigrationSetup<test::BasicToken>;

bool TestConstructionRequiresHaltedPredecessor() {
  test::TestWorld world;
  auto& adapter_v1 = world.DeployAdapter(0x20);
  auto& adapter_v2 = world.DeployAdapter(0x21);
  auto& fwd_v1 = world.DeployForwarder<ERC20Forwarder>(
      0x30, forwarder::ForwarderBinding{adapter_v1.GetAddress(), kLogicRefV1, kCommittee});
  const forwarder::ForwarderBinding binding{adapter_v2.GetAddress(), kLogicRefV2, kCommittee};
  const forwarder::Forwarder& predecessor = fwd_v1;
  if (!test::ExpectError(
          host::ErrorCode::kProtocolAdapterNotStopped,
          [&] { world.DeployForwarder<ERC20ForwarderV2>(0x31, binding, predecessor); },
          "successor over a live adapter")) {
    return false;
  }
  adapter_v1.SetCommitmentRoot(kRootV1);
  adapter_v1.Halt();
  auto& fwd_v2 = world.DeployForwarder<ERC20ForwarderV2>(0x31, binding, predecessor);
  const auto& anchor = fwd_v2.GetMigrationAnchorV1();
  if (fwd_v2.GetVersion() != "2.0.0" || anchor.forwarder != fwd_v1.GetAddress() ||
      anchor.protocol_adapter != adapter_v1.GetAddress() || anchor.commitment_tree_root != kRootV1 ||
      anchor.logic_ref != kLogicRefV1) {
    std::cerr << "migration anchors not captured from the predecessor\n";
    return false;
  }
  return true;
}

bool TestHappyPathAndReplay() {
  MigrationSetup setup;
  setup.AuthorizeSuccessor();
  const auto events_before = setup.world.env.Events().size();
  setup.Migrate(300, MakeHash(0x01));
  if (!setup.BalancesAre(700, 300) || !setup.fwd_v2->IsNullifierContained(MakeHash(0x01))) {
    std::cerr << "migration did not move custody\n";
    return false;
  }
  const auto& events = setup.world.env.Events();
  const host::Event wrapped{host::EventKind::kWrapped, setup.fwd_v2->GetAddress(),
                            setup.token.GetAddress(), setup.fwd_v1.GetAddress(), 300};
  const host::Event unwrapped{host::EventKind::kUnwrapped, setup.fwd_v1.GetAddress(),
                              setup.token.GetAddress(), setup.fwd_v2->GetAddress(), 300};
  if (events.size() != events_before + 2 || events[events_before] != wrapped ||
      events[events_before + 1] != unwrapped) {
    std::cerr << "migration events missing or out of order\n";
    return false;
  }

  if (!test::ExpectError(
          host::ErrorCode::kPreExistingNullifier, [&] { setup.Migrate(300, MakeHash(0x01)); },
          "second migration of one nullifier")) {
    return false;
  }
  // A bad root behind a used nullifier still reports the nullifier first.
  if (!test::ExpectError(
          host::ErrorCode::kPreExistingNullifier,
          [&] { setup.Migrate(300, MakeHash(0x01), MakeHash(0xEE)); }, "used nullifier, bad root")) {
    return false;
  }
  // Consumed upstream takes precedence over the local ledger.
  setup.adapter_v1.Consume(MakeHash(0x01));
  if (!test::ExpectError(
          host::ErrorCode::kResourceAlreadyConsumed, [&] { setup.Migrate(300, MakeHash(0x01)); },
          "nullifier consumed in the predecessor adapter")) {
    return false;
  }
  if (!setup.BalancesAre(700, 300)) {
    std::cerr << "rejected migrations moved funds\n";
    return false;
  }

  // Migrated funds are ordinary custody of the successor.
  setup.world.CallFromAdapter(
      *setup.fwd_v2, forwarder::EncodeUnwrapCall(setup.token.GetAddress(), 300, MakeAddress(1)));
  return setup.BalancesAre(700, 0) && setup.token.BalanceOf(MakeAddress(1)) == Uint128{300};
}

bool TestIntegrityChecks() {
  MigrationSetup setup;
  setup.AuthorizeSuccessor();

  setup.adapter_v1.Consume(MakeHash(0x02));
  if (!test::ExpectError(
          host::ErrorCode::kResourceAlreadyConsumed, [&] { setup.Migrate(100, MakeHash(0x02)); },
          "consumed nullifier")) {
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kInvalidMigrationCommitmentTreeRoot,
          [&] { setup.Migrate(100, MakeHash(0x03), MakeHash(0xEE)); }, "wrong root")) {
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kInvalidMigrationLogicRef,
          [&] { setup.Migrate(100, MakeHash(0x04), kRootV1, kLogicRefV2); }, "wrong logic ref")) {
    return false;
  }
  const auto stranger = MakeAddress(0x39);
  if (!test::ExpectError(
          host::ErrorCode::kInvalidForwarder,
          [&] { setup.Migrate(100, MakeHash(0x05), kRootV1, kLogicRefV1, &stranger); },
          "wrong source forwarder")) {
    return false;
  }

  // The anchors are frozen: a later root published by the old adapter is
  // not accepted.
  setup.adapter_v1.SetCommitmentRoot(MakeHash(0xE2));
  if (!test::ExpectError(
          host::ErrorCode::kInvalidMigrationCommitmentTreeRoot,
          [&] { setup.Migrate(100, MakeHash(0x06), MakeHash(0xE2)); }, "post-construction root")) {
    return false;
  }

  for (std::uint8_t tag = 0x02; tag <= 0x06; ++tag) {
    if (setup.fwd_v2->IsNullifierContained(MakeHash(tag))) {
      std::cerr << "failed migration recorded nullifier " << static_cast<int>(tag) << "\n";
      return false;
    }
  }
  if (!setup.BalancesAre(1000, 0)) {
    std::cerr << "failed migrations moved funds\n";
    return false;
  }

  // The failed attempts leave those nullifiers usable.
  setup.Migrate(100, MakeHash(0x03));
  return setup.BalancesAre(900, 100);
}

bool TestRequiresEmergencyCaller() {
  MigrationSetup setup;
  if (!test::ExpectError(
          host::ErrorCode::kUnauthorizedCaller, [&] { setup.Migrate(100, MakeHash(0x07)); },
          "migration before the successor is authorized")) {
    return false;
  }
  if (setup.fwd_v2->IsNullifierContained(MakeHash(0x07)) || !setup.BalancesAre(1000, 0)) {
    std::cerr << "unauthorized migration left side effects\n";
    return false;
  }
  setup.AuthorizeSuccessor();
  if (!test::ExpectError(
          host::ErrorCode::kInsufficientBalance, [&] { setup.Migrate(1001, MakeHash(0x07)); },
          "migration beyond custody")) {
    return false;
  }
  if (setup.fwd_v2->IsNullifierContained(MakeHash(0x07))) {
    std::cerr << "migration beyond custody recorded its nullifier\n";
    return false;
  }
  const auto third_generation_call = forwarder::EncodeMigrateCall(
      CallType::kMigrateV2, setup.token.GetAddress(), 1, MakeHash(0x08), kRootV1, kLogicRefV1,
      setup.fwd_v1.GetAddress());
  return test::ExpectError(
      host::ErrorCode::kInvalidCallType,
      [&] { setup.world.CallFromAdapter(*setup.fwd_v2, third_generation_call); },
      "MigrateV2 on the second generation");
}

bool TestShortDeliveryRollsBack() {
  BasicMigrationSetup<test::FeeOnTransferToken> setup;
  setup.AuthorizeSuccessor();
  const auto events_before = setup.world.env.Events().size();
  try {
    setup.Migrate(300, MakeHash(0x09));
    std::cerr << "migration of a fee-on-transfer token succeeded\n";
    return false;
  } catch (const host::ForwarderError& error) {
    if (error.Code() != host::ErrorCode::kBalanceMismatch || error.Expected() != "300" ||
        error.Actual() != "299") {
      std::cerr << "unexpected short delivery failure: " << error.what() << "\n";
      return false;
    }
  }
  if (setup.fwd_v2->IsNullifierContained(MakeHash(0x09)) || !setup.BalancesAre(1000, 0) ||
      setup.world.env.Events().size() != events_before) {
    std::cerr << "short delivery left side effects\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestConstructionRequiresHaltedPredecessor()) return EXIT_FAILURE;
  if (!TestHappyPathAndReplay()) return EXIT_FAILURE;
  if (!TestIntegrityChecks()) return EXIT_FAILURE;
  if (!TestRequiresEmergencyCaller()) return EXIT_FAILURE;
  if (!TestShortDeliveryRollsBack()) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}
