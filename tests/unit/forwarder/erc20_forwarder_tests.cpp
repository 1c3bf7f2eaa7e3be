#include <cstdlib>
#include <iostream>
#include <memory>

#include "crypto/pq_engine.hpp"
#include "forwarder/erc20_forwarder.hpp"
#include "tests/unit/util/deterministic_rng.hpp"
#include "tests/unit/util/forwarder_fixture.hpp"

namespace {

using namespace wrapfwd;
using forwarder::ERC20Forwarder;
using primitives::Uint128;
using test::MakeAddress;
using test::MakeHash;

const primitives::Address kCommittee = MakeAddress(0xC0);
const primitives::Hash256 kLogicRef = MakeHash(0x77);

forwarder::ForwarderBinding BindingFor(const test::MockProtocolAdapter& adapter) {
  return {adapter.GetAddress(), kLogicRef, kCommittee};
}

bool TestConstructionRejectsZero() {
  test::TestWorld world;
  auto& adapter = world.DeployAdapter(0x20);
  auto binding = BindingFor(adapter);

  auto zero_adapter = binding;
  zero_adapter.protocol_adapter = {};
  auto zero_logic = binding;
  zero_logic.logic_ref = {};
  auto zero_committee = binding;
  zero_committee.emergency_committee = {};
  for (const auto& bad : {zero_adapter, zero_logic, zero_committee}) {
    if (!test::ExpectError(
            host::ErrorCode::kZeroNotAllowed,
            [&] { world.DeployForwarder<ERC20Forwarder>(0x30, bad); }, "zero binding field")) {
      return false;
    }
  }
  if (world.env.Find(MakeAddress(0x30)) != nullptr) {
    std::cerr << "rejected forwarder was registered\n";
    return false;
  }
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, binding);
  if (fwd.GetVersion() != "1.0.0" || fwd.GetProtocolAdapter() != adapter.GetAddress() ||
      fwd.GetLogicRef() != kLogicRef || fwd.GetEmergencyCommittee() != kCommittee ||
      fwd.GetEmergencyCaller().has_value()) {
    std::cerr << "forwarder getters do not reflect the binding\n";
    return false;
  }
  return true;
}

bool TestWrapThenUnwrap() {
  test::ScopedDeterministicRng rng(11);
  test::TestWorld world;
  auto& token = world.DeployToken(10);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));

  const auto alice_key = crypto::SigningKey::Generate();
  const auto alice = permit::AddressFromPublicKey(alice_key.PublicKey());
  world.FundOwner(token, alice, 1000);
  world.env.SetTimestamp(100);

  const auto wrap = world.SignWrap(alice_key, fwd.GetAddress(), token.GetAddress(), 1000, 1, 200,
                                   MakeHash(0xA1));
  const auto output =
      world.CallFromAdapter(fwd, forwarder::EncodeWrapCall(token.GetAddress(), 1000, wrap));
  if (!output.empty()) {
    std::cerr << "wrap returned data\n";
    return false;
  }
  if (token.BalanceOf(fwd.GetAddress()) != Uint128{1000} || token.BalanceOf(alice) != Uint128{0}) {
    std::cerr << "wrap did not move custody to the forwarder\n";
    return false;
  }
  const host::Event wrapped{host::EventKind::kWrapped, fwd.GetAddress(), token.GetAddress(), alice,
                            1000};
  if (world.env.Events().size() != 1 || world.env.Events().back() != wrapped) {
    std::cerr << "missing Wrapped event\n";
    return false;
  }

  world.CallFromAdapter(fwd, forwarder::EncodeUnwrapCall(token.GetAddress(), 1000, alice));
  if (token.BalanceOf(fwd.GetAddress()) != Uint128{0} || token.BalanceOf(alice) != Uint128{1000}) {
    std::cerr << "unwrap did not return funds\n";
    return false;
  }
  const host::Event unwrapped{host::EventKind::kUnwrapped, fwd.GetAddress(), token.GetAddress(),
                              alice, 1000};
  if (world.env.Events().size() != 2 || world.env.Events().back() != unwrapped) {
    std::cerr << "missing Unwrapped event\n";
    return false;
  }

  if (!test::ExpectError(
          host::ErrorCode::kInsufficientBalance,
          [&] {
            world.CallFromAdapter(fwd, forwarder::EncodeUnwrapCall(token.GetAddress(), 1, alice));
          },
          "unwrap beyond custody")) {
    return false;
  }

  // Same signature again: the nonce is spent.
  return test::ExpectError(
      host::ErrorCode::kInvalidNonce,
      [&] {
        world.CallFromAdapter(fwd, forwarder::EncodeWrapCall(token.GetAddress(), 1000, wrap));
      },
      "replayed wrap");
}

bool TestCallerAuthentication() {
  test::TestWorld world;
  auto& token = world.DeployToken(10);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  const auto input = forwarder::EncodeUnwrapCall(token.GetAddress(), 0, MakeAddress(1));

  try {
    world.env.Invoke(MakeAddress(0x66), [&] { return fwd.ForwardCall(kLogicRef, input); });
    std::cerr << "call from a stranger succeeded\n";
    return false;
  } catch (const host::ForwarderError& error) {
    if (error.Code() != host::ErrorCode::kUnauthorizedCaller ||
        error.Expected() != primitives::AddressToHex(adapter.GetAddress()) ||
        error.Actual() != primitives::AddressToHex(MakeAddress(0x66))) {
      std::cerr << "unexpected rejection: " << error.what() << "\n";
      return false;
    }
  }
  return test::ExpectError(
      host::ErrorCode::kUnauthorizedLogicRef,
      [&] {
        world.env.Invoke(adapter.GetAddress(), [&] { return fwd.ForwardCall(MakeHash(0x78), input); });
      },
      "wrong logic ref");
}

bool TestFeeTokenAndZeroAmount() {
  test::ScopedDeterministicRng rng(12);
  test::TestWorld world;
  auto& token = world.DeployToken<test::FeeOnTransferToken>(11);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  const auto key = crypto::SigningKey::Generate();
  const auto owner = permit::AddressFromPublicKey(key.PublicKey());
  world.FundOwner(token, owner, 100);

  const auto wrap =
      world.SignWrap(key, fwd.GetAddress(), token.GetAddress(), 100, 1, 10, MakeHash(0xA2));
  try {
    world.CallFromAdapter(fwd, forwarder::EncodeWrapCall(token.GetAddress(), 100, wrap));
    std::cerr << "fee-on-transfer wrap succeeded\n";
    return false;
  } catch (const host::ForwarderError& error) {
    if (error.Code() != host::ErrorCode::kBalanceMismatch || error.Expected() != "100" ||
        error.Actual() != "99") {
      std::cerr << "unexpected fee token failure: " << error.what() << "\n";
      return false;
    }
  }
  if (token.BalanceOf(owner) != Uint128{100} || token.BalanceOf(fwd.GetAddress()) != Uint128{0} ||
      world.signature_transfer->IsNonceUsed(owner, test::NonceWord(1)) ||
      !world.env.Events().empty()) {
    std::cerr << "failed wrap left side effects\n";
    return false;
  }

  forwarder::WrapPayload empty;
  empty.owner = owner;
  world.CallFromAdapter(fwd, forwarder::EncodeWrapCall(token.GetAddress(), 0, empty));
  world.CallFromAdapter(fwd, forwarder::EncodeUnwrapCall(token.GetAddress(), 0, owner));
  if (token.BalanceOf(owner) != Uint128{100} || world.env.Events().size() != 2) {
    std::cerr << "zero-amount calls were not plain no-ops\n";
    return false;
  }
  return true;
}

bool TestUnwrapOverchargeRejected() {
  test::TestWorld world;
  auto& token = world.DeployToken<test::OverchargingToken>(14);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  token.Mint(fwd.GetAddress(), 100);

  try {
    world.CallFromAdapter(fwd, forwarder::EncodeUnwrapCall(token.GetAddress(), 50, MakeAddress(1)));
    std::cerr << "overcharged unwrap succeeded\n";
    return false;
  } catch (const host::ForwarderError& error) {
    if (error.Code() != host::ErrorCode::kBalanceMismatch || error.Expected() != "50" ||
        error.Actual() != "51") {
      std::cerr << "unexpected overcharge failure: " << error.what() << "\n";
      return false;
    }
  }
  if (token.BalanceOf(fwd.GetAddress()) != Uint128{100} ||
      token.BalanceOf(MakeAddress(1)) != Uint128{0} || !world.env.Events().empty()) {
    std::cerr << "failed unwrap left side effects\n";
    return false;
  }
  return true;
}

bool TestNonStandardTokens() {
  test::TestWorld world;
  auto& silent = world.DeployToken<test::NoReturnToken>(12);
  auto& refusing = world.DeployToken<test::FalseReturningToken>(13);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  silent.Mint(fwd.GetAddress(), 50);
  refusing.Mint(fwd.GetAddress(), 50);

  world.CallFromAdapter(fwd, forwarder::EncodeUnwrapCall(silent.GetAddress(), 50, MakeAddress(1)));
  if (silent.BalanceOf(MakeAddress(1)) != Uint128{50}) {
    std::cerr << "token without return value did not unwrap\n";
    return false;
  }

  refusing.SetRefuseTransfers(true);
  if (!test::ExpectError(
          host::ErrorCode::kTransferFailed,
          [&] {
            world.CallFromAdapter(
                fwd, forwarder::EncodeUnwrapCall(refusing.GetAddress(), 50, MakeAddress(1)));
          },
          "token returning false")) {
    return false;
  }
  return refusing.BalanceOf(fwd.GetAddress()) == Uint128{50};
}

bool TestReentrancyAndCallType() {
  test::TestWorld world;
  auto& token = world.DeployToken(10);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  token.Mint(fwd.GetAddress(), 10);

  const auto inner = forwarder::EncodeUnwrapCall(token.GetAddress(), 5, MakeAddress(2));
  token.SetTransferHook([&] { world.CallFromAdapter(fwd, inner); });
  if (!test::ExpectError(
          host::ErrorCode::kReentrantCall,
          [&] {
            world.CallFromAdapter(fwd,
                                  forwarder::EncodeUnwrapCall(token.GetAddress(), 5, MakeAddress(1)));
          },
          "reentrant unwrap")) {
    return false;
  }
  token.SetTransferHook({});
  if (token.BalanceOf(fwd.GetAddress()) != Uint128{10}) {
    std::cerr << "reentrant attempt moved funds\n";
    return false;
  }
  // The guard is released after the failed call.
  world.CallFromAdapter(fwd, inner);
  if (token.BalanceOf(MakeAddress(2)) != Uint128{5}) {
    std::cerr << "forwarder stuck after reentrancy failure\n";
    return false;
  }

  const auto migrate = forwarder::EncodeMigrateCall(forwarder::CallType::kMigrateV1,
                                                    token.GetAddress(), 1, MakeHash(1), MakeHash(2),
                                                    kLogicRef, MakeAddress(0x31));
  return test::ExpectError(
      host::ErrorCode::kInvalidCallType, [&] { world.CallFromAdapter(fwd, migrate); },
      "migrate on first generation");
}

bool TestEmergencyLifecycle() {
  test::TestWorld world;
  auto& token = world.DeployToken(10);
  auto& adapter = world.DeployAdapter(0x20);
  auto& fwd = world.DeployForwarder<ERC20Forwarder>(0x30, BindingFor(adapter));
  token.Mint(fwd.GetAddress(), 10);
  const auto rescuer = MakeAddress(0x40);
  const auto unwrap = forwarder::EncodeUnwrapCall(token.GetAddress(), 10, MakeAddress(1));

  auto set_as = [&](const primitives::Address& sender, const primitives::Address& caller) {
    world.env.Invoke(sender, [&] { fwd.SetEmergencyCaller(caller); });
  };
  auto emergency_as = [&](const primitives::Address& sender) {
    return world.env.Invoke(sender, [&] { return fwd.ForwardEmergencyCall(unwrap); });
  };

  if (!test::ExpectError(
          host::ErrorCode::kUnauthorizedCaller, [&] { emergency_as(rescuer); },
          "emergency call before a caller is set")) {
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kUnauthorizedCaller, [&] { set_as(MakeAddress(0x66), rescuer); },
          "set by non-committee")) {
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kProtocolAdapterNotStopped, [&] { set_as(kCommittee, rescuer); },
          "set while adapter is live")) {
    return false;
  }
  adapter.Halt();
  if (!test::ExpectError(
          host::ErrorCode::kZeroNotAllowed, [&] { set_as(kCommittee, primitives::Address{}); },
          "zero emergency caller")) {
    return false;
  }
  set_as(kCommittee, rescuer);
  const host::Event caller_set{host::EventKind::kEmergencyCallerSet, fwd.GetAddress(), {}, rescuer,
                               {}};
  if (fwd.GetEmergencyCaller() != rescuer || world.env.Events().empty() ||
      world.env.Events().back() != caller_set) {
    std::cerr << "emergency caller not recorded\n";
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kEmergencyCallerAlreadySet,
          [&] { set_as(kCommittee, MakeAddress(0x41)); }, "second set")) {
    return false;
  }
  if (!test::ExpectError(
          host::ErrorCode::kUnauthorizedCaller, [&] { emergency_as(MakeAddress(0x41)); },
          "emergency call from the wrong caller")) {
    return false;
  }
  emergency_as(rescuer);
  return token.BalanceOf(MakeAddress(1)) == Uint128{10} && fwd.GetEmergencyCaller() == rescuer;
}

}  // namespace

int main() {
  if (!TestConstructionRejectsZero()) return EXIT_FAILURE;
  if (!TestWrapThenUnwrap()) return EXIT_FAILURE;
  if (!TestCallerAuthentication()) return EXIT_FAILURE;
  if (!TestFeeTokenAndZeroAmount()) return EXIT_FAILURE;
  if (!TestUnwrapOverchargeRejected()) return EXIT_FAILURE;
  if (!TestNonStandardTokens()) return EXIT_FAILURE;
  if (!TestReentrancyAndCallType()) return EXIT_FAILURE;
  if (!TestEmergencyLifecycle()) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}
