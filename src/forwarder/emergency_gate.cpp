#include "forwarder/emergency_gate.hpp"

#include "adapter/protocol_adapter.hpp"
#include "forwarder/forwarder_core.hpp"
#include "host/environment.hpp"
#include "host/errors.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

using host::ErrorCode;
using host::ForwarderError;

void EmergencyGate::SetEmergencyCaller(const ForwarderCore& core,
                                       const primitives::Address& caller) {
  const auto sender = env_.Sender();
  if (sender != core.EmergencyCommittee()) {
    throw ForwarderError(ErrorCode::kUnauthorizedCaller,
                         primitives::AddressToHex(core.EmergencyCommittee()),
                         primitives::AddressToHex(sender));
  }
  const auto& bound = env_.Resolve<adapter::ProtocolAdapter>(core.ProtocolAdapter());
  if (!bound.IsHalted()) {
    throw ForwarderError(ErrorCode::kProtocolAdapterNotStopped, {},
                         primitives::AddressToHex(core.ProtocolAdapter()));
  }
  if (caller_.has_value()) {
    throw ForwarderError(ErrorCode::kEmergencyCallerAlreadySet,
                         primitives::AddressToHex(*caller_), primitives::AddressToHex(caller));
  }
  if (primitives::IsZero(caller)) {
    throw ForwarderError(ErrorCode::kZeroNotAllowed, {}, "emergencyCaller");
  }

  caller_ = caller;
  env_.Record([this] { caller_.reset(); });
  env_.Emit(host::Event{host::EventKind::kEmergencyCallerSet, core.Self(), {}, caller, {}});
  util::LogInfo("forwarder", primitives::AddressToHex(core.Self()) + " emergency caller set to " +
                                 primitives::AddressToHex(caller));
}

void EmergencyGate::CheckEmergencyCaller() const {
  const auto sender = env_.Sender();
  if (!caller_.has_value() || *caller_ != sender) {
    const primitives::Address expected = caller_.value_or(primitives::Address{});
    util::LogWarn("forwarder", "emergency call rejected from " + primitives::AddressToHex(sender));
    throw ForwarderError(ErrorCode::kUnauthorizedCaller, primitives::AddressToHex(expected),
                         primitives::AddressToHex(sender));
  }
}

}  // namespace wrapfwd::forwarder
