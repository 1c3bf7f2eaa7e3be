#include "forwarder/forwarder_core.hpp"

#include "host/environment.hpp"
#include "host/errors.hpp"
#include "util/log.hpp"

namespace wrapfwd::forwarder {

namespace {

using host::ErrorCode;
using host::ForwarderError;

void RequireNonZero(bool zero, const char* field) {
  if (zero) {
    throw ForwarderError(ErrorCode::kZeroNotAllowed, {}, field);
  }
}

}  // namespace

ForwarderCore::EntryGuard::EntryGuard(bool& entered) : entered_(entered) {
  if (entered_) {
    throw ForwarderError(ErrorCode::kReentrantCall);
  }
  entered_ = true;
}

ForwarderCore::ForwarderCore(host::Environment& env, const primitives::Address& self,
                             const ForwarderBinding& binding)
    : env_(env), self_(self), binding_(binding) {
  RequireNonZero(primitives::IsZero(binding_.protocol_adapter), "protocolAdapter");
  RequireNonZero(primitives::IsZero(binding_.logic_ref), "logicRef");
  RequireNonZero(primitives::IsZero(binding_.emergency_committee), "emergencyCommittee");
}

std::vector<std::uint8_t> ForwarderCore::Forward(const primitives::Hash256& logic_ref,
                                                 const Dispatch& dispatch) {
  const auto sender = env_.Sender();
  if (sender != binding_.protocol_adapter) {
    util::LogWarn("forwarder", primitives::AddressToHex(self_) + " rejected call from " +
                                   primitives::AddressToHex(sender));
    throw ForwarderError(ErrorCode::kUnauthorizedCaller,
                         primitives::AddressToHex(binding_.protocol_adapter),
                         primitives::AddressToHex(sender));
  }
  if (logic_ref != binding_.logic_ref) {
    util::LogWarn("forwarder", primitives::AddressToHex(self_) + " rejected logic ref " +
                                   primitives::HashToHex(logic_ref));
    throw ForwarderError(ErrorCode::kUnauthorizedLogicRef, primitives::HashToHex(binding_.logic_ref),
                         primitives::HashToHex(logic_ref));
  }
  return RunGuarded(dispatch);
}

std::vector<std::uint8_t> ForwarderCore::RunGuarded(const Dispatch& dispatch) {
  EntryGuard guard(entered_);
  try {
    return dispatch();
  } catch (const ForwarderError& error) {
    util::LogWarn("forwarder", primitives::AddressToHex(self_) + " call failed: " + error.what());
    throw;
  }
}

}  // namespace wrapfwd::forwarder
