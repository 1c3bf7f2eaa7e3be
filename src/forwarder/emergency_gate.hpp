#pragma once

#include <optional>

#include "primitives/address.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

class ForwarderCore;

// One-time settable emergency caller. The committee may set it only once the
// bound adapter is permanently halted; afterwards only that caller may use
// the emergency path.
class EmergencyGate {
 public:
  explicit EmergencyGate(host::Environment& env) : env_(env) {}

  void SetEmergencyCaller(const ForwarderCore& core, const primitives::Address& caller);
  // Throws ForwarderError(kUnauthorizedCaller) unless the sender is the
  // configured caller. With no caller set every sender is rejected.
  void CheckEmergencyCaller() const;

  const std::optional<primitives::Address>& Caller() const noexcept { return caller_; }

 private:
  host::Environment& env_;
  std::optional<primitives::Address> caller_;
};

}  // namespace wrapfwd::forwarder
