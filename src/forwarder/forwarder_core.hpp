#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/hash.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

struct ForwarderBinding {
  primitives::Address protocol_adapter{};
  primitives::Hash256 logic_ref{};
  primitives::Address emergency_committee{};
};

using Dispatch = std::function<std::vector<std::uint8_t>()>;

// Authenticates normal calls against the bound adapter and logic ref and
// serializes entry into a forwarder. Both the normal and the emergency path
// run under the same single-entry guard.
class ForwarderCore {
 public:
  // Throws ForwarderError(kZeroNotAllowed) if any binding field is zero.
  ForwarderCore(host::Environment& env, const primitives::Address& self,
                const ForwarderBinding& binding);

  // Checks sender and logic ref, then runs `dispatch` under the guard.
  std::vector<std::uint8_t> Forward(const primitives::Hash256& logic_ref,
                                    const Dispatch& dispatch);
  // Runs `dispatch` under the guard only; callers authenticate first.
  std::vector<std::uint8_t> RunGuarded(const Dispatch& dispatch);

  const primitives::Address& ProtocolAdapter() const noexcept {
    return binding_.protocol_adapter;
  }
  const primitives::Hash256& LogicRef() const noexcept { return binding_.logic_ref; }
  const primitives::Address& EmergencyCommittee() const noexcept {
    return binding_.emergency_committee;
  }
  const primitives::Address& Self() const noexcept { return self_; }

 private:
  class EntryGuard {
   public:
    explicit EntryGuard(bool& entered);
    ~EntryGuard() { entered_ = false; }
    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

   private:
    bool& entered_;
  };

  host::Environment& env_;
  primitives::Address self_;
  ForwarderBinding binding_;
  bool entered_{false};
};

}  // namespace wrapfwd::forwarder
