#pragma once

#include <cstddef>
#include <unordered_set>

#include "primitives/hash.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

// Append-only set of consumed nullifiers. Inserts are journaled in the
// environment so a call that fails after AddNullifier leaves no trace.
class NullifierLedger {
 public:
  explicit NullifierLedger(host::Environment& env) : env_(env) {}

  // Throws ForwarderError(kPreExistingNullifier) if already present.
  void AddNullifier(const primitives::Hash256& nullifier);
  bool IsContained(const primitives::Hash256& nullifier) const;
  std::size_t Size() const noexcept { return set_.size(); }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& nullifier : set_) {
      if (!fn(nullifier)) {
        break;
      }
    }
  }

 private:
  host::Environment& env_;
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> set_;
};

}  // namespace wrapfwd::forwarder
