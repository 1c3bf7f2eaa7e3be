#include "forwarder/nullifier_ledger.hpp"

#include "host/environment.hpp"
#include "host/errors.hpp"

namespace wrapfwd::forwarder {

void NullifierLedger::AddNullifier(const primitives::Hash256& nullifier) {
  if (!set_.insert(nullifier).second) {
    throw host::ForwarderError(host::ErrorCode::kPreExistingNullifier, {},
                               primitives::HashToHex(nullifier));
  }
  env_.Record([this, nullifier] { set_.erase(nullifier); });
}

bool NullifierLedger::IsContained(const primitives::Hash256& nullifier) const {
  return set_.find(nullifier) != set_.end();
}

}  // namespace wrapfwd::forwarder
