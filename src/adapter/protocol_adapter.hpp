#pragma once

#include "host/contract.hpp"
#include "primitives/hash.hpp"

namespace wrapfwd::adapter {

// Upstream protocol adapter a forwarder is bound to. Only its read surface
// is consumed here; the adapter reaches forwarders by invoking
// Forwarder::ForwardCall with its own address as sender.
class ProtocolAdapter : public host::Contract {
 public:
  using host::Contract::Contract;

  // True if the nullifier has been consumed in this adapter's ledger.
  virtual bool IsContained(const primitives::Hash256& nullifier) const = 0;
  // Permanently stopped adapters report true forever.
  virtual bool IsHalted() const = 0;
  virtual primitives::Hash256 LatestCommitmentRoot() const = 0;
};

}  // namespace wrapfwd::adapter
