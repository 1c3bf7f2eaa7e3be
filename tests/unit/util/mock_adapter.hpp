#pragma once

#include <unordered_set>

#include "adapter/protocol_adapter.hpp"

namespace wrapfwd::test {

class MockProtocolAdapter : public adapter::ProtocolAdapter {
 public:
  using adapter::ProtocolAdapter::ProtocolAdapter;

  bool IsContained(const primitives::Hash256& nullifier) const override {
    return nullifiers_.count(nullifier) != 0;
  }
  bool IsHalted() const override { return halted_; }
  primitives::Hash256 LatestCommitmentRoot() const override { return root_; }

  void Consume(const primitives::Hash256& nullifier) { nullifiers_.insert(nullifier); }
  void Halt() { halted_ = true; }
  void SetCommitmentRoot(const primitives::Hash256& root) { root_ = root; }

 private:
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> nullifiers_;
  primitives::Hash256 root_{};
  bool halted_{false};
};

}  // namespace wrapfwd::test
