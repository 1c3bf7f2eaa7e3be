#include "host/environment.hpp"

namespace wrapfwd::host {

Environment::CallFrame::CallFrame(Environment& env, const primitives::Address& sender)
    : env_(env), checkpoint_(env.journal_.size()) {
  env_.senders_.push_back(sender);
}

Environment::CallFrame::~CallFrame() {
  env_.senders_.pop_back();
  if (!committed_) {
    env_.RollbackTo(checkpoint_);
  } else if (env_.senders_.empty()) {
    // Outermost call finished; its effects are final.
    env_.journal_.clear();
  }
}

Contract* Environment::Find(const primitives::Address& address) const {
  auto it = accounts_.find(address);
  return it == accounts_.end() ? nullptr : it->second.get();
}

void Environment::Register(std::unique_ptr<Contract> contract) {
  const auto& address = contract->GetAddress();
  if (primitives::IsZero(address)) {
    throw ForwarderError(ErrorCode::kZeroNotAllowed, {}, primitives::AddressToHex(address));
  }
  if (accounts_.count(address) != 0) {
    throw ForwarderError(ErrorCode::kAccountExists, {}, primitives::AddressToHex(address));
  }
  accounts_.emplace(address, std::move(contract));
}

primitives::Address Environment::Sender() const noexcept {
  if (senders_.empty()) {
    return primitives::Address{};
  }
  return senders_.back();
}

void Environment::Record(std::function<void()> undo) {
  if (senders_.empty()) {
    return;
  }
  journal_.push_back(std::move(undo));
}

void Environment::Emit(const Event& event) {
  events_.push_back(event);
  Record([this] { events_.pop_back(); });
}

void Environment::RollbackTo(std::size_t checkpoint) noexcept {
  while (journal_.size() > checkpoint) {
    auto undo = std::move(journal_.back());
    journal_.pop_back();
    undo();
  }
}

}  // namespace wrapfwd::host
