#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "host/contract.hpp"
#include "host/errors.hpp"
#include "host/event.hpp"
#include "primitives/address.hpp"

namespace wrapfwd::host {

// Single-threaded execution host. Every call runs inside a frame opened by
// Invoke(); the frame records the sender and a journal checkpoint, and if
// the callee throws, every state change recorded since the checkpoint is
// undone before the exception propagates. Contracts register an undo action
// through Record() for each mutation they make.
class Environment {
 public:
  Environment() = default;
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  // Takes ownership; throws ForwarderError(kZeroNotAllowed) for the zero
  // address and ForwarderError(kAccountExists) for a taken one.
  template <typename T>
  T& Deploy(std::unique_ptr<T> contract) {
    static_assert(std::is_base_of_v<Contract, T>, "Deploy requires a Contract");
    T& ref = *contract;
    Register(std::unique_ptr<Contract>(std::move(contract)));
    return ref;
  }

  Contract* Find(const primitives::Address& address) const;

  // Throws ForwarderError(kUnknownAccount) if nothing of type T lives at
  // `address`.
  template <typename T>
  T& Resolve(const primitives::Address& address) const {
    auto* typed = dynamic_cast<T*>(Find(address));
    if (typed == nullptr) {
      throw ForwarderError(ErrorCode::kUnknownAccount, {}, primitives::AddressToHex(address));
    }
    return *typed;
  }

  template <typename Fn>
  decltype(auto) Invoke(const primitives::Address& sender, Fn&& fn) {
    CallFrame frame(*this, sender);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      frame.Commit();
    } else {
      auto result = std::forward<Fn>(fn)();
      frame.Commit();
      return result;
    }
  }

  // Sender of the innermost open frame; the zero address outside any call.
  primitives::Address Sender() const noexcept;
  std::size_t Depth() const noexcept { return senders_.size(); }

  std::uint64_t Timestamp() const noexcept { return timestamp_; }
  void SetTimestamp(std::uint64_t timestamp) noexcept { timestamp_ = timestamp; }

  // No-op outside a frame, where nothing can be rolled back.
  void Record(std::function<void()> undo);

  void Emit(const Event& event);
  const std::vector<Event>& Events() const noexcept { return events_; }

 private:
  class CallFrame {
   public:
    CallFrame(Environment& env, const primitives::Address& sender);
    ~CallFrame();
    CallFrame(const CallFrame&) = delete;
    CallFrame& operator=(const CallFrame&) = delete;

    void Commit() noexcept { committed_ = true; }

   private:
    Environment& env_;
    std::size_t checkpoint_;
    bool committed_{false};
  };

  void Register(std::unique_ptr<Contract> contract);
  void RollbackTo(std::size_t checkpoint) noexcept;

  std::unordered_map<primitives::Address, std::unique_ptr<Contract>, primitives::AddressHasher>
      accounts_;
  std::vector<primitives::Address> senders_;
  std::vector<std::function<void()>> journal_;
  std::vector<Event> events_;
  std::uint64_t timestamp_{0};
};

}  // namespace wrapfwd::host
