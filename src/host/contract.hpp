#pragma once

#include "primitives/address.hpp"

namespace wrapfwd::host {

class Environment;

// Anything that owns an address in the environment: forwarders, tokens,
// the signature-transfer contract, protocol adapters.
class Contract {
 public:
  Contract(Environment& env, const primitives::Address& address) : env_(env), address_(address) {}
  virtual ~Contract() = default;
  Contract(const Contract&) = delete;
  Contract& operator=(const Contract&) = delete;

  const primitives::Address& GetAddress() const noexcept { return address_; }

 protected:
  Environment& env() const noexcept { return env_; }

 private:
  Environment& env_;
  primitives::Address address_;
};

}  // namespace wrapfwd::host
