#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "host/contract.hpp"
#include "primitives/address.hpp"
#include "primitives/hash.hpp"

namespace wrapfwd::forwarder {

// Externally callable surface shared by every forwarder generation.
class Forwarder : public host::Contract {
 public:
  using host::Contract::Contract;

  // Normal path: only the bound adapter, with the bound logic ref.
  virtual std::vector<std::uint8_t> ForwardCall(const primitives::Hash256& logic_ref,
                                                std::span<const std::uint8_t> input) = 0;
  // Emergency path: only the configured emergency caller.
  virtual std::vector<std::uint8_t> ForwardEmergencyCall(std::span<const std::uint8_t> input) = 0;
  virtual void SetEmergencyCaller(const primitives::Address& caller) = 0;

  virtual const primitives::Address& GetProtocolAdapter() const = 0;
  virtual const primitives::Hash256& GetLogicRef() const = 0;
  virtual const primitives::Address& GetEmergencyCommittee() const = 0;
  virtual std::optional<primitives::Address> GetEmergencyCaller() const = 0;
  virtual std::string_view GetVersion() const = 0;
};

}  // namespace wrapfwd::forwarder
