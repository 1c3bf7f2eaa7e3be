#pragma once

#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "primitives/address.hpp"
#include "primitives/uint128.hpp"

namespace wrapfwd::host {

enum class EventKind {
  kWrapped,
  kUnwrapped,
  kEmergencyCallerSet,
};

// Notification appended to the environment log by a contract. For
// Wrapped/Unwrapped the counterparty is the source/destination of funds; for
// EmergencyCallerSet it is the new caller and token/amount are zero.
struct Event {
  EventKind kind{EventKind::kWrapped};
  primitives::Address emitter{};
  primitives::Address token{};
  primitives::Address counterparty{};
  primitives::Uint128 amount{};

  bool operator==(const Event& other) const = default;
};

std::string_view EventKindName(EventKind kind);

nlohmann::json EventToJson(const Event& event);
std::string EventsToJson(std::span<const Event> events);

}  // namespace wrapfwd::host
