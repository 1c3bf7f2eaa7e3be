#include "host/event.hpp"

namespace wrapfwd::host {

std::string_view EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kWrapped:
      return "Wrapped";
    case EventKind::kUnwrapped:
      return "Unwrapped";
    case EventKind::kEmergencyCallerSet:
      return "EmergencyCallerSet";
  }
  return "Unknown";
}

nlohmann::json EventToJson(const Event& event) {
  nlohmann::json obj;
  obj["event"] = std::string(EventKindName(event.kind));
  obj["emitter"] = primitives::AddressToHex(event.emitter);
  switch (event.kind) {
    case EventKind::kWrapped:
      obj["token"] = primitives::AddressToHex(event.token);
      obj["from"] = primitives::AddressToHex(event.counterparty);
      obj["amount"] = event.amount.ToString();
      break;
    case EventKind::kUnwrapped:
      obj["token"] = primitives::AddressToHex(event.token);
      obj["to"] = primitives::AddressToHex(event.counterparty);
      obj["amount"] = event.amount.ToString();
      break;
    case EventKind::kEmergencyCallerSet:
      obj["emergencyCaller"] = primitives::AddressToHex(event.counterparty);
      break;
  }
  return obj;
}

std::string EventsToJson(std::span<const Event> events) {
  nlohmann::json json = nlohmann::json::array();
  for (const auto& event : events) {
    json.push_back(EventToJson(event));
  }
  return json.dump(2);
}

}  // namespace wrapfwd::host
