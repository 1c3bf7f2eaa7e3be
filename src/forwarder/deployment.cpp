#include "forwarder/deployment.hpp"

#include "forwarder/forwarder.hpp"
#include "host/environment.hpp"

namespace wrapfwd::forwarder {

bool CheckDeployment(const host::Environment& env, const config::DeploymentRecord& record,
                     std::string* error) {
  const auto* forwarder = dynamic_cast<const Forwarder*>(env.Find(record.forwarder));
  if (forwarder == nullptr) {
    if (error) *error = "no forwarder at " + primitives::AddressToHex(record.forwarder);
    return false;
  }
  if (forwarder->GetVersion() != record.version) {
    if (error) {
      *error = primitives::AddressToHex(record.forwarder) + " reports version " +
               std::string(forwarder->GetVersion()) + ", expected " + record.version;
    }
    return false;
  }
  if (forwarder->GetProtocolAdapter() != record.protocol_adapter) {
    if (error) {
      *error = primitives::AddressToHex(record.forwarder) + " is bound to adapter " +
               primitives::AddressToHex(forwarder->GetProtocolAdapter()) + ", expected " +
               primitives::AddressToHex(record.protocol_adapter);
    }
    return false;
  }
  return true;
}

bool CheckNetworkDeployments(const host::Environment& env, std::string* error) {
  for (const auto& record : config::GetNetworkConfig().deployments) {
    if (!CheckDeployment(env, record, error)) {
      return false;
    }
  }
  return true;
}

}  // namespace wrapfwd::forwarder
