#pragma once

#include <string>

#include "config/network.hpp"

namespace wrapfwd::host {
class Environment;
}

namespace wrapfwd::forwarder {

// Confirms that a forwarder is deployed at `record.forwarder`, reports
// `record.version` and is bound to `record.protocol_adapter`.
bool CheckDeployment(const host::Environment& env, const config::DeploymentRecord& record,
                     std::string* error);

// Runs CheckDeployment over every record of the selected network.
bool CheckNetworkDeployments(const host::Environment& env, std::string* error);

}  // namespace wrapfwd::forwarder
