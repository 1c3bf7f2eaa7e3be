#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "primitives/address.hpp"

namespace wrapfwd::config {

enum class NetworkType {
  kMainnet,
  kSepolia,
  kLocal,
};

// A forwarder known to be deployed on a network, with the adapter it must
// be bound to.
struct DeploymentRecord {
  primitives::Address forwarder{};
  primitives::Address protocol_adapter{};
  std::string version;
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  std::uint64_t chain_id{1};
  // Signature-transfer contract the wrap path pulls deposits through.
  primitives::Address signature_transfer_address{};
  std::vector<DeploymentRecord> deployments;
};

const NetworkConfig& GetNetworkConfig();
NetworkConfig& GetMutableNetworkConfig();
void SelectNetwork(NetworkType type);
NetworkType NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace wrapfwd::config
