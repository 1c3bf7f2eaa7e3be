#include "config/network.hpp"

#include <utility>

namespace wrapfwd::config {

namespace {

// Canonical deployment address shared by every supported network.
constexpr primitives::Address kSignatureTransferAddress{
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x22, 0xd4, 0x73, 0x03, 0x0f,
     0x11, 0x6d, 0xde, 0xe9, 0xf6, 0xb4, 0x3a, 0xc7, 0x8b, 0xa3}};

NetworkConfig BuildConfig(NetworkType type, std::string id, std::uint64_t chain_id) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.chain_id = chain_id;
  cfg.signature_transfer_address = kSignatureTransferAddress;
  return cfg;
}

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet = BuildConfig(NetworkType::kMainnet, "mainnet", 1);
  static const NetworkConfig sepolia = BuildConfig(NetworkType::kSepolia, "sepolia", 11155111);
  static const NetworkConfig local = BuildConfig(NetworkType::kLocal, "local", 31337);
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kSepolia:
      return sepolia;
    case NetworkType::kLocal:
      return local;
  }
  return mainnet;
}

NetworkConfig g_network_config = ConfigFor(NetworkType::kMainnet);

}  // namespace

const NetworkConfig& GetNetworkConfig() { return g_network_config; }

NetworkConfig& GetMutableNetworkConfig() { return g_network_config; }

void SelectNetwork(NetworkType type) { g_network_config = ConfigFor(type); }

NetworkType NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "sepolia" || name == "testnet" || name == "test") return NetworkType::kSepolia;
  if (name == "local" || name == "localhost" || name == "devnet") return NetworkType::kLocal;
  return NetworkType::kMainnet;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kSepolia:
      return "sepolia";
    case NetworkType::kLocal:
      return "local";
  }
  return "mainnet";
}

}  // namespace wrapfwd::config
