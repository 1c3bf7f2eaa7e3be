#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "config/network.hpp"

namespace wrapfwd::config {

struct ForwarderOptions {
  std::string network{"mainnet"};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  // Overrides the network's signature-transfer address when non-empty.
  std::string signature_transfer;
  // Each entry is "<forwarder>:<adapter>:<version>".
  std::vector<std::string> deployments;
};

// Applies one `key = value` pair. Keys are case-insensitive and ignore '-'
// and '_'. Unknown keys are reported on stderr and otherwise ignored.
void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       ForwarderOptions* opts);

// Reads `key = value` lines; '#' starts a comment, a bare key means "1".
// A missing file is not an error. Throws std::runtime_error naming the file
// and line of a value that cannot be parsed.
void LoadConfigFile(const std::filesystem::path& path, ForwarderOptions* opts);

// Throws std::runtime_error on a malformed entry.
DeploymentRecord ParseDeploymentRecord(const std::string& value);

// Selects the network, applies overrides to the global network config and
// configures the global logger.
void ApplyForwarderOptions(const ForwarderOptions& opts);

}  // namespace wrapfwd::config
