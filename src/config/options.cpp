#include "config/options.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "util/log.hpp"

namespace wrapfwd::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

primitives::Address RequireAddress(const std::string& value, const char* what) {
  auto address = primitives::AddressFromHex(Trim(value));
  if (!address) {
    throw std::runtime_error(std::string("invalid ") + what + " address '" + value + "'");
  }
  return *address;
}

}  // namespace

void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       ForwarderOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    opts->network = value;
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(std::stoul(value));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(std::stoul(value));
  } else if (key == "signaturetransfer" || key == "permit2") {
    opts->signature_transfer = value;
  } else if (key == "deployment") {
    opts->deployments.push_back(value);
  } else {
    std::cerr << "[config] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, ForwarderOptions* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

DeploymentRecord ParseDeploymentRecord(const std::string& value) {
  const auto first = value.find(':');
  const auto second = first == std::string::npos ? first : value.find(':', first + 1);
  if (second == std::string::npos) {
    throw std::runtime_error("deployment must be <forwarder>:<adapter>:<version>, got '" + value +
                             "'");
  }
  DeploymentRecord record;
  record.forwarder = RequireAddress(value.substr(0, first), "forwarder");
  record.protocol_adapter = RequireAddress(value.substr(first + 1, second - first - 1), "adapter");
  record.version = Trim(value.substr(second + 1));
  if (record.version.empty()) {
    throw std::runtime_error("deployment '" + value + "' has no version");
  }
  return record;
}

void ApplyForwarderOptions(const ForwarderOptions& opts) {
  SelectNetwork(NetworkFromString(opts.network));
  auto& network = GetMutableNetworkConfig();
  if (!opts.signature_transfer.empty()) {
    network.signature_transfer_address =
        RequireAddress(opts.signature_transfer, "signature-transfer");
  }
  for (const auto& entry : opts.deployments) {
    network.deployments.push_back(ParseDeploymentRecord(entry));
  }

  if (opts.debug_log_path.empty()) {
    return;
  }
  util::LogLevel level = util::LogLevel::kDebug;
  try {
    level = util::ParseLogLevelString(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[config] warn: " << ex.what() << " (falling back to debug level)\n";
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  auto& logger = util::GlobalLogger();
  logger.Configure(level, max_bytes, opts.log_max_files);
  logger.Enable(opts.debug_log_path);
  util::LogDebug("config", "debug log enabled at " + opts.debug_log_path + " on " +
                               network.network_id);
}

}  // namespace wrapfwd::config
