#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace wrapfwd::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Throws std::runtime_error on an unknown level name.
LogLevel ParseLogLevelString(const std::string& value);

// Process-wide log sink. Without a file sink, warnings and errors go to
// stderr as "[component] warn: message" and lower levels are dropped.
class Logger {
 public:
  void Enable(const std::string& path);
  void Disable();
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);

  void Log(LogLevel level, std::string_view component, const std::string& message);

  bool Enabled() const;
  LogLevel Threshold() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

Logger& GlobalLogger();

void LogDebug(std::string_view component, const std::string& message);
void LogInfo(std::string_view component, const std::string& message);
void LogWarn(std::string_view component, const std::string& message);
void LogError(std::string_view component, const std::string& message);

}  // namespace wrapfwd::util
