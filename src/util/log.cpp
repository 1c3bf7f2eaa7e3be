#include "util/log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace wrapfwd::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

const char* LowerLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void Logger::Enable(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open debug log: " + path);
  }
  current_size_ = 0;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec) {
    current_size_ = size;
  }
  const std::string header = "---- wrapfwd log started " + FormatTimestamp() + " ----\n";
  stream_ << header;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(header.size());
}

void Logger::Disable() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_.clear();
  current_size_ = 0;
}

void Logger::Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::Log(LogLevel level, std::string_view component, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_.is_open()) {
    if (static_cast<int>(level) >= static_cast<int>(LogLevel::kWarn)) {
      std::cerr << "[" << component << "] " << LowerLevelName(level) << ": " << message << '\n';
    }
    return;
  }
  if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
    RotateLocked();
  }
  std::ostringstream line;
  line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] [" << component << "] "
       << message << '\n';
  const std::string text = line.str();
  stream_ << text;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(text.size());
}

bool Logger::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_.is_open();
}

LogLevel Logger::Threshold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_threshold_;
}

void Logger::RotateLocked() {
  if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
    return;
  }
  stream_.close();
  // logfile.(n-1) -> logfile.n
  for (std::size_t i = max_files_; i > 0; --i) {
    std::filesystem::path rotated = std::filesystem::path(path_).concat("." + std::to_string(i));
    std::filesystem::path previous =
        (i == 1) ? std::filesystem::path(path_)
                 : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

Logger& GlobalLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view component, const std::string& message) {
  GlobalLogger().Log(LogLevel::kDebug, component, message);
}

void LogInfo(std::string_view component, const std::string& message) {
  GlobalLogger().Log(LogLevel::kInfo, component, message);
}

void LogWarn(std::string_view component, const std::string& message) {
  GlobalLogger().Log(LogLevel::kWarn, component, message);
}

void LogError(std::string_view component, const std::string& message) {
  GlobalLogger().Log(LogLevel::kError, component, message);
}

}  // namespace wrapfwd::util
