// utils.hpp - Utility functions
#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace hymoctl {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void set_console(bool enabled) { console_ = enabled; }
  bool verbose() const { return verbose_; }
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  bool console_ = true;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) ::hymoctl::Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) ::hymoctl::Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) ::hymoctl::Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) ::hymoctl::Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool is_real_directory(const fs::path &path);

// Decode bytes as UTF-8, replacing invalid sequences with U+FFFD
std::string utf8_lossy(const char *data, size_t len);

std::string errno_string(int err);
std::string json_escape(const std::string &s);

} // namespace hymoctl
