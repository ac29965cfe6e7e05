// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cstdio>
#include <cstring>
#include <sstream>
#include <ctime>
#include <iostream>
#include <system_error>

namespace hymoctl {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path() && !ensure_dir_exists(log_path.parent_path())) {
      return;
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  struct tm tm_buf;
  localtime_r(&now, &tm_buf);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  if (console_) {
    std::cerr << log_line;
  }
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return true;
  }
  fs::create_directories(path, ec);
  if (ec) {
    // Not LOG_ERROR: the logger itself calls this while opening its file
    std::cerr << "Failed to create directory " << path.string() << ": "
              << ec.message() << "\n";
    return false;
  }
  return true;
}

bool is_real_directory(const fs::path &path) {
  std::error_code ec;
  return fs::exists(path, ec) && fs::is_directory(path, ec);
}

std::string json_escape(const std::string &s) {
  std::ostringstream o;
  for (char c : s) {
    if (c == '"')
      o << "\\\"";
    else if (c == '\\')
      o << "\\\\";
    else if (c == '\n')
      o << "\\n";
    else if (c == '\r')
      o << "\\r";
    else if (c == '\t')
      o << "\\t";
    else if ((unsigned char)c < 0x20) {
      char buf[7];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      o << buf;
    } else
      o << c;
  }
  return o.str();
}

std::string errno_string(int err) { return std::system_category().message(err); }

// Returns the number of bytes consumed; *valid is false when those bytes are
// the maximal invalid subpart that gets one replacement character.
static size_t utf8_step(const unsigned char *p, size_t avail, bool *valid) {
  unsigned char c = p[0];
  *valid = true;
  if (c < 0x80)
    return 1;

  size_t need;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) {
    need = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    need = 3;
    if (c == 0xE0)
      lo = 0xA0;
    else if (c == 0xED)
      hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    need = 4;
    if (c == 0xF0)
      lo = 0x90;
    else if (c == 0xF4)
      hi = 0x8F;
  } else {
    *valid = false;
    return 1;
  }

  // Second byte has the restricted range, the rest are plain continuations
  size_t i = 1;
  if (i >= avail || p[i] < lo || p[i] > hi) {
    *valid = false;
    return i;
  }
  for (++i; i < need; ++i) {
    if (i >= avail || (p[i] & 0xC0) != 0x80) {
      *valid = false;
      return i;
    }
  }
  return need;
}

std::string utf8_lossy(const char *data, size_t len) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  const auto *p = reinterpret_cast<const unsigned char *>(data);

  std::string out;
  out.reserve(len);
  size_t i = 0;
  while (i < len) {
    bool valid;
    size_t n = utf8_step(p + i, len - i, &valid);
    if (valid)
      out.append(data + i, n);
    else
      out += kReplacement;
    i += n;
  }
  return out;
}

} // namespace hymoctl
