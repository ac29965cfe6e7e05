// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hymoctl {

fs::path default_config_path() { return fs::path(BASE_DIR) / CONFIG_FILENAME; }

static void trim(std::string &s, const char *chars) {
  s.erase(0, s.find_first_not_of(chars));
  size_t last = s.find_last_not_of(chars);
  s.erase(last == std::string::npos ? 0 : last + 1);
}

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = default_config_path();
  std::error_code ec;
  if (fs::exists(default_path, ec)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    trim(line, " \t\r");
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN("Ignoring malformed config line: " + line);
      continue;
    }

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);
    trim(key, " \t");
    trim(value, " \t\"");

    if (key == "moduledir")
      config.moduledir = value;
    else if (key == "device")
      config.device = value;
    else if (key == "target_root")
      config.target_root = value;
    else if (key == "state_dir")
      config.state_dir = value;
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "partitions") {
      std::stringstream ss(value);
      std::string part;
      while (std::getline(ss, part, ',')) {
        trim(part, " \t");
        if (!part.empty()) {
          config.partitions.push_back(part);
        }
      }
    } else {
      LOG_DEBUG("Unknown config key: " + key);
    }
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# hymoctl configuration\n";
  file << "moduledir = \"" << moduledir.string() << "\"\n";
  file << "device = \"" << device.string() << "\"\n";
  file << "target_root = \"" << target_root.string() << "\"\n";
  file << "state_dir = \"" << state_dir.string() << "\"\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "verbose = " << (verbose ? "true" : "false") << "\n";

  if (!partitions.empty()) {
    file << "partitions = \"";
    for (size_t i = 0; i < partitions.size(); ++i) {
      file << partitions[i];
      if (i < partitions.size() - 1)
        file << ",";
    }
    file << "\"\n";
  }

  return file.good();
}

void Config::merge_with_cli(
    const fs::path &moduledir_override, const fs::path &device_override,
    bool verbose_override,
    const std::vector<std::string> &partitions_override) {
  if (!moduledir_override.empty()) {
    moduledir = moduledir_override;
  }
  if (!device_override.empty()) {
    device = device_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  if (!partitions_override.empty()) {
    partitions = partitions_override;
  }
}

} // namespace hymoctl
