// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace hymoctl {

struct Config {
  fs::path moduledir = DEFAULT_MODULE_DIR;
  fs::path device = CONTROL_DEVICE_PATH;
  fs::path target_root = "/";
  fs::path state_dir = RUN_DIR;
  fs::path log_file;
  bool verbose = false;
  std::vector<std::string> partitions;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &moduledir_override,
                      const fs::path &device_override, bool verbose_override,
                      const std::vector<std::string> &partitions_override);
};

fs::path default_config_path();

} // namespace hymoctl
