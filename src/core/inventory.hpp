// core/inventory.hpp - Module inventory
#pragma once

#include "../conf/config.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace hymoctl {

struct Module {
  std::string id;
  fs::path source_path;
  std::string name = "";
  std::string version = "";
  std::string author = "";
  std::string description = "";
};

// Enabled modules only (no disable/remove/skip_mount marker), sorted by id
std::vector<Module> scan_modules(const fs::path &source_dir);

// Built-in partitions plus the configured extras, sorted and unique
std::vector<std::string> all_partitions(const Config &config);

} // namespace hymoctl
