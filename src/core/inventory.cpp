// core/inventory.cpp - Module inventory implementation
#include "inventory.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <fstream>

namespace hymoctl {

static void parse_module_prop(const fs::path &module_path, Module &module) {
  fs::path prop_file = module_path / MODULE_PROP_FILENAME;
  std::ifstream file(prop_file);
  if (!file.is_open())
    return;

  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);

    if (key == "name")
      module.name = value;
    else if (key == "version")
      module.version = value;
    else if (key == "author")
      module.author = value;
    else if (key == "description")
      module.description = value;
  }
}

std::vector<Module> scan_modules(const fs::path &source_dir) {
  std::vector<Module> modules;

  if (!is_real_directory(source_dir)) {
    return modules;
  }

  try {
    for (const auto &entry : fs::directory_iterator(source_dir)) {
      if (!entry.is_directory()) {
        continue;
      }

      std::string id = entry.path().filename().string();

      if (id == "lost+found" || id == ".git") {
        continue;
      }

      if (fs::exists(entry.path() / DISABLE_FILE_NAME) ||
          fs::exists(entry.path() / REMOVE_FILE_NAME) ||
          fs::exists(entry.path() / SKIP_MOUNT_FILE_NAME)) {
        LOG_DEBUG("Skipping module " + id);
        continue;
      }

      Module mod;
      mod.id = id;
      mod.source_path = entry.path();
      parse_module_prop(entry.path(), mod);
      modules.push_back(mod);
    }

    std::sort(modules.begin(), modules.end(),
              [](const Module &a, const Module &b) { return a.id < b.id; });

  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Failed to scan modules: " + std::string(e.what()));
  }

  return modules;
}

std::vector<std::string> all_partitions(const Config &config) {
  std::vector<std::string> parts = BUILTIN_PARTITIONS;
  parts.insert(parts.end(), config.partitions.begin(), config.partitions.end());
  std::sort(parts.begin(), parts.end());
  parts.erase(std::unique(parts.begin(), parts.end()), parts.end());
  return parts;
}

} // namespace hymoctl
