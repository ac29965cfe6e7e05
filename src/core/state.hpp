// core/state.hpp - Runtime state management
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace hymoctl {

// Which modules currently have rules applied through hymoctl
struct RuntimeState {
  std::vector<std::string> active_module_ids;
  int kernel_version = -1;

  bool is_active(const std::string &id) const;
  // Both return true when the list changed
  bool mark_active(const std::string &id);
  bool mark_inactive(const std::string &id);

  bool save(const fs::path &state_dir) const;
};

RuntimeState load_runtime_state(const fs::path &state_dir);

} // namespace hymoctl
