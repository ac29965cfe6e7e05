// core/state.cpp - Runtime state implementation
#include "state.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace hymoctl {

bool RuntimeState::is_active(const std::string &id) const {
  return std::find(active_module_ids.begin(), active_module_ids.end(), id) !=
         active_module_ids.end();
}

bool RuntimeState::mark_active(const std::string &id) {
  if (is_active(id))
    return false;
  active_module_ids.push_back(id);
  return true;
}

bool RuntimeState::mark_inactive(const std::string &id) {
  auto it = std::remove(active_module_ids.begin(), active_module_ids.end(), id);
  if (it == active_module_ids.end())
    return false;
  active_module_ids.erase(it, active_module_ids.end());
  return true;
}

bool RuntimeState::save(const fs::path &state_dir) const {
  if (!ensure_dir_exists(state_dir)) {
    LOG_ERROR("Failed to save runtime state: cannot create " +
              state_dir.string());
    return false;
  }

  fs::path state_file = state_dir / STATE_FILENAME;
  std::ofstream file(state_file);
  if (!file.is_open()) {
    LOG_ERROR("Failed to save runtime state to " + state_file.string());
    return false;
  }

  file << "{\n";
  file << "  \"kernel_version\": " << kernel_version << ",\n";
  file << "  \"active_module_ids\": [";
  for (size_t i = 0; i < active_module_ids.size(); ++i) {
    file << "\"" << json_escape(active_module_ids[i]) << "\"";
    if (i < active_module_ids.size() - 1)
      file << ", ";
  }
  file << "]\n";
  file << "}\n";

  return file.good();
}

// Reads the string items of a single-line array written by save().
// Commas inside quotes belong to the item; json_escape sequences are undone.
static std::vector<std::string> parse_json_array(const std::string &line) {
  std::vector<std::string> result;
  auto start = line.find("[");
  auto end = line.rfind("]");
  if (start == std::string::npos || end == std::string::npos || end < start)
    return result;

  std::string item;
  bool in_string = false;
  for (size_t i = start + 1; i < end; ++i) {
    char c = line[i];
    if (!in_string) {
      if (c == '"') {
        in_string = true;
        item.clear();
      }
      continue;
    }

    if (c == '"') {
      in_string = false;
      result.push_back(item);
    } else if (c == '\\' && i + 1 < end) {
      char next = line[++i];
      switch (next) {
      case 'n':
        item += '\n';
        break;
      case 'r':
        item += '\r';
        break;
      case 't':
        item += '\t';
        break;
      case 'u':
        if (i + 4 < end) {
          try {
            item += static_cast<char>(std::stoi(line.substr(i + 1, 4), nullptr, 16));
          } catch (const std::exception &) {
            LOG_WARN("Ignoring malformed escape in runtime state");
          }
          i += 4;
        }
        break;
      default:
        item += next;
        break;
      }
    } else {
      item += c;
    }
  }
  return result;
}

RuntimeState load_runtime_state(const fs::path &state_dir) {
  RuntimeState state;

  std::ifstream file(state_dir / STATE_FILENAME);
  if (!file.is_open()) {
    return state;
  }

  std::string line;
  while (std::getline(file, line)) {
    line.erase(0, line.find_first_not_of(" \t"));

    if (line.find("\"kernel_version\"") != std::string::npos) {
      auto colon = line.find(':');
      if (colon != std::string::npos) {
        try {
          state.kernel_version = std::stoi(line.substr(colon + 1));
        } catch (const std::exception &) {
          LOG_WARN("Ignoring malformed kernel_version in runtime state");
        }
      }
    } else if (line.find("\"active_module_ids\"") != std::string::npos) {
      state.active_module_ids = parse_json_array(line);
    }
  }

  return state;
}

} // namespace hymoctl
