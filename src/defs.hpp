// Constants and definitions
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hymoctl {

#define HYMOCTL_DATA_DIR "/data/adb/hymo"

// Control device
constexpr const char *CONTROL_DEVICE_PATH = "/dev/hymo_ctl";

// Directories
constexpr const char *BASE_DIR = HYMOCTL_DATA_DIR "/";
constexpr const char *RUN_DIR = HYMOCTL_DATA_DIR "/run/";
constexpr const char *DEFAULT_MODULE_DIR = "/data/adb/modules";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *STATE_FILENAME = "daemon_state.json";
constexpr const char *MODULE_PROP_FILENAME = "module.prop";

// Marker files
constexpr const char *DISABLE_FILE_NAME = "disable";
constexpr const char *REMOVE_FILE_NAME = "remove";
constexpr const char *SKIP_MOUNT_FILE_NAME = "skip_mount";

// LIST_RULES reply buffer, fixed
constexpr size_t LIST_RULES_BUFFER_SIZE = 128 * 1024;

// Standard Android partitions
const std::vector<std::string> BUILTIN_PARTITIONS = {
    "system", "vendor", "product", "system_ext", "odm", "oem"};

} // namespace hymoctl
