// ctl/hymofs.hpp - HymoFS control device client
#pragma once

#include "../defs.hpp"
#include "control.hpp"
#include "hymo_ioctl.h"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace hymoctl {

// errno of a failed open() / LIST_RULES ioctl to the reported kind
ErrorKind open_error_kind(int err);
ErrorKind list_error_kind(int err);

// Talks to the control device. Every operation opens the device, issues a
// single ioctl and closes it again; nothing is cached between calls.
class HymoFS : public ControlChannel {
public:
  explicit HymoFS(fs::path device_path = CONTROL_DEVICE_PATH);

  // Existence check only, the device is never opened
  HymoFSStatus check_status() override;
  std::optional<int> get_version() override;
  void clear_rules() override;
  void add_rule(const std::string &src, const std::string &target,
                uint8_t type = 0) override;
  void delete_rule(const std::string &src) override;
  void hide_path(const std::string &path) override;
  void inject_dir(const std::string &dir) override;
  std::string list_active_rules() override;

private:
  int open_device(const std::string &operation, const std::string &path) const;
  void submit_rule(const std::string &operation, uint32_t cmd,
                   const std::string &src, const std::string *target,
                   uint8_t type);

  fs::path device_path_;
};

} // namespace hymoctl
