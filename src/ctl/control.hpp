// ctl/control.hpp - Control channel interface and errors
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace hymoctl {

// KernelTooOld/ModuleTooOld are reserved for version negotiation and are
// not produced yet.
enum class HymoFSStatus { Available, NotPresent, KernelTooOld, ModuleTooOld };

const char *status_name(HymoFSStatus status);

enum class ErrorKind {
  DeviceUnavailable,
  PermissionDenied,
  OsError,
  InvalidArgument,
  ControlOpFailed,
  BufferTooSmall,
};

const char *error_kind_name(ErrorKind kind);

class ControlError : public std::runtime_error {
public:
  ControlError(ErrorKind kind, std::string operation, std::string path,
               int os_error, const std::string &detail);

  ErrorKind kind() const { return kind_; }
  const std::string &operation() const { return operation_; }
  const std::string &path() const { return path_; }
  int os_error() const { return os_error_; }

private:
  ErrorKind kind_;
  std::string operation_;
  std::string path_;
  int os_error_;
};

// One logical request per call. Implementations throw ControlError from
// every operation except check_status/is_available/get_version.
class ControlChannel {
public:
  virtual ~ControlChannel() = default;

  virtual HymoFSStatus check_status() = 0;
  bool is_available() { return check_status() == HymoFSStatus::Available; }

  virtual std::optional<int> get_version() = 0;
  virtual void clear_rules() = 0;
  virtual void add_rule(const std::string &src, const std::string &target,
                        uint8_t type = 0) = 0;
  virtual void delete_rule(const std::string &src) = 0;
  virtual void hide_path(const std::string &path) = 0;
  // Mark a directory so the kernel surfaces injected children under it
  virtual void inject_dir(const std::string &dir) = 0;
  virtual std::string list_active_rules() = 0;
};

} // namespace hymoctl
