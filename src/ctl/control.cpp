// ctl/control.cpp - Control channel errors
#include "control.hpp"
#include <utility>

namespace hymoctl {

static std::string format_error(const std::string &operation,
                                const std::string &path,
                                const std::string &detail) {
  std::string msg = operation + " failed";
  if (!path.empty()) {
    msg += " for " + path;
  }
  if (!detail.empty()) {
    msg += ": " + detail;
  }
  return msg;
}

ControlError::ControlError(ErrorKind kind, std::string operation,
                           std::string path, int os_error,
                           const std::string &detail)
    : std::runtime_error(format_error(operation, path, detail)), kind_(kind),
      operation_(std::move(operation)), path_(std::move(path)),
      os_error_(os_error) {}

const char *status_name(HymoFSStatus status) {
  switch (status) {
  case HymoFSStatus::Available:
    return "available";
  case HymoFSStatus::NotPresent:
    return "not-present";
  case HymoFSStatus::KernelTooOld:
    return "kernel-too-old";
  case HymoFSStatus::ModuleTooOld:
    return "module-too-old";
  }
  return "unknown";
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::DeviceUnavailable:
    return "DeviceUnavailable";
  case ErrorKind::PermissionDenied:
    return "PermissionDenied";
  case ErrorKind::OsError:
    return "OsError";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::ControlOpFailed:
    return "ControlOpFailed";
  case ErrorKind::BufferTooSmall:
    return "BufferTooSmall";
  }
  return "Unknown";
}

} // namespace hymoctl
