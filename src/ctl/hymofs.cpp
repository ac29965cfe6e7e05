#include "hymofs.hpp"
#include "../utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace hymoctl {

namespace {

// Owns the device fd for the duration of one request
class DeviceHandle {
public:
  explicit DeviceHandle(int fd) : fd_(fd) {}
  ~DeviceHandle() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  DeviceHandle(const DeviceHandle &) = delete;
  DeviceHandle &operator=(const DeviceHandle &) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

void reject_embedded_nul(const std::string &operation, const std::string &value) {
  if (value.find('\0') != std::string::npos) {
    std::string shown = value.substr(0, value.find('\0'));
    throw ControlError(ErrorKind::InvalidArgument, operation, shown, EINVAL,
                       "path contains an embedded NUL byte");
  }
}

} // namespace

ErrorKind open_error_kind(int err) {
  if (err == ENOENT || err == ENODEV || err == ENXIO)
    return ErrorKind::DeviceUnavailable;
  if (err == EACCES || err == EPERM)
    return ErrorKind::PermissionDenied;
  return ErrorKind::OsError;
}

ErrorKind list_error_kind(int err) {
  if (err == ENOSPC || err == EOVERFLOW || err == E2BIG || err == ERANGE)
    return ErrorKind::BufferTooSmall;
  return ErrorKind::ControlOpFailed;
}

HymoFS::HymoFS(fs::path device_path) : device_path_(std::move(device_path)) {}

int HymoFS::open_device(const std::string &operation,
                        const std::string &path) const {
  int fd = ::open(device_path_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd >= 0) {
    return fd;
  }

  int err = errno;
  std::string detail =
      "cannot open " + device_path_.string() + ": " + errno_string(err);
  throw ControlError(open_error_kind(err), operation, path, err, detail);
}

HymoFSStatus HymoFS::check_status() {
  std::error_code ec;
  if (fs::exists(device_path_, ec)) {
    return HymoFSStatus::Available;
  }
  return HymoFSStatus::NotPresent;
}

std::optional<int> HymoFS::get_version() {
  int fd = ::open(device_path_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    LOG_DEBUG("HymoFS: get_version: cannot open " + device_path_.string() +
              ": " + errno_string(errno));
    return std::nullopt;
  }
  DeviceHandle dev(fd);

  int version = 0;
  int ret = ioctl(dev.get(), HYMO_IOC_GET_VERSION, &version);
  if (ret < 0) {
    LOG_DEBUG("HymoFS: get_version failed: " + errno_string(errno));
    return std::nullopt;
  }
  return ret;
}

void HymoFS::clear_rules() {
  LOG_DEBUG("HymoFS: Clearing all rules");
  DeviceHandle dev(open_device("clear", ""));

  if (ioctl(dev.get(), HYMO_IOC_CLEAR_ALL) < 0) {
    int err = errno;
    throw ControlError(ErrorKind::ControlOpFailed, "clear", "", err,
                       errno_string(err));
  }
}

void HymoFS::submit_rule(const std::string &operation, uint32_t cmd,
                         const std::string &src, const std::string *target,
                         uint8_t type) {
  reject_embedded_nul(operation, src);
  if (target) {
    reject_embedded_nul(operation, *target);
  }

  DeviceHandle dev(open_device(operation, src));

  // Borrows the strings for the duration of the call only
  struct hymo_ioctl_arg arg;
  std::memset(&arg, 0, sizeof(arg));
  arg.src = src.c_str();
  arg.target = target ? target->c_str() : nullptr;
  arg.type = type;

  if (ioctl(dev.get(), cmd, &arg) < 0) {
    int err = errno;
    std::string path = target ? src + " -> " + *target : src;
    throw ControlError(ErrorKind::ControlOpFailed, operation, path, err,
                       errno_string(err));
  }
}

void HymoFS::add_rule(const std::string &src, const std::string &target,
                      uint8_t type) {
  LOG_DEBUG("HymoFS: ADD_RULE src='" + src + "' target='" + target +
            "' type=" + std::to_string(type));
  submit_rule("add_rule", HYMO_IOC_ADD_RULE, src, &target, type);
}

void HymoFS::delete_rule(const std::string &src) {
  LOG_DEBUG("HymoFS: DEL_RULE src='" + src + "'");
  submit_rule("delete_rule", HYMO_IOC_DEL_RULE, src, nullptr, 0);
}

void HymoFS::hide_path(const std::string &path) {
  LOG_DEBUG("HymoFS: HIDE_RULE path='" + path + "'");
  submit_rule("hide_path", HYMO_IOC_HIDE_RULE, path, nullptr, 0);
}

void HymoFS::inject_dir(const std::string &dir) {
  LOG_DEBUG("HymoFS: INJECT_DIR dir='" + dir + "'");
  submit_rule("inject_dir", HYMO_IOC_INJECT_DIR, dir, nullptr, 0);
}

std::string HymoFS::list_active_rules() {
  DeviceHandle dev(open_device("list_rules", ""));

  std::vector<char> buffer(LIST_RULES_BUFFER_SIZE, '\0');
  struct hymo_ioctl_list_arg arg;
  arg.buf = buffer.data();
  arg.size = buffer.size();

  if (ioctl(dev.get(), HYMO_IOC_LIST_RULES, &arg) < 0) {
    int err = errno;
    ErrorKind kind = list_error_kind(err);
    std::string detail = errno_string(err);
    if (kind == ErrorKind::BufferTooSmall) {
      detail = "rule dump exceeds " + std::to_string(LIST_RULES_BUFFER_SIZE) +
               " bytes: " + detail;
    }
    throw ControlError(kind, "list_rules", "", err, detail);
  }

  const void *nul = std::memchr(buffer.data(), '\0', buffer.size());
  size_t len = nul ? static_cast<const char *>(nul) - buffer.data()
                   : buffer.size();
  std::string result = utf8_lossy(buffer.data(), len);
  LOG_DEBUG("HymoFS: list_rules returned " + std::to_string(result.length()) +
            " bytes");
  return result;
}

} // namespace hymoctl
