#ifndef HYMOCTL_HYMO_IOCTL_H
#define HYMOCTL_HYMO_IOCTL_H

#include <stddef.h>
#include <stdint.h>

/*
 * Wire protocol of the HymoFS control device.
 *
 * Command codes follow the Linux ioctl encoding:
 *
 *   31 30 | 29 ........ 16 | 15 ..... 8 | 7 ...... 0
 *    dir  |  payload size  |   type     |   number
 *
 * Everything here must stay bit-compatible with the kernel module.
 */

namespace hymoctl {

constexpr uint32_t IOC_NRBITS = 8;
constexpr uint32_t IOC_TYPEBITS = 8;
constexpr uint32_t IOC_SIZEBITS = 14;
constexpr uint32_t IOC_DIRBITS = 2;

constexpr uint32_t IOC_NRSHIFT = 0;
constexpr uint32_t IOC_TYPESHIFT = IOC_NRSHIFT + IOC_NRBITS;
constexpr uint32_t IOC_SIZESHIFT = IOC_TYPESHIFT + IOC_TYPEBITS;
constexpr uint32_t IOC_DIRSHIFT = IOC_SIZESHIFT + IOC_SIZEBITS;

enum class IocDir : uint32_t { None = 0, Write = 1, Read = 2, ReadWrite = 3 };

constexpr uint32_t encode_command(IocDir dir, uint8_t type, uint8_t nr,
                                  uint32_t size) {
  return (static_cast<uint32_t>(dir) << IOC_DIRSHIFT) |
         (static_cast<uint32_t>(type) << IOC_TYPESHIFT) |
         (static_cast<uint32_t>(nr) << IOC_NRSHIFT) |
         ((size & ((1u << IOC_SIZEBITS) - 1)) << IOC_SIZESHIFT);
}

constexpr uint8_t HYMO_IOC_MAGIC = 0xE0;

/*
 * Rule record. target is NULL for everything except ADD_RULE.
 * type is passed through to the kernel untouched.
 */
struct hymo_ioctl_arg {
  const char *src;
  const char *target;
  uint8_t type;
};

/* LIST_RULES in/out descriptor; the kernel writes a NUL-terminated dump. */
struct hymo_ioctl_list_arg {
  char *buf;
  size_t size;
};

/* The size field is 14 bits wide; encode_command() would truncate silently. */
static_assert(sizeof(hymo_ioctl_arg) < (1u << IOC_SIZEBITS),
              "hymo_ioctl_arg does not fit the ioctl size field");
static_assert(sizeof(hymo_ioctl_list_arg) < (1u << IOC_SIZEBITS),
              "hymo_ioctl_list_arg does not fit the ioctl size field");

constexpr uint32_t HYMO_IOC_ADD_RULE = encode_command(
    IocDir::Write, HYMO_IOC_MAGIC, 1, sizeof(hymo_ioctl_arg));
constexpr uint32_t HYMO_IOC_DEL_RULE = encode_command(
    IocDir::Write, HYMO_IOC_MAGIC, 2, sizeof(hymo_ioctl_arg));
constexpr uint32_t HYMO_IOC_HIDE_RULE = encode_command(
    IocDir::Write, HYMO_IOC_MAGIC, 3, sizeof(hymo_ioctl_arg));
constexpr uint32_t HYMO_IOC_INJECT_DIR = encode_command(
    IocDir::Write, HYMO_IOC_MAGIC, 4, sizeof(hymo_ioctl_arg));
constexpr uint32_t HYMO_IOC_CLEAR_ALL =
    encode_command(IocDir::None, HYMO_IOC_MAGIC, 5, 0);
constexpr uint32_t HYMO_IOC_GET_VERSION =
    encode_command(IocDir::Read, HYMO_IOC_MAGIC, 6, sizeof(int));
constexpr uint32_t HYMO_IOC_LIST_RULES = encode_command(
    IocDir::ReadWrite, HYMO_IOC_MAGIC, 7, sizeof(hymo_ioctl_list_arg));

} // namespace hymoctl

#endif /* HYMOCTL_HYMO_IOCTL_H */
