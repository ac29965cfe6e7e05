#include "ctl/hymo_ioctl.h"
#include <cstddef>
#include <gtest/gtest.h>
#include <sys/ioctl.h>

using namespace hymoctl;

TEST(ProtocolTest, FieldsArePackedFromBitZero) {
  EXPECT_EQ(0x00000001u, encode_command(IocDir::None, 0, 1, 0));
  EXPECT_EQ(0x0000E000u, encode_command(IocDir::None, 0xE0, 0, 0));
  EXPECT_EQ(0x00180000u, encode_command(IocDir::None, 0, 0, 24));
  EXPECT_EQ(0x40000000u, encode_command(IocDir::Write, 0, 0, 0));
  EXPECT_EQ(0x80000000u, encode_command(IocDir::Read, 0, 0, 0));
  EXPECT_EQ(0xC0000000u, encode_command(IocDir::ReadWrite, 0, 0, 0));
}

TEST(ProtocolTest, FieldsDoNotOverlap) {
  EXPECT_EQ(0xFFFFFFFFu, encode_command(IocDir::ReadWrite, 0xFF, 0xFF, 0x3FFF));
  EXPECT_EQ(0x3FFF0000u, encode_command(IocDir::None, 0, 0, 0x3FFF));
}

TEST(ProtocolTest, RuleRecordLayout) {
  EXPECT_EQ(0u, offsetof(hymo_ioctl_arg, src));
  EXPECT_EQ(sizeof(void *), offsetof(hymo_ioctl_arg, target));
  EXPECT_EQ(2 * sizeof(void *), offsetof(hymo_ioctl_arg, type));
  EXPECT_EQ(3 * sizeof(void *), sizeof(hymo_ioctl_arg));

  EXPECT_EQ(0u, offsetof(hymo_ioctl_list_arg, buf));
  EXPECT_EQ(sizeof(void *), offsetof(hymo_ioctl_list_arg, size));
  EXPECT_EQ(sizeof(void *) + sizeof(size_t), sizeof(hymo_ioctl_list_arg));
}

TEST(ProtocolTest, PayloadSizesSurviveEncoding) {
  auto size_field = [](uint32_t code) { return (code >> IOC_SIZESHIFT) & 0x3FFFu; };
  EXPECT_EQ(sizeof(hymo_ioctl_arg), size_field(HYMO_IOC_ADD_RULE));
  EXPECT_EQ(sizeof(hymo_ioctl_arg), size_field(HYMO_IOC_INJECT_DIR));
  EXPECT_EQ(sizeof(int), size_field(HYMO_IOC_GET_VERSION));
  EXPECT_EQ(sizeof(hymo_ioctl_list_arg), size_field(HYMO_IOC_LIST_RULES));
}

#if __SIZEOF_POINTER__ == 8
TEST(ProtocolTest, CommandCodesOnLP64) {
  EXPECT_EQ(0x4018E001u, HYMO_IOC_ADD_RULE);
  EXPECT_EQ(0x4018E002u, HYMO_IOC_DEL_RULE);
  EXPECT_EQ(0x4018E003u, HYMO_IOC_HIDE_RULE);
  EXPECT_EQ(0x4018E004u, HYMO_IOC_INJECT_DIR);
  EXPECT_EQ(0x0000E005u, HYMO_IOC_CLEAR_ALL);
  EXPECT_EQ(0x8004E006u, HYMO_IOC_GET_VERSION);
  EXPECT_EQ(0xC010E007u, HYMO_IOC_LIST_RULES);
}
#endif

// The encoder has to agree with the kernel headers' own macros
TEST(ProtocolTest, MatchesSystemIoctlMacros) {
  EXPECT_EQ(static_cast<uint32_t>(_IOW(0xE0, 1, hymoctl::hymo_ioctl_arg)),
            HYMO_IOC_ADD_RULE);
  EXPECT_EQ(static_cast<uint32_t>(_IOW(0xE0, 2, hymoctl::hymo_ioctl_arg)),
            HYMO_IOC_DEL_RULE);
  EXPECT_EQ(static_cast<uint32_t>(_IOW(0xE0, 3, hymoctl::hymo_ioctl_arg)),
            HYMO_IOC_HIDE_RULE);
  EXPECT_EQ(static_cast<uint32_t>(_IOW(0xE0, 4, hymoctl::hymo_ioctl_arg)),
            HYMO_IOC_INJECT_DIR);
  EXPECT_EQ(static_cast<uint32_t>(_IO(0xE0, 5)), HYMO_IOC_CLEAR_ALL);
  EXPECT_EQ(static_cast<uint32_t>(_IOR(0xE0, 6, int)), HYMO_IOC_GET_VERSION);
  EXPECT_EQ(static_cast<uint32_t>(_IOWR(0xE0, 7, hymoctl::hymo_ioctl_list_arg)),
            HYMO_IOC_LIST_RULES);
}

TEST(ProtocolTest, CommandNumbersAreDistinct) {
  const uint32_t codes[] = {HYMO_IOC_ADD_RULE,   HYMO_IOC_DEL_RULE,
                            HYMO_IOC_HIDE_RULE,  HYMO_IOC_INJECT_DIR,
                            HYMO_IOC_CLEAR_ALL,  HYMO_IOC_GET_VERSION,
                            HYMO_IOC_LIST_RULES};
  for (size_t i = 0; i < 7; ++i) {
    EXPECT_EQ(i + 1, codes[i] & 0xFF);
    EXPECT_EQ(0xE0u, (codes[i] >> 8) & 0xFF);
  }
}
