#include "ctl/rule_list.hpp"
#include "fake_channel.hpp"
#include "test_util.hpp"
#include "utils.hpp"
#include <cerrno>
#include <utility>
#include <gtest/gtest.h>

using namespace hymoctl;
using hymoctl::test::RecordingChannel;

static const std::string kReplacement = "\xEF\xBF\xBD";

static std::string lossy(const std::string &bytes) {
  return utf8_lossy(bytes.data(), bytes.size());
}

TEST(Utf8LossyTest, ValidTextIsUnchanged) {
  EXPECT_EQ("", lossy(""));
  EXPECT_EQ("add /system/bin/sh", lossy("add /system/bin/sh"));
  EXPECT_EQ("/data/\xC3\xA9t\xC3\xA9", lossy("/data/\xC3\xA9t\xC3\xA9"));
  EXPECT_EQ("\xE2\x82\xAC \xF0\x9F\x98\x80", lossy("\xE2\x82\xAC \xF0\x9F\x98\x80"));
}

TEST(Utf8LossyTest, InvalidBytesAreReplaced) {
  EXPECT_EQ("a" + kReplacement + "b", lossy("a\xFF" "b"));
  EXPECT_EQ(kReplacement + kReplacement, lossy("\xC0\xAF"));
  EXPECT_EQ(kReplacement, lossy("\x80"));
}

TEST(Utf8LossyTest, TruncatedSequenceIsOneReplacement) {
  EXPECT_EQ("x" + kReplacement, lossy("x\xE2\x82"));
  EXPECT_EQ(kReplacement + "y", lossy("\xF0\x9F\x98y"));
}

TEST(Utf8LossyTest, SurrogatesAreRejectedBytewise) {
  EXPECT_EQ(kReplacement + kReplacement + kReplacement, lossy("\xED\xA0\x80"));
}

TEST(RuleListingTest, ParsesKnownLineShapes) {
  const std::string dump = "add /system/bin/sh /data/adb/modules/m1/system/bin/sh\n"
                           "hide /system/app/Bloat\n"
                           "inject /system/bin\n"
                           "\n"
                           "MERGE /vendor/etc /data/adb/modules/m2/vendor/etc\r\n";

  auto rules = parse_rule_listing(dump);

  ASSERT_EQ(4u, rules.size());
  EXPECT_EQ("ADD", rules[0].type);
  EXPECT_EQ("/system/bin/sh", rules[0].target);
  EXPECT_EQ("/data/adb/modules/m1/system/bin/sh", rules[0].source);
  EXPECT_EQ("HIDE", rules[1].type);
  EXPECT_EQ("/system/app/Bloat", rules[1].path);
  EXPECT_EQ("INJECT", rules[2].type);
  EXPECT_EQ("/system/bin", rules[2].path);
  EXPECT_EQ("MERGE", rules[3].type);
  EXPECT_EQ("/data/adb/modules/m2/vendor/etc", rules[3].source);
}

TEST(RuleListingTest, UnknownLinesAreKeptVerbatim) {
  auto rules = parse_rule_listing("HymoFS Protocol: 12\n  stealth   on  \n");

  ASSERT_EQ(2u, rules.size());
  EXPECT_EQ("HYMOFS", rules[0].type);
  EXPECT_EQ("Protocol: 12", rules[0].args);
  EXPECT_EQ("STEALTH", rules[1].type);
  EXPECT_EQ("on  ", rules[1].args);
}

TEST(RuleListingTest, EmptyDump) {
  EXPECT_TRUE(parse_rule_listing("").empty());
  EXPECT_TRUE(parse_rule_listing("\n \n\t\n").empty());
  EXPECT_EQ("[]", rules_to_json({}));
}

TEST(RuleListingTest, ActiveModulesComeFromRuleSources) {
  auto rules = parse_rule_listing(
      "add /system/a /data/adb/modules/alpha/system/a\n"
      "add /system/b /data/adb/modules/alpha/system/b\n"
      "add /vendor/c /data/adb/modules/beta/vendor/c\n"
      "add /system/d /data/local/tmp/d\n"
      "hide /data/adb/modules/gamma/system/x\n");

  EXPECT_EQ((std::set<std::string>{"alpha", "beta"}),
            active_module_ids(rules, "/data/adb/modules"));
  EXPECT_EQ((std::set<std::string>{"alpha", "beta"}),
            active_module_ids(rules, "/data/adb/modules/"));
  EXPECT_TRUE(active_module_ids(rules, "").empty());
}

TEST(RuleListingTest, KernelActiveModulesReadsTheDump) {
  RecordingChannel channel;
  channel.listing = "add /system/a /data/adb/modules/alpha/system/a\n"
                    "inject /system\n"
                    "add /vendor/b /data/adb/modules/beta/vendor/b\n";

  auto active = kernel_active_modules(channel, "/data/adb/modules");

  ASSERT_TRUE(active.has_value());
  EXPECT_EQ((std::set<std::string>{"alpha", "beta"}), *active);
  EXPECT_EQ(1u, channel.calls_of("list").size());
}

TEST(RuleListingTest, KernelActiveModulesWithoutDevice) {
  test::quiet_logs();
  RecordingChannel absent;
  absent.status = HymoFSStatus::NotPresent;
  EXPECT_FALSE(kernel_active_modules(absent, "/data/adb/modules").has_value());
  EXPECT_TRUE(absent.calls.empty());

  RecordingChannel failing;
  failing.list_error = ENOSPC;
  EXPECT_FALSE(kernel_active_modules(failing, "/data/adb/modules").has_value());
}

TEST(RuleTypeTest, AcceptsDecimalByte) {
  for (auto expected : {std::make_pair("0", 0), std::make_pair("007", 7),
                        std::make_pair("255", 255)}) {
    auto parsed = parse_rule_type(expected.first);
    ASSERT_TRUE(parsed.has_value()) << expected.first;
    EXPECT_EQ(expected.second, static_cast<int>(*parsed));
  }
}

TEST(RuleTypeTest, RejectsEverythingElse) {
  EXPECT_FALSE(parse_rule_type("").has_value());
  EXPECT_FALSE(parse_rule_type("abc").has_value());
  EXPECT_FALSE(parse_rule_type("7abc").has_value());
  EXPECT_FALSE(parse_rule_type("-1").has_value());
  EXPECT_FALSE(parse_rule_type("256").has_value());
  EXPECT_FALSE(parse_rule_type("99999999999999999999").has_value());
  EXPECT_FALSE(parse_rule_type(" 1").has_value());
}

TEST(RuleListingTest, JsonOutputEscapes) {
  RuleEntry rule;
  rule.type = "ADD";
  rule.target = "/system/\"quoted\"";
  rule.source = "C:\\odd";

  std::string json = rules_to_json({rule});

  EXPECT_NE(std::string::npos, json.find("\"type\": \"ADD\""));
  EXPECT_NE(std::string::npos, json.find("/system/\\\"quoted\\\""));
  EXPECT_NE(std::string::npos, json.find("C:\\\\odd"));
  EXPECT_EQ(std::string::npos, json.find("\"path\""));
  EXPECT_EQ('[', json.front());
  EXPECT_EQ(']', json.back());
}

TEST(JsonEscapeTest, ControlCharacters) {
  EXPECT_EQ("a\\nb\\tc", json_escape("a\nb\tc"));
  EXPECT_EQ("\\u0001", json_escape(std::string(1, '\x01')));
}
