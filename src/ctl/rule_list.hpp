// ctl/rule_list.hpp - Parsing of the LIST_RULES dump
#pragma once

#include "control.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hymoctl {

struct RuleEntry {
  std::string type;   // upper-cased first token: ADD, HIDE, INJECT, ...
  std::string target; // ADD/MERGE
  std::string source; // ADD/MERGE
  std::string path;   // HIDE/INJECT/DEL
  std::string args;   // anything else, verbatim
};

// The dump is diagnostic text; unknown lines are kept, never rejected.
std::vector<RuleEntry> parse_rule_listing(const std::string &text);

// Module ids referenced by rule sources below moduledir
std::set<std::string> active_module_ids(const std::vector<RuleEntry> &rules,
                                        const std::string &moduledir);

// Module ids the kernel currently holds rules for. Empty when the device is
// absent or the dump cannot be read; the failure is logged.
std::optional<std::set<std::string>>
kernel_active_modules(ControlChannel &channel, const std::string &moduledir);

std::string rules_to_json(const std::vector<RuleEntry> &rules);

// Decimal rule type byte as given on the command line, 0..255
std::optional<uint8_t> parse_rule_type(const std::string &text);

} // namespace hymoctl
