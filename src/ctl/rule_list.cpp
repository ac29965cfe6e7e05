// ctl/rule_list.cpp - Parsing of the LIST_RULES dump
#include "rule_list.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace hymoctl {

std::vector<RuleEntry> parse_rule_listing(const std::string &text) {
  std::vector<RuleEntry> rules;
  std::istringstream iss(text);
  std::string line;

  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos)
      continue;

    RuleEntry rule;
    std::istringstream ls(line);
    ls >> rule.type;
    std::transform(rule.type.begin(), rule.type.end(), rule.type.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (rule.type == "ADD" || rule.type == "MERGE") {
      ls >> rule.target >> rule.source;
    } else if (rule.type == "HIDE" || rule.type == "INJECT" ||
               rule.type == "DEL") {
      ls >> rule.path;
    } else {
      std::string rest;
      std::getline(ls, rest);
      size_t first = rest.find_first_not_of(" \t");
      if (first != std::string::npos)
        rule.args = rest.substr(first);
    }
    rules.push_back(rule);
  }
  return rules;
}

std::set<std::string> active_module_ids(const std::vector<RuleEntry> &rules,
                                        const std::string &moduledir) {
  std::set<std::string> ids;
  std::string prefix = moduledir;
  if (prefix.empty())
    return ids;
  if (prefix.back() != '/')
    prefix += '/';

  for (const auto &rule : rules) {
    if (rule.source.compare(0, prefix.size(), prefix) != 0)
      continue;
    size_t start = prefix.size();
    size_t end = rule.source.find('/', start);
    if (end != std::string::npos && end > start) {
      ids.insert(rule.source.substr(start, end - start));
    }
  }
  return ids;
}

std::optional<std::set<std::string>>
kernel_active_modules(ControlChannel &channel, const std::string &moduledir) {
  if (!channel.is_available()) {
    return std::nullopt;
  }
  try {
    return active_module_ids(parse_rule_listing(channel.list_active_rules()),
                             moduledir);
  } catch (const ControlError &e) {
    LOG_WARN("Cannot read active rules: " + std::string(e.what()));
    return std::nullopt;
  }
}

std::optional<uint8_t> parse_rule_type(const std::string &text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;
  try {
    int value = std::stoi(text);
    if (value > 255)
      return std::nullopt;
    return static_cast<uint8_t>(value);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string rules_to_json(const std::vector<RuleEntry> &rules) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < rules.size(); ++i) {
    const RuleEntry &r = rules[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "  {\"type\": \"" << json_escape(r.type) << "\"";
    if (!r.target.empty())
      out << ", \"target\": \"" << json_escape(r.target) << "\"";
    if (!r.source.empty())
      out << ", \"source\": \"" << json_escape(r.source) << "\"";
    if (!r.path.empty())
      out << ", \"path\": \"" << json_escape(r.path) << "\"";
    if (!r.args.empty())
      out << ", \"args\": \"" << json_escape(r.args) << "\"";
    out << "}";
  }
  out << (rules.empty() ? "]" : "\n]");
  return out.str();
}

} // namespace hymoctl
