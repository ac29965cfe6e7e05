// core/executor.cpp - Module rule execution implementation
#include "executor.hpp"
#include "../utils.hpp"
#include "inventory.hpp"

namespace hymoctl {

template <typename Fn>
static ModuleResult for_each_partition(const Config &config,
                                       const std::string &module_id, Fn fn) {
  ModuleResult result;
  fs::path module_path = config.moduledir / module_id;

  for (const auto &part : all_partitions(config)) {
    fs::path src_dir = module_path / part;
    if (!is_real_directory(src_dir)) {
      continue;
    }
    fs::path target_base = config.target_root / part;
    result.partitions.push_back(part);
    result.stats += fn(target_base, src_dir);
  }
  return result;
}

ModuleResult apply_module(ControlChannel &channel, const Config &config,
                          const std::string &module_id) {
  LOG_INFO("Applying module " + module_id);
  return for_each_partition(
      config, module_id, [&](const fs::path &target_base, const fs::path &src) {
        return inject_directory(channel, target_base, src);
      });
}

ModuleResult revert_module(ControlChannel &channel, const Config &config,
                           const std::string &module_id) {
  LOG_INFO("Reverting module " + module_id);
  return for_each_partition(
      config, module_id, [&](const fs::path &target_base, const fs::path &src) {
        return remove_directory_rules(channel, target_base, src);
      });
}

} // namespace hymoctl
