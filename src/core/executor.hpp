// core/executor.hpp - Module rule execution
#pragma once

#include "../conf/config.hpp"
#include "../ctl/control.hpp"
#include "reconciler.hpp"
#include <string>
#include <vector>

namespace hymoctl {

struct ModuleResult {
  std::vector<std::string> partitions; // partitions with content
  ApplyStats stats;

  bool has_content() const { return !partitions.empty(); }
  bool ok() const { return stats.failed == 0; }
};

// Overlays <moduledir>/<id>/<partition> onto <target_root>/<partition> for
// every known partition present in the module.
ModuleResult apply_module(ControlChannel &channel, const Config &config,
                          const std::string &module_id);
ModuleResult revert_module(ControlChannel &channel, const Config &config,
                           const std::string &module_id);

} // namespace hymoctl
