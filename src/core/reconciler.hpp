// core/reconciler.hpp - Module tree to HymoFS rule reconciliation
#pragma once

#include "../ctl/control.hpp"
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <sys/types.h>
#include <vector>

namespace fs = std::filesystem;

namespace hymoctl {

enum class EntryClass { Redirect, Hide, Ignore };

// Regular files and symlinks are redirected. A character device with
// rdev 0 is the kernel module's whiteout marker and hides the target path.
// Everything else, directories included, produces no rule.
EntryClass classify_entry(fs::file_type type, dev_t rdev);

struct PendingOp {
  enum class Kind { AddRedirect, HideVirtual };

  Kind kind;
  std::string dest;
  std::string source; // empty for HideVirtual
};

struct ReconcilePlan {
  std::set<std::string> injected_dirs;
  std::vector<PendingOp> ops; // discovery order
};

struct ApplyStats {
  size_t attempted = 0;
  size_t failed = 0;

  ApplyStats &operator+=(const ApplyStats &other) {
    attempted += other.attempted;
    failed += other.failed;
    return *this;
  }
};

// Walks module_dir depth-first (root excluded, symlinks not followed) and
// re-roots every rule-bearing entry under target_base. Unreadable entries
// are logged and skipped. An absent module_dir gives an empty plan.
ReconcilePlan plan_module_tree(const fs::path &target_base,
                               const fs::path &module_dir);

// Marks every injected directory, then applies the pending operations in
// order. Per-entry failures are logged and counted, never thrown.
ApplyStats apply_plan(ControlChannel &channel, const ReconcilePlan &plan);

ApplyStats inject_directory(ControlChannel &channel,
                            const fs::path &target_base,
                            const fs::path &module_dir);

// Deletes the rule of every entry inject_directory would have produced.
// Injected directories stay marked.
ApplyStats remove_directory_rules(ControlChannel &channel,
                                  const fs::path &target_base,
                                  const fs::path &module_dir);

} // namespace hymoctl
