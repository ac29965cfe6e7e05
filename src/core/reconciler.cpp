// core/reconciler.cpp - Module tree reconciliation implementation
#include "reconciler.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace hymoctl {

EntryClass classify_entry(fs::file_type type, dev_t rdev) {
  switch (type) {
  case fs::file_type::regular:
  case fs::file_type::symlink:
    return EntryClass::Redirect;
  case fs::file_type::character:
    return rdev == 0 ? EntryClass::Hide : EntryClass::Ignore;
  default:
    return EntryClass::Ignore;
  }
}

static void walk_tree(const fs::path &dir, const fs::path &rel,
                      const fs::path &target_base, ReconcilePlan &plan) {
  std::error_code ec;
  std::vector<fs::directory_entry> entries;

  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("HymoFS walk error: " + dir.string() + ": " + ec.message());
    return;
  }
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    LOG_WARN("HymoFS walk error: " + dir.string() + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });

  for (const auto &entry : entries) {
    const fs::path &current_path = entry.path();
    fs::path rel_path = rel / current_path.filename();
    fs::path target_path = target_base / rel_path;

    fs::file_type type = entry.symlink_status(ec).type();
    if (ec) {
      LOG_WARN("HymoFS walk error: " + current_path.string() + ": " +
               ec.message());
      continue;
    }

    if (type == fs::file_type::directory) {
      walk_tree(current_path, rel_path, target_base, plan);
      continue;
    }

    dev_t rdev = 0;
    if (type == fs::file_type::character) {
      struct stat st;
      if (lstat(current_path.c_str(), &st) != 0) {
        LOG_WARN("HymoFS walk error: " + current_path.string() + ": " +
                 strerror(errno));
        continue;
      }
      rdev = st.st_rdev;
    }

    switch (classify_entry(type, rdev)) {
    case EntryClass::Redirect:
      plan.injected_dirs.insert(target_path.parent_path().string());
      plan.ops.push_back({PendingOp::Kind::AddRedirect, target_path.string(),
                          current_path.string()});
      break;
    case EntryClass::Hide:
      plan.injected_dirs.insert(target_path.parent_path().string());
      plan.ops.push_back(
          {PendingOp::Kind::HideVirtual, target_path.string(), ""});
      break;
    case EntryClass::Ignore:
      break;
    }
  }
}

ReconcilePlan plan_module_tree(const fs::path &target_base,
                               const fs::path &module_dir) {
  ReconcilePlan plan;
  if (!is_real_directory(module_dir)) {
    return plan;
  }
  walk_tree(module_dir, fs::path(), target_base, plan);
  return plan;
}

ApplyStats apply_plan(ControlChannel &channel, const ReconcilePlan &plan) {
  ApplyStats stats;

  // Directories first, or the kernel will not surface injected children
  for (const auto &dir : plan.injected_dirs) {
    try {
      channel.inject_dir(dir);
    } catch (const ControlError &e) {
      LOG_WARN("HymoFS: Inject dir '" + dir + "' warning: " + e.what());
    }
  }

  for (const auto &op : plan.ops) {
    ++stats.attempted;
    try {
      if (op.kind == PendingOp::Kind::AddRedirect) {
        channel.add_rule(op.dest, op.source, 0);
      } else {
        channel.hide_path(op.dest);
      }
    } catch (const ControlError &e) {
      ++stats.failed;
      if (op.kind == PendingOp::Kind::AddRedirect) {
        LOG_WARN("Failed to add rule for " + op.dest + ": " + e.what());
      } else {
        LOG_WARN("Failed to hide path " + op.dest + ": " + e.what());
      }
    }
  }
  return stats;
}

ApplyStats inject_directory(ControlChannel &channel,
                            const fs::path &target_base,
                            const fs::path &module_dir) {
  if (!is_real_directory(module_dir)) {
    return {};
  }

  LOG_DEBUG("HymoFS: Scanning module dir: " + module_dir.string() + " -> " +
            target_base.string());
  ReconcilePlan plan = plan_module_tree(target_base, module_dir);
  ApplyStats stats = apply_plan(channel, plan);
  LOG_INFO("HymoFS: Injected " + module_dir.string() + " onto " +
           target_base.string() + " (" + std::to_string(plan.injected_dirs.size()) +
           " dirs, " + std::to_string(stats.attempted - stats.failed) + "/" +
           std::to_string(stats.attempted) + " rules)");
  return stats;
}

ApplyStats remove_directory_rules(ControlChannel &channel,
                                  const fs::path &target_base,
                                  const fs::path &module_dir) {
  if (!is_real_directory(module_dir)) {
    return {};
  }

  ReconcilePlan plan = plan_module_tree(target_base, module_dir);
  ApplyStats stats;
  for (const auto &op : plan.ops) {
    ++stats.attempted;
    try {
      channel.delete_rule(op.dest);
    } catch (const ControlError &e) {
      ++stats.failed;
      if (op.kind == PendingOp::Kind::AddRedirect) {
        LOG_WARN("Failed to delete rule for " + op.dest + ": " + e.what());
      } else {
        LOG_WARN("Failed to delete hidden rule for " + op.dest + ": " +
                 e.what());
      }
    }
  }
  LOG_INFO("HymoFS: Removed rules of " + module_dir.string() + " from " +
           target_base.string() + " (" +
           std::to_string(stats.attempted - stats.failed) + "/" +
           std::to_string(stats.attempted) + ")");
  return stats;
}

} // namespace hymoctl
