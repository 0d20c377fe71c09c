#pragma once
#include "wtmirror/virtualenv.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror {

struct CopyPolicy {
  std::vector<std::string> include_patterns; // empty = every file
  std::vector<std::string> exclude_patterns;
  bool isolation_enabled = false;
};

// "Is this root-relative path under version control?"
using TrackedPredicate = std::function<bool(std::string_view)>;

using ScanResult = std::vector<std::string>;

// Collect untracked files under `root` selected by `policy`, as POSIX relative
// paths in directory listing order. Unreadable directories are skipped.
// Empty include and exclude lists select nothing.
auto scan_directory(const std::filesystem::path &root, const CopyPolicy &policy,
                    const TrackedPredicate &is_tracked, const VirtualEnvClassifier &classifier)
    -> ScanResult;

} // namespace wtmirror
