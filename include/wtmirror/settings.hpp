#pragma once
#include "wtmirror/consts.hpp"
#include "wtmirror/copier.hpp"
#include "wtmirror/virtualenv.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror {

struct CopyIgnoredFilesSettings {
  bool enabled = true;
  std::vector<std::string> patterns{".env", ".env.*", ".env.local", ".env.*.local"};
  std::vector<std::string> exclude_patterns{".env.example", ".env.sample"};
};

struct VirtualEnvSettings {
  bool isolate_virtual_envs = false;
  std::int64_t max_file_size_mb = consts::kDefaultMaxFileSizeMb; // < 0 disables
  std::int64_t max_dir_size_mb = consts::kDefaultMaxDirSizeMb;   // < 0 disables
  int max_scan_depth = consts::kDefaultMaxScanDepth;              // -1 = unlimited
  int copy_parallelism = consts::kDefaultCopyParallelism;         // 0 = all processors
  std::vector<VirtualEnvGroup> custom_patterns;
};

struct Settings {
  CopyIgnoredFilesSettings copy_ignored_files;
  VirtualEnvSettings virtual_env_handling;
};

// Parse `key: value` lines; unknown keys are ignored and malformed values keep
// their defaults.
auto parse_settings(std::string_view text) -> Settings;

// Defaults when the file does not exist; throws if it exists but cannot be read.
auto load_settings(const std::filesystem::path &file) -> Settings;

// $HOME/.config/wtmirror/config, then $HOME/.wtmirrorrc
auto default_config_paths() -> std::vector<std::filesystem::path>;

// First existing default path, or defaults
auto load_default_settings() -> Settings;

// MiB -> bytes; negative disables the limit, oversized values saturate
auto mib_to_bytes(std::int64_t mib) -> std::optional<std::uintmax_t>;

auto copy_limits(const VirtualEnvSettings &veh) -> CopyLimits;

// 0 -> `hardware` (at least 1)
auto effective_parallelism(int configured, unsigned hardware) -> std::size_t;

} // namespace wtmirror
