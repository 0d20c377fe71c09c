#include "wtmirror/settings.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  // defaults
  {
    const auto s = wtmirror::parse_settings("");
    const auto &veh = s.virtual_env_handling;
    if (!s.copy_ignored_files.enabled || s.copy_ignored_files.patterns.size() != 4 ||
        s.copy_ignored_files.exclude_patterns.size() != 2) {
      std::cerr << "copy_ignored_files defaults wrong\n";
      return 1;
    }
    if (veh.isolate_virtual_envs || veh.max_file_size_mb != 100 || veh.max_dir_size_mb != 500 ||
        veh.max_scan_depth != 5 || veh.copy_parallelism != 4 || !veh.custom_patterns.empty()) {
      std::cerr << "virtual_env_handling defaults wrong\n";
      return 1;
    }
  }

  // a full file
  {
    const auto s = wtmirror::parse_settings(
        "# local overrides\n"
        "copy_ignored_files.enabled: yes\n"
        "copy_ignored_files.patterns: .env, config/*.local.json\n"
        "copy_ignored_files.exclude_patterns:\n"
        "virtual_env_handling.isolate_virtual_envs: true\r\n"
        "virtual_env_handling.max_file_size_mb: -1\n"
        "virtual_env_handling.max_dir_size_mb: 0\n"
        "virtual_env_handling.max_scan_depth: -1\n"
        "virtual_env_handling.copy_parallelism: 0\n"
        "virtual_env_handling.custom_patterns: Deno = .deno, deno_dir | deno cache main.ts\n"
        "virtual_env_handling.custom_patterns: Zig = zig-cache, zig-out\n"
        "unknown.key: ignored\n");
    const auto &veh = s.virtual_env_handling;
    if (s.copy_ignored_files.patterns != std::vector<std::string>{".env", "config/*.local.json"} ||
        !s.copy_ignored_files.exclude_patterns.empty()) {
      std::cerr << "pattern lists not parsed\n";
      return 1;
    }
    if (!veh.isolate_virtual_envs || veh.max_file_size_mb != -1 || veh.max_dir_size_mb != 0 ||
        veh.max_scan_depth != -1 || veh.copy_parallelism != 0) {
      std::cerr << "numeric settings not parsed\n";
      return 1;
    }
    if (veh.custom_patterns.size() != 2 || veh.custom_patterns[0].ecosystem != "Deno" ||
        veh.custom_patterns[0].patterns != std::vector<std::string>{".deno", "deno_dir"} ||
        veh.custom_patterns[0].setup_hints != std::vector<std::string>{"deno cache main.ts"} ||
        !veh.custom_patterns[1].setup_hints.empty()) {
      std::cerr << "custom patterns not parsed\n";
      return 1;
    }

    const auto limits = wtmirror::copy_limits(veh);
    if (limits.max_file_bytes.has_value() || limits.max_dir_bytes != 0U) {
      std::cerr << "limits: -1 disables, 0 rejects everything\n";
      return 1;
    }
  }

  // malformed values fall back to defaults
  {
    const auto s = wtmirror::parse_settings("virtual_env_handling.max_file_size_mb: lots\n"
                                            "virtual_env_handling.max_dir_size_mb: -7\n"
                                            "virtual_env_handling.copy_parallelism: -1\n"
                                            "virtual_env_handling.max_scan_depth: 3.5\n"
                                            "virtual_env_handling.isolate_virtual_envs: maybe\n"
                                            "virtual_env_handling.custom_patterns: = foo\n"
                                            "virtual_env_handling.custom_patterns: NoPatterns =\n");
    const auto &veh = s.virtual_env_handling;
    if (veh.max_file_size_mb != 100 || veh.max_dir_size_mb != 500 || veh.copy_parallelism != 4 ||
        veh.max_scan_depth != 5 || veh.isolate_virtual_envs || !veh.custom_patterns.empty()) {
      std::cerr << "malformed values should keep defaults\n";
      return 1;
    }
  }

  // deprecated keys apply only when the current key is absent
  {
    const auto legacy = wtmirror::parse_settings("virtual_env_handling.mode: skip\n"
                                                 "virtual_env_handling.max_copy_size_mb: 7\n");
    if (!legacy.virtual_env_handling.isolate_virtual_envs ||
        legacy.virtual_env_handling.max_file_size_mb != 7) {
      std::cerr << "deprecated keys ignored\n";
      return 1;
    }
    const auto both = wtmirror::parse_settings("virtual_env_handling.max_copy_size_mb: 7\n"
                                               "virtual_env_handling.mode: skip\n"
                                               "virtual_env_handling.isolate_virtual_envs: false\n"
                                               "virtual_env_handling.max_file_size_mb: 9\n");
    if (both.virtual_env_handling.isolate_virtual_envs ||
        both.virtual_env_handling.max_file_size_mb != 9) {
      std::cerr << "current keys must win over deprecated ones\n";
      return 1;
    }
  }

  // values too large for their field keep the defaults instead of wrapping
  {
    const auto s = wtmirror::parse_settings("virtual_env_handling.max_file_size_mb: 17592186044416\n"
                                            "virtual_env_handling.max_dir_size_mb: 9223372036854775807\n"
                                            "virtual_env_handling.max_copy_size_mb: 17592186044416\n"
                                            "virtual_env_handling.copy_parallelism: 4294967297\n"
                                            "virtual_env_handling.max_scan_depth: 2147483648\n");
    const auto &veh = s.virtual_env_handling;
    if (veh.max_file_size_mb != 100 || veh.max_dir_size_mb != 500 || veh.copy_parallelism != 4 ||
        veh.max_scan_depth != 5) {
      std::cerr << "out-of-range values should keep defaults\n";
      return 1;
    }
    const auto limits = wtmirror::copy_limits(veh);
    if (limits.max_file_bytes != 100U * 1024U * 1024U) {
      std::cerr << "file limit should stay at the default\n";
      return 1;
    }

    const auto edge = wtmirror::parse_settings("virtual_env_handling.max_file_size_mb: 17592186044415\n"
                                               "virtual_env_handling.copy_parallelism: 2147483647\n");
    if (edge.virtual_env_handling.max_file_size_mb != 17592186044415 ||
        edge.virtual_env_handling.copy_parallelism != 2147483647 ||
        wtmirror::copy_limits(edge.virtual_env_handling).max_file_bytes.value_or(0) <
            std::uintmax_t{17592186044415} * 1024U * 1024U) {
      std::cerr << "largest representable values should be accepted\n";
      return 1;
    }
  }

  // MiB conversion
  if (wtmirror::mib_to_bytes(2) != 2U * 1024U * 1024U || wtmirror::mib_to_bytes(-1).has_value()) {
    std::cerr << "mib_to_bytes mismatch\n";
    return 1;
  }
  if (wtmirror::mib_to_bytes(std::numeric_limits<std::int64_t>::max()) !=
      std::numeric_limits<std::uintmax_t>::max()) {
    std::cerr << "mib_to_bytes should saturate\n";
    return 1;
  }

  // file loading: missing file -> defaults
  const fs::path dir =
      fs::temp_directory_path() / ("wtmirror_settings_" + std::to_string(std::random_device{}()));
  try {
    fs::create_directories(dir);
    if (wtmirror::load_settings(dir / "absent").virtual_env_handling.max_scan_depth != 5) {
      std::cerr << "missing file should give defaults\n";
      return 1;
    }
    std::ofstream(dir / "config") << "virtual_env_handling.max_scan_depth: 2\n";
    if (wtmirror::load_settings(dir / "config").virtual_env_handling.max_scan_depth != 2) {
      std::cerr << "config file not read\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);

  std::cout << "OK\n";
  return 0;
}
