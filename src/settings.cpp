#include "wtmirror/settings.hpp"

#include "wtmirror/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_list(std::string_view sv, char sep = ',') {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= sv.size()) {
    std::size_t end = sv.find(sep, start);
    if (end == std::string_view::npos)
      end = sv.size();
    if (auto item = trim(sv.substr(start, end - start)); !item.empty())
      out.push_back(std::move(item));
    start = end + 1;
  }
  return out;
}

std::optional<bool> parse_bool(std::string_view v) {
  std::string s(v);
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "true" || s == "yes" || s == "on" || s == "1")
    return true;
  if (s == "false" || s == "no" || s == "off" || s == "0")
    return false;
  return std::nullopt;
}

// Integer within [min, max], nothing else on the line
std::optional<std::int64_t> parse_int(std::string_view v, std::int64_t min, std::int64_t max) {
  std::int64_t out = 0;
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc{} || ptr != v.data() + v.size() || out < min || out > max)
    return std::nullopt;
  return out;
}

constexpr std::int64_t kMaxInt = std::numeric_limits<int>::max();

// "<ecosystem> = <pattern>, <pattern> [| <command>, <command>]"
std::optional<wtmirror::VirtualEnvGroup> parse_custom_group(std::string_view v) {
  const std::size_t eq = v.find('=');
  if (eq == std::string_view::npos)
    return std::nullopt;

  wtmirror::VirtualEnvGroup g;
  g.ecosystem = trim(v.substr(0, eq));
  std::string_view rest = v.substr(eq + 1);
  std::string_view cmds;
  if (const std::size_t bar = rest.find('|'); bar != std::string_view::npos) {
    cmds = rest.substr(bar + 1);
    rest = rest.substr(0, bar);
  }
  g.patterns = split_list(rest);
  g.setup_hints = split_list(cmds);
  if (g.ecosystem.empty() || g.patterns.empty())
    return std::nullopt;
  return g;
}

} // namespace

namespace wtmirror {

Settings parse_settings(std::string_view text) {
  Settings out{};
  auto &cif = out.copy_ignored_files;
  auto &veh = out.virtual_env_handling;

  // deprecated spellings only apply when the current key is absent
  bool saw_isolate = false;
  bool saw_max_file = false;
  std::optional<bool> legacy_mode_skip;
  std::optional<std::int64_t> legacy_max_copy;

  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    const std::string stripped = trim(sv);
    if (stripped.empty() || stripped[0] == '#')
      continue; // allow comments
    const std::size_t colon = stripped.find(':');
    if (colon == std::string::npos)
      continue;
    const std::string key = trim(std::string_view(stripped).substr(0, colon));
    const std::string value = trim(std::string_view(stripped).substr(colon + 1));

    if (key == "copy_ignored_files.enabled") {
      if (auto b = parse_bool(value))
        cif.enabled = *b;
    } else if (key == "copy_ignored_files.patterns") {
      cif.patterns = split_list(value);
    } else if (key == "copy_ignored_files.exclude_patterns") {
      cif.exclude_patterns = split_list(value);
    } else if (key == "virtual_env_handling.isolate_virtual_envs") {
      if (auto b = parse_bool(value)) {
        veh.isolate_virtual_envs = *b;
        saw_isolate = true;
      }
    } else if (key == "virtual_env_handling.mode") {
      if (value == "skip" || value == "ignore")
        legacy_mode_skip = value == "skip";
    } else if (key == "virtual_env_handling.max_file_size_mb") {
      if (auto n = parse_int(value, -1, consts::kMaxSizeMb)) {
        veh.max_file_size_mb = *n;
        saw_max_file = true;
      }
    } else if (key == "virtual_env_handling.max_copy_size_mb") {
      if (auto n = parse_int(value, 0, consts::kMaxSizeMb))
        legacy_max_copy = *n;
    } else if (key == "virtual_env_handling.max_dir_size_mb") {
      if (auto n = parse_int(value, -1, consts::kMaxSizeMb))
        veh.max_dir_size_mb = *n;
    } else if (key == "virtual_env_handling.max_scan_depth") {
      if (auto n = parse_int(value, -1, kMaxInt))
        veh.max_scan_depth = static_cast<int>(*n);
    } else if (key == "virtual_env_handling.copy_parallelism") {
      if (auto n = parse_int(value, 0, kMaxInt))
        veh.copy_parallelism = static_cast<int>(*n);
    } else if (key == "virtual_env_handling.custom_patterns") {
      if (auto g = parse_custom_group(value))
        veh.custom_patterns.push_back(std::move(*g));
    }
  }

  if (!saw_isolate && legacy_mode_skip)
    veh.isolate_virtual_envs = *legacy_mode_skip;
  if (!saw_max_file && legacy_max_copy)
    veh.max_file_size_mb = *legacy_max_copy;
  return out;
}

Settings load_settings(const std::filesystem::path &file) {
  if (!fs::exists(file))
    return Settings{};
  const auto bytes = fs::read_file(file);
  return parse_settings(std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

std::vector<std::filesystem::path> default_config_paths() {
  std::vector<std::filesystem::path> out;
  const char *home = std::getenv("HOME");
  if (!home || !*home)
    return out;
  const std::filesystem::path h{home};
  out.push_back(h / ".config" / consts::kConfigDirName / consts::kConfigFile);
  out.push_back(h / consts::kRcFile);
  return out;
}

Settings load_default_settings() {
  for (const auto &p : default_config_paths()) {
    if (fs::exists(p))
      return load_settings(p);
  }
  return Settings{};
}

std::optional<std::uintmax_t> mib_to_bytes(std::int64_t mib) {
  if (mib < 0)
    return std::nullopt;
  if (mib > consts::kMaxSizeMb)
    return std::numeric_limits<std::uintmax_t>::max();
  return static_cast<std::uintmax_t>(mib) * consts::kBytesPerMiB;
}

CopyLimits copy_limits(const VirtualEnvSettings &veh) {
  return CopyLimits{.max_file_bytes = mib_to_bytes(veh.max_file_size_mb),
                    .max_dir_bytes = mib_to_bytes(veh.max_dir_size_mb)};
}

std::size_t effective_parallelism(int configured, unsigned hardware) {
  if (configured > 0)
    return static_cast<std::size_t>(configured);
  return hardware > 0 ? hardware : 1;
}

} // namespace wtmirror
