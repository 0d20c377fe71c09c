#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror {

struct VirtualEnvGroup {
  std::string ecosystem;                // "Python", "Node.js", ...
  std::vector<std::string> patterns;    // directory names or root-relative prefixes
  std::vector<std::string> setup_hints; // commands that recreate the artifact
};

struct DetectedVirtualEnv {
  std::string ecosystem;
  std::string path;    // POSIX, relative to the detection root
  std::string pattern; // normalized pattern that matched
};

// The fixed built-in groups, in priority order.
auto builtin_virtual_env_groups() -> std::vector<VirtualEnvGroup>;

class VirtualEnvClassifier {
public:
  // Built-in groups only
  VirtualEnvClassifier();
  // Built-in groups followed by `custom`
  explicit VirtualEnvClassifier(std::vector<VirtualEnvGroup> custom);

  [[nodiscard]] const std::vector<VirtualEnvGroup> &groups() const { return groups_; }

  // Segment match for bare names ("node_modules"), prefix match for patterns with
  // a separator ("vendor/bundle"). Case-insensitive.
  [[nodiscard]] bool is_virtual_env(std::string_view relpath) const;

  // Depth-first walk reporting every matching directory without descending into it.
  // Negative max_depth = unlimited.
  [[nodiscard]] auto detect_all(const std::filesystem::path &root, int max_depth) const
      -> std::vector<DetectedVirtualEnv>;

  // All patterns, de-duplicated, in group order
  [[nodiscard]] auto exclude_patterns() const -> std::vector<std::string>;

  // "# <ecosystem>: Choose one of the following:" followed by indented hints,
  // once per ecosystem in detection order.
  [[nodiscard]] auto suggest_setup_commands(const std::vector<DetectedVirtualEnv> &detected) const
      -> std::vector<std::string>;

private:
  std::vector<VirtualEnvGroup> groups_;
};

} // namespace wtmirror
