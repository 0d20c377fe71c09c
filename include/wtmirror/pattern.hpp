#pragma once
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror {

// Restricted glob: literal text plus `*`, which matches any run of characters
// (separators included). Compiled once into an anchored regex.
class GlobPattern {
public:
  explicit GlobPattern(std::string_view pattern);

  [[nodiscard]] bool matches(std::string_view candidate) const;

private:
  std::regex re_;
};

// Translate a glob into the anchored regex source, e.g. ".env*" -> "^\.env.*$"
auto glob_to_regex(std::string_view pattern) -> std::string;

auto compile_patterns(const std::vector<std::string> &patterns) -> std::vector<GlobPattern>;

// True if the basename or the root-relative path matches any pattern
bool matches_any(const std::vector<GlobPattern> &patterns, std::string_view basename,
                 std::string_view relpath);

} // namespace wtmirror
