#include "wtmirror/pattern.hpp"

#include <algorithm>
#include <string_view>

namespace wtmirror {

namespace {

constexpr std::string_view kRegexMeta = ".^$|()[]{}*+?\\";

void append_escaped(std::string &out, std::string_view literal) {
  for (const char c : literal) {
    if (kRegexMeta.find(c) != std::string_view::npos)
      out.push_back('\\');
    out.push_back(c);
  }
}

} // namespace

std::string glob_to_regex(std::string_view pattern) {
  std::string re = "^";
  std::size_t start = 0;
  while (true) {
    const std::size_t star = pattern.find('*', start);
    if (star == std::string_view::npos) {
      append_escaped(re, pattern.substr(start));
      break;
    }
    append_escaped(re, pattern.substr(start, star - start));
    re += ".*";
    start = star + 1;
  }
  re.push_back('$');
  return re;
}

// Every literal is escaped, so construction cannot fail on user input.
GlobPattern::GlobPattern(std::string_view pattern)
    : re_(glob_to_regex(pattern), std::regex::ECMAScript | std::regex::optimize) {}

bool GlobPattern::matches(std::string_view candidate) const {
  return std::regex_match(candidate.begin(), candidate.end(), re_);
}

std::vector<GlobPattern> compile_patterns(const std::vector<std::string> &patterns) {
  std::vector<GlobPattern> out;
  out.reserve(patterns.size());
  for (const auto &p : patterns)
    out.emplace_back(p);
  return out;
}

bool matches_any(const std::vector<GlobPattern> &patterns, std::string_view basename,
                 std::string_view relpath) {
  return std::ranges::any_of(patterns, [&](const GlobPattern &p) {
    return p.matches(basename) || p.matches(relpath);
  });
}

} // namespace wtmirror
