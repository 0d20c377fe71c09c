#include "wtmirror/virtualenv.hpp"

#include "wtmirror/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <climits>
#include <set>
#include <string_view>
#include <system_error>

namespace stdfs = std::filesystem;

namespace wtmirror {

namespace {

// Never descended into by detect_all
constexpr std::array<std::string_view, 7> kDetectSkipDirs = {
    ".git", ".hg", ".svn", ".idea", ".vscode", "dist", "build"};

std::string lower(std::string s) {
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string_view> split_segments(std::string_view path) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t end = path.find('/', start);
    if (end == std::string_view::npos)
      end = path.size();
    out.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

bool has_prefix_dir(std::string_view path, std::string_view prefix) {
  return path == prefix ||
         (path.size() > prefix.size() && path.starts_with(prefix) && path[prefix.size()] == '/');
}

struct DetectWalk {
  const std::vector<VirtualEnvGroup> &groups;
  const stdfs::path &root;
  std::vector<DetectedVirtualEnv> &out;
  std::set<std::string> seen; // ecosystem::pattern::path

  void walk(const stdfs::path &dir, int depth) {
    if (depth < 0)
      return;

    std::error_code ec;
    stdfs::directory_iterator it(dir, ec);
    for (; !ec && it != stdfs::directory_iterator(); it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (std::ranges::find(kDetectSkipDirs, name) != kDetectSkipDirs.end())
        continue;

      // lstat: a symlinked directory is never walked
      std::error_code sec;
      if (!it->is_directory(sec) || it->is_symlink(sec))
        continue;

      const std::string rel = fs::relative_generic(it->path(), root);
      bool matched = false;
      for (const auto &group : groups) {
        for (const auto &raw : group.patterns) {
          const std::string pattern = fs::to_posix(raw);
          const bool hit = pattern.find('/') != std::string::npos ? has_prefix_dir(rel, pattern)
                                                                  : name == pattern;
          if (!hit)
            continue;
          matched = true;
          if (seen.insert(group.ecosystem + "::" + pattern + "::" + rel).second) {
            out.push_back(DetectedVirtualEnv{.ecosystem = group.ecosystem, .path = rel,
                                             .pattern = pattern});
          }
        }
      }

      // contents of a matched directory belong to the artifact
      if (!matched)
        walk(it->path(), depth - 1);
    }
  }
};

} // namespace

std::vector<VirtualEnvGroup> builtin_virtual_env_groups() {
  return {
      {.ecosystem = "Python",
       .patterns = {".venv", "venv", ".virtualenv", "env", ".direnv", ".tox", "__pypackages__",
                    "__pycache__"},
       .setup_hints = {"python -m venv .venv", "poetry install", "pipenv install",
                       "conda env create"}},
      {.ecosystem = "Node.js",
       .patterns = {"node_modules", ".pnpm-store", ".yarn", ".yarn/cache", ".npm", ".nvm"},
       .setup_hints = {"npm install", "pnpm install", "yarn install"}},
      {.ecosystem = "Ruby",
       .patterns = {".bundle", "vendor/bundle", "vendor"},
       .setup_hints = {"bundle install"}},
      {.ecosystem = "Rust", .patterns = {"target"}, .setup_hints = {"cargo build"}},
      {.ecosystem = "Go",
       .patterns = {"vendor"},
       .setup_hints = {"go mod vendor", "go mod download"}},
      {.ecosystem = "PHP", .patterns = {"vendor"}, .setup_hints = {"composer install"}},
      {.ecosystem = "Java",
       .patterns = {".gradle", ".m2", "build", "target"},
       .setup_hints = {"gradle build", "mvn install"}},
      {.ecosystem = "Elixir",
       .patterns = {"_build", "deps"},
       .setup_hints = {"mix deps.get", "mix compile"}},
  };
}

VirtualEnvClassifier::VirtualEnvClassifier() : groups_(builtin_virtual_env_groups()) {}

VirtualEnvClassifier::VirtualEnvClassifier(std::vector<VirtualEnvGroup> custom)
    : groups_(builtin_virtual_env_groups()) {
  for (auto &g : custom)
    groups_.push_back(std::move(g));
}

bool VirtualEnvClassifier::is_virtual_env(std::string_view relpath) const {
  const std::string path = lower(fs::to_posix(relpath));
  const auto segments = split_segments(path);

  for (const auto &group : groups_) {
    for (const auto &raw : group.patterns) {
      const std::string pattern = lower(fs::to_posix(raw));
      if (pattern.empty())
        continue;
      if (pattern.find('/') != std::string::npos) {
        if (has_prefix_dir(path, pattern))
          return true;
        continue;
      }
      if (std::ranges::find(segments, pattern) != segments.end())
        return true;
    }
  }
  return false;
}

std::vector<DetectedVirtualEnv> VirtualEnvClassifier::detect_all(const stdfs::path &root,
                                                                 int max_depth) const {
  std::vector<DetectedVirtualEnv> detected;
  std::error_code ec;
  if (!stdfs::is_directory(root, ec))
    return detected;

  DetectWalk w{.groups = groups_, .root = root, .out = detected, .seen = {}};
  w.walk(root, max_depth < 0 ? INT_MAX : max_depth);
  return detected;
}

std::vector<std::string> VirtualEnvClassifier::exclude_patterns() const {
  std::vector<std::string> out;
  for (const auto &group : groups_) {
    for (const auto &p : group.patterns) {
      if (std::ranges::find(out, p) == out.end())
        out.push_back(p);
    }
  }
  return out;
}

std::vector<std::string>
VirtualEnvClassifier::suggest_setup_commands(const std::vector<DetectedVirtualEnv> &detected) const {
  std::vector<std::string> lines;
  std::set<std::string> seen;
  for (const auto &d : detected) {
    if (!seen.insert(d.ecosystem).second)
      continue;
    const auto it = std::ranges::find_if(
        groups_, [&](const VirtualEnvGroup &g) { return g.ecosystem == d.ecosystem; });
    if (it == groups_.end())
      continue;
    lines.push_back("# " + d.ecosystem + ": Choose one of the following:");
    for (const auto &cmd : it->setup_hints)
      lines.push_back("  " + cmd);
  }
  return lines;
}

} // namespace wtmirror
