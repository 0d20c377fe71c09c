#include "wtmirror/scanner.hpp"

#include "wtmirror/consts.hpp"
#include "wtmirror/fs.hpp"
#include "wtmirror/pattern.hpp"

#include <system_error>

namespace stdfs = std::filesystem;

namespace wtmirror {

namespace {

struct ScanWalk {
  const stdfs::path &root;
  const CopyPolicy &policy;
  const TrackedPredicate &is_tracked;
  const VirtualEnvClassifier &classifier;
  std::vector<GlobPattern> includes;
  std::vector<GlobPattern> excludes;
  ScanResult &out;

  void walk(const stdfs::path &dir) {
    std::error_code ec;
    stdfs::directory_iterator it(dir, ec);
    // an unreadable directory drops its subtree, nothing more
    for (; !ec && it != stdfs::directory_iterator(); it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (name == consts::kGitDir)
        continue;

      const std::string rel = fs::relative_generic(it->path(), root);
      if (matches_any(excludes, name, rel))
        continue;
      if (policy.isolation_enabled && classifier.is_virtual_env(rel))
        continue;

      std::error_code sec;
      const auto lst = it->symlink_status(sec);
      if (sec)
        continue;

      if (stdfs::is_directory(lst)) {
        walk(it->path());
        continue;
      }

      // a symlink qualifies only when it resolves to a regular file
      bool file_like = stdfs::is_regular_file(lst);
      if (!file_like && stdfs::is_symlink(lst))
        file_like = stdfs::is_regular_file(stdfs::status(it->path(), sec));
      if (!file_like)
        continue;

      if (!includes.empty() && !matches_any(includes, name, rel))
        continue;
      if (is_tracked && is_tracked(rel))
        continue;
      out.push_back(rel);
    }
  }
};

} // namespace

ScanResult scan_directory(const stdfs::path &root, const CopyPolicy &policy,
                          const TrackedPredicate &is_tracked,
                          const VirtualEnvClassifier &classifier) {
  ScanResult result;
  if (policy.include_patterns.empty() && policy.exclude_patterns.empty())
    return result;

  ScanWalk w{.root = root,
             .policy = policy,
             .is_tracked = is_tracked,
             .classifier = classifier,
             .includes = compile_patterns(policy.include_patterns),
             .excludes = compile_patterns(policy.exclude_patterns),
             .out = result};
  w.walk(root);
  return result;
}

} // namespace wtmirror
