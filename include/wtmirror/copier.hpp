#pragma once
#include "wtmirror/virtualenv.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror {

// Byte limits; an empty optional disables the limit.
struct CopyLimits {
  std::optional<std::uintmax_t> max_file_bytes;
  std::optional<std::uintmax_t> max_dir_bytes;
};

enum class CopyDisposition : std::uint8_t { Copied, SkippedVirtualEnv, SkippedOversize };

struct CopyOutcome {
  std::vector<std::string> copied;
  std::vector<std::string> skipped_virtual_envs; // de-duplicated
  std::vector<std::string> skipped_oversize;
};

// Cumulative bytes committed per directory ("." is the root). A file counts
// against its parent and every ancestor up to the root.
class DirectoryQuota {
public:
  explicit DirectoryQuota(std::optional<std::uintmax_t> max_dir_bytes);

  // Would committing `size` bytes for `relfile` keep every ancestor within budget?
  [[nodiscard]] bool admits(std::string_view relfile, std::uintmax_t size) const;
  void commit(std::string_view relfile, std::uintmax_t size);

  // Bytes committed so far to `reldir` and its descendants
  [[nodiscard]] std::uintmax_t total(std::string_view reldir) const;

private:
  std::optional<std::uintmax_t> limit_;
  std::map<std::string, std::uintmax_t, std::less<>> totals_;
};

// Parent chain of a relative file path, nearest first, ending with ".".
// "a/b/c.txt" -> {"a/b", "a", "."}
auto ancestor_dirs(std::string_view relfile) -> std::vector<std::string>;

struct CopyRequest {
  std::filesystem::path source_root;
  std::filesystem::path target_root;
  CopyLimits limits;
  bool isolation_enabled = false;
  std::size_t parallelism = 0; // 0 = logical processor count
};

// Materializes relative paths from the source root into the target root.
// Admission (existence, isolation, size, directory quota) runs on the calling
// thread in input order; the transfers run on a BoundedScheduler.
class Copier {
public:
  Copier(CopyRequest request, const VirtualEnvClassifier &classifier);

  // Per-file failures leave the path out of every bucket; this never throws for them.
  auto run(const std::vector<std::string> &relpaths) -> CopyOutcome;

  [[nodiscard]] const DirectoryQuota &quota() const { return quota_; }

private:
  struct Admission {
    std::optional<CopyDisposition> verdict; // set when decided without a transfer
    bool symlink = false;
  };

  auto admit(const std::string &relpath) -> std::optional<Admission>;
  void transfer(const std::string &relpath, bool symlink) const;
  void recreate_symlink(const std::filesystem::path &src, const std::filesystem::path &dst) const;

  CopyRequest request_;
  const VirtualEnvClassifier &classifier_;
  DirectoryQuota quota_;
};

} // namespace wtmirror
