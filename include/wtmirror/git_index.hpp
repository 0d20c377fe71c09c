#pragma once
#include "wtmirror/scanner.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace wtmirror {

// Which paths of a worktree git already tracks, answered through libgit2.
// A path is tracked when the index has an entry for it at any stage, or when
// it is a file in the tree of HEAD. The HEAD lookup keeps committed files
// tracked even when the index uses an extension libgit2 cannot read (a split
// index, for one).
class GitIndex {
public:
  explicit GitIndex(std::filesystem::path worktree_root);

  // Open the repository around the worktree root; linked worktrees (".git" as
  // a "gitdir:" file) included. A root outside any repository leaves nothing
  // tracked. Throws std::runtime_error when the repository cannot be read.
  void load();

  [[nodiscard]] bool in_repository() const { return state_ != nullptr; }
  // False when the repository has an index libgit2 could not read
  [[nodiscard]] bool index_loaded() const;
  // Location of the worktree root inside the repository workdir ("" at the top)
  [[nodiscard]] std::string prefix() const;

  [[nodiscard]] bool is_tracked(std::string_view relpath) const;

  // Predicate for scan_directory; shares the open repository handles
  [[nodiscard]] auto as_predicate() const -> TrackedPredicate;

private:
  struct State;

  std::filesystem::path root_;
  std::shared_ptr<const State> state_;
};

} // namespace wtmirror
