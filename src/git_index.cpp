#include "wtmirror/git_index.hpp"

#include "wtmirror/fs.hpp"

#include <git2.h>

#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;

namespace wtmirror {

namespace {

// git_libgit2_init/shutdown are reference counted; one pair per open repository
struct Libgit2Session {
  Libgit2Session() { git_libgit2_init(); }
  ~Libgit2Session() { git_libgit2_shutdown(); }
  Libgit2Session(const Libgit2Session &) = delete;
  Libgit2Session &operator=(const Libgit2Session &) = delete;
};

struct RepositoryDeleter {
  void operator()(git_repository *repo) const noexcept { git_repository_free(repo); }
};

struct IndexDeleter {
  void operator()(git_index *index) const noexcept { git_index_free(index); }
};

struct TreeDeleter {
  void operator()(git_tree *tree) const noexcept { git_tree_free(tree); }
};

struct CommitDeleter {
  void operator()(git_commit *commit) const noexcept { git_commit_free(commit); }
};

struct TreeEntryDeleter {
  void operator()(git_tree_entry *entry) const noexcept { git_tree_entry_free(entry); }
};

void check(int rc, std::string_view what) {
  if (rc >= 0)
    return;
  const git_error *err = git_error_last();
  std::string msg(what);
  msg += " failed";
  if (err && err->message) {
    msg += ": ";
    msg += err->message;
  }
  throw std::runtime_error(msg);
}

stdfs::path resolved(const stdfs::path &p) {
  std::error_code ec;
  auto out = stdfs::weakly_canonical(p, ec);
  if (ec)
    out = stdfs::absolute(p, ec);
  return out;
}

} // namespace

struct GitIndex::State {
  Libgit2Session session; // first in, last out
  std::unique_ptr<git_repository, RepositoryDeleter> repo;
  std::unique_ptr<git_index, IndexDeleter> index; // null when unreadable
  std::unique_ptr<git_tree, TreeDeleter> head_tree; // null on an unborn branch
  std::string prefix;                               // "" or "sub/dir/"
};

GitIndex::GitIndex(stdfs::path worktree_root) : root_(std::move(worktree_root)) {}

void GitIndex::load() {
  state_.reset();
  auto state = std::make_shared<State>();

  git_repository *raw_repo = nullptr;
  const int rc = git_repository_open_ext(&raw_repo, root_.string().c_str(),
                                         GIT_REPOSITORY_OPEN_CROSS_FS, nullptr);
  if (rc == GIT_ENOTFOUND)
    return;
  check(rc, "opening repository at " + root_.string());
  state->repo.reset(raw_repo);

  const char *workdir = git_repository_workdir(raw_repo);
  if (!workdir)
    return; // bare: no checked-out files to protect

  // workdir carries a trailing '/'
  const stdfs::path top = resolved(stdfs::path(workdir).parent_path());
  const stdfs::path here = resolved(root_);
  if (here != top && fs::is_within(here, top))
    state->prefix = here.lexically_relative(top).generic_string() + "/";

  git_index *raw_index = nullptr;
  if (git_repository_index(&raw_index, raw_repo) == 0)
    state->index.reset(raw_index);
  else
    git_error_clear();

  git_oid head{};
  const int hrc = git_reference_name_to_id(&head, raw_repo, "HEAD");
  if (hrc == 0) {
    git_commit *raw_commit = nullptr;
    check(git_commit_lookup(&raw_commit, raw_repo, &head), "reading HEAD commit");
    const std::unique_ptr<git_commit, CommitDeleter> commit(raw_commit);
    git_tree *raw_tree = nullptr;
    check(git_commit_tree(&raw_tree, commit.get()), "reading HEAD tree");
    state->head_tree.reset(raw_tree);
  } else if (hrc != GIT_ENOTFOUND && hrc != GIT_EUNBORNBRANCH) {
    check(hrc, "resolving HEAD");
  }

  state_ = std::move(state);
}

bool GitIndex::index_loaded() const { return state_ && state_->index; }

std::string GitIndex::prefix() const { return state_ ? state_->prefix : std::string{}; }

bool GitIndex::is_tracked(std::string_view relpath) const {
  if (!state_)
    return false;
  const std::string key = state_->prefix + fs::to_posix(relpath);

  if (state_->index) {
    // stages 1-3 hold the sides of an unresolved merge conflict
    for (int stage = 0; stage <= 3; ++stage) {
      if (git_index_get_bypath(state_->index.get(), key.c_str(), stage))
        return true;
    }
  }

  if (state_->head_tree) {
    git_tree_entry *raw_entry = nullptr;
    if (git_tree_entry_bypath(&raw_entry, state_->head_tree.get(), key.c_str()) == 0) {
      const std::unique_ptr<git_tree_entry, TreeEntryDeleter> entry(raw_entry);
      return git_tree_entry_type(entry.get()) == GIT_OBJECT_BLOB;
    }
    git_error_clear();
  }
  return false;
}

TrackedPredicate GitIndex::as_predicate() const {
  return [self = *this](std::string_view relpath) { return self.is_tracked(relpath); };
}

} // namespace wtmirror
