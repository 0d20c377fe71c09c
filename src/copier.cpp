#include "wtmirror/copier.hpp"

#include "wtmirror/consts.hpp"
#include "wtmirror/fs.hpp"
#include "wtmirror/scheduler.hpp"

#include <functional>
#include <set>
#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;

namespace wtmirror {

// Quota bookkeeping

std::vector<std::string> ancestor_dirs(std::string_view relfile) {
  std::vector<std::string> out;
  std::string_view cursor = relfile;
  while (true) {
    const std::size_t slash = cursor.rfind('/');
    if (slash == std::string_view::npos)
      break;
    cursor = cursor.substr(0, slash);
    if (!cursor.empty())
      out.emplace_back(cursor);
  }
  out.emplace_back(consts::kRootRel);
  return out;
}

DirectoryQuota::DirectoryQuota(std::optional<std::uintmax_t> max_dir_bytes)
    : limit_(max_dir_bytes) {}

bool DirectoryQuota::admits(std::string_view relfile, std::uintmax_t size) const {
  if (!limit_)
    return true;
  for (const auto &dir : ancestor_dirs(relfile)) {
    if (total(dir) + size > *limit_)
      return false;
  }
  return true;
}

void DirectoryQuota::commit(std::string_view relfile, std::uintmax_t size) {
  for (auto &dir : ancestor_dirs(relfile))
    totals_[std::move(dir)] += size;
}

std::uintmax_t DirectoryQuota::total(std::string_view reldir) const {
  const auto it = totals_.find(reldir);
  return it == totals_.end() ? 0 : it->second;
}

// Copier

Copier::Copier(CopyRequest request, const VirtualEnvClassifier &classifier)
    : request_(std::move(request)), classifier_(classifier),
      quota_(request_.limits.max_dir_bytes) {}

auto Copier::admit(const std::string &relpath) -> std::optional<Admission> {
  const auto src = request_.source_root / stdfs::path(relpath);

  std::error_code ec;
  const auto lst = stdfs::symlink_status(src, ec);
  if (ec || !stdfs::exists(lst))
    return std::nullopt; // vanished since the scan

  if (request_.isolation_enabled && classifier_.is_virtual_env(relpath))
    return Admission{.verdict = CopyDisposition::SkippedVirtualEnv};

  // links carry no payload of their own: no size checks, no quota
  if (stdfs::is_symlink(lst))
    return Admission{.symlink = true};

  if (!stdfs::is_regular_file(lst))
    return std::nullopt;

  const std::uintmax_t size = stdfs::file_size(src, ec);
  if (ec)
    return std::nullopt;
  if (request_.limits.max_file_bytes && size > *request_.limits.max_file_bytes)
    return Admission{.verdict = CopyDisposition::SkippedOversize};
  if (!quota_.admits(relpath, size))
    return Admission{.verdict = CopyDisposition::SkippedOversize};

  quota_.commit(relpath, size);
  return Admission{};
}

void Copier::transfer(const std::string &relpath, bool symlink) const {
  const auto src = request_.source_root / stdfs::path(relpath);
  const auto dst = request_.target_root / stdfs::path(relpath);

  fs::ensure_parent_dir(dst);
  if (symlink) {
    recreate_symlink(src, dst);
    return;
  }
  if (!stdfs::copy_file(src, dst, stdfs::copy_options::overwrite_existing))
    throw std::runtime_error("copy failed: " + src.string());
}

void Copier::recreate_symlink(const stdfs::path &src, const stdfs::path &dst) const {
  const stdfs::path link_text = stdfs::read_symlink(src);
  stdfs::path new_text = link_text;

  if (request_.isolation_enabled) {
    const stdfs::path absolute =
        link_text.is_absolute() ? link_text : src.parent_path() / link_text;
    std::error_code ec;
    const auto real_source = stdfs::canonical(request_.source_root, ec);
    const auto real_target = ec ? stdfs::path{} : stdfs::canonical(absolute, ec);
    // a link back into the source tree is re-pointed at the same spot in the target tree
    if (!ec && fs::is_within(real_target, real_source)) {
      const auto mirrored = request_.target_root / real_target.lexically_relative(real_source);
      new_text = mirrored.lexically_relative(dst.parent_path());
    }
  }

  stdfs::create_symlink(new_text, dst);
}

CopyOutcome Copier::run(const std::vector<std::string> &relpaths) {
  std::vector<std::optional<CopyDisposition>> verdicts(relpaths.size());

  std::vector<std::function<CopyDisposition()>> units;
  std::vector<std::size_t> unit_slots;
  for (std::size_t i = 0; i < relpaths.size(); ++i) {
    const auto adm = admit(relpaths[i]);
    if (!adm)
      continue; // vanished or unreadable: left out of every bucket
    if (adm->verdict) {
      verdicts[i] = adm->verdict;
      continue;
    }
    unit_slots.push_back(i);
    units.emplace_back([this, &rel = relpaths[i], symlink = adm->symlink] {
      transfer(rel, symlink);
      return CopyDisposition::Copied;
    });
  }

  const BoundedScheduler scheduler{request_.parallelism};
  const auto results = scheduler.run(std::move(units));
  for (std::size_t k = 0; k < results.size(); ++k)
    verdicts[unit_slots[k]] = results[k];

  CopyOutcome out;
  std::set<std::string> venv_seen;
  for (std::size_t i = 0; i < relpaths.size(); ++i) {
    if (!verdicts[i])
      continue;
    switch (*verdicts[i]) {
    case CopyDisposition::Copied:
      out.copied.push_back(relpaths[i]);
      break;
    case CopyDisposition::SkippedVirtualEnv:
      if (venv_seen.insert(relpaths[i]).second)
        out.skipped_virtual_envs.push_back(relpaths[i]);
      break;
    case CopyDisposition::SkippedOversize:
      out.skipped_oversize.push_back(relpaths[i]);
      break;
    }
  }
  return out;
}

} // namespace wtmirror
