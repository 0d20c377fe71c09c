#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wtmirror::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Collapse "." and ".." segments, unify separators to '/', strip leading/trailing '/'.
// "" and "." both normalize to "".
auto to_posix(std::string_view path) -> std::string;

// Root-relative generic ('/') form of `p`; "." for the root itself.
auto relative_generic(const std::filesystem::path& p, const std::filesystem::path& root)
    -> std::string;

// Does `p` equal `base` or lie beneath it (component-wise, both already resolved)?
bool is_within(const std::filesystem::path& p, const std::filesystem::path& base);

// Same filesystem object; paths that do not exist yet are compared after
// resolving symlinks in their existing prefix.
bool same_location(const std::filesystem::path& a, const std::filesystem::path& b);

} // namespace wtmirror::fs
