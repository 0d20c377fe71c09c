#pragma once
#include <cstdint>
#include <limits>
#include <string_view>

namespace wtmirror::consts {

// Directory and file names
inline constexpr std::string_view kGitDir  = ".git";
inline constexpr std::string_view kRootRel = "."; // synthetic scan root in quota maps

// ——— Sizes ———
inline constexpr std::uintmax_t kBytesPerMiB = 1024ULL * 1024ULL;
// largest size setting whose byte count fits in std::uintmax_t
inline constexpr std::int64_t kMaxSizeMb =
    static_cast<std::int64_t>(std::numeric_limits<std::uintmax_t>::max() / kBytesPerMiB);

// ——— Setting defaults ———
inline constexpr std::int64_t kDefaultMaxFileSizeMb  = 100;
inline constexpr std::int64_t kDefaultMaxDirSizeMb   = 500;
inline constexpr int kDefaultMaxScanDepth            = 5;
inline constexpr int kDefaultCopyParallelism         = 4;

// ——— Config file ———
inline constexpr std::string_view kConfigDirName = "wtmirror";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kRcFile        = ".wtmirrorrc";

} // namespace wtmirror::consts
