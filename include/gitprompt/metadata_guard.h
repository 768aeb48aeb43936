#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace gitprompt {

inline constexpr std::uintmax_t kDefaultMaxGitDirBytes = 1'000'000'000;

enum class GuardVerdict {
    Proceed,
    MissingDirectory,
    OversizedMetadata
};

// Total size of regular files under dir, without following symlinks.
// Stops early once the running total exceeds limit, if one is given.
std::uintmax_t directory_size(const std::filesystem::path& dir,
                              std::optional<std::uintmax_t> limit = std::nullopt);

// Cheap checks run before the repository is opened: working_dir must be an
// existing directory, and its .git directory (if any) must not exceed
// max_git_dir_bytes.
GuardVerdict check_working_directory(const std::filesystem::path& working_dir,
                                     std::uintmax_t max_git_dir_bytes = kDefaultMaxGitDirBytes);

} // namespace gitprompt
