#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitprompt {

// Single-bit status values of one status entry. The numeric values follow
// libgit2's git_status_t so backends can pass flags through unchanged.
namespace status_flag {
inline constexpr unsigned kCurrent = 0u;
inline constexpr unsigned kIndexNew = 1u << 0;
inline constexpr unsigned kIndexModified = 1u << 1;
inline constexpr unsigned kIndexDeleted = 1u << 2;
inline constexpr unsigned kIndexRenamed = 1u << 3;
inline constexpr unsigned kIndexTypechange = 1u << 4;
inline constexpr unsigned kWtNew = 1u << 7;
inline constexpr unsigned kWtModified = 1u << 8;
inline constexpr unsigned kWtDeleted = 1u << 9;
inline constexpr unsigned kWtTypechange = 1u << 10;
inline constexpr unsigned kWtRenamed = 1u << 11;
inline constexpr unsigned kWtUnreadable = 1u << 12;
inline constexpr unsigned kIgnored = 1u << 14;
inline constexpr unsigned kConflicted = 1u << 15;
} // namespace status_flag

using ObjectId = std::vector<std::uint8_t>;

struct HeadLookup {
    enum class Outcome {
        Resolved,
        BareRepository,
        Failed
    };

    Outcome outcome = Outcome::Failed;
    // Short name of the reference HEAD resolves to ("HEAD" when detached).
    std::string shorthand;
};

struct UpstreamLookup {
    // Fully qualified name, e.g. refs/remotes/origin/main. Empty if unreadable.
    std::string name;
    std::optional<ObjectId> local_tip;
    std::optional<ObjectId> upstream_tip;
};

struct AheadBehind {
    std::size_t ahead = 0;
    std::size_t behind = 0;
};

struct StatusQuery {
    bool include_untracked = true;
    bool recurse_untracked_dirs = true;
    bool renames_head_to_index = true;
    bool include_ignored = false;
};

// One opened repository. Implementations report failures through empty
// optionals; none of these calls throw for ordinary repository states.
class Repository {
public:
    virtual ~Repository() = default;

    virtual HeadLookup head() = 0;
    virtual std::optional<ObjectId> head_commit() = 0;
    virtual bool is_empty() = 0;

    // Directory holding the repository metadata: <workdir>/.git, or the
    // repository itself when bare.
    virtual std::filesystem::path metadata_dir() = 0;

    virtual std::optional<UpstreamLookup> upstream_of(const std::string& local_branch) = 0;
    virtual std::optional<AheadBehind> ahead_behind(const ObjectId& local, const ObjectId& upstream) = 0;

    // Status value of every entry, in enumeration order.
    virtual std::optional<std::vector<unsigned>> statuses(const StatusQuery& query) = 0;
};

class RepositoryBackend {
public:
    virtual ~RepositoryBackend() = default;

    // Returns nullptr when path is not a repository.
    virtual std::unique_ptr<Repository> open(const std::filesystem::path& path) = 0;
};

struct LibGit2Options {
    // Search parent directories for the repository instead of requiring path
    // to be one.
    bool discover = false;
};

// libgit2-backed implementation. Owns the library's global init/shutdown.
std::unique_ptr<RepositoryBackend> make_libgit2_backend(LibGit2Options options = {});

} // namespace gitprompt
