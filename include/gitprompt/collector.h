#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "gitprompt/process.h"
#include "gitprompt/repository.h"
#include "gitprompt/snapshot.h"

namespace gitprompt {

enum class StatusMatch {
    // An entry counts only when its status equals one canonical flag.
    // Entries carrying several flags at once are not counted at all.
    Exact,
    // Every canonical flag contained in the entry status is counted.
    Containment
};

struct CollectorOptions {
    StatusMatch match = StatusMatch::Exact;
    bool include_ignored = false;
    // Size limit for a metadata directory found somewhere other than
    // <path>/.git, as with a repository discovered in a parent directory.
    // Checked after opening; nullopt disables the check.
    std::optional<std::uintmax_t> max_git_dir_bytes;
};

class StatusCollector {
public:
    StatusCollector(RepositoryBackend& backend, CommandRunner& runner, CollectorOptions options = {});

    // nullopt when path is not a repository or its status cannot be read.
    std::optional<StatusSnapshot> collect(const std::filesystem::path& path) const;

    // Adds one status entry to the matching counters of snapshot.
    static void classify(unsigned status, StatusMatch match, StatusSnapshot& snapshot);

    static std::string short_id(const ObjectId& id);

private:
    std::string resolve_identity(Repository& repo, StatusSnapshot& snapshot) const;
    void resolve_upstream(Repository& repo, const std::string& branch, StatusSnapshot& snapshot) const;
    bool metadata_too_large(Repository& repo, const std::filesystem::path& path) const;
    std::string describe_tag(const std::filesystem::path& path) const;

    RepositoryBackend& backend_;
    CommandRunner& runner_;
    CollectorOptions options_;
};

} // namespace gitprompt
