#include "gitprompt/collector.h"

#include <array>
#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "gitprompt/logger.h"
#include "gitprompt/metadata_guard.h"
#include "gitprompt/perf.h"
#include "gitprompt/string_utils.h"

namespace gitprompt {
namespace {

constexpr std::string_view kDetachedShorthand = "HEAD";
constexpr std::string_view kUnbornDefaultBranch = "master";
constexpr std::size_t kShortIdBytes = 4;

struct Classification {
    unsigned flag;
    StatusSnapshot::Counter StatusSnapshot::*counter;
};

constexpr std::array<Classification, 12> kClassifications{{
    {status_flag::kIndexNew, &StatusSnapshot::index_new},
    {status_flag::kIndexModified, &StatusSnapshot::index_modified},
    {status_flag::kIndexDeleted, &StatusSnapshot::index_deleted},
    {status_flag::kIndexRenamed, &StatusSnapshot::index_renamed},
    {status_flag::kIndexTypechange, &StatusSnapshot::index_typechange},
    {status_flag::kWtNew, &StatusSnapshot::wt_new},
    {status_flag::kWtModified, &StatusSnapshot::wt_modified},
    {status_flag::kWtDeleted, &StatusSnapshot::wt_deleted},
    {status_flag::kWtRenamed, &StatusSnapshot::wt_renamed},
    {status_flag::kWtTypechange, &StatusSnapshot::wt_typechange},
    {status_flag::kIgnored, &StatusSnapshot::ignored},
    {status_flag::kConflicted, &StatusSnapshot::conflicted},
}};

StatusSnapshot::Counter saturate(std::size_t value) {
    constexpr auto max = std::numeric_limits<StatusSnapshot::Counter>::max();
    return value > max ? max : static_cast<StatusSnapshot::Counter>(value);
}

void increment(StatusSnapshot::Counter& counter) {
    if (counter < std::numeric_limits<StatusSnapshot::Counter>::max()) {
        ++counter;
    }
}

} // namespace

StatusCollector::StatusCollector(RepositoryBackend& backend, CommandRunner& runner, CollectorOptions options)
    : backend_{backend}, runner_{runner}, options_{options} {}

std::optional<StatusSnapshot> StatusCollector::collect(const std::filesystem::path& path) const {
    perf::ScopedTimer timer{"collect"};

    std::unique_ptr<Repository> repo;
    {
        perf::ScopedTimer open_timer{"open"};
        repo = backend_.open(path);
    }
    if (!repo) {
        return std::nullopt;
    }
    if (metadata_too_large(*repo, path)) {
        return std::nullopt;
    }

    StatusSnapshot snapshot;
    snapshot.branch = resolve_identity(*repo, snapshot);
    snapshot.tag = describe_tag(path);

    StatusQuery query;
    query.include_ignored = options_.include_ignored;

    std::optional<std::vector<unsigned>> entries;
    {
        perf::ScopedTimer status_timer{"statuses"};
        entries = repo->statuses(query);
    }
    if (!entries) {
        return std::nullopt;
    }

    for (unsigned status : *entries) {
        classify(status, options_.match, snapshot);
    }

    Logger::instance().debug("branch={} tag={} remote={} entries={}",
                             snapshot.branch, snapshot.tag, snapshot.remote, entries->size());
    return snapshot;
}

void StatusCollector::classify(unsigned status, StatusMatch match, StatusSnapshot& snapshot) {
    for (const auto& rule : kClassifications) {
        const bool hit = match == StatusMatch::Exact ? status == rule.flag : (status & rule.flag) != 0;
        if (hit) {
            increment(snapshot.*rule.counter);
        }
    }
}

std::string StatusCollector::short_id(const ObjectId& id) {
    std::string hex;
    hex.reserve(kShortIdBytes * 2);
    for (std::size_t i = 0; i < id.size() && i < kShortIdBytes; ++i) {
        std::array<char, 3> buf{};
        std::snprintf(buf.data(), buf.size(), "%02x", static_cast<unsigned>(id[i]));
        hex.append(buf.data(), 2);
    }
    return hex;
}

std::string StatusCollector::resolve_identity(Repository& repo, StatusSnapshot& snapshot) const {
    const HeadLookup head = repo.head();
    switch (head.outcome) {
        case HeadLookup::Outcome::Resolved:
            break;
        case HeadLookup::Outcome::BareRepository:
            return std::string{kUnbornDefaultBranch};
        case HeadLookup::Outcome::Failed:
            if (repo.is_empty()) {
                return std::string{kUnbornDefaultBranch};
            }
            return std::string{kDetachedShorthand};
    }

    if (head.shorthand.empty()) {
        return std::string{kDetachedShorthand};
    }

    if (head.shorthand == kDetachedShorthand) {
        auto commit = repo.head_commit();
        if (!commit || commit->empty()) {
            return std::string{kDetachedShorthand};
        }
        return short_id(*commit);
    }

    resolve_upstream(repo, head.shorthand, snapshot);
    return head.shorthand;
}

void StatusCollector::resolve_upstream(Repository& repo, const std::string& branch, StatusSnapshot& snapshot) const {
    auto upstream = repo.upstream_of(branch);
    if (!upstream) {
        return;
    }

    if (upstream->local_tip && upstream->upstream_tip) {
        if (auto counts = repo.ahead_behind(*upstream->local_tip, *upstream->upstream_tip)) {
            snapshot.ahead = saturate(counts->ahead);
            snapshot.behind = saturate(counts->behind);
        }
    }
    snapshot.remote = upstream->name;
}

bool StatusCollector::metadata_too_large(Repository& repo, const std::filesystem::path& path) const {
    if (!options_.max_git_dir_bytes) {
        return false;
    }
    const std::filesystem::path metadata = repo.metadata_dir();
    if (metadata.empty()) {
        return false;
    }

    // <path>/.git was already measured by the working directory guard.
    std::error_code ec;
    if (std::filesystem::equivalent(metadata, path / ".git", ec)) {
        return false;
    }

    perf::ScopedTimer timer{"metadata size"};
    const auto limit = *options_.max_git_dir_bytes;
    const auto size = directory_size(metadata, limit);
    if (size > limit) {
        Logger::instance().debug("{} exceeds {} bytes, skipping", metadata.string(), limit);
        return true;
    }
    return false;
}

std::string StatusCollector::describe_tag(const std::filesystem::path& path) const {
    perf::ScopedTimer timer{"describe"};
    auto result = runner_.run({"git", "describe", "--tags", "--abbrev=0"}, path);
    if (!result) {
        return {};
    }
    if (!result->succeeded()) {
        Logger::instance().trace("git describe exited with {}", result->exit_code);
        return {};
    }
    if (!string_utils::is_valid_utf8(result->output)) {
        Logger::instance().debug("git describe produced invalid UTF-8");
        return {};
    }
    return std::string{string_utils::trim(result->output)};
}

} // namespace gitprompt
