#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gitprompt/process.h"
#include "gitprompt/repository.h"

namespace gitprompt::testing {

// Scripted repository state shared between a FakeBackend and the
// repositories it hands out, plus a record of what the collector asked for.
struct FakeRepositoryState {
    bool openable = true;

    HeadLookup head{HeadLookup::Outcome::Resolved, "main"};
    std::optional<ObjectId> head_commit;
    bool empty = false;
    std::filesystem::path metadata_dir;
    std::optional<UpstreamLookup> upstream;
    std::optional<AheadBehind> counts;
    std::optional<std::vector<unsigned>> entries = std::vector<unsigned>{};

    std::vector<std::filesystem::path> opened;
    std::vector<std::string> upstream_requests;
    std::optional<StatusQuery> last_query;
    int status_calls = 0;
};

class FakeRepository : public Repository {
public:
    explicit FakeRepository(FakeRepositoryState& state)
        : state_{state} {}

    HeadLookup head() override { return state_.head; }
    std::optional<ObjectId> head_commit() override { return state_.head_commit; }
    bool is_empty() override { return state_.empty; }
    std::filesystem::path metadata_dir() override { return state_.metadata_dir; }

    std::optional<UpstreamLookup> upstream_of(const std::string& local_branch) override {
        state_.upstream_requests.push_back(local_branch);
        return state_.upstream;
    }

    std::optional<AheadBehind> ahead_behind(const ObjectId&, const ObjectId&) override {
        return state_.counts;
    }

    std::optional<std::vector<unsigned>> statuses(const StatusQuery& query) override {
        ++state_.status_calls;
        state_.last_query = query;
        return state_.entries;
    }

private:
    FakeRepositoryState& state_;
};

class FakeBackend : public RepositoryBackend {
public:
    explicit FakeBackend(FakeRepositoryState& state)
        : state_{state} {}

    std::unique_ptr<Repository> open(const std::filesystem::path& path) override {
        state_.opened.push_back(path);
        if (!state_.openable) {
            return nullptr;
        }
        return std::make_unique<FakeRepository>(state_);
    }

private:
    FakeRepositoryState& state_;
};

class FakeRunner : public CommandRunner {
public:
    std::optional<CommandResult> result = CommandResult{128, ""};

    std::vector<std::vector<std::string>> calls;
    std::vector<std::filesystem::path> directories;

    std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                     const std::filesystem::path& working_dir) override {
        calls.push_back(argv);
        directories.push_back(working_dir);
        return result;
    }
};

inline CommandResult describe_output(std::string text) {
    return CommandResult{0, std::move(text)};
}

} // namespace gitprompt::testing
