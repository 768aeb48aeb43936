#include "gitprompt/repository.h"

#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <git2.h>

#include "gitprompt/logger.h"

namespace fs = std::filesystem;

namespace gitprompt {
namespace {

static_assert(status_flag::kIndexNew == static_cast<unsigned>(GIT_STATUS_INDEX_NEW));
static_assert(status_flag::kIndexModified == static_cast<unsigned>(GIT_STATUS_INDEX_MODIFIED));
static_assert(status_flag::kIndexDeleted == static_cast<unsigned>(GIT_STATUS_INDEX_DELETED));
static_assert(status_flag::kIndexRenamed == static_cast<unsigned>(GIT_STATUS_INDEX_RENAMED));
static_assert(status_flag::kIndexTypechange == static_cast<unsigned>(GIT_STATUS_INDEX_TYPECHANGE));
static_assert(status_flag::kWtNew == static_cast<unsigned>(GIT_STATUS_WT_NEW));
static_assert(status_flag::kWtModified == static_cast<unsigned>(GIT_STATUS_WT_MODIFIED));
static_assert(status_flag::kWtDeleted == static_cast<unsigned>(GIT_STATUS_WT_DELETED));
static_assert(status_flag::kWtTypechange == static_cast<unsigned>(GIT_STATUS_WT_TYPECHANGE));
static_assert(status_flag::kWtRenamed == static_cast<unsigned>(GIT_STATUS_WT_RENAMED));
static_assert(status_flag::kWtUnreadable == static_cast<unsigned>(GIT_STATUS_WT_UNREADABLE));
static_assert(status_flag::kIgnored == static_cast<unsigned>(GIT_STATUS_IGNORED));
static_assert(status_flag::kConflicted == static_cast<unsigned>(GIT_STATUS_CONFLICTED));

struct RepositoryDeleter {
    void operator()(git_repository* repo) const noexcept { git_repository_free(repo); }
};

struct ReferenceDeleter {
    void operator()(git_reference* ref) const noexcept { git_reference_free(ref); }
};

struct ObjectDeleter {
    void operator()(git_object* object) const noexcept { git_object_free(object); }
};

struct StatusListDeleter {
    void operator()(git_status_list* list) const noexcept { git_status_list_free(list); }
};

using RepositoryHandle = std::unique_ptr<git_repository, RepositoryDeleter>;
using ReferenceHandle = std::unique_ptr<git_reference, ReferenceDeleter>;
using ObjectHandle = std::unique_ptr<git_object, ObjectDeleter>;
using StatusListHandle = std::unique_ptr<git_status_list, StatusListDeleter>;

std::string last_error_message() {
    const git_error* error = git_error_last();
    if (error == nullptr || error->message == nullptr) {
        return "unknown libgit2 error";
    }
    return error->message;
}

ObjectId to_object_id(const git_oid& oid) {
    return ObjectId(oid.id, oid.id + sizeof(oid.id));
}

std::optional<git_oid> to_git_oid(const ObjectId& id) {
    git_oid oid{};
    if (id.empty() || id.size() > sizeof(oid.id)) {
        return std::nullopt;
    }
    std::memcpy(oid.id, id.data(), id.size());
    return oid;
}

std::optional<ObjectId> reference_target(git_reference* ref) {
    const git_oid* target = git_reference_target(ref);
    if (target == nullptr) {
        return std::nullopt;
    }
    return to_object_id(*target);
}

class LibGit2Repository : public Repository {
public:
    explicit LibGit2Repository(RepositoryHandle handle)
        : handle_{std::move(handle)} {}

    HeadLookup head() override {
        HeadLookup lookup;
        git_reference* raw = nullptr;
        const int rc = git_repository_head(&raw, handle_.get());
        if (rc == 0) {
            ReferenceHandle ref{raw};
            const char* shorthand = git_reference_shorthand(ref.get());
            lookup.outcome = HeadLookup::Outcome::Resolved;
            lookup.shorthand = shorthand != nullptr ? shorthand : "";
            return lookup;
        }

        Logger::instance().debug("HEAD lookup failed ({}): {}", rc, last_error_message());
        lookup.outcome = rc == GIT_EBAREREPO ? HeadLookup::Outcome::BareRepository : HeadLookup::Outcome::Failed;
        return lookup;
    }

    std::optional<ObjectId> head_commit() override {
        git_reference* raw = nullptr;
        if (git_repository_head(&raw, handle_.get()) != 0) {
            return std::nullopt;
        }
        ReferenceHandle ref{raw};

        git_object* peeled = nullptr;
        if (git_reference_peel(&peeled, ref.get(), GIT_OBJECT_COMMIT) != 0) {
            Logger::instance().debug("cannot peel HEAD to a commit: {}", last_error_message());
            return std::nullopt;
        }
        ObjectHandle commit{peeled};
        return to_object_id(*git_object_id(commit.get()));
    }

    bool is_empty() override {
        return git_repository_is_empty(handle_.get()) == 1;
    }

    fs::path metadata_dir() override {
        const char* path = git_repository_path(handle_.get());
        return path != nullptr ? fs::path{path} : fs::path{};
    }

    std::optional<UpstreamLookup> upstream_of(const std::string& local_branch) override {
        git_reference* raw_local = nullptr;
        if (git_branch_lookup(&raw_local, handle_.get(), local_branch.c_str(), GIT_BRANCH_LOCAL) != 0) {
            Logger::instance().debug("no local branch '{}': {}", local_branch, last_error_message());
            return std::nullopt;
        }
        ReferenceHandle local{raw_local};

        git_reference* raw_upstream = nullptr;
        if (git_branch_upstream(&raw_upstream, local.get()) != 0) {
            Logger::instance().debug("branch '{}' has no upstream: {}", local_branch, last_error_message());
            return std::nullopt;
        }
        ReferenceHandle upstream{raw_upstream};

        UpstreamLookup lookup;
        if (const char* name = git_reference_name(upstream.get())) {
            lookup.name = name;
        }
        lookup.local_tip = reference_target(local.get());
        lookup.upstream_tip = reference_target(upstream.get());
        return lookup;
    }

    std::optional<AheadBehind> ahead_behind(const ObjectId& local, const ObjectId& upstream) override {
        auto local_oid = to_git_oid(local);
        auto upstream_oid = to_git_oid(upstream);
        if (!local_oid || !upstream_oid) {
            return std::nullopt;
        }

        AheadBehind counts;
        if (git_graph_ahead_behind(&counts.ahead, &counts.behind, handle_.get(), &*local_oid, &*upstream_oid) != 0) {
            Logger::instance().debug("ahead/behind failed: {}", last_error_message());
            return std::nullopt;
        }
        return counts;
    }

    std::optional<std::vector<unsigned>> statuses(const StatusQuery& query) override {
        git_status_options options = GIT_STATUS_OPTIONS_INIT;
        options.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
        options.flags = 0;
        if (query.include_untracked) {
            options.flags |= GIT_STATUS_OPT_INCLUDE_UNTRACKED;
        }
        if (query.recurse_untracked_dirs) {
            options.flags |= GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS;
        }
        if (query.renames_head_to_index) {
            options.flags |= GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
        }
        if (query.include_ignored) {
            options.flags |= GIT_STATUS_OPT_INCLUDE_IGNORED;
        }

        git_status_list* raw_list = nullptr;
        if (git_status_list_new(&raw_list, handle_.get(), &options) != 0) {
            Logger::instance().debug("status enumeration failed: {}", last_error_message());
            return std::nullopt;
        }
        StatusListHandle list{raw_list};

        const std::size_t count = git_status_list_entrycount(list.get());
        std::vector<unsigned> values;
        values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            const git_status_entry* entry = git_status_byindex(list.get(), i);
            if (!entry) continue;
            values.push_back(static_cast<unsigned>(entry->status));
        }
        return values;
    }

private:
    RepositoryHandle handle_;
};

class LibGit2Backend : public RepositoryBackend {
public:
    explicit LibGit2Backend(LibGit2Options options)
        : options_{options} {
        initialized_ = git_libgit2_init() >= 0;
        if (!initialized_) {
            Logger::instance().error("failed to initialize libgit2");
        }
    }

    ~LibGit2Backend() override {
        if (initialized_) {
            git_libgit2_shutdown();
        }
    }

    LibGit2Backend(const LibGit2Backend&) = delete;
    LibGit2Backend& operator=(const LibGit2Backend&) = delete;

    std::unique_ptr<Repository> open(const fs::path& path) override {
        if (!initialized_) {
            return nullptr;
        }

        git_repository* raw_repo = nullptr;
        const std::string native = path.string();
        int rc = 0;
        if (options_.discover) {
            rc = git_repository_open_ext(&raw_repo, native.c_str(), GIT_REPOSITORY_OPEN_CROSS_FS, nullptr);
        } else {
            rc = git_repository_open(&raw_repo, native.c_str());
        }
        if (rc != 0) {
            Logger::instance().debug("{} is not a repository: {}", native, last_error_message());
            return nullptr;
        }

        return std::make_unique<LibGit2Repository>(RepositoryHandle{raw_repo});
    }

private:
    LibGit2Options options_;
    bool initialized_ = false;
};

} // namespace

std::unique_ptr<RepositoryBackend> make_libgit2_backend(LibGit2Options options) {
    return std::make_unique<LibGit2Backend>(options);
}

} // namespace gitprompt
