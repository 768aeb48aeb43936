#include "gitprompt/collector.h"
#include "gitprompt/metadata_guard.h"
#include "gitprompt/renderer.h"
#include "gitprompt/repository.h"

#include "fakes.h"

#include <git2.h>
#include <git2/sys/commit.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

using gitprompt::CollectorOptions;
using gitprompt::PromptRenderer;
using gitprompt::StatusCollector;
using gitprompt::StatusMatch;
using gitprompt::StatusSnapshot;
using gitprompt::testing::FakeRunner;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static void check_git(int rc, std::string_view what) {
  if (rc < 0) {
    const git_error *e = git_error_last();
    throw std::runtime_error(std::string{what} + ": " + (e && e->message ? e->message : "unknown"));
  }
}

static git_oid stage_all(git_repository *repo) {
  git_index *index = nullptr;
  check_git(git_repository_index(&index, repo), "open index");
  git_oid tree_id{};
  int rc = git_index_add_all(index, nullptr, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr);
  if (rc >= 0)
    rc = git_index_write(index);
  if (rc >= 0)
    rc = git_index_write_tree(&tree_id, index);
  git_index_free(index);
  check_git(rc, "stage");
  return tree_id;
}

static git_oid commit(git_repository *repo, const char *update_ref, const git_oid &tree,
                      std::vector<const git_oid *> parents, const char *message) {
  git_signature *sig = nullptr;
  check_git(git_signature_new(&sig, "Prompt Test", "prompt@example.com", 1700000000, 0), "signature");
  git_oid id{};
  const int rc = git_commit_create_from_ids(&id, repo, update_ref, sig, sig, nullptr, message, &tree,
                                            parents.size(), parents.data());
  git_signature_free(sig);
  check_git(rc, "commit");
  return id;
}

static std::string head_shorthand(git_repository *repo) {
  git_reference *head = nullptr;
  check_git(git_repository_head(&head, repo), "head");
  std::string name = git_reference_shorthand(head);
  git_reference_free(head);
  return name;
}

static bool expect_line(const std::optional<StatusSnapshot> &s, const std::string &expected, std::string_view what) {
  if (!s) {
    std::cerr << what << ": expected a snapshot\n";
    return false;
  }
  const auto line = PromptRenderer::render(*s);
  if (line != expected) {
    std::cerr << what << ": expected '" << expected << "' got '" << line << "'\n";
    return false;
  }
  return true;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitprompt_libgit2_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  git_libgit2_init();

  int rc = 0;
  git_repository *repo = nullptr;
  try {
    auto backend = gitprompt::make_libgit2_backend();
    FakeRunner runner;
    StatusCollector collector{*backend, runner};

    const fs::path work = root / "work";
    check_git(git_repository_init(&repo, work.string().c_str(), 0), "init");

    // 1) Unborn HEAD in an empty repository falls back to master
    write_file(work / "a.txt", "one\n");
    {
      auto s = collector.collect(work);
      if (!expect_line(s, " master ?1", "unborn"))
        throw std::runtime_error("unborn");
    }

    // 2) First commit on the default branch, clean tree
    const git_oid tree1 = stage_all(repo);
    const git_oid c1 = commit(repo, "HEAD", tree1, {}, "first\n");
    const std::string branch = head_shorthand(repo);
    {
      auto s = collector.collect(work);
      if (!expect_line(s, " " + branch, "first commit"))
        throw std::runtime_error("first commit");
      if (!s->remote.empty()) {
        std::cerr << "no upstream configured yet, got '" << s->remote << "'\n";
        throw std::runtime_error("remote");
      }
    }

    // 3) Upstream one commit behind the local branch
    {
      git_remote *remote = nullptr;
      check_git(git_remote_create(&remote, repo, "origin", "https://example.invalid/origin.git"), "remote");
      git_remote_free(remote);

      const std::string tracking = "refs/remotes/origin/" + branch;
      git_reference *ref = nullptr;
      check_git(git_reference_create(&ref, repo, tracking.c_str(), &c1, 1, "test"), "tracking ref");
      git_reference_free(ref);

      git_reference *local = nullptr;
      check_git(git_branch_lookup(&local, repo, branch.c_str(), GIT_BRANCH_LOCAL), "lookup");
      const int set_rc = git_branch_set_upstream(local, ("origin/" + branch).c_str());
      git_reference_free(local);
      check_git(set_rc, "set upstream");
    }
    write_file(work / "a.txt", "one\ntwo\n");
    const git_oid tree2 = stage_all(repo);
    const git_oid c2 = commit(repo, "HEAD", tree2, {&c1}, "second\n");
    {
      auto s = collector.collect(work);
      if (!expect_line(s, " " + branch + " \xe2\x86\x91" "1", "ahead"))
        throw std::runtime_error("ahead");
      if (s->remote != "refs/remotes/origin/" + branch) {
        std::cerr << "unexpected remote '" << s->remote << "'\n";
        throw std::runtime_error("remote");
      }
    }

    // 4) Upstream moved to a sibling commit: diverged both ways
    {
      const git_oid c3 = commit(repo, nullptr, tree1, {&c1}, "sibling\n");
      git_reference *ref = nullptr;
      check_git(git_reference_create(&ref, repo, ("refs/remotes/origin/" + branch).c_str(), &c3, 1, "test"),
                "move tracking ref");
      git_reference_free(ref);

      auto s = collector.collect(work);
      if (!expect_line(s, " " + branch + " \xe2\x86\x91" "1 \xe2\x86\x93" "1", "diverged"))
        throw std::runtime_error("diverged");
    }

    // 5) Staged change, then a further working tree edit on the same file
    write_file(work / "a.txt", "one\ntwo\nthree\n");
    stage_all(repo);
    {
      auto s = collector.collect(work);
      if (!s || s->index_modified != 1) {
        std::cerr << "expected one staged modification\n";
        throw std::runtime_error("staged");
      }
    }
    write_file(work / "a.txt", "x\n");
    {
      auto exact = collector.collect(work);
      if (!exact || exact->index_modified != 0 || exact->wt_modified != 0) {
        std::cerr << "composite status should not be counted in exact mode\n";
        throw std::runtime_error("exact");
      }

      CollectorOptions options;
      options.match = StatusMatch::Containment;
      StatusCollector containing{*backend, runner, options};
      auto contained = containing.collect(work);
      if (!contained || contained->index_modified != 1 || contained->wt_modified != 1) {
        std::cerr << "containment should count both sides\n";
        throw std::runtime_error("containment");
      }
    }

    // 6) Detached HEAD at the second commit after restoring a clean tree
    write_file(work / "a.txt", "one\ntwo\n");
    stage_all(repo);
    check_git(git_repository_set_head_detached(repo, &c2), "detach");
    {
      const std::string hash8 = std::string{git_oid_tostr_s(&c2)}.substr(0, 8);
      auto s = collector.collect(work);
      if (!expect_line(s, " " + hash8, "detached"))
        throw std::runtime_error("detached");
    }

    // 7) Subdirectories only resolve with discovery enabled
    fs::create_directories(work / "sub");
    if (collector.collect(work / "sub")) {
      std::cerr << "subdirectory should not open without discovery\n";
      throw std::runtime_error("discover");
    }
    {
      gitprompt::LibGit2Options options;
      options.discover = true;
      auto discovering = gitprompt::make_libgit2_backend(options);
      StatusCollector collector_up{*discovering, runner};
      if (!collector_up.collect(work / "sub")) {
        std::cerr << "discovery should find the parent repository\n";
        throw std::runtime_error("discover");
      }

      // The discovered parent .git is held to the size limit too
      CollectorOptions limited;
      limited.max_git_dir_bytes = 1;
      StatusCollector guarded{*discovering, runner, limited};
      if (guarded.collect(work / "sub")) {
        std::cerr << "oversized parent .git should not render\n";
        throw std::runtime_error("discover size");
      }
      limited.max_git_dir_bytes = gitprompt::kDefaultMaxGitDirBytes;
      StatusCollector roomy{*discovering, runner, limited};
      if (!roomy.collect(work / "sub")) {
        std::cerr << "parent .git within the limit should render\n";
        throw std::runtime_error("discover size");
      }

      // Discovery ignores GIT_DIR and friends from the environment
      ::setenv("GIT_DIR", (root / "no-such-repo").string().c_str(), 1);
      const bool found = collector_up.collect(work / "sub").has_value();
      ::unsetenv("GIT_DIR");
      if (!found) {
        std::cerr << "discovery should not follow GIT_DIR\n";
        throw std::runtime_error("discover env");
      }
    }

    // 8) Plain directory
    fs::create_directories(root / "plain");
    if (collector.collect(root / "plain")) {
      std::cerr << "plain directory is not a repository\n";
      throw std::runtime_error("plain");
    }

    // 9) Bare repository: unborn HEAD, no working tree to enumerate
    {
      git_repository *bare = nullptr;
      check_git(git_repository_init(&bare, (root / "bare.git").string().c_str(), 1), "init bare");
      git_repository_free(bare);

      auto opened = backend->open(root / "bare.git");
      if (!opened || opened->head().outcome == gitprompt::HeadLookup::Outcome::Resolved || !opened->is_empty()) {
        std::cerr << "bare repository should have an unborn HEAD\n";
        throw std::runtime_error("bare");
      }
      if (opened->statuses({})) {
        std::cerr << "bare repository has no status to enumerate\n";
        throw std::runtime_error("bare status");
      }
      if (collector.collect(root / "bare.git")) {
        std::cerr << "bare repository should not render\n";
        throw std::runtime_error("bare collect");
      }
    }

    std::cout << "libgit2_repository OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  git_repository_free(repo);
  git_libgit2_shutdown();
  std::error_code ec;
  fs::remove_all(root, ec);
  return rc;
}
