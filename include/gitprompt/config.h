#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gitprompt/collector.h"
#include "gitprompt/logger.h"
#include "gitprompt/metadata_guard.h"
#include "gitprompt/repository.h"

namespace gitprompt {

class Config {
public:
    enum class Mode {
        OneShot,
        Serve,
        ListCommands
    };

    struct Options {
        Mode mode = Mode::OneShot;
        std::string command{"git_prompt"};
        std::optional<std::filesystem::path> working_dir;

        StatusMatch status_match = StatusMatch::Exact;
        bool show_ignored = false;
        bool discover = false;
        std::uintmax_t max_git_dir_bytes = kDefaultMaxGitDirBytes;

        Logger::Level log_level = Logger::Level::Error;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    // Views of the options for the components they configure.
    CollectorOptions collector_options() const noexcept;
    LibGit2Options backend_options() const noexcept;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

} // namespace gitprompt
