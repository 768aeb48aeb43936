#include "gitprompt/config.h"

#include <utility>

namespace gitprompt {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

CollectorOptions Config::collector_options() const noexcept {
    CollectorOptions collector;
    collector.match = options_.status_match;
    collector.include_ignored = options_.show_ignored;
    collector.max_git_dir_bytes = options_.max_git_dir_bytes;
    return collector;
}

LibGit2Options Config::backend_options() const noexcept {
    LibGit2Options backend;
    backend.discover = options_.discover;
    return backend;
}

void Config::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace gitprompt
