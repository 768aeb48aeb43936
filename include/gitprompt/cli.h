#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <optional>
#include <string>

#include "gitprompt/config.h"

namespace gitprompt {

class Cli {
public:
    struct Result {
        Config::Options options;
        // Set when the process should exit right away (help, version, bad usage).
        std::optional<int> exit_code;
    };

    Cli();
    ~Cli();

    Result parse(int argc, char** argv);

private:
    void add_mode_options();
    void add_status_options();
    void add_diagnostic_options();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::string working_dir_;
    std::string log_level_{"error"};
    bool serve_ = false;
    bool list_commands_ = false;
};

} // namespace gitprompt
