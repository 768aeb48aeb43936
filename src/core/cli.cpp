#include "gitprompt/cli.h"

#include <map>
#include <string>

#include "gitprompt/command.h"
#include "gitprompt/version.h"

namespace gitprompt {

namespace {
constexpr std::string_view kDescription =
    "gitprompt: one line git status summary for shell prompts";

const std::map<std::string, StatusMatch>& status_match_map() {
    static const std::map<std::string, StatusMatch> table{
        {"exact", StatusMatch::Exact},
        {"contains", StatusMatch::Containment},
    };
    return table;
}
} // namespace

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "gitprompt")} {
    app_->set_version_flag("--version", std::string{Version::String()});
    app_->footer(R"(Output is empty whenever the directory is not a repository, its .git
directory is larger than --max-git-dir-size, or the status cannot be read.

Serve mode reads one request per line, COMMAND optionally followed by a TAB
and the directory to inspect, and answers each line, blank ones included,
with exactly one line.)");

    app_->add_option("command", options_.command, "Command to run")
        ->type_name("COMMAND")
        ->default_str(std::string{GitPromptCommand::kName});

    add_mode_options();
    add_status_options();
    add_diagnostic_options();
}

Cli::~Cli() = default;

void Cli::add_mode_options() {
    auto mode = app_->add_option_group("Mode");

    auto* serve = mode->add_flag("--serve", serve_, "Answer requests from stdin until end of input");
    auto* list = mode->add_flag("--list-commands", list_commands_, "Print registered commands and exit");
    serve->excludes(list);

    mode->add_option("-C,--cwd", working_dir_, "Inspect PATH instead of the current directory")
        ->type_name("PATH");
}

void Cli::add_status_options() {
    auto status = app_->add_option_group("Status");

    status->add_option("--status-match", options_.status_match,
                       "How entry flags map to counters (exact, contains)")
        ->transform(CLI::CheckedTransformer(status_match_map(), CLI::ignore_case))
        ->default_str("exact");

    status->add_flag("--show-ignored", options_.show_ignored, "Count ignored files");
    status->add_flag("--discover", options_.discover, "Search parent directories for the repository");

    status->add_option("--max-git-dir-size", options_.max_git_dir_bytes,
                       "Skip repositories whose .git directory exceeds BYTES")
        ->type_name("BYTES")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
}

void Cli::add_diagnostic_options() {
    app_->add_option("-v,--log-level", log_level_, "Log verbosity on stderr (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->check([](const std::string& value) -> std::string {
            return Logger::parse_level(value) ? std::string{} : "invalid log level: " + value;
        })
        ->capture_default_str();
}

Cli::Result Cli::parse(int argc, char** argv) {
    Result result;
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& ex) {
        result.exit_code = app_->exit(ex);
        return result;
    }

    if (serve_) {
        options_.mode = Config::Mode::Serve;
    } else if (list_commands_) {
        options_.mode = Config::Mode::ListCommands;
    }
    if (!working_dir_.empty()) {
        options_.working_dir = std::filesystem::path{working_dir_};
    }
    options_.log_level = Logger::parse_level(log_level_).value_or(Logger::Level::Error);

    result.options = options_;
    return result;
}

} // namespace gitprompt
