#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitprompt {

struct CommandResult {
    int exit_code = -1;
    std::string output;

    bool succeeded() const noexcept { return exit_code == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] with the remaining arguments inside working_dir and
    // captures standard output. Returns nullopt if the process could not be
    // launched. Standard error is discarded.
    virtual std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                             const std::filesystem::path& working_dir) = 0;
};

// popen-based runner going through the platform shell.
class ProcessRunner : public CommandRunner {
public:
    std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                     const std::filesystem::path& working_dir) override;
};

std::string shell_quote(std::string_view argument);

} // namespace gitprompt
