#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gitprompt/collector.h"
#include "gitprompt/metadata_guard.h"

namespace gitprompt {

struct CommandContext {
    // Caller's working directory; nullopt when the host could not report one.
    std::optional<std::filesystem::path> current_dir;
};

class Command {
public:
    virtual ~Command() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual std::string_view description() const noexcept = 0;
    virtual std::string run(const CommandContext& context) = 0;
};

class CommandRegistry {
public:
    // Throws std::invalid_argument on a duplicate name.
    void add(std::unique_ptr<Command> command);

    Command* find(std::string_view name) const;
    const std::vector<std::unique_ptr<Command>>& commands() const noexcept { return commands_; }

    // nullopt for an unknown name. A command that throws yields "".
    std::optional<std::string> dispatch(std::string_view name, const CommandContext& context) const;

private:
    std::vector<std::unique_ptr<Command>> commands_;
};

// Guards, collects and renders the prompt line for the context directory.
class GitPromptCommand : public Command {
public:
    static constexpr std::string_view kName = "git_prompt";

    explicit GitPromptCommand(const StatusCollector& collector,
                              std::uintmax_t max_git_dir_bytes = kDefaultMaxGitDirBytes);

    std::string_view name() const noexcept override { return kName; }
    std::string_view description() const noexcept override;
    std::string run(const CommandContext& context) override;

private:
    const StatusCollector& collector_;
    std::uintmax_t max_git_dir_bytes_;
};

} // namespace gitprompt
