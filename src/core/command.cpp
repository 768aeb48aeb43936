#include "gitprompt/command.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "gitprompt/logger.h"
#include "gitprompt/perf.h"
#include "gitprompt/renderer.h"

namespace gitprompt {

void CommandRegistry::add(std::unique_ptr<Command> command) {
    if (!command) {
        throw std::invalid_argument("cannot register a null command");
    }
    if (find(command->name()) != nullptr) {
        throw std::invalid_argument("command already registered: " + std::string{command->name()});
    }
    commands_.push_back(std::move(command));
}

Command* CommandRegistry::find(std::string_view name) const {
    for (const auto& command : commands_) {
        if (command->name() == name) {
            return command.get();
        }
    }
    return nullptr;
}

std::optional<std::string> CommandRegistry::dispatch(std::string_view name, const CommandContext& context) const {
    Command* command = find(name);
    if (!command) {
        Logger::instance().warn("unknown command '{}'", name);
        return std::nullopt;
    }

    try {
        return command->run(context);
    } catch (const std::exception& ex) {
        Logger::instance().error("{} failed: {}", name, ex.what());
        return std::string{};
    }
}

GitPromptCommand::GitPromptCommand(const StatusCollector& collector, std::uintmax_t max_git_dir_bytes)
    : collector_{collector}, max_git_dir_bytes_{max_git_dir_bytes} {}

std::string_view GitPromptCommand::description() const noexcept {
    return "One line git status output to show in your shell prompt";
}

std::string GitPromptCommand::run(const CommandContext& context) {
    perf::ScopedTimer timer{std::string{kName}};

    if (!context.current_dir) {
        Logger::instance().debug("no current directory");
        return {};
    }
    const auto& dir = *context.current_dir;

    switch (check_working_directory(dir, max_git_dir_bytes_)) {
        case GuardVerdict::Proceed:
            break;
        case GuardVerdict::MissingDirectory:
            Logger::instance().debug("{} is not a directory", dir.string());
            return {};
        case GuardVerdict::OversizedMetadata:
            return {};
    }

    auto snapshot = collector_.collect(dir);
    if (!snapshot) {
        return {};
    }
    return PromptRenderer::render(*snapshot);
}

} // namespace gitprompt
