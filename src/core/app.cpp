#include "gitprompt/app.h"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "gitprompt/cli.h"
#include "gitprompt/collector.h"
#include "gitprompt/logger.h"
#include "gitprompt/process.h"
#include "gitprompt/repository.h"
#include "gitprompt/transport.h"

namespace gitprompt {

App::App(std::istream& in, std::ostream& out, std::ostream& err)
    : in_{in}, out_{out}, err_{err} {}

int App::run(int argc, char** argv) {
    Cli cli;
    auto parsed = cli.parse(argc, argv);
    if (parsed.exit_code) {
        return *parsed.exit_code;
    }

    Config& config = Config::instance();
    config.set_program_name(argc > 0 && argv ? argv[0] : "gitprompt");
    config.set_options(std::move(parsed.options));
    Logger::instance().set_level(config.options().log_level);

    auto backend = make_libgit2_backend(config.backend_options());
    ProcessRunner runner;
    StatusCollector collector{*backend, runner, config.collector_options()};

    CommandRegistry registry;
    registry.add(std::make_unique<GitPromptCommand>(collector, config.options().max_git_dir_bytes));

    return execute(config.options(), registry);
}

int App::execute(const Config::Options& options, const CommandRegistry& registry) {
    switch (options.mode) {
        case Config::Mode::ListCommands:
            return list_commands(registry);
        case Config::Mode::Serve:
            return serve(registry);
        case Config::Mode::OneShot:
            break;
    }
    return run_once(options, registry);
}

int App::list_commands(const CommandRegistry& registry) {
    for (const auto& command : registry.commands()) {
        out_ << command->name() << '\t' << command->description() << '\n';
    }
    return 0;
}

int App::serve(const CommandRegistry& registry) {
    StdioTransport transport{registry, in_, out_};
    const auto handled = transport.serve();
    Logger::instance().debug("served {} requests", handled);
    return 0;
}

int App::run_once(const Config::Options& options, const CommandRegistry& registry) {
    CommandContext context;
    context.current_dir = options.working_dir ? options.working_dir : process_current_dir();

    auto reply = registry.dispatch(options.command, context);
    if (!reply) {
        std::string_view program = Config::instance().program_name();
        err_ << (program.empty() ? "gitprompt" : program) << ": unknown command '" << options.command << "'\n";
        return 2;
    }
    out_ << *reply << '\n';
    return 0;
}

} // namespace gitprompt
