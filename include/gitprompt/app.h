#pragma once

#include <iosfwd>

#include "gitprompt/command.h"
#include "gitprompt/config.h"

namespace gitprompt {

// Binds the command line, the libgit2 backend and the command registry to a
// set of process streams.
class App {
public:
    App(std::istream& in, std::ostream& out, std::ostream& err);

    // Parses argv, registers git_prompt and runs the selected mode.
    int run(int argc, char** argv);

    // Runs options.mode against registry. Returns 2 for an unknown command.
    int execute(const Config::Options& options, const CommandRegistry& registry);

private:
    int list_commands(const CommandRegistry& registry);
    int serve(const CommandRegistry& registry);
    int run_once(const Config::Options& options, const CommandRegistry& registry);

    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace gitprompt
