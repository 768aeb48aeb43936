#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "gitprompt/command.h"

namespace gitprompt {

using CurrentDirProvider = std::function<std::optional<std::filesystem::path>()>;

// Process working directory, or nullopt if it cannot be read.
std::optional<std::filesystem::path> process_current_dir();

// Line protocol for a long-lived host. Each request line is
//   COMMAND[<TAB>CWD]
// and gets exactly one reply line. Requests without CWD use the provider.
// Blank lines and unknown commands reply with an empty line.
class StdioTransport {
public:
    StdioTransport(const CommandRegistry& registry,
                   std::istream& in,
                   std::ostream& out,
                   CurrentDirProvider current_dir = process_current_dir);

    // Serves until end of input; returns the number of requests handled.
    std::size_t serve();

    std::string handle(std::string_view request) const;

private:
    const CommandRegistry& registry_;
    std::istream& in_;
    std::ostream& out_;
    CurrentDirProvider current_dir_;
};

} // namespace gitprompt
