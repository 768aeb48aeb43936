#include "gitprompt/process.h"

#include <array>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "gitprompt/logger.h"

namespace gitprompt {
namespace {
#ifndef _WIN32
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}
int close_pipe(popen_handle pipe) {
    const int status = ::pclose(pipe.release());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}
constexpr std::string_view kDiscardStderr = " 2>/dev/null";
constexpr std::string_view kChangeDirectory = "cd ";
#else
using popen_handle = std::unique_ptr<FILE, decltype(&_pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(_popen(command.c_str(), "r"), _pclose);
}
int close_pipe(popen_handle pipe) {
    return ::_pclose(pipe.release());
}
constexpr std::string_view kDiscardStderr = " 2>NUL";
constexpr std::string_view kChangeDirectory = "cd /d ";
#endif

// The whole command runs in a subshell so the cd error text is discarded too.
// The directory is made absolute (or ./-prefixed) so cd never consults CDPATH.
std::string build_command(const std::vector<std::string>& argv, const std::filesystem::path& working_dir) {
    std::string command = "(";
    if (!working_dir.empty()) {
        std::error_code ec;
        auto dir = std::filesystem::absolute(working_dir, ec);
        if (ec) {
            dir = std::filesystem::path{"."} / working_dir;
        }
        command += kChangeDirectory;
        command += shell_quote(dir.string());
        command += " && ";
    }
    bool first = true;
    for (const auto& arg : argv) {
        if (!first) {
            command.push_back(' ');
        }
        command += shell_quote(arg);
        first = false;
    }
    command += ')';
    command += kDiscardStderr;
    return command;
}
} // namespace

std::string shell_quote(std::string_view argument) {
#ifndef _WIN32
    std::string result = "'";
    for (char ch : argument) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
#else
    std::string result = "\"";
    for (char ch : argument) {
        if (ch == '"') {
            result += "\\\"";
        } else {
            result += ch;
        }
    }
    result += "\"";
    return result;
#endif
}

std::optional<CommandResult> ProcessRunner::run(const std::vector<std::string>& argv,
                                                const std::filesystem::path& working_dir) {
    if (argv.empty()) {
        return std::nullopt;
    }

    const std::string command = build_command(argv, working_dir);
    Logger::instance().trace("exec: {}", command);

    std::fflush(nullptr);
    auto pipe = make_pipe(command);
    if (!pipe) {
        Logger::instance().debug("failed to launch '{}'", argv.front());
        return std::nullopt;
    }

    CommandResult result;
    std::array<char, 4096> buffer{};
    while (true) {
        std::size_t bytes = std::fread(buffer.data(), 1, buffer.size(), pipe.get());
        if (bytes == 0) {
            break;
        }
        result.output.append(buffer.data(), bytes);
    }

    result.exit_code = close_pipe(std::move(pipe));
    return result;
}

} // namespace gitprompt
