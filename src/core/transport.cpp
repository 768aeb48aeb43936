#include "gitprompt/transport.h"

#include <istream>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include "gitprompt/logger.h"

namespace gitprompt {

std::optional<std::filesystem::path> process_current_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        Logger::instance().debug("cannot read current directory: {}", ec.message());
        return std::nullopt;
    }
    return cwd;
}

StdioTransport::StdioTransport(const CommandRegistry& registry,
                               std::istream& in,
                               std::ostream& out,
                               CurrentDirProvider current_dir)
    : registry_{registry}, in_{in}, out_{out}, current_dir_{std::move(current_dir)} {}

std::size_t StdioTransport::serve() {
    std::size_t handled = 0;
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out_ << (line.empty() ? std::string{} : handle(line)) << '\n';
        out_.flush();
        ++handled;
    }
    return handled;
}

std::string StdioTransport::handle(std::string_view request) const {
    std::string_view name = request;
    CommandContext context;

    const auto tab = request.find('\t');
    if (tab != std::string_view::npos) {
        name = request.substr(0, tab);
        const auto dir = request.substr(tab + 1);
        if (!dir.empty()) {
            context.current_dir = std::filesystem::path{std::string{dir}};
        }
    }
    if (!context.current_dir && current_dir_) {
        context.current_dir = current_dir_();
    }

    return registry_.dispatch(name, context).value_or(std::string{});
}

} // namespace gitprompt
