#include "gitprompt/metadata_guard.h"

#include <system_error>

#include "gitprompt/logger.h"
#include "gitprompt/perf.h"

namespace fs = std::filesystem;

namespace gitprompt {

std::uintmax_t directory_size(const fs::path& dir, std::optional<std::uintmax_t> limit) {
    std::uintmax_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it{dir, fs::directory_options::skip_permission_denied, ec};
    if (ec) {
        Logger::instance().debug("cannot walk {}: {}", dir.string(), ec.message());
        return 0;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        const auto status = it->symlink_status(entry_ec);
        if (!entry_ec && fs::is_regular_file(status)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += size;
                if (limit && total > *limit) {
                    break;
                }
            }
        }

        it.increment(ec);
        if (ec) {
            // The iterator is unusable after a failed increment.
            Logger::instance().debug("walk of {} stopped early: {}", dir.string(), ec.message());
            break;
        }
    }
    return total;
}

GuardVerdict check_working_directory(const fs::path& working_dir, std::uintmax_t max_git_dir_bytes) {
    std::error_code ec;
    if (working_dir.empty() || !fs::is_directory(working_dir, ec) || ec) {
        return GuardVerdict::MissingDirectory;
    }

    const fs::path git_dir = working_dir / ".git";
    if (!fs::is_directory(git_dir, ec) || ec) {
        return GuardVerdict::Proceed;
    }

    perf::ScopedTimer timer{"git dir scan"};
    const std::uintmax_t size = directory_size(git_dir, max_git_dir_bytes);
    if (size > max_git_dir_bytes) {
        Logger::instance().debug("{} holds more than {} bytes, skipping", git_dir.string(), max_git_dir_bytes);
        return GuardVerdict::OversizedMetadata;
    }
    return GuardVerdict::Proceed;
}

} // namespace gitprompt
