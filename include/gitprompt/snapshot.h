#pragma once

#include <cstdint>
#include <string>

namespace gitprompt {

// Everything the prompt line is rendered from. Built once per request by
// StatusCollector and consumed once by PromptRenderer.
struct StatusSnapshot {
    using Counter = std::uint32_t;

    std::string branch;
    std::string tag;
    std::string remote;

    Counter index_new = 0;
    Counter index_modified = 0;
    Counter index_deleted = 0;
    Counter index_renamed = 0;
    Counter index_typechange = 0;

    Counter wt_new = 0;
    Counter wt_modified = 0;
    Counter wt_deleted = 0;
    Counter wt_renamed = 0;
    Counter wt_typechange = 0;

    Counter ignored = 0;
    Counter conflicted = 0;
    Counter ahead = 0;
    Counter behind = 0;

    const std::string& identity() const noexcept { return tag.empty() ? branch : tag; }

    bool operator==(const StatusSnapshot&) const = default;
};

} // namespace gitprompt
