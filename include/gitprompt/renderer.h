#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gitprompt/snapshot.h"

namespace gitprompt {

// Display groups of the prompt line, in output order. The color names are
// labels for a presentation layer; nothing here emits escape sequences.
enum class Category {
    Remote,
    Identity,
    Staged,     // green
    Unstaged,   // yellow
    Ignored,    // gray
    Conflict    // red
};

std::string_view to_string(Category category) noexcept;

struct Segment {
    Category category;
    std::string text;

    bool operator==(const Segment&) const = default;
};

class PromptRenderer {
public:
    // Non-empty categories in display order.
    static std::vector<Segment> segments(const StatusSnapshot& snapshot);

    // One line with a single leading space. An all-empty snapshot yields " ".
    static std::string render(const StatusSnapshot& snapshot);

    static std::string remote(const StatusSnapshot& snapshot);
    static std::string identity(const StatusSnapshot& snapshot);
    static std::string staged(const StatusSnapshot& snapshot);
    static std::string unstaged(const StatusSnapshot& snapshot);
    static std::string ignored(const StatusSnapshot& snapshot);
    static std::string conflict(const StatusSnapshot& snapshot);
};

} // namespace gitprompt
