#include "gitprompt/renderer.h"

#include <format>
#include <initializer_list>
#include <string>
#include <utility>

#include "gitprompt/string_utils.h"

namespace gitprompt {
namespace {

struct Field {
    std::string_view prefix;
    StatusSnapshot::Counter value;
};

std::string join_fields(std::initializer_list<Field> fields) {
    std::string out;
    for (const auto& field : fields) {
        if (field.value == 0) {
            continue;
        }
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += std::format("{}{}", field.prefix, field.value);
    }
    return out;
}

} // namespace

std::string_view to_string(Category category) noexcept {
    switch (category) {
        case Category::Remote:
            return "remote";
        case Category::Identity:
            return "identity";
        case Category::Staged:
            return "staged";
        case Category::Unstaged:
            return "unstaged";
        case Category::Ignored:
            return "ignored";
        case Category::Conflict:
            return "conflict";
    }
    return "unknown";
}

// Reserved slot: a configured upstream does not currently change the line.
std::string PromptRenderer::remote(const StatusSnapshot&) {
    return {};
}

std::string PromptRenderer::identity(const StatusSnapshot& snapshot) {
    return snapshot.identity();
}

std::string PromptRenderer::staged(const StatusSnapshot& s) {
    return join_fields({
        {"+", s.index_new},
        {"+~", s.index_modified},
        {"+->", s.index_renamed},
        {"+t", s.index_typechange},
    });
}

std::string PromptRenderer::unstaged(const StatusSnapshot& s) {
    return join_fields({
        {"?", s.wt_new},
        {"~", s.wt_modified},
        {"->", s.wt_renamed},
        {"t", s.wt_typechange},
        {"\xe2\x86\x91", s.ahead},
        {"\xe2\x86\x93", s.behind},
    });
}

std::string PromptRenderer::ignored(const StatusSnapshot& s) {
    return join_fields({{"!", s.ignored}});
}

std::string PromptRenderer::conflict(const StatusSnapshot& s) {
    return join_fields({
        {"+-", s.index_deleted},
        {"-", s.wt_deleted},
        {"c", s.conflicted},
    });
}

std::vector<Segment> PromptRenderer::segments(const StatusSnapshot& snapshot) {
    std::vector<Segment> out;
    out.reserve(6);
    auto push = [&out](Category category, std::string text) {
        if (!text.empty()) {
            out.push_back(Segment{category, std::move(text)});
        }
    };

    push(Category::Remote, remote(snapshot));
    push(Category::Identity, identity(snapshot));
    push(Category::Staged, staged(snapshot));
    push(Category::Unstaged, unstaged(snapshot));
    push(Category::Ignored, ignored(snapshot));
    push(Category::Conflict, conflict(snapshot));
    return out;
}

std::string PromptRenderer::render(const StatusSnapshot& snapshot) {
    std::string body;
    for (const auto& segment : segments(snapshot)) {
        if (!body.empty()) {
            body.push_back(' ');
        }
        body += segment.text;
    }
    return " " + std::string{string_utils::trim(body)};
}

} // namespace gitprompt
