#include "chatvault/pipeline/title_derivation.hpp"

namespace chatvault::pipeline {

namespace {

bool IsSpace(const char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool IsContinuationByte(const char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string CollapseWhitespace(std::string_view text) {
    std::string collapsed;
    collapsed.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (IsSpace(c)) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(c);
    }
    return collapsed;
}

} // namespace

size_t CountCodePoints(std::string_view text) noexcept {
    size_t count = 0;
    for (const char c : text) {
        if (!IsContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> DeriveTitle(std::string_view text, const size_t max_length, std::string_view marker) {
    std::string title = CollapseWhitespace(text);
    if (title.empty()) {
        return std::nullopt;
    }
    if (CountCodePoints(title) <= max_length) {
        return title;
    }

    // Byte offset of the first code point past the limit
    size_t seen = 0;
    size_t cut = 0;
    for (; cut < title.size(); ++cut) {
        if (!IsContinuationByte(title[cut])) {
            if (seen == max_length) {
                break;
            }
            ++seen;
        }
    }
    title.resize(cut);
    while (!title.empty() && title.back() == ' ') {
        title.pop_back();
    }
    title.append(marker);
    return title;
}

} // namespace chatvault::pipeline
