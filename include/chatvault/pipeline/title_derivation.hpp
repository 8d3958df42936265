#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chatvault::pipeline {

/**
 * @brief Session title candidate from the first user message
 *
 * Surrounding whitespace is trimmed and every internal whitespace run
 * (newlines and tabs included) becomes one space. Text longer than
 * @p max_length code points is cut to that many code points, right-trimmed
 * and suffixed with @p marker.
 *
 * @return nullopt when nothing but whitespace remains
 */
[[nodiscard]] std::optional<std::string> DeriveTitle(
    std::string_view text,
    size_t max_length,
    std::string_view marker);

/** Number of UTF-8 code points; stray continuation bytes are not counted. */
[[nodiscard]] size_t CountCodePoints(std::string_view text) noexcept;

} // namespace chatvault::pipeline
