#pragma once

#include <cstddef>

/**
 * @file span.h
 * @brief Where a token, statement or violation sits in a submitted script.
 */

namespace sandpit::source
{

/**
 * @brief Half-open byte range `[start, end)` into the script text.
 *
 * Columns are derived later by LineMap; a span never stores line numbers itself.
 */
struct Span
{
    std::size_t start = 0;
    std::size_t end = 0;

    /** @brief Number of script bytes covered; zero for an insertion point. */
    [[nodiscard]] constexpr std::size_t length() const { return end - start; }
};

/** @brief Joins the span of a construct's first token with that of its last. */
[[nodiscard]] constexpr Span cover(const Span& first, const Span& last)
{
    return Span{.start = first.start, .end = (last.end > first.end) ? last.end : first.end};
}

} // namespace sandpit::source
