#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * @file line_map.h
 * @brief Maps byte offsets to line/column positions within source text.
 */

namespace sandpit::source
{

/** @brief A 1-based line/column pair; columns are counted in bytes. */
struct LineCol
{
    std::size_t line = 1;
    std::size_t col = 1;
};

/**
 * @brief Precomputes line start offsets for fast offset-to-line/col queries.
 *
 * The map keeps a view of the text; the text must outlive the map.
 */
class LineMap
{
  public:
    explicit LineMap(std::string_view text);

    /** @brief Convert a byte offset into a LineCol (1-based). */
    [[nodiscard]] LineCol offset_to_line_col(std::size_t offset) const;
    /** @brief Return the start offset (byte index) of the given 1-based line. */
    [[nodiscard]] std::size_t line_start_offset(std::size_t line) const;
    /** @brief Return the text of a 1-based line without its terminator. */
    [[nodiscard]] std::string_view line_text(std::size_t line) const;
    /** @brief Return the total number of lines in the mapped text. */
    [[nodiscard]] std::size_t line_count() const;

  private:
    std::string_view text_;
    std::vector<std::size_t> line_starts_;
};

} // namespace sandpit::source
