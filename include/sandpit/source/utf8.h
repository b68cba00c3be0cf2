#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file utf8.h
 * @brief Minimal UTF-8 helpers: scripts index strings by code point, storage stays UTF-8.
 */

namespace sandpit::source
{

/** @brief Append the UTF-8 encoding of `cp` to `out`. Invalid code points become U+FFFD. */
inline void append_utf8(std::string& out, char32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        cp = 0xFFFD;
    }
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/** @brief True when every byte is 7-bit ASCII (byte offsets equal code point offsets). */
[[nodiscard]] inline bool is_ascii(std::string_view text)
{
    for (char c : text)
    {
        if (static_cast<unsigned char>(c) >= 0x80)
        {
            return false;
        }
    }
    return true;
}

/** @brief Byte length of the UTF-8 sequence starting with `lead` (1 for stray bytes). */
[[nodiscard]] inline std::size_t utf8_sequence_length(unsigned char lead)
{
    if (lead < 0x80)
    {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0)
    {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0)
    {
        return 4;
    }
    return 1;
}

/** @brief Split `text` into one string per code point. */
[[nodiscard]] inline std::vector<std::string_view> split_code_points(std::string_view text)
{
    std::vector<std::string_view> out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t n = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        if (i + n > text.size())
        {
            n = text.size() - i;
        }
        out.push_back(text.substr(i, n));
        i += n;
    }
    return out;
}

/** @brief Number of code points in `text`. */
[[nodiscard]] inline std::size_t code_point_count(std::string_view text)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        i += utf8_sequence_length(static_cast<unsigned char>(text[i]));
        ++count;
    }
    return count;
}

/** @brief Decode the code point at the start of `text` (U+FFFD for malformed input). */
[[nodiscard]] inline char32_t decode_code_point(std::string_view text)
{
    if (text.empty())
    {
        return 0xFFFD;
    }
    const auto lead = static_cast<unsigned char>(text[0]);
    const std::size_t n = utf8_sequence_length(lead);
    if (n == 1)
    {
        return (lead < 0x80) ? lead : 0xFFFD;
    }
    if (text.size() < n)
    {
        return 0xFFFD;
    }
    char32_t cp = lead & (0xFF >> (n + 1));
    for (std::size_t i = 1; i < n; ++i)
    {
        cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return cp;
}

} // namespace sandpit::source
