#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * @file log.h
 * @brief Single-line stderr logging: `sandpit: <level>: <message>`.
 *
 * The threshold is read from SANDPIT_LOG (debug, info, warn, error) on first use and defaults
 * to warn. Records from concurrent threads never interleave.
 */

namespace sandpit::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] std::optional<Level> parse_level(std::string_view text);
[[nodiscard]] const char* to_string(Level level);

[[nodiscard]] Level threshold();
void set_threshold(Level level);
[[nodiscard]] bool enabled(Level level);

/** @brief The record text written for `message` at `level`, newline included. */
[[nodiscard]] std::string format_record(Level level, std::string_view message);

void write(Level level, std::string_view message);

inline void debug(std::string_view message)
{
    write(Level::Debug, message);
}
inline void info(std::string_view message)
{
    write(Level::Info, message);
}
inline void warn(std::string_view message)
{
    write(Level::Warn, message);
}
inline void error(std::string_view message)
{
    write(Level::Error, message);
}

} // namespace sandpit::log
