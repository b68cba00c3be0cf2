#pragma once

#include <optional>
#include <sandpit/source/span.h>
#include <string>
#include <utility>
#include <vector>

/**
 * @file diagnostic.h
 * @brief Problems found in a script before it runs: lex errors, blocked constructs, syntax.
 *
 * `sandpit check` renders these with a caret line; the engine only keeps the first message.
 */

namespace sandpit::diag
{

enum class Severity
{
    Error,
    Warning,
    Note,
};

/** @brief A follow-up line such as "(line 3)", pointing elsewhere in the script if it can. */
struct Related
{
    std::string message;
    std::optional<sandpit::source::Span> span;
};

struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    std::optional<sandpit::source::Span> span; ///< Absent when the problem has no location.
    std::vector<Related> notes;
};

[[nodiscard]] inline Diagnostic error_at(sandpit::source::Span span, std::string message)
{
    return Diagnostic{
        .severity = Severity::Error, .message = std::move(message), .span = span, .notes = {}};
}

} // namespace sandpit::diag
