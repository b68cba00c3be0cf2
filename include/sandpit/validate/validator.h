#pragma once

#include <sandpit/diag/diagnostic.h>
#include <sandpit/source/span.h>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file validator.h
 * @brief Static blocklist check run over submitted source before anything executes.
 *
 * The check is structural: it walks the lexer's token stream, so the word `import` inside a
 * comment or string is fine while the keyword is not. Runtime-constructed capability access is
 * out of reach of a static check; the restricted namespace is the second line of defense.
 */

namespace sandpit::validate
{

enum class ViolationKind
{
    Import,
    ReservedName,
};

/** @brief The first disallowed construct found, in source order. */
struct Violation
{
    ViolationKind kind = ViolationKind::Import;
    std::string reason;
    sandpit::source::Span span;
};

struct Accepted
{
};

using ValidationResult = std::variant<Accepted, Violation>;

/** @brief Validate `source`. Side-effect free. */
[[nodiscard]] ValidationResult validate(std::string_view source);

/** @brief True for `__name__`-style identifiers (two leading and two trailing underscores). */
[[nodiscard]] bool is_dunder(std::string_view name);

/** @brief Convert a violation into a diagnostic for rendering. */
[[nodiscard]] sandpit::diag::Diagnostic to_diagnostic(const Violation& violation);

} // namespace sandpit::validate
