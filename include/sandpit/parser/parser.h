#pragma once

#include <sandpit/diag/diagnostic.h>
#include <sandpit/lexer/token.h>
#include <sandpit/parser/ast.h>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file parser.h
 * @brief Public parser API returning parse results or diagnostics.
 */

namespace sandpit::parser
{

/** @brief Result of parsing: either a Program or diagnostics (the first syntax error). */
using ParseResult = std::variant<Program, std::vector<sandpit::diag::Diagnostic>>;

/** @brief Parse a sequence of tokens (as produced by `lexer::lex`) into a Program. */
[[nodiscard]] ParseResult parse(std::span<const sandpit::lexer::Token> tokens);

/** @brief Lex and parse `source` in one step; lexer errors are returned as diagnostics. */
[[nodiscard]] ParseResult parse_source(std::string_view source);

/** @brief Dump a Program to a compact s-expression string (for debugging/tests). */
[[nodiscard]] std::string dump(const Program& program);

} // namespace sandpit::parser
