#pragma once

#include <sandpit/diag/diagnostic.h>
#include <sandpit/lexer/token.h>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file lexer.h
 * @brief Tokenizes Python-subset source into Token sequences or a diagnostic.
 */

namespace sandpit::lexer
{

/** @brief Result of lexing: token vector on success, diagnostic on failure. */
using LexResult = std::variant<std::vector<Token>, sandpit::diag::Diagnostic>;

/**
 * @brief Lex the provided input into tokens.
 *
 * Logical lines end with a Newline token; block structure is expressed with Indent/Dedent
 * tokens. On success the vector ends with a single Eof token. Token lexemes view `input`.
 */
[[nodiscard]] LexResult lex(std::string_view input);

} // namespace sandpit::lexer
