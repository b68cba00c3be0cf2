#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <sandpit/lexer/lexer.h>
#include <sandpit/validate/validator.h>
#include <vector>

namespace sandpit::validate
{
namespace
{

using sandpit::lexer::Token;
using sandpit::lexer::TokenKind;
using sandpit::source::Span;

bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

Violation import_violation(Span span)
{
    return Violation{.kind = ViolationKind::Import,
                     .reason = "import statements are not allowed",
                     .span = span};
}

Violation reserved_violation(Span span, std::string_view name)
{
    return Violation{.kind = ViolationKind::ReservedName,
                     .reason = "reserved name '" + std::string(name) + "' is not allowed",
                     .span = span};
}

// Finds the first `__ident__` run inside `text`; returns its offset and length.
std::optional<std::pair<std::size_t, std::size_t>> find_dunder(std::string_view text)
{
    std::size_t i = 0;
    while (i + 1 < text.size())
    {
        if (text[i] != '_' || text[i + 1] != '_')
        {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && is_ident_char(text[j]))
        {
            ++j;
        }
        const std::string_view word = text.substr(i, j - i);
        if (is_dunder(word))
        {
            return std::make_pair(i, word.size());
        }
        i = (j > i) ? j : i + 1;
    }
    return std::nullopt;
}

// Used when the source does not tokenize: whole-word `import` or any `__` rejects.
ValidationResult textual_scan(std::string_view source)
{
    constexpr std::string_view kImport = "import";
    std::optional<Violation> first;

    for (std::size_t pos = source.find(kImport); pos != std::string_view::npos;
         pos = source.find(kImport, pos + 1))
    {
        const bool left_ok = pos == 0 || !is_ident_char(source[pos - 1]);
        const std::size_t after = pos + kImport.size();
        const bool right_ok = after >= source.size() || !is_ident_char(source[after]);
        if (left_ok && right_ok)
        {
            first = import_violation(Span{pos, after});
            break;
        }
    }

    const std::size_t dunder = source.find("__");
    if (dunder != std::string_view::npos && (!first.has_value() || dunder < first->span.start))
    {
        std::size_t end = dunder;
        while (end < source.size() && is_ident_char(source[end]))
        {
            ++end;
        }
        first = reserved_violation(Span{dunder, end}, source.substr(dunder, end - dunder));
    }

    if (first.has_value())
    {
        return *first;
    }
    return Accepted{};
}

} // namespace

bool is_dunder(std::string_view name)
{
    if (name.size() < 5 || !name.starts_with("__") || !name.ends_with("__"))
    {
        return false;
    }
    const std::string_view inner = name.substr(2, name.size() - 4);
    for (char c : inner)
    {
        if (!is_ident_char(c))
        {
            return false;
        }
    }
    return true;
}

ValidationResult validate(std::string_view source)
{
    auto lexed = sandpit::lexer::lex(source);
    if (std::holds_alternative<sandpit::diag::Diagnostic>(lexed))
    {
        return textual_scan(source);
    }

    const auto& tokens = std::get<std::vector<Token>>(lexed);
    for (const auto& token : tokens)
    {
        switch (token.kind)
        {
        case TokenKind::KwImport:
            return import_violation(token.span);
        case TokenKind::Identifier:
            if (token.lexeme.starts_with("__"))
            {
                return reserved_violation(token.span, token.lexeme);
            }
            break;
        case TokenKind::StringLiteral:
            if (auto hit = find_dunder(token.lexeme))
            {
                const Span span{token.span.start + hit->first,
                                token.span.start + hit->first + hit->second};
                return reserved_violation(span, token.lexeme.substr(hit->first, hit->second));
            }
            break;
        default:
            break;
        }
    }
    return Accepted{};
}

sandpit::diag::Diagnostic to_diagnostic(const Violation& violation)
{
    return sandpit::diag::error_at(violation.span, violation.reason);
}

} // namespace sandpit::validate
