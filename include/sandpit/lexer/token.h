#pragma once

#include <sandpit/source/span.h>
#include <string_view>

namespace sandpit::lexer
{

enum class TokenKind
{
    Eof,

    // Layout
    Newline,
    Indent,
    Dedent,

    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,

    // Keywords (the full Python keyword set, so unsupported statements are recognised)
    KwFalse,
    KwNone,
    KwTrue,
    KwAnd,
    KwAs,
    KwAssert,
    KwAsync,
    KwAwait,
    KwBreak,
    KwClass,
    KwContinue,
    KwDef,
    KwDel,
    KwElif,
    KwElse,
    KwExcept,
    KwFinally,
    KwFor,
    KwFrom,
    KwGlobal,
    KwIf,
    KwImport,
    KwIn,
    KwIs,
    KwLambda,
    KwNonlocal,
    KwNot,
    KwOr,
    KwPass,
    KwRaise,
    KwReturn,
    KwTry,
    KwWhile,
    KwWith,
    KwYield,

    // Punctuation / operators
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,

    Comma,
    Colon,
    Semicolon,
    Dot,
    Arrow,      // ->
    At,         // @
    ColonEqual, // :=

    Equal,      // =
    EqualEqual, // ==
    BangEqual,  // !=
    Less,
    LessEqual,
    Greater,
    GreaterEqual,

    Plus,
    Minus,
    Star,
    StarStar,
    Slash,
    SlashSlash,
    Percent,
    Tilde,
    Amp,
    Pipe,
    Caret,
    LessLess,
    GreaterGreater,

    // Augmented assignment
    PlusEqual,
    MinusEqual,
    StarEqual,
    StarStarEqual,
    SlashEqual,
    SlashSlashEqual,
    PercentEqual,
    AmpEqual,
    PipeEqual,
    CaretEqual,
    LessLessEqual,
    GreaterGreaterEqual,
    AtEqual,
};

struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string_view lexeme;
    sandpit::source::Span span;
};

[[nodiscard]] constexpr bool is_keyword(TokenKind kind)
{
    return kind >= TokenKind::KwFalse && kind <= TokenKind::KwYield;
}

[[nodiscard]] constexpr bool is_augmented_assign(TokenKind kind)
{
    return kind >= TokenKind::PlusEqual && kind <= TokenKind::AtEqual;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Eof:
        return "eof";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::IntLiteral:
        return "int";
    case TokenKind::FloatLiteral:
        return "float";
    case TokenKind::StringLiteral:
        return "string";

    case TokenKind::KwFalse:
        return "kw_False";
    case TokenKind::KwNone:
        return "kw_None";
    case TokenKind::KwTrue:
        return "kw_True";
    case TokenKind::KwAnd:
        return "kw_and";
    case TokenKind::KwAs:
        return "kw_as";
    case TokenKind::KwAssert:
        return "kw_assert";
    case TokenKind::KwAsync:
        return "kw_async";
    case TokenKind::KwAwait:
        return "kw_await";
    case TokenKind::KwBreak:
        return "kw_break";
    case TokenKind::KwClass:
        return "kw_class";
    case TokenKind::KwContinue:
        return "kw_continue";
    case TokenKind::KwDef:
        return "kw_def";
    case TokenKind::KwDel:
        return "kw_del";
    case TokenKind::KwElif:
        return "kw_elif";
    case TokenKind::KwElse:
        return "kw_else";
    case TokenKind::KwExcept:
        return "kw_except";
    case TokenKind::KwFinally:
        return "kw_finally";
    case TokenKind::KwFor:
        return "kw_for";
    case TokenKind::KwFrom:
        return "kw_from";
    case TokenKind::KwGlobal:
        return "kw_global";
    case TokenKind::KwIf:
        return "kw_if";
    case TokenKind::KwImport:
        return "kw_import";
    case TokenKind::KwIn:
        return "kw_in";
    case TokenKind::KwIs:
        return "kw_is";
    case TokenKind::KwLambda:
        return "kw_lambda";
    case TokenKind::KwNonlocal:
        return "kw_nonlocal";
    case TokenKind::KwNot:
        return "kw_not";
    case TokenKind::KwOr:
        return "kw_or";
    case TokenKind::KwPass:
        return "kw_pass";
    case TokenKind::KwRaise:
        return "kw_raise";
    case TokenKind::KwReturn:
        return "kw_return";
    case TokenKind::KwTry:
        return "kw_try";
    case TokenKind::KwWhile:
        return "kw_while";
    case TokenKind::KwWith:
        return "kw_with";
    case TokenKind::KwYield:
        return "kw_yield";

    case TokenKind::LParen:
        return "l_paren";
    case TokenKind::RParen:
        return "r_paren";
    case TokenKind::LBracket:
        return "l_bracket";
    case TokenKind::RBracket:
        return "r_bracket";
    case TokenKind::LBrace:
        return "l_brace";
    case TokenKind::RBrace:
        return "r_brace";

    case TokenKind::Comma:
        return "comma";
    case TokenKind::Colon:
        return "colon";
    case TokenKind::Semicolon:
        return "semicolon";
    case TokenKind::Dot:
        return "dot";
    case TokenKind::Arrow:
        return "arrow";
    case TokenKind::At:
        return "at";
    case TokenKind::ColonEqual:
        return "colon_equal";

    case TokenKind::Equal:
        return "equal";
    case TokenKind::EqualEqual:
        return "equal_equal";
    case TokenKind::BangEqual:
        return "bang_equal";
    case TokenKind::Less:
        return "less";
    case TokenKind::LessEqual:
        return "less_equal";
    case TokenKind::Greater:
        return "greater";
    case TokenKind::GreaterEqual:
        return "greater_equal";

    case TokenKind::Plus:
        return "plus";
    case TokenKind::Minus:
        return "minus";
    case TokenKind::Star:
        return "star";
    case TokenKind::StarStar:
        return "star_star";
    case TokenKind::Slash:
        return "slash";
    case TokenKind::SlashSlash:
        return "slash_slash";
    case TokenKind::Percent:
        return "percent";
    case TokenKind::Tilde:
        return "tilde";
    case TokenKind::Amp:
        return "amp";
    case TokenKind::Pipe:
        return "pipe";
    case TokenKind::Caret:
        return "caret";
    case TokenKind::LessLess:
        return "less_less";
    case TokenKind::GreaterGreater:
        return "greater_greater";

    case TokenKind::PlusEqual:
        return "plus_equal";
    case TokenKind::MinusEqual:
        return "minus_equal";
    case TokenKind::StarEqual:
        return "star_equal";
    case TokenKind::StarStarEqual:
        return "star_star_equal";
    case TokenKind::SlashEqual:
        return "slash_equal";
    case TokenKind::SlashSlashEqual:
        return "slash_slash_equal";
    case TokenKind::PercentEqual:
        return "percent_equal";
    case TokenKind::AmpEqual:
        return "amp_equal";
    case TokenKind::PipeEqual:
        return "pipe_equal";
    case TokenKind::CaretEqual:
        return "caret_equal";
    case TokenKind::LessLessEqual:
        return "less_less_equal";
    case TokenKind::GreaterGreaterEqual:
        return "greater_greater_equal";
    case TokenKind::AtEqual:
        return "at_equal";
    }
    return "unknown";
}

} // namespace sandpit::lexer
