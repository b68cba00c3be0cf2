#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <sandpit/lexer/lexer.h>
#include <string>
#include <utility>

namespace sandpit::lexer
{
namespace
{

constexpr std::size_t kTabWidth = 8;

struct Keyword
{
    std::string_view text;
    TokenKind kind;
};

constexpr std::array<Keyword, 35> kKeywords = {{
    {"False", TokenKind::KwFalse},       {"None", TokenKind::KwNone},
    {"True", TokenKind::KwTrue},         {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},             {"assert", TokenKind::KwAssert},
    {"async", TokenKind::KwAsync},       {"await", TokenKind::KwAwait},
    {"break", TokenKind::KwBreak},       {"class", TokenKind::KwClass},
    {"continue", TokenKind::KwContinue}, {"def", TokenKind::KwDef},
    {"del", TokenKind::KwDel},           {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},         {"except", TokenKind::KwExcept},
    {"finally", TokenKind::KwFinally},   {"for", TokenKind::KwFor},
    {"from", TokenKind::KwFrom},         {"global", TokenKind::KwGlobal},
    {"if", TokenKind::KwIf},             {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},             {"is", TokenKind::KwIs},
    {"lambda", TokenKind::KwLambda},     {"nonlocal", TokenKind::KwNonlocal},
    {"not", TokenKind::KwNot},           {"or", TokenKind::KwOr},
    {"pass", TokenKind::KwPass},         {"raise", TokenKind::KwRaise},
    {"return", TokenKind::KwReturn},     {"try", TokenKind::KwTry},
    {"while", TokenKind::KwWhile},       {"with", TokenKind::KwWith},
    {"yield", TokenKind::KwYield},
}};

struct Operator
{
    std::string_view text;
    TokenKind kind;
};

// Longest operators first so the first match wins.
constexpr std::array<Operator, 46> kOperators = {{
    {"**=", TokenKind::StarStarEqual},
    {"//=", TokenKind::SlashSlashEqual},
    {"<<=", TokenKind::LessLessEqual},
    {">>=", TokenKind::GreaterGreaterEqual},
    {"**", TokenKind::StarStar},
    {"//", TokenKind::SlashSlash},
    {"==", TokenKind::EqualEqual},
    {"!=", TokenKind::BangEqual},
    {"<=", TokenKind::LessEqual},
    {">=", TokenKind::GreaterEqual},
    {"<<", TokenKind::LessLess},
    {">>", TokenKind::GreaterGreater},
    {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},
    {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},
    {"%=", TokenKind::PercentEqual},
    {"&=", TokenKind::AmpEqual},
    {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},
    {"@=", TokenKind::AtEqual},
    {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonEqual},
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"}", TokenKind::RBrace},
    {",", TokenKind::Comma},
    {":", TokenKind::Colon},
    {";", TokenKind::Semicolon},
    {".", TokenKind::Dot},
    {"@", TokenKind::At},
    {"=", TokenKind::Equal},
    {"<", TokenKind::Less},
    {">", TokenKind::Greater},
    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Star},
    {"/", TokenKind::Slash},
    {"%", TokenKind::Percent},
    {"~", TokenKind::Tilde},
    {"&", TokenKind::Amp},
    {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},
}};

class Lexer
{
  public:
    explicit Lexer(std::string_view input) : input_(input) {}

    [[nodiscard]] LexResult lex_all()
    {
        while (true)
        {
            if (at_line_start_ && paren_depth_ == 0)
            {
                if (auto err = handle_indentation())
                {
                    return *err;
                }
                if (is_at_end())
                {
                    return finish();
                }
                if (at_line_start_)
                {
                    // Blank or comment-only line consumed.
                    continue;
                }
            }

            if (auto err = skip_trivia())
            {
                return *err;
            }

            if (is_at_end())
            {
                return finish();
            }

            const std::size_t start = pos_;
            const char c = peek();

            if (c == '\n' || c == '\r')
            {
                consume_line_break();
                if (paren_depth_ == 0)
                {
                    tokens_.push_back(make_token(TokenKind::Newline, start, pos_));
                    at_line_start_ = true;
                }
                continue;
            }

            if (is_ident_start(c))
            {
                advance();
                while (!is_at_end() && is_ident_continue(peek()))
                {
                    advance();
                }
                const std::string_view word = input_.substr(start, pos_ - start);
                if (!is_at_end() && (peek() == '"' || peek() == '\'') && is_string_prefix(word))
                {
                    if (auto err = lex_string(start))
                    {
                        return *err;
                    }
                    continue;
                }
                tokens_.push_back(
                    Token{.kind = keyword_or_ident(word), .lexeme = word, .span = {start, pos_}});
                continue;
            }

            if (is_digit(c) || (c == '.' && is_digit(peek_next())))
            {
                if (auto err = lex_number(start))
                {
                    return *err;
                }
                continue;
            }

            if (c == '"' || c == '\'')
            {
                if (auto err = lex_string(start))
                {
                    return *err;
                }
                continue;
            }

            if (auto err = lex_operator(start))
            {
                return *err;
            }
        }
    }

  private:
    std::string_view input_;
    std::size_t pos_ = 0;
    static constexpr std::size_t kMaxNesting = 200;
    std::size_t paren_depth_ = 0;
    bool at_line_start_ = true;
    std::vector<std::size_t> indents_{0};
    std::vector<Token> tokens_;

    [[nodiscard]] bool is_at_end() const { return pos_ >= input_.size(); }
    [[nodiscard]] char peek() const { return input_[pos_]; }

    [[nodiscard]] char peek_next() const
    {
        const std::size_t n = pos_ + 1;
        return (n < input_.size()) ? input_[n] : '\0';
    }

    void advance() { ++pos_; }

    static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    static bool is_ident_start(char c)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        // Bytes >= 0x80 belong to UTF-8 encoded identifier characters.
        return (std::isalpha(uc) != 0) || c == '_' || uc >= 0x80;
    }

    static bool is_ident_continue(char c)
    {
        return is_ident_start(c) || is_digit(c);
    }

    static bool is_string_prefix(std::string_view word)
    {
        if (word.size() > 2)
        {
            return false;
        }
        std::string lower;
        for (char ch : word)
        {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return lower == "r" || lower == "u" || lower == "f" || lower == "b" || lower == "rf" ||
               lower == "fr" || lower == "rb" || lower == "br";
    }

    static TokenKind keyword_or_ident(std::string_view word)
    {
        for (const auto& kw : kKeywords)
        {
            if (kw.text == word)
            {
                return kw.kind;
            }
        }
        return TokenKind::Identifier;
    }

    [[nodiscard]] Token make_token(TokenKind kind, std::size_t start, std::size_t end) const
    {
        return Token{
            .kind = kind, .lexeme = input_.substr(start, end - start), .span = {start, end}};
    }

    [[nodiscard]] sandpit::diag::Diagnostic make_error(std::size_t start, std::size_t end,
                                                       std::string_view message) const
    {
        return sandpit::diag::error_at(sandpit::source::Span{start, end}, std::string(message));
    }

    void consume_line_break()
    {
        if (peek() == '\r')
        {
            advance();
            if (!is_at_end() && peek() == '\n')
            {
                advance();
            }
            return;
        }
        advance();
    }

    [[nodiscard]] LexResult finish()
    {
        const std::size_t end = input_.size();
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline &&
            tokens_.back().kind != TokenKind::Dedent)
        {
            tokens_.push_back(Token{.kind = TokenKind::Newline, .lexeme = {}, .span = {end, end}});
        }
        while (indents_.size() > 1)
        {
            indents_.pop_back();
            tokens_.push_back(Token{.kind = TokenKind::Dedent, .lexeme = {}, .span = {end, end}});
        }
        tokens_.push_back(Token{.kind = TokenKind::Eof, .lexeme = {}, .span = {end, end}});
        return std::move(tokens_);
    }

    // Measures the indentation of a new physical line. Blank and comment-only lines are
    // consumed entirely and leave `at_line_start_` set.
    [[nodiscard]] std::optional<sandpit::diag::Diagnostic> handle_indentation()
    {
        std::size_t column = 0;
        const std::size_t line_start = pos_;
        while (!is_at_end())
        {
            const char c = peek();
            if (c == ' ')
            {
                ++column;
            }
            else if (c == '\t')
            {
                column = (column / kTabWidth + 1) * kTabWidth;
            }
            else if (c == '\f')
            {
                column = 0;
            }
            else
            {
                break;
            }
            advance();
        }

        if (is_at_end())
        {
            return std::nullopt;
        }

        const char c = peek();
        if (c == '#')
        {
            while (!is_at_end() && peek() != '\n' && peek() != '\r')
            {
                advance();
            }
            if (!is_at_end())
            {
                consume_line_break();
            }
            return std::nullopt;
        }
        if (c == '\n' || c == '\r')
        {
            consume_line_break();
            return std::nullopt;
        }
        if (c == '\\' && (peek_next() == '\n' || peek_next() == '\r'))
        {
            // A continuation on an otherwise empty line joins with the next one.
            advance();
            consume_line_break();
            return std::nullopt;
        }

        at_line_start_ = false;
        const sandpit::source::Span span{line_start, pos_};
        if (column > indents_.back())
        {
            indents_.push_back(column);
            tokens_.push_back(Token{.kind = TokenKind::Indent,
                                    .lexeme = input_.substr(line_start, pos_ - line_start),
                                    .span = span});
            return std::nullopt;
        }

        while (column < indents_.back())
        {
            indents_.pop_back();
            tokens_.push_back(Token{.kind = TokenKind::Dedent, .lexeme = {}, .span = {pos_, pos_}});
        }
        if (column != indents_.back())
        {
            return make_error(line_start, pos_,
                              "unindent does not match any outer indentation level");
        }
        return std::nullopt;
    }

    // Skips spaces, comments and explicit line joins inside a logical line.
    [[nodiscard]] std::optional<sandpit::diag::Diagnostic> skip_trivia()
    {
        while (!is_at_end())
        {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\f')
            {
                advance();
                continue;
            }
            if (c == '#')
            {
                while (!is_at_end() && peek() != '\n' && peek() != '\r')
                {
                    advance();
                }
                continue;
            }
            if (c == '\\')
            {
                const char next = peek_next();
                if (next == '\n' || next == '\r')
                {
                    advance();
                    consume_line_break();
                    continue;
                }
                return make_error(pos_, pos_ + 1,
                                  "unexpected character after line continuation character");
            }
            if ((c == '\n' || c == '\r') && paren_depth_ > 0)
            {
                consume_line_break();
                continue;
            }
            break;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<sandpit::diag::Diagnostic> lex_number(std::size_t start)
    {
        bool is_float = false;
        const char first = peek();
        const char second = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_next())));
        if (first == '0' && (second == 'x' || second == 'o' || second == 'b'))
        {
            pos_ += 2;
            const std::size_t digits_start = pos_;
            while (!is_at_end() && (std::isalnum(static_cast<unsigned char>(peek())) != 0 ||
                                    peek() == '_'))
            {
                advance();
            }
            if (pos_ == digits_start)
            {
                return make_error(start, pos_, "invalid number literal");
            }
            tokens_.push_back(make_token(TokenKind::IntLiteral, start, pos_));
            return std::nullopt;
        }

        while (!is_at_end() && (is_digit(peek()) || peek() == '_'))
        {
            advance();
        }
        if (!is_at_end() && peek() == '.')
        {
            is_float = true;
            advance();
            while (!is_at_end() && (is_digit(peek()) || peek() == '_'))
            {
                advance();
            }
        }
        if (!is_at_end() && (peek() == 'e' || peek() == 'E'))
        {
            const std::size_t save = pos_;
            advance();
            if (!is_at_end() && (peek() == '+' || peek() == '-'))
            {
                advance();
            }
            if (is_at_end() || !is_digit(peek()))
            {
                pos_ = save;
            }
            else
            {
                is_float = true;
                while (!is_at_end() && (is_digit(peek()) || peek() == '_'))
                {
                    advance();
                }
            }
        }
        if (!is_at_end() && (peek() == 'j' || peek() == 'J'))
        {
            return make_error(start, pos_ + 1, "complex numbers are not supported");
        }
        if (!is_at_end() && is_ident_start(peek()))
        {
            return make_error(start, pos_ + 1, "invalid decimal literal");
        }

        const std::string_view text = input_.substr(start, pos_ - start);
        if (!is_float && text.size() > 1 && text[0] == '0' &&
            text.find_first_not_of("0_") != std::string_view::npos)
        {
            return make_error(start, pos_,
                              "leading zeros in decimal integer literals are not permitted");
        }
        tokens_.push_back(
            make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start, pos_));
        return std::nullopt;
    }

    // Lexes a string literal whose optional prefix starts at `start`; pos_ is at the quote.
    [[nodiscard]] std::optional<sandpit::diag::Diagnostic> lex_string(std::size_t start)
    {
        for (std::size_t i = start; i < pos_; ++i)
        {
            if (input_[i] == 'b' || input_[i] == 'B')
            {
                return make_error(start, pos_ + 1, "byte strings are not supported");
            }
        }

        const char quote = peek();
        const bool triple = pos_ + 2 < input_.size() && input_[pos_ + 1] == quote &&
                            input_[pos_ + 2] == quote;
        pos_ += triple ? 3 : 1;

        while (!is_at_end())
        {
            const char ch = peek();
            if (ch == '\\')
            {
                advance();
                if (is_at_end())
                {
                    break;
                }
                if (peek() == '\r')
                {
                    consume_line_break();
                }
                else
                {
                    advance();
                }
                continue;
            }
            if (ch == quote)
            {
                if (!triple)
                {
                    advance();
                    tokens_.push_back(make_token(TokenKind::StringLiteral, start, pos_));
                    return std::nullopt;
                }
                if (pos_ + 2 < input_.size() && input_[pos_ + 1] == quote &&
                    input_[pos_ + 2] == quote)
                {
                    pos_ += 3;
                    tokens_.push_back(make_token(TokenKind::StringLiteral, start, pos_));
                    return std::nullopt;
                }
                advance();
                continue;
            }
            if ((ch == '\n' || ch == '\r') && !triple)
            {
                return make_error(start, pos_, "unterminated string literal");
            }
            advance();
        }

        return make_error(start, pos_,
                          triple ? "unterminated triple-quoted string literal"
                                 : "unterminated string literal");
    }

    [[nodiscard]] std::optional<sandpit::diag::Diagnostic> lex_operator(std::size_t start)
    {
        const std::string_view rest = input_.substr(pos_);
        for (const auto& op : kOperators)
        {
            if (rest.substr(0, op.text.size()) != op.text)
            {
                continue;
            }
            pos_ += op.text.size();
            switch (op.kind)
            {
            case TokenKind::LParen:
            case TokenKind::LBracket:
            case TokenKind::LBrace:
                ++paren_depth_;
                if (paren_depth_ > kMaxNesting)
                {
                    return make_error(start, pos_, "too many nested parentheses");
                }
                break;
            case TokenKind::RParen:
            case TokenKind::RBracket:
            case TokenKind::RBrace:
                if (paren_depth_ > 0)
                {
                    --paren_depth_;
                }
                break;
            default:
                break;
            }
            tokens_.push_back(make_token(op.kind, start, pos_));
            return std::nullopt;
        }

        advance();
        return make_error(start, pos_, "invalid character in source");
    }
};

} // namespace

LexResult lex(std::string_view input)
{
    return Lexer(input).lex_all();
}

} // namespace sandpit::lexer
