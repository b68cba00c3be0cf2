#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <sandpit/lexer/lexer.h>
#include <sandpit/parser/parser.h>
#include <sandpit/source/utf8.h>
#include <set>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sandpit::parser
{
namespace
{

using sandpit::diag::Diagnostic;
using sandpit::lexer::Token;
using sandpit::lexer::TokenKind;
using sandpit::source::Span;

template <typename T> using Result = std::variant<T, Diagnostic>;

Span span_cover(const Span& a, const Span& b)
{
    return sandpit::source::cover(a, b);
}

Expr make_expr(Span span, auto node)
{
    return Expr{.span = span, .node = std::move(node)};
}

ExprPtr boxed(Expr expr)
{
    return std::make_unique<Expr>(std::move(expr));
}

// ---------------------------------------------------------------------------
// Literal decoding
// ---------------------------------------------------------------------------

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

// Decodes backslash escapes of a non-raw literal body. `base` is the byte offset of `body`
// within the source, used for error spans.
Result<std::string> unescape(std::string_view body, bool raw, std::size_t base)
{
    std::string out;
    out.reserve(body.size());
    std::size_t i = 0;
    while (i < body.size())
    {
        const char c = body[i];
        if (c == '\r')
        {
            // Source newlines inside triple-quoted strings are normalised to '\n'.
            out.push_back('\n');
            i += (i + 1 < body.size() && body[i + 1] == '\n') ? 2 : 1;
            continue;
        }
        if (c != '\\' || raw)
        {
            out.push_back(c);
            ++i;
            continue;
        }
        if (i + 1 >= body.size())
        {
            out.push_back('\\');
            ++i;
            continue;
        }

        const std::size_t esc_start = i;
        const char e = body[i + 1];
        i += 2;
        switch (e)
        {
        case '\n':
            break;
        case '\r':
            if (i < body.size() && body[i] == '\n')
            {
                ++i;
            }
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '\'':
            out.push_back('\'');
            break;
        case '"':
            out.push_back('"');
            break;
        case 'a':
            out.push_back('\a');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'v':
            out.push_back('\v');
            break;
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        {
            char32_t cp = static_cast<char32_t>(e - '0');
            for (int k = 0; k < 2 && i < body.size() && body[i] >= '0' && body[i] <= '7'; ++k)
            {
                cp = cp * 8 + static_cast<char32_t>(body[i] - '0');
                ++i;
            }
            sandpit::source::append_utf8(out, cp);
            break;
        }
        case 'x':
        case 'u':
        case 'U':
        {
            const std::size_t digits = (e == 'x') ? 2 : (e == 'u') ? 4 : 8;
            char32_t cp = 0;
            for (std::size_t k = 0; k < digits; ++k)
            {
                const int v = (i < body.size()) ? hex_value(body[i]) : -1;
                if (v < 0)
                {
                    return sandpit::diag::error_at(
                        Span{base + esc_start, base + i},
                        std::string("truncated \\") + e + " escape in string literal");
                }
                cp = cp * 16 + static_cast<char32_t>(v);
                ++i;
            }
            if (cp > 0x10FFFF)
            {
                return sandpit::diag::error_at(Span{base + esc_start, base + i},
                                               "illegal Unicode character in string literal");
            }
            sandpit::source::append_utf8(out, cp);
            break;
        }
        case 'N':
            return sandpit::diag::error_at(Span{base + esc_start, base + i},
                                           "named Unicode escapes are not supported");
        default:
            // Unknown escapes are kept verbatim.
            out.push_back('\\');
            out.push_back(e);
            break;
        }
    }
    return out;
}

struct LiteralShape
{
    bool raw = false;
    bool formatted = false;
    std::string_view body;
    std::size_t body_offset = 0;
};

LiteralShape literal_shape(const Token& token)
{
    const std::string_view lexeme = token.lexeme;
    std::size_t prefix = 0;
    LiteralShape shape;
    while (prefix < lexeme.size() && lexeme[prefix] != '\'' && lexeme[prefix] != '"')
    {
        const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(lexeme[prefix])));
        shape.raw = shape.raw || lower == 'r';
        shape.formatted = shape.formatted || lower == 'f';
        ++prefix;
    }
    const char quote = lexeme[prefix];
    const bool triple = lexeme.size() >= prefix + 6 && lexeme[prefix + 1] == quote &&
                        lexeme[prefix + 2] == quote;
    const std::size_t q = triple ? 3 : 1;
    shape.body = lexeme.substr(prefix + q, lexeme.size() - prefix - 2 * q);
    shape.body_offset = token.span.start + prefix + q;
    return shape;
}

Result<std::int64_t> parse_int_literal(const Token& token)
{
    std::string_view text = token.lexeme;
    int base = 10;
    if (text.size() > 2 && text[0] == '0')
    {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        if (p == 'x' || p == 'o' || p == 'b')
        {
            base = (p == 'x') ? 16 : (p == 'o') ? 8 : 2;
            text.remove_prefix(2);
            if (!text.empty() && text.front() == '_')
            {
                text.remove_prefix(1);
            }
        }
    }

    std::string digits;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '_')
        {
            if (i == 0 || i + 1 == text.size() || text[i + 1] == '_')
            {
                return sandpit::diag::error_at(token.span, "invalid number literal");
            }
            continue;
        }
        digits.push_back(text[i]);
    }

    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec == std::errc::result_out_of_range)
    {
        return sandpit::diag::error_at(token.span,
                                       "integer literal is too large (limit is 64 bits)");
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty())
    {
        return sandpit::diag::error_at(token.span, "invalid digit in number literal");
    }
    return value;
}

Result<double> parse_float_literal(const Token& token)
{
    std::string digits;
    for (char c : token.lexeme)
    {
        if (c != '_')
        {
            digits.push_back(c);
        }
    }
    char* end = nullptr;
    const double value = std::strtod(digits.c_str(), &end);
    if (end != digits.c_str() + digits.size())
    {
        return sandpit::diag::error_at(token.span, "invalid float literal");
    }
    return value;
}

bool starts_expression(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::KwNone:
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
    case TokenKind::KwNot:
    case TokenKind::KwLambda:
    case TokenKind::KwAwait:
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::LBrace:
    case TokenKind::Plus:
    case TokenKind::Minus:
    case TokenKind::Tilde:
    case TokenKind::Star:
        return true;
    default:
        return false;
    }
}

std::string_view describe_target(const Expr& expr)
{
    return std::visit(
        [](const auto& node) -> std::string_view
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, CallExpr>)
            {
                return "function call";
            }
            else if constexpr (std::is_same_v<Node, NoneExpr> || std::is_same_v<Node, BoolExpr> ||
                               std::is_same_v<Node, IntExpr> || std::is_same_v<Node, FloatExpr> ||
                               std::is_same_v<Node, StringExpr> ||
                               std::is_same_v<Node, FStringExpr>)
            {
                return "literal";
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                return "lambda";
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                return "comprehension";
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                return "comparison";
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                return "conditional expression";
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                return "dict literal";
            }
            else if constexpr (std::is_same_v<Node, SetExpr>)
            {
                return "set display";
            }
            else
            {
                return "expression";
            }
        },
        expr.node);
}

// Checks that `expr` can appear on the left of `=` (or after `for` / `del`).
std::optional<Diagnostic> check_target(const Expr& expr, bool for_del, bool inside_sequence)
{
    if (std::holds_alternative<NameExpr>(expr.node) ||
        std::holds_alternative<AttributeExpr>(expr.node) ||
        std::holds_alternative<SubscriptExpr>(expr.node))
    {
        return std::nullopt;
    }

    if (const auto* starred = std::get_if<StarredExpr>(&expr.node))
    {
        if (for_del || !inside_sequence)
        {
            return sandpit::diag::error_at(expr.span, "starred assignment target must be in a "
                                                      "list or tuple");
        }
        return check_target(*starred->value, for_del, false);
    }

    const std::vector<Expr>* elements = nullptr;
    if (const auto* tuple = std::get_if<TupleExpr>(&expr.node))
    {
        elements = &tuple->elements;
    }
    else if (const auto* list = std::get_if<ListExpr>(&expr.node))
    {
        elements = &list->elements;
    }

    if (elements != nullptr)
    {
        std::size_t stars = 0;
        for (const auto& element : *elements)
        {
            if (std::holds_alternative<StarredExpr>(element.node))
            {
                ++stars;
                if (stars > 1)
                {
                    return sandpit::diag::error_at(element.span,
                                                   "multiple starred expressions in assignment");
                }
            }
            if (auto err = check_target(element, for_del, true))
            {
                return err;
            }
        }
        return std::nullopt;
    }

    return sandpit::diag::error_at(expr.span, std::string(for_del ? "cannot delete "
                                                                  : "cannot assign to ") +
                                                  std::string(describe_target(expr)));
}

void shift_spans(Expr& expr, std::size_t base);

class Parser
{
  public:
    explicit Parser(std::span<const Token> tokens) : tokens_(tokens) {}

    [[nodiscard]] ParseResult parse_program()
    {
        Program program;
        while (!is_at_end())
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            if (auto err = parse_statement(program.body))
            {
                return std::vector<Diagnostic>{std::move(*err)};
            }
        }
        return program;
    }

    // Parses a standalone expression list (the inside of an f-string replacement field).
    [[nodiscard]] Result<Expr> parse_standalone_expression()
    {
        if (check(TokenKind::Newline) || is_at_end())
        {
            return error_at(peek(), "f-string: empty expression not allowed");
        }
        auto res = parse_expression_list(true);
        if (std::holds_alternative<Diagnostic>(res))
        {
            return res;
        }
        while (match(TokenKind::Newline))
        {
        }
        if (!is_at_end())
        {
            return error_at(peek(), "f-string: invalid syntax");
        }
        return res;
    }

  private:
    std::span<const Token> tokens_;
    std::size_t pos_ = 0;

    // -- token helpers ------------------------------------------------------

    [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }

    [[nodiscard]] const Token& peek_next() const
    {
        return (pos_ + 1 < tokens_.size()) ? tokens_[pos_ + 1] : tokens_.back();
    }

    [[nodiscard]] const Token& previous() const { return tokens_[pos_ - 1]; }

    [[nodiscard]] bool is_at_end() const { return peek().kind == TokenKind::Eof; }

    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    const Token& advance()
    {
        if (!is_at_end())
        {
            ++pos_;
        }
        return previous();
    }

    bool match(TokenKind kind)
    {
        if (!check(kind))
        {
            return false;
        }
        advance();
        return true;
    }

    [[nodiscard]] Diagnostic error_at(const Token& token, std::string message) const
    {
        if (token.kind == TokenKind::Eof)
        {
            message += " (unexpected end of input)";
        }
        return sandpit::diag::error_at(token.span, std::move(message));
    }

    std::optional<Diagnostic> consume(TokenKind kind, std::string_view message)
    {
        if (check(kind))
        {
            advance();
            return std::nullopt;
        }
        return error_at(peek(), std::string(message));
    }

    // -- statements ---------------------------------------------------------

    std::optional<Diagnostic> parse_statement(std::vector<Stmt>& out)
    {
        const Token& t = peek();
        switch (t.kind)
        {
        case TokenKind::Indent:
            return error_at(t, "unexpected indent");
        case TokenKind::Dedent:
            return error_at(t, "unexpected dedent");
        case TokenKind::KwIf:
        case TokenKind::KwWhile:
        case TokenKind::KwFor:
        case TokenKind::KwDef:
        {
            auto res = parse_compound();
            if (auto* err = std::get_if<Diagnostic>(&res))
            {
                return std::move(*err);
            }
            out.push_back(std::get<Stmt>(std::move(res)));
            return std::nullopt;
        }
        case TokenKind::KwClass:
            return error_at(t, "'class' definitions are not supported");
        case TokenKind::KwTry:
        case TokenKind::KwExcept:
        case TokenKind::KwFinally:
            return error_at(t, "'try' statements are not supported");
        case TokenKind::KwWith:
            return error_at(t, "'with' statements are not supported");
        case TokenKind::KwAsync:
            return error_at(t, "'async' code is not supported");
        case TokenKind::At:
            return error_at(t, "decorators are not supported");
        case TokenKind::KwElif:
        case TokenKind::KwElse:
            return error_at(t, "'" + std::string(t.lexeme) + "' without a matching statement");
        default:
            return parse_simple_line(out);
        }
    }

    // simple_stmt (';' simple_stmt)* [';'] NEWLINE
    std::optional<Diagnostic> parse_simple_line(std::vector<Stmt>& out)
    {
        while (true)
        {
            auto res = parse_small_statement();
            if (auto* err = std::get_if<Diagnostic>(&res))
            {
                return std::move(*err);
            }
            out.push_back(std::get<Stmt>(std::move(res)));

            if (match(TokenKind::Semicolon))
            {
                if (check(TokenKind::Newline) || is_at_end())
                {
                    break;
                }
                continue;
            }
            break;
        }

        if (is_at_end())
        {
            return std::nullopt;
        }
        return consume(TokenKind::Newline, "invalid syntax");
    }

    [[nodiscard]] Result<Stmt> parse_small_statement()
    {
        const Token& start = peek();
        switch (start.kind)
        {
        case TokenKind::KwPass:
            advance();
            return Stmt{.span = start.span, .node = PassStmt{}};
        case TokenKind::KwBreak:
            advance();
            return Stmt{.span = start.span, .node = BreakStmt{}};
        case TokenKind::KwContinue:
            advance();
            return Stmt{.span = start.span, .node = ContinueStmt{}};
        case TokenKind::KwReturn:
        {
            advance();
            ReturnStmt ret;
            Span span = start.span;
            if (starts_expression(peek().kind))
            {
                auto value = parse_expression_list(true);
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                ret.value = std::get<Expr>(std::move(value));
                span = span_cover(span, ret.value->span);
            }
            return Stmt{.span = span, .node = std::move(ret)};
        }
        case TokenKind::KwGlobal:
        case TokenKind::KwNonlocal:
        {
            advance();
            std::vector<std::string> names;
            Span span = start.span;
            do
            {
                if (!check(TokenKind::Identifier))
                {
                    return error_at(peek(), "expected a name after '" +
                                                std::string(start.lexeme) + "'");
                }
                const Token& name = advance();
                names.emplace_back(name.lexeme);
                span = span_cover(span, name.span);
            } while (match(TokenKind::Comma));
            if (start.kind == TokenKind::KwGlobal)
            {
                return Stmt{.span = span, .node = GlobalStmt{.names = std::move(names)}};
            }
            return Stmt{.span = span, .node = NonlocalStmt{.names = std::move(names)}};
        }
        case TokenKind::KwDel:
        {
            advance();
            auto targets_res = parse_target_list();
            if (auto* err = std::get_if<Diagnostic>(&targets_res))
            {
                return std::move(*err);
            }
            Expr targets = std::get<Expr>(std::move(targets_res));
            DelStmt del;
            if (auto* tuple = std::get_if<TupleExpr>(&targets.node))
            {
                del.targets = std::move(tuple->elements);
            }
            else
            {
                del.targets.push_back(std::move(targets));
            }
            for (const auto& target : del.targets)
            {
                if (auto err = check_target(target, true, false))
                {
                    return *err;
                }
            }
            const Span span = span_cover(start.span, previous().span);
            return Stmt{.span = span, .node = std::move(del)};
        }
        case TokenKind::KwAssert:
        {
            advance();
            auto test = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&test))
            {
                return std::move(*err);
            }
            AssertStmt stmt{.test = std::get<Expr>(std::move(test)), .message = std::nullopt};
            if (match(TokenKind::Comma))
            {
                auto message = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&message))
                {
                    return std::move(*err);
                }
                stmt.message = std::get<Expr>(std::move(message));
            }
            const Span span = span_cover(start.span, previous().span);
            return Stmt{.span = span, .node = std::move(stmt)};
        }
        case TokenKind::KwImport:
        case TokenKind::KwFrom:
            return error_at(start, "import statements are not allowed");
        case TokenKind::KwRaise:
            return error_at(start, "'raise' statements are not supported");
        case TokenKind::KwYield:
            return error_at(start, "'yield' is not supported");
        default:
            break;
        }

        return parse_expression_statement();
    }

    [[nodiscard]] Result<Stmt> parse_expression_statement()
    {
        auto first_res = parse_expression_list(true);
        if (auto* err = std::get_if<Diagnostic>(&first_res))
        {
            return std::move(*err);
        }
        Expr first = std::get<Expr>(std::move(first_res));

        if (lexer::is_augmented_assign(peek().kind))
        {
            const Token& op_token = advance();
            if (!std::holds_alternative<NameExpr>(first.node) &&
                !std::holds_alternative<AttributeExpr>(first.node) &&
                !std::holds_alternative<SubscriptExpr>(first.node))
            {
                return sandpit::diag::error_at(
                    first.span, "'" + std::string(describe_target(first)) +
                                    "' is an illegal expression for augmented assignment");
            }
            const auto op = augmented_op(op_token);
            if (!op.has_value())
            {
                return error_at(op_token, "matrix multiplication is not supported");
            }
            auto value_res = parse_expression_list(true);
            if (auto* err = std::get_if<Diagnostic>(&value_res))
            {
                return std::move(*err);
            }
            Expr value = std::get<Expr>(std::move(value_res));
            const Span span = span_cover(first.span, value.span);
            return Stmt{.span = span,
                        .node = AugAssignStmt{
                            .target = std::move(first), .op = *op, .value = std::move(value)}};
        }

        if (check(TokenKind::Colon))
        {
            return error_at(peek(), "variable annotations are not supported");
        }

        if (!check(TokenKind::Equal))
        {
            if (auto* starred = std::get_if<StarredExpr>(&first.node))
            {
                (void)starred;
                return sandpit::diag::error_at(first.span,
                                               "can't use starred expression here");
            }
            const Span span = first.span;
            return Stmt{.span = span, .node = ExprStmt{.expr = std::move(first)}};
        }

        std::vector<Expr> chain;
        chain.push_back(std::move(first));
        while (match(TokenKind::Equal))
        {
            if (check(TokenKind::KwYield))
            {
                return error_at(peek(), "'yield' is not supported");
            }
            auto next = parse_expression_list(true);
            if (auto* err = std::get_if<Diagnostic>(&next))
            {
                return std::move(*err);
            }
            chain.push_back(std::get<Expr>(std::move(next)));
        }

        Expr value = std::move(chain.back());
        chain.pop_back();
        for (const auto& target : chain)
        {
            if (auto err = check_target(target, false, false))
            {
                return *err;
            }
        }
        const Span span = span_cover(chain.front().span, value.span);
        return Stmt{.span = span,
                    .node = AssignStmt{.targets = std::move(chain), .value = std::move(value)}};
    }

    static std::optional<BinaryOp> augmented_op(const Token& token)
    {
        switch (token.kind)
        {
        case TokenKind::PlusEqual:
            return BinaryOp::Add;
        case TokenKind::MinusEqual:
            return BinaryOp::Sub;
        case TokenKind::StarEqual:
            return BinaryOp::Mul;
        case TokenKind::StarStarEqual:
            return BinaryOp::Pow;
        case TokenKind::SlashEqual:
            return BinaryOp::Div;
        case TokenKind::SlashSlashEqual:
            return BinaryOp::FloorDiv;
        case TokenKind::PercentEqual:
            return BinaryOp::Mod;
        case TokenKind::AmpEqual:
            return BinaryOp::BitAnd;
        case TokenKind::PipeEqual:
            return BinaryOp::BitOr;
        case TokenKind::CaretEqual:
            return BinaryOp::BitXor;
        case TokenKind::LessLessEqual:
            return BinaryOp::LShift;
        case TokenKind::GreaterGreaterEqual:
            return BinaryOp::RShift;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] Result<Stmt> parse_compound()
    {
        const Token& start = peek();
        switch (start.kind)
        {
        case TokenKind::KwIf:
            advance();
            return parse_if_rest(start);
        case TokenKind::KwWhile:
            advance();
            return parse_while_rest(start);
        case TokenKind::KwFor:
            advance();
            return parse_for_rest(start);
        default:
            advance();
            return parse_def_rest(start);
        }
    }

    // After `if` or `elif`.
    [[nodiscard]] Result<Stmt> parse_if_rest(const Token& keyword)
    {
        auto cond = parse_expression();
        if (auto* err = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*err);
        }
        auto then_block = parse_suite();
        if (auto* err = std::get_if<Diagnostic>(&then_block))
        {
            return std::move(*err);
        }

        IfStmt stmt{.cond = std::get<Expr>(std::move(cond)),
                    .then_block = std::get<std::unique_ptr<Block>>(std::move(then_block)),
                    .else_block = nullptr};
        Span span = span_cover(keyword.span, stmt.then_block->span);

        if (check(TokenKind::KwElif))
        {
            const Token& elif = advance();
            auto nested = parse_if_rest(elif);
            if (auto* err = std::get_if<Diagnostic>(&nested))
            {
                return std::move(*err);
            }
            Stmt nested_stmt = std::get<Stmt>(std::move(nested));
            auto block = std::make_unique<Block>();
            block->span = nested_stmt.span;
            span = span_cover(span, nested_stmt.span);
            block->stmts.push_back(std::move(nested_stmt));
            stmt.else_block = std::move(block);
        }
        else if (match(TokenKind::KwElse))
        {
            auto else_block = parse_suite();
            if (auto* err = std::get_if<Diagnostic>(&else_block))
            {
                return std::move(*err);
            }
            stmt.else_block = std::get<std::unique_ptr<Block>>(std::move(else_block));
            span = span_cover(span, stmt.else_block->span);
        }

        return Stmt{.span = span, .node = std::move(stmt)};
    }

    [[nodiscard]] Result<std::unique_ptr<Block>> parse_optional_else(Span& span)
    {
        if (!match(TokenKind::KwElse))
        {
            return std::unique_ptr<Block>{};
        }
        auto block = parse_suite();
        if (auto* ok = std::get_if<std::unique_ptr<Block>>(&block))
        {
            span = span_cover(span, (*ok)->span);
        }
        return block;
    }

    [[nodiscard]] Result<Stmt> parse_while_rest(const Token& keyword)
    {
        auto cond = parse_expression();
        if (auto* err = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*err);
        }
        auto body = parse_suite();
        if (auto* err = std::get_if<Diagnostic>(&body))
        {
            return std::move(*err);
        }
        WhileStmt stmt{.cond = std::get<Expr>(std::move(cond)),
                       .body = std::get<std::unique_ptr<Block>>(std::move(body)),
                       .else_block = nullptr};
        Span span = span_cover(keyword.span, stmt.body->span);
        auto else_block = parse_optional_else(span);
        if (auto* err = std::get_if<Diagnostic>(&else_block))
        {
            return std::move(*err);
        }
        stmt.else_block = std::get<std::unique_ptr<Block>>(std::move(else_block));
        return Stmt{.span = span, .node = std::move(stmt)};
    }

    [[nodiscard]] Result<Stmt> parse_for_rest(const Token& keyword)
    {
        auto target = parse_target_list();
        if (auto* err = std::get_if<Diagnostic>(&target))
        {
            return std::move(*err);
        }
        if (auto err = check_target(std::get<Expr>(target), false, false))
        {
            return *err;
        }
        if (auto err = consume(TokenKind::KwIn, "expected 'in' after for-loop target"))
        {
            return *err;
        }
        auto iter = parse_expression_list(true);
        if (auto* err = std::get_if<Diagnostic>(&iter))
        {
            return std::move(*err);
        }
        auto body = parse_suite();
        if (auto* err = std::get_if<Diagnostic>(&body))
        {
            return std::move(*err);
        }
        ForStmt stmt{.target = std::get<Expr>(std::move(target)),
                     .iter = std::get<Expr>(std::move(iter)),
                     .body = std::get<std::unique_ptr<Block>>(std::move(body)),
                     .else_block = nullptr};
        Span span = span_cover(keyword.span, stmt.body->span);
        auto else_block = parse_optional_else(span);
        if (auto* err = std::get_if<Diagnostic>(&else_block))
        {
            return std::move(*err);
        }
        stmt.else_block = std::get<std::unique_ptr<Block>>(std::move(else_block));
        return Stmt{.span = span, .node = std::move(stmt)};
    }

    [[nodiscard]] Result<Stmt> parse_def_rest(const Token& keyword)
    {
        if (!check(TokenKind::Identifier))
        {
            return error_at(peek(), "expected function name after 'def'");
        }
        const Token& name = advance();
        if (auto err = consume(TokenKind::LParen, "expected '(' after function name"))
        {
            return *err;
        }

        auto params = parse_params(TokenKind::RParen);
        if (auto* err = std::get_if<Diagnostic>(&params))
        {
            return std::move(*err);
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after parameter list"))
        {
            return *err;
        }
        if (match(TokenKind::Arrow))
        {
            // Return annotations are accepted and ignored.
            auto annotation = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&annotation))
            {
                return std::move(*err);
            }
        }

        auto body = parse_suite();
        if (auto* err = std::get_if<Diagnostic>(&body))
        {
            return std::move(*err);
        }

        FunctionDef def{.name = std::string(name.lexeme),
                        .params = std::get<std::vector<Param>>(std::move(params)),
                        .body = std::get<std::unique_ptr<Block>>(std::move(body))};
        const Span span = span_cover(keyword.span, def.body->span);
        return Stmt{.span = span, .node = std::move(def)};
    }

    // Parameters of `def` (closed by ')') or `lambda` (closed by ':').
    [[nodiscard]] Result<std::vector<Param>> parse_params(TokenKind closer)
    {
        std::vector<Param> params;
        std::set<std::string, std::less<>> seen;
        bool seen_default = false;
        while (!check(closer))
        {
            if (check(TokenKind::Star) || check(TokenKind::StarStar))
            {
                return error_at(peek(), "'*' and '**' parameters are not supported");
            }
            if (!check(TokenKind::Identifier))
            {
                return error_at(peek(), "expected parameter name");
            }
            const Token& name = advance();
            if (seen.contains(name.lexeme))
            {
                return error_at(name, "duplicate argument '" + std::string(name.lexeme) +
                                          "' in function definition");
            }
            seen.emplace(name.lexeme);

            Param param{.span = name.span, .name = std::string(name.lexeme), .default_value = {}};
            if (closer == TokenKind::RParen && match(TokenKind::Colon))
            {
                auto annotation = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&annotation))
                {
                    return std::move(*err);
                }
            }
            if (match(TokenKind::Equal))
            {
                auto value = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                param.default_value = boxed(std::get<Expr>(std::move(value)));
                seen_default = true;
            }
            else if (seen_default)
            {
                return error_at(name, "non-default argument follows default argument");
            }
            params.push_back(std::move(param));

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }
        return params;
    }

    // ':' followed by an indented block or simple statements on the same line.
    [[nodiscard]] Result<std::unique_ptr<Block>> parse_suite()
    {
        if (auto err = consume(TokenKind::Colon, "expected ':'"))
        {
            return *err;
        }
        auto block = std::make_unique<Block>();
        const Span colon = previous().span;

        if (!match(TokenKind::Newline))
        {
            if (auto err = parse_simple_line(block->stmts))
            {
                return *err;
            }
            block->span = span_cover(colon, block->stmts.back().span);
            return block;
        }

        if (!match(TokenKind::Indent))
        {
            return error_at(peek(), "expected an indented block");
        }
        while (!check(TokenKind::Dedent) && !is_at_end())
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            if (auto err = parse_statement(block->stmts))
            {
                return *err;
            }
        }
        (void)match(TokenKind::Dedent);
        block->span = block->stmts.empty() ? colon
                                           : span_cover(block->stmts.front().span,
                                                        block->stmts.back().span);
        return block;
    }

    // -- expressions --------------------------------------------------------

    // Comma-separated expressions; more than one (or a trailing comma) makes a tuple.
    [[nodiscard]] Result<Expr> parse_expression_list(bool allow_star)
    {
        auto first = parse_list_item(allow_star);
        if (auto* err = std::get_if<Diagnostic>(&first))
        {
            return std::move(*err);
        }
        if (!check(TokenKind::Comma))
        {
            return first;
        }

        TupleExpr tuple;
        Span span = std::get<Expr>(first).span;
        tuple.elements.push_back(std::get<Expr>(std::move(first)));
        while (match(TokenKind::Comma))
        {
            span = span_cover(span, previous().span);
            if (!starts_expression(peek().kind))
            {
                break;
            }
            auto next = parse_list_item(allow_star);
            if (auto* err = std::get_if<Diagnostic>(&next))
            {
                return std::move(*err);
            }
            span = span_cover(span, std::get<Expr>(next).span);
            tuple.elements.push_back(std::get<Expr>(std::move(next)));
        }
        return make_expr(span, std::move(tuple));
    }

    [[nodiscard]] Result<Expr> parse_list_item(bool allow_star)
    {
        if (allow_star && check(TokenKind::Star))
        {
            const Token& star = advance();
            auto value = parse_bitor();
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            Expr inner = std::get<Expr>(std::move(value));
            const Span span = span_cover(star.span, inner.span);
            return make_expr(span, StarredExpr{.value = boxed(std::move(inner))});
        }
        return parse_expression();
    }

    // Targets for `for` and `del`: bitwise-or level expressions, so `in` is not consumed.
    [[nodiscard]] Result<Expr> parse_target_list()
    {
        std::vector<Expr> items;
        Span span = peek().span;
        bool trailing_comma = false;
        while (true)
        {
            Result<Expr> item = [&]() -> Result<Expr>
            {
                if (check(TokenKind::Star))
                {
                    const Token& star = advance();
                    auto value = parse_bitor();
                    if (auto* err = std::get_if<Diagnostic>(&value))
                    {
                        return std::move(*err);
                    }
                    Expr inner = std::get<Expr>(std::move(value));
                    const Span s = span_cover(star.span, inner.span);
                    return make_expr(s, StarredExpr{.value = boxed(std::move(inner))});
                }
                return parse_bitor();
            }();
            if (auto* err = std::get_if<Diagnostic>(&item))
            {
                return std::move(*err);
            }
            span = span_cover(span, std::get<Expr>(item).span);
            items.push_back(std::get<Expr>(std::move(item)));
            trailing_comma = false;
            if (!match(TokenKind::Comma))
            {
                break;
            }
            trailing_comma = true;
            if (!starts_expression(peek().kind))
            {
                break;
            }
        }
        if (items.size() == 1 && !trailing_comma)
        {
            return std::move(items.front());
        }
        return make_expr(span, TupleExpr{.elements = std::move(items)});
    }

    [[nodiscard]] Result<Expr> parse_expression()
    {
        if (check(TokenKind::KwLambda))
        {
            return parse_lambda();
        }
        if (check(TokenKind::KwYield))
        {
            return error_at(peek(), "'yield' is not supported");
        }

        auto value = parse_or();
        if (auto* err = std::get_if<Diagnostic>(&value))
        {
            return std::move(*err);
        }
        if (check(TokenKind::ColonEqual))
        {
            return error_at(peek(), "assignment expressions (':=') are not supported");
        }
        if (!match(TokenKind::KwIf))
        {
            return value;
        }

        auto cond = parse_or();
        if (auto* err = std::get_if<Diagnostic>(&cond))
        {
            return std::move(*err);
        }
        if (auto err = consume(TokenKind::KwElse, "expected 'else' after condition"))
        {
            return *err;
        }
        auto other = parse_expression();
        if (auto* err = std::get_if<Diagnostic>(&other))
        {
            return std::move(*err);
        }
        Expr then_value = std::get<Expr>(std::move(value));
        Expr else_value = std::get<Expr>(std::move(other));
        const Span span = span_cover(then_value.span, else_value.span);
        return make_expr(span, IfExpr{.cond = boxed(std::get<Expr>(std::move(cond))),
                                      .then_value = boxed(std::move(then_value)),
                                      .else_value = boxed(std::move(else_value))});
    }

    [[nodiscard]] Result<Expr> parse_lambda()
    {
        const Token& keyword = advance();
        auto params = parse_params(TokenKind::Colon);
        if (auto* err = std::get_if<Diagnostic>(&params))
        {
            return std::move(*err);
        }
        if (auto err = consume(TokenKind::Colon, "expected ':' after lambda parameters"))
        {
            return *err;
        }
        auto body = parse_expression();
        if (auto* err = std::get_if<Diagnostic>(&body))
        {
            return std::move(*err);
        }
        Expr body_expr = std::get<Expr>(std::move(body));
        const Span span = span_cover(keyword.span, body_expr.span);
        return make_expr(span, LambdaExpr{.params = std::get<std::vector<Param>>(std::move(params)),
                                          .body = boxed(std::move(body_expr))});
    }

    [[nodiscard]] Result<Expr> parse_or()
    {
        auto lhs = parse_and();
        if (std::holds_alternative<Diagnostic>(lhs))
        {
            return lhs;
        }
        Expr expr = std::get<Expr>(std::move(lhs));
        while (match(TokenKind::KwOr))
        {
            auto rhs = parse_and();
            if (auto* err = std::get_if<Diagnostic>(&rhs))
            {
                return std::move(*err);
            }
            Expr right = std::get<Expr>(std::move(rhs));
            const Span span = span_cover(expr.span, right.span);
            expr = make_expr(span, BoolOpExpr{.op = BoolOp::Or,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(right))});
        }
        return expr;
    }

    [[nodiscard]] Result<Expr> parse_and()
    {
        auto lhs = parse_not();
        if (std::holds_alternative<Diagnostic>(lhs))
        {
            return lhs;
        }
        Expr expr = std::get<Expr>(std::move(lhs));
        while (match(TokenKind::KwAnd))
        {
            auto rhs = parse_not();
            if (auto* err = std::get_if<Diagnostic>(&rhs))
            {
                return std::move(*err);
            }
            Expr right = std::get<Expr>(std::move(rhs));
            const Span span = span_cover(expr.span, right.span);
            expr = make_expr(span, BoolOpExpr{.op = BoolOp::And,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(right))});
        }
        return expr;
    }

    [[nodiscard]] Result<Expr> parse_not()
    {
        if (!check(TokenKind::KwNot))
        {
            return parse_comparison();
        }
        const Token& op = advance();
        auto operand = parse_not();
        if (auto* err = std::get_if<Diagnostic>(&operand))
        {
            return std::move(*err);
        }
        Expr inner = std::get<Expr>(std::move(operand));
        const Span span = span_cover(op.span, inner.span);
        return make_expr(span, UnaryExpr{.op = UnaryOp::Not, .operand = boxed(std::move(inner))});
    }

    std::optional<CompareOp> match_compare_op()
    {
        switch (peek().kind)
        {
        case TokenKind::EqualEqual:
            advance();
            return CompareOp::Eq;
        case TokenKind::BangEqual:
            advance();
            return CompareOp::NotEq;
        case TokenKind::Less:
            advance();
            return CompareOp::Lt;
        case TokenKind::LessEqual:
            advance();
            return CompareOp::LtE;
        case TokenKind::Greater:
            advance();
            return CompareOp::Gt;
        case TokenKind::GreaterEqual:
            advance();
            return CompareOp::GtE;
        case TokenKind::KwIn:
            advance();
            return CompareOp::In;
        case TokenKind::KwNot:
            if (peek_next().kind == TokenKind::KwIn)
            {
                advance();
                advance();
                return CompareOp::NotIn;
            }
            return std::nullopt;
        case TokenKind::KwIs:
            advance();
            if (match(TokenKind::KwNot))
            {
                return CompareOp::IsNot;
            }
            return CompareOp::Is;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] Result<Expr> parse_comparison()
    {
        auto lhs = parse_bitor();
        if (std::holds_alternative<Diagnostic>(lhs))
        {
            return lhs;
        }
        Expr first = std::get<Expr>(std::move(lhs));
        std::vector<CompareLink> links;
        Span span = first.span;
        while (auto op = match_compare_op())
        {
            auto rhs = parse_bitor();
            if (auto* err = std::get_if<Diagnostic>(&rhs))
            {
                return std::move(*err);
            }
            Expr right = std::get<Expr>(std::move(rhs));
            span = span_cover(span, right.span);
            links.push_back(CompareLink{.op = *op, .rhs = boxed(std::move(right))});
        }
        if (links.empty())
        {
            return first;
        }
        return make_expr(span,
                         CompareExpr{.first = boxed(std::move(first)), .links = std::move(links)});
    }

    // Generic left-associative binary level.
    template <typename Next>
    [[nodiscard]] Result<Expr> parse_binary_level(Next next,
                                                  std::optional<BinaryOp> (*op_for)(TokenKind))
    {
        auto lhs = (this->*next)();
        if (std::holds_alternative<Diagnostic>(lhs))
        {
            return lhs;
        }
        Expr expr = std::get<Expr>(std::move(lhs));
        while (true)
        {
            if (check(TokenKind::At))
            {
                return error_at(peek(), "matrix multiplication is not supported");
            }
            const auto op = op_for(peek().kind);
            if (!op.has_value())
            {
                break;
            }
            advance();
            auto rhs = (this->*next)();
            if (auto* err = std::get_if<Diagnostic>(&rhs))
            {
                return std::move(*err);
            }
            Expr right = std::get<Expr>(std::move(rhs));
            const Span span = span_cover(expr.span, right.span);
            expr = make_expr(span, BinaryExpr{.op = *op,
                                              .lhs = boxed(std::move(expr)),
                                              .rhs = boxed(std::move(right))});
        }
        return expr;
    }

    static std::optional<BinaryOp> bitor_op(TokenKind kind)
    {
        return kind == TokenKind::Pipe ? std::optional{BinaryOp::BitOr} : std::nullopt;
    }

    static std::optional<BinaryOp> bitxor_op(TokenKind kind)
    {
        return kind == TokenKind::Caret ? std::optional{BinaryOp::BitXor} : std::nullopt;
    }

    static std::optional<BinaryOp> bitand_op(TokenKind kind)
    {
        return kind == TokenKind::Amp ? std::optional{BinaryOp::BitAnd} : std::nullopt;
    }

    static std::optional<BinaryOp> shift_op(TokenKind kind)
    {
        if (kind == TokenKind::LessLess)
        {
            return BinaryOp::LShift;
        }
        if (kind == TokenKind::GreaterGreater)
        {
            return BinaryOp::RShift;
        }
        return std::nullopt;
    }

    static std::optional<BinaryOp> arith_op(TokenKind kind)
    {
        if (kind == TokenKind::Plus)
        {
            return BinaryOp::Add;
        }
        if (kind == TokenKind::Minus)
        {
            return BinaryOp::Sub;
        }
        return std::nullopt;
    }

    static std::optional<BinaryOp> term_op(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::Star:
            return BinaryOp::Mul;
        case TokenKind::Slash:
            return BinaryOp::Div;
        case TokenKind::SlashSlash:
            return BinaryOp::FloorDiv;
        case TokenKind::Percent:
            return BinaryOp::Mod;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] Result<Expr> parse_bitor()
    {
        return parse_binary_level(&Parser::parse_bitxor, &Parser::bitor_op);
    }

    [[nodiscard]] Result<Expr> parse_bitxor()
    {
        return parse_binary_level(&Parser::parse_bitand, &Parser::bitxor_op);
    }

    [[nodiscard]] Result<Expr> parse_bitand()
    {
        return parse_binary_level(&Parser::parse_shift, &Parser::bitand_op);
    }

    [[nodiscard]] Result<Expr> parse_shift()
    {
        return parse_binary_level(&Parser::parse_arith, &Parser::shift_op);
    }

    [[nodiscard]] Result<Expr> parse_arith()
    {
        return parse_binary_level(&Parser::parse_term, &Parser::arith_op);
    }

    [[nodiscard]] Result<Expr> parse_term()
    {
        return parse_binary_level(&Parser::parse_factor, &Parser::term_op);
    }

    [[nodiscard]] Result<Expr> parse_factor()
    {
        std::optional<UnaryOp> op;
        switch (peek().kind)
        {
        case TokenKind::Minus:
            op = UnaryOp::Neg;
            break;
        case TokenKind::Plus:
            op = UnaryOp::Pos;
            break;
        case TokenKind::Tilde:
            op = UnaryOp::Invert;
            break;
        default:
            return parse_power();
        }
        const Token& op_token = advance();
        auto operand = parse_factor();
        if (auto* err = std::get_if<Diagnostic>(&operand))
        {
            return std::move(*err);
        }
        Expr inner = std::get<Expr>(std::move(operand));
        const Span span = span_cover(op_token.span, inner.span);
        return make_expr(span, UnaryExpr{.op = *op, .operand = boxed(std::move(inner))});
    }

    [[nodiscard]] Result<Expr> parse_power()
    {
        if (check(TokenKind::KwAwait))
        {
            return error_at(peek(), "'await' is not supported");
        }
        auto base = parse_primary();
        if (std::holds_alternative<Diagnostic>(base))
        {
            return base;
        }
        if (!match(TokenKind::StarStar))
        {
            return base;
        }
        // Right-associative and binds tighter than unary minus on its left.
        auto exponent = parse_factor();
        if (auto* err = std::get_if<Diagnostic>(&exponent))
        {
            return std::move(*err);
        }
        Expr lhs = std::get<Expr>(std::move(base));
        Expr rhs = std::get<Expr>(std::move(exponent));
        const Span span = span_cover(lhs.span, rhs.span);
        return make_expr(span, BinaryExpr{.op = BinaryOp::Pow,
                                          .lhs = boxed(std::move(lhs)),
                                          .rhs = boxed(std::move(rhs))});
    }

    [[nodiscard]] Result<Expr> parse_primary()
    {
        auto atom = parse_atom();
        if (std::holds_alternative<Diagnostic>(atom))
        {
            return atom;
        }
        Expr expr = std::get<Expr>(std::move(atom));

        while (true)
        {
            if (match(TokenKind::LParen))
            {
                auto args = parse_call_args();
                if (auto* err = std::get_if<Diagnostic>(&args))
                {
                    return std::move(*err);
                }
                const Span span = span_cover(expr.span, previous().span);
                expr = make_expr(span,
                                 CallExpr{.callee = boxed(std::move(expr)),
                                          .args = std::get<std::vector<Argument>>(std::move(args))});
                continue;
            }
            if (match(TokenKind::LBracket))
            {
                auto index = parse_subscript();
                if (auto* err = std::get_if<Diagnostic>(&index))
                {
                    return std::move(*err);
                }
                if (auto err = consume(TokenKind::RBracket, "expected ']' after subscript"))
                {
                    return *err;
                }
                const Span span = span_cover(expr.span, previous().span);
                expr = make_expr(span, SubscriptExpr{.base = boxed(std::move(expr)),
                                                     .index = boxed(std::get<Expr>(
                                                         std::move(index)))});
                continue;
            }
            if (match(TokenKind::Dot))
            {
                if (!check(TokenKind::Identifier))
                {
                    return error_at(peek(), "expected attribute name after '.'");
                }
                const Token& name = advance();
                const Span span = span_cover(expr.span, name.span);
                expr = make_expr(span, AttributeExpr{.base = boxed(std::move(expr)),
                                                     .name = std::string(name.lexeme)});
                continue;
            }
            break;
        }
        return expr;
    }

    // After '('; consumes the closing ')'.
    [[nodiscard]] Result<std::vector<Argument>> parse_call_args()
    {
        std::vector<Argument> args;
        bool seen_keyword = false;
        while (!check(TokenKind::RParen))
        {
            const Token& start = peek();
            if (check(TokenKind::StarStar))
            {
                return error_at(start, "'**' arguments are not supported");
            }
            if (match(TokenKind::Star))
            {
                auto value = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                Expr inner = std::get<Expr>(std::move(value));
                const Span span = span_cover(start.span, inner.span);
                args.push_back(Argument{.span = span,
                                        .keyword = std::nullopt,
                                        .star = true,
                                        .value = boxed(std::move(inner))});
            }
            else if (check(TokenKind::Identifier) && peek_next().kind == TokenKind::Equal)
            {
                const Token& name = advance();
                advance();
                auto value = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                for (const auto& existing : args)
                {
                    if (existing.keyword.has_value() && *existing.keyword == name.lexeme)
                    {
                        return error_at(name, "keyword argument repeated: " +
                                                  std::string(name.lexeme));
                    }
                }
                Expr inner = std::get<Expr>(std::move(value));
                const Span span = span_cover(name.span, inner.span);
                args.push_back(Argument{.span = span,
                                        .keyword = std::string(name.lexeme),
                                        .star = false,
                                        .value = boxed(std::move(inner))});
                seen_keyword = true;
            }
            else
            {
                if (seen_keyword)
                {
                    return error_at(start, "positional argument follows keyword argument");
                }
                auto value = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                Expr inner = std::get<Expr>(std::move(value));
                if (check(TokenKind::KwFor))
                {
                    auto gen = parse_comprehension_tail(ComprehensionKind::Generator,
                                                        std::move(inner), nullptr, start.span);
                    if (auto* err = std::get_if<Diagnostic>(&gen))
                    {
                        return std::move(*err);
                    }
                    inner = std::get<Expr>(std::move(gen));
                    if (!args.empty() || !check(TokenKind::RParen))
                    {
                        return sandpit::diag::error_at(
                            inner.span, "generator expression must be parenthesized");
                    }
                }
                const Span span = inner.span;
                args.push_back(Argument{.span = span,
                                        .keyword = std::nullopt,
                                        .star = false,
                                        .value = boxed(std::move(inner))});
            }

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after arguments"))
        {
            return *err;
        }
        return args;
    }

    // Inside '[...]' of a subscript: an index, a slice, or a tuple of them.
    [[nodiscard]] Result<Expr> parse_subscript()
    {
        std::vector<Expr> items;
        Span span = peek().span;
        bool trailing_comma = false;
        while (true)
        {
            auto item = parse_slice_item();
            if (auto* err = std::get_if<Diagnostic>(&item))
            {
                return std::move(*err);
            }
            span = span_cover(span, std::get<Expr>(item).span);
            items.push_back(std::get<Expr>(std::move(item)));
            trailing_comma = false;
            if (!match(TokenKind::Comma))
            {
                break;
            }
            trailing_comma = true;
            if (check(TokenKind::RBracket))
            {
                break;
            }
        }
        if (items.size() == 1 && !trailing_comma)
        {
            return std::move(items.front());
        }
        return make_expr(span, TupleExpr{.elements = std::move(items)});
    }

    [[nodiscard]] Result<Expr> parse_slice_item()
    {
        const Span start = peek().span;
        ExprPtr lower;
        if (!check(TokenKind::Colon))
        {
            auto value = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            if (!check(TokenKind::Colon))
            {
                return value;
            }
            lower = boxed(std::get<Expr>(std::move(value)));
        }

        (void)match(TokenKind::Colon);
        ExprPtr upper;
        ExprPtr step;
        if (!check(TokenKind::Colon) && !check(TokenKind::RBracket) && !check(TokenKind::Comma))
        {
            auto value = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            upper = boxed(std::get<Expr>(std::move(value)));
        }
        if (match(TokenKind::Colon) && !check(TokenKind::RBracket) && !check(TokenKind::Comma))
        {
            auto value = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            step = boxed(std::get<Expr>(std::move(value)));
        }
        const Span span = span_cover(start, previous().span);
        return make_expr(span, SliceExpr{.lower = std::move(lower),
                                         .upper = std::move(upper),
                                         .step = std::move(step)});
    }

    // `for ... in ... [if ...]` clauses after the element of a comprehension.
    [[nodiscard]] Result<Expr> parse_comprehension_tail(ComprehensionKind kind, Expr element,
                                                        ExprPtr value, Span start)
    {
        ComprehensionExpr comp{.kind = kind,
                               .element = boxed(std::move(element)),
                               .value = std::move(value),
                               .clauses = {}};
        while (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
        {
            if (check(TokenKind::KwAsync))
            {
                return error_at(peek(), "'async' code is not supported");
            }
            advance();
            auto target = parse_target_list();
            if (auto* err = std::get_if<Diagnostic>(&target))
            {
                return std::move(*err);
            }
            if (auto err = check_target(std::get<Expr>(target), false, false))
            {
                return *err;
            }
            if (auto err = consume(TokenKind::KwIn, "expected 'in' in comprehension"))
            {
                return *err;
            }
            auto iter = parse_or();
            if (auto* err = std::get_if<Diagnostic>(&iter))
            {
                return std::move(*err);
            }
            CompFor clause{.target = boxed(std::get<Expr>(std::move(target))),
                           .iter = boxed(std::get<Expr>(std::move(iter))),
                           .conditions = {}};
            while (match(TokenKind::KwIf))
            {
                auto cond = parse_or();
                if (auto* err = std::get_if<Diagnostic>(&cond))
                {
                    return std::move(*err);
                }
                clause.conditions.push_back(std::get<Expr>(std::move(cond)));
            }
            comp.clauses.push_back(std::move(clause));
        }
        const Span span = span_cover(start, previous().span);
        return make_expr(span, std::move(comp));
    }

    [[nodiscard]] Result<Expr> parse_atom()
    {
        const Token& t = peek();
        switch (t.kind)
        {
        case TokenKind::Identifier:
            advance();
            return make_expr(t.span, NameExpr{.name = std::string(t.lexeme)});
        case TokenKind::KwNone:
            advance();
            return make_expr(t.span, NoneExpr{});
        case TokenKind::KwTrue:
            advance();
            return make_expr(t.span, BoolExpr{.value = true});
        case TokenKind::KwFalse:
            advance();
            return make_expr(t.span, BoolExpr{.value = false});
        case TokenKind::IntLiteral:
        {
            advance();
            auto value = parse_int_literal(t);
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            return make_expr(t.span, IntExpr{.value = std::get<std::int64_t>(value)});
        }
        case TokenKind::FloatLiteral:
        {
            advance();
            auto value = parse_float_literal(t);
            if (auto* err = std::get_if<Diagnostic>(&value))
            {
                return std::move(*err);
            }
            return make_expr(t.span, FloatExpr{.value = std::get<double>(value)});
        }
        case TokenKind::StringLiteral:
            return parse_strings();
        case TokenKind::LParen:
            return parse_paren();
        case TokenKind::LBracket:
            return parse_list_display();
        case TokenKind::LBrace:
            return parse_brace_display();
        case TokenKind::KwYield:
            return error_at(t, "'yield' is not supported");
        default:
            break;
        }
        if (lexer::is_keyword(t.kind))
        {
            return error_at(t, "invalid syntax: unexpected keyword '" + std::string(t.lexeme) +
                                   "'");
        }
        if (t.kind == TokenKind::Newline || t.kind == TokenKind::Eof)
        {
            return error_at(t, "invalid syntax: expected an expression");
        }
        if (t.kind == TokenKind::Indent)
        {
            return error_at(t, "unexpected indent");
        }
        return error_at(t, "invalid syntax: unexpected '" + std::string(t.lexeme) + "'");
    }

    [[nodiscard]] Result<Expr> parse_paren()
    {
        const Token& open = advance();
        if (match(TokenKind::RParen))
        {
            return make_expr(span_cover(open.span, previous().span), TupleExpr{});
        }

        auto first = parse_list_item(true);
        if (auto* err = std::get_if<Diagnostic>(&first))
        {
            return std::move(*err);
        }
        Expr expr = std::get<Expr>(std::move(first));

        if (check(TokenKind::KwFor))
        {
            auto gen = parse_comprehension_tail(ComprehensionKind::Generator, std::move(expr),
                                                nullptr, open.span);
            if (std::holds_alternative<Diagnostic>(gen))
            {
                return gen;
            }
            if (auto err = consume(TokenKind::RParen, "expected ')' after generator expression"))
            {
                return *err;
            }
            Expr out = std::get<Expr>(std::move(gen));
            out.span = span_cover(open.span, previous().span);
            return out;
        }

        if (!check(TokenKind::Comma))
        {
            if (auto err = consume(TokenKind::RParen, "expected ')'"))
            {
                return *err;
            }
            if (std::holds_alternative<StarredExpr>(expr.node))
            {
                return sandpit::diag::error_at(expr.span, "can't use starred expression here");
            }
            expr.span = span_cover(open.span, previous().span);
            return expr;
        }

        TupleExpr tuple;
        tuple.elements.push_back(std::move(expr));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RParen))
            {
                break;
            }
            auto next = parse_list_item(true);
            if (auto* err = std::get_if<Diagnostic>(&next))
            {
                return std::move(*err);
            }
            tuple.elements.push_back(std::get<Expr>(std::move(next)));
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after tuple"))
        {
            return *err;
        }
        return make_expr(span_cover(open.span, previous().span), std::move(tuple));
    }

    [[nodiscard]] Result<Expr> parse_list_display()
    {
        const Token& open = advance();
        ListExpr list;
        if (match(TokenKind::RBracket))
        {
            return make_expr(span_cover(open.span, previous().span), std::move(list));
        }

        auto first = parse_list_item(true);
        if (auto* err = std::get_if<Diagnostic>(&first))
        {
            return std::move(*err);
        }
        if (check(TokenKind::KwFor))
        {
            auto comp = parse_comprehension_tail(ComprehensionKind::List,
                                                 std::get<Expr>(std::move(first)), nullptr,
                                                 open.span);
            if (std::holds_alternative<Diagnostic>(comp))
            {
                return comp;
            }
            if (auto err = consume(TokenKind::RBracket, "expected ']' after list comprehension"))
            {
                return *err;
            }
            Expr out = std::get<Expr>(std::move(comp));
            out.span = span_cover(open.span, previous().span);
            return out;
        }

        list.elements.push_back(std::get<Expr>(std::move(first)));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBracket))
            {
                break;
            }
            auto next = parse_list_item(true);
            if (auto* err = std::get_if<Diagnostic>(&next))
            {
                return std::move(*err);
            }
            list.elements.push_back(std::get<Expr>(std::move(next)));
        }
        if (auto err = consume(TokenKind::RBracket, "expected ']' after list elements"))
        {
            return *err;
        }
        return make_expr(span_cover(open.span, previous().span), std::move(list));
    }

    [[nodiscard]] Result<Expr> parse_brace_display()
    {
        const Token& open = advance();
        if (match(TokenKind::RBrace))
        {
            return make_expr(span_cover(open.span, previous().span), DictExpr{});
        }
        if (check(TokenKind::StarStar))
        {
            return error_at(peek(), "'**' unpacking is not supported");
        }

        auto first = parse_list_item(true);
        if (auto* err = std::get_if<Diagnostic>(&first))
        {
            return std::move(*err);
        }

        if (match(TokenKind::Colon))
        {
            auto first_value = parse_expression();
            if (auto* err = std::get_if<Diagnostic>(&first_value))
            {
                return std::move(*err);
            }
            if (check(TokenKind::KwFor))
            {
                auto comp = parse_comprehension_tail(
                    ComprehensionKind::Dict, std::get<Expr>(std::move(first)),
                    boxed(std::get<Expr>(std::move(first_value))), open.span);
                if (std::holds_alternative<Diagnostic>(comp))
                {
                    return comp;
                }
                if (auto err =
                        consume(TokenKind::RBrace, "expected '}' after dict comprehension"))
                {
                    return *err;
                }
                Expr out = std::get<Expr>(std::move(comp));
                out.span = span_cover(open.span, previous().span);
                return out;
            }

            DictExpr dict;
            dict.keys.push_back(std::get<Expr>(std::move(first)));
            dict.values.push_back(std::get<Expr>(std::move(first_value)));
            while (match(TokenKind::Comma))
            {
                if (check(TokenKind::RBrace))
                {
                    break;
                }
                auto key = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&key))
                {
                    return std::move(*err);
                }
                if (auto err = consume(TokenKind::Colon, "expected ':' after dict key"))
                {
                    return *err;
                }
                auto value = parse_expression();
                if (auto* err = std::get_if<Diagnostic>(&value))
                {
                    return std::move(*err);
                }
                dict.keys.push_back(std::get<Expr>(std::move(key)));
                dict.values.push_back(std::get<Expr>(std::move(value)));
            }
            if (auto err = consume(TokenKind::RBrace, "expected '}' after dict entries"))
            {
                return *err;
            }
            return make_expr(span_cover(open.span, previous().span), std::move(dict));
        }

        if (check(TokenKind::KwFor))
        {
            auto comp = parse_comprehension_tail(ComprehensionKind::Set,
                                                 std::get<Expr>(std::move(first)), nullptr,
                                                 open.span);
            if (std::holds_alternative<Diagnostic>(comp))
            {
                return comp;
            }
            if (auto err = consume(TokenKind::RBrace, "expected '}' after set comprehension"))
            {
                return *err;
            }
            Expr out = std::get<Expr>(std::move(comp));
            out.span = span_cover(open.span, previous().span);
            return out;
        }

        SetExpr set;
        set.elements.push_back(std::get<Expr>(std::move(first)));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBrace))
            {
                break;
            }
            auto next = parse_list_item(true);
            if (auto* err = std::get_if<Diagnostic>(&next))
            {
                return std::move(*err);
            }
            set.elements.push_back(std::get<Expr>(std::move(next)));
        }
        if (auto err = consume(TokenKind::RBrace, "expected '}' after set elements"))
        {
            return *err;
        }
        return make_expr(span_cover(open.span, previous().span), std::move(set));
    }

    // Adjacent string literals concatenate; any f-string among them makes the result an
    // FStringExpr.
    [[nodiscard]] Result<Expr> parse_strings()
    {
        const Span start = peek().span;
        std::vector<FStringPart> parts;
        bool formatted = false;

        auto append_literal = [&parts](std::string text)
        {
            if (text.empty())
            {
                return;
            }
            if (!parts.empty() && parts.back().expr == nullptr)
            {
                parts.back().literal += text;
                return;
            }
            parts.push_back(FStringPart{.literal = std::move(text),
                                        .expr = nullptr,
                                        .conversion = '\0',
                                        .format_spec = {}});
        };

        while (check(TokenKind::StringLiteral))
        {
            const Token& token = advance();
            const LiteralShape shape = literal_shape(token);
            if (!shape.formatted)
            {
                auto text = unescape(shape.body, shape.raw, shape.body_offset);
                if (auto* err = std::get_if<Diagnostic>(&text))
                {
                    return std::move(*err);
                }
                append_literal(std::get<std::string>(std::move(text)));
                continue;
            }

            formatted = true;
            if (auto err = parse_fstring_body(shape, parts, append_literal))
            {
                return *err;
            }
        }

        const Span span = span_cover(start, previous().span);
        if (!formatted)
        {
            std::string value = parts.empty() ? std::string{} : std::move(parts.front().literal);
            return make_expr(span, StringExpr{.value = std::move(value)});
        }
        return make_expr(span, FStringExpr{.parts = std::move(parts)});
    }

    template <typename AppendLiteral>
    std::optional<Diagnostic> parse_fstring_body(const LiteralShape& shape,
                                                 std::vector<FStringPart>& parts,
                                                 AppendLiteral& append_literal)
    {
        const std::string_view body = shape.body;
        const std::size_t base = shape.body_offset;
        std::size_t literal_start = 0;
        std::size_t i = 0;

        auto flush_literal = [&](std::size_t end) -> std::optional<Diagnostic>
        {
            auto text = unescape(body.substr(literal_start, end - literal_start), shape.raw,
                                 base + literal_start);
            if (auto* err = std::get_if<Diagnostic>(&text))
            {
                return std::move(*err);
            }
            append_literal(std::get<std::string>(std::move(text)));
            return std::nullopt;
        };

        while (i < body.size())
        {
            const char c = body[i];
            if (c == '}')
            {
                if (i + 1 < body.size() && body[i + 1] == '}')
                {
                    if (auto err = flush_literal(i + 1))
                    {
                        return err;
                    }
                    i += 2;
                    literal_start = i;
                    continue;
                }
                return sandpit::diag::error_at(Span{base + i, base + i + 1},
                                               "f-string: single '}' is not allowed");
            }
            if (c != '{')
            {
                ++i;
                continue;
            }
            if (i + 1 < body.size() && body[i + 1] == '{')
            {
                if (auto err = flush_literal(i + 1))
                {
                    return err;
                }
                i += 2;
                literal_start = i;
                continue;
            }

            if (auto err = flush_literal(i))
            {
                return err;
            }

            // Replacement field: find where the expression ends.
            const std::size_t expr_start = i + 1;
            std::size_t j = expr_start;
            int depth = 0;
            char in_quote = '\0';
            while (j < body.size())
            {
                const char ch = body[j];
                if (in_quote != '\0')
                {
                    if (ch == in_quote)
                    {
                        in_quote = '\0';
                    }
                    ++j;
                    continue;
                }
                if (ch == '\'' || ch == '"')
                {
                    in_quote = ch;
                }
                else if (ch == '(' || ch == '[' || ch == '{')
                {
                    ++depth;
                }
                else if ((ch == ')' || ch == ']' || ch == '}') && depth > 0)
                {
                    --depth;
                }
                else if (depth == 0 && (ch == '}' || ch == ':'))
                {
                    break;
                }
                else if (depth == 0 && ch == '!' && j + 1 < body.size() && body[j + 1] != '=')
                {
                    break;
                }
                ++j;
            }
            if (j >= body.size())
            {
                return sandpit::diag::error_at(Span{base + i, base + body.size()},
                                               "f-string: expecting '}'");
            }

            std::string_view expr_text = body.substr(expr_start, j - expr_start);
            FStringPart part{.literal = {}, .expr = nullptr, .conversion = '\0', .format_spec = {}};

            // Self-documenting `{expr=}`.
            std::size_t trimmed = expr_text.size();
            while (trimmed > 0 && std::isspace(static_cast<unsigned char>(expr_text[trimmed - 1])))
            {
                --trimmed;
            }
            if (trimmed > 0 && expr_text[trimmed - 1] == '=' &&
                (trimmed < 2 || std::string_view("=!<>").find(expr_text[trimmed - 2]) ==
                                    std::string_view::npos))
            {
                append_literal(std::string(expr_text));
                part.conversion = 'r';
                expr_text = expr_text.substr(0, trimmed - 1);
            }

            auto expr = parse_embedded_expression(expr_text, base + expr_start);
            if (auto* err = std::get_if<Diagnostic>(&expr))
            {
                return std::move(*err);
            }
            part.expr = boxed(std::get<Expr>(std::move(expr)));

            if (body[j] == '!')
            {
                const char conv = (j + 1 < body.size()) ? body[j + 1] : '\0';
                if (conv != 'r' && conv != 's' && conv != 'a')
                {
                    return sandpit::diag::error_at(
                        Span{base + j, base + j + 2},
                        "f-string: invalid conversion character: expected 's', 'r', or 'a'");
                }
                part.conversion = (conv == 'a') ? 'r' : conv;
                j += 2;
            }
            if (j < body.size() && body[j] == ':')
            {
                const std::size_t spec_start = j + 1;
                ++j;
                while (j < body.size() && body[j] != '}')
                {
                    if (body[j] == '{')
                    {
                        return sandpit::diag::error_at(
                            Span{base + j, base + j + 1},
                            "f-string: nested replacement fields are not supported");
                    }
                    ++j;
                }
                part.format_spec = std::string(body.substr(spec_start, j - spec_start));
            }
            if (j >= body.size() || body[j] != '}')
            {
                return sandpit::diag::error_at(Span{base + i, base + j},
                                               "f-string: expecting '}'");
            }

            parts.push_back(std::move(part));
            i = j + 1;
            literal_start = i;
        }

        return flush_literal(body.size());
    }

    // Lexes and parses the source text of an f-string replacement field. Spans are shifted
    // to point into the enclosing source.
    static Result<Expr> parse_embedded_expression(std::string_view text, std::size_t base)
    {
        if (text.find('\\') != std::string_view::npos)
        {
            return sandpit::diag::error_at(
                Span{base, base + text.size()},
                "f-string expression part cannot include a backslash");
        }
        if (text.find('#') != std::string_view::npos)
        {
            return sandpit::diag::error_at(Span{base, base + text.size()},
                                           "f-string expression part cannot include '#'");
        }

        // Wrap in parentheses so the expression may span lines.
        const std::string wrapped = "(" + std::string(text) + ")";
        auto lexed = sandpit::lexer::lex(wrapped);
        if (auto* err = std::get_if<Diagnostic>(&lexed))
        {
            Diagnostic d = std::move(*err);
            if (d.span.has_value())
            {
                d.span = shift_wrapped(*d.span, base);
            }
            return d;
        }
        auto tokens = std::get<std::vector<Token>>(std::move(lexed));
        if (text.find_first_not_of(" \t\r\n") == std::string_view::npos)
        {
            return sandpit::diag::error_at(Span{base, base + text.size()},
                                           "f-string: empty expression not allowed");
        }

        Parser sub(tokens);
        auto res = sub.parse_standalone_expression();
        if (auto* err = std::get_if<Diagnostic>(&res))
        {
            if (err->span.has_value())
            {
                err->span = shift_wrapped(*err->span, base);
            }
            return res;
        }
        Expr expr = std::get<Expr>(std::move(res));
        shift_spans(expr, base);
        return expr;
    }

    static Span shift_wrapped(Span span, std::size_t base)
    {
        // Offsets inside the wrapper are one past the real text because of the '('.
        const std::size_t start = (span.start > 0) ? span.start - 1 : 0;
        const std::size_t end = (span.end > 0) ? span.end - 1 : 0;
        return Span{base + start, base + end};
    }

};

} // namespace

namespace
{

Span shift_span(Span span, std::size_t base)
{
    const std::size_t start = (span.start > 0) ? span.start - 1 : 0;
    const std::size_t end = (span.end > 0) ? span.end - 1 : 0;
    return Span{base + start, base + end};
}

void shift_ptr(ExprPtr& expr, std::size_t base)
{
    if (expr)
    {
        shift_spans(*expr, base);
    }
}

void shift_all(std::vector<Expr>& exprs, std::size_t base)
{
    for (auto& e : exprs)
    {
        shift_spans(e, base);
    }
}

void shift_spans(Expr& expr, std::size_t base)
{
    expr.span = shift_span(expr.span, base);
    std::visit(
        [base](auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                for (auto& part : node.parts)
                {
                    shift_ptr(part.expr, base);
                }
            }
            else if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                shift_ptr(node.operand, base);
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr> ||
                               std::is_same_v<Node, BoolOpExpr>)
            {
                shift_ptr(node.lhs, base);
                shift_ptr(node.rhs, base);
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                shift_ptr(node.first, base);
                for (auto& link : node.links)
                {
                    shift_ptr(link.rhs, base);
                }
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                shift_ptr(node.cond, base);
                shift_ptr(node.then_value, base);
                shift_ptr(node.else_value, base);
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                shift_ptr(node.callee, base);
                for (auto& arg : node.args)
                {
                    arg.span = shift_span(arg.span, base);
                    shift_ptr(arg.value, base);
                }
            }
            else if constexpr (std::is_same_v<Node, AttributeExpr>)
            {
                shift_ptr(node.base, base);
            }
            else if constexpr (std::is_same_v<Node, SubscriptExpr>)
            {
                shift_ptr(node.base, base);
                shift_ptr(node.index, base);
            }
            else if constexpr (std::is_same_v<Node, SliceExpr>)
            {
                shift_ptr(node.lower, base);
                shift_ptr(node.upper, base);
                shift_ptr(node.step, base);
            }
            else if constexpr (std::is_same_v<Node, StarredExpr>)
            {
                shift_ptr(node.value, base);
            }
            else if constexpr (std::is_same_v<Node, ListExpr> || std::is_same_v<Node, TupleExpr> ||
                               std::is_same_v<Node, SetExpr>)
            {
                shift_all(node.elements, base);
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                shift_all(node.keys, base);
                shift_all(node.values, base);
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                shift_ptr(node.element, base);
                shift_ptr(node.value, base);
                for (auto& clause : node.clauses)
                {
                    shift_ptr(clause.target, base);
                    shift_ptr(clause.iter, base);
                    shift_all(clause.conditions, base);
                }
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                for (auto& param : node.params)
                {
                    param.span = shift_span(param.span, base);
                    shift_ptr(param.default_value, base);
                }
                shift_ptr(node.body, base);
            }
        },
        expr.node);
}

// ---------------------------------------------------------------------------
// Dump
// ---------------------------------------------------------------------------

std::string_view unary_name(UnaryOp op)
{
    switch (op)
    {
    case UnaryOp::Neg:
        return "neg";
    case UnaryOp::Pos:
        return "pos";
    case UnaryOp::Not:
        return "not";
    case UnaryOp::Invert:
        return "~";
    }
    return "?";
}

std::string_view binary_name(BinaryOp op)
{
    switch (op)
    {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::FloorDiv:
        return "//";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Pow:
        return "**";
    case BinaryOp::BitAnd:
        return "&";
    case BinaryOp::BitOr:
        return "|";
    case BinaryOp::BitXor:
        return "^";
    case BinaryOp::LShift:
        return "<<";
    case BinaryOp::RShift:
        return ">>";
    }
    return "?";
}

std::string_view compare_name(CompareOp op)
{
    switch (op)
    {
    case CompareOp::Eq:
        return "==";
    case CompareOp::NotEq:
        return "!=";
    case CompareOp::Lt:
        return "<";
    case CompareOp::LtE:
        return "<=";
    case CompareOp::Gt:
        return ">";
    case CompareOp::GtE:
        return ">=";
    case CompareOp::In:
        return "in";
    case CompareOp::NotIn:
        return "not-in";
    case CompareOp::Is:
        return "is";
    case CompareOp::IsNot:
        return "is-not";
    }
    return "?";
}

std::string_view comprehension_name(ComprehensionKind kind)
{
    switch (kind)
    {
    case ComprehensionKind::List:
        return "listcomp";
    case ComprehensionKind::Set:
        return "setcomp";
    case ComprehensionKind::Dict:
        return "dictcomp";
    case ComprehensionKind::Generator:
        return "genexpr";
    }
    return "?";
}

void quote_into(std::ostringstream& os, std::string_view text)
{
    os << '"';
    for (char c : text)
    {
        switch (c)
        {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            os << c;
            break;
        }
    }
    os << '"';
}

class Dumper
{
  public:
    std::ostringstream os;

    void expr(const Expr& e)
    {
        std::visit([this](const auto& node) { expr_node(node); }, e.node);
    }

    void exprs(const std::vector<Expr>& list)
    {
        for (const auto& e : list)
        {
            os << ' ';
            expr(e);
        }
    }

    void block(const Block* b)
    {
        os << "(block";
        if (b != nullptr)
        {
            for (const auto& s : b->stmts)
            {
                os << ' ';
                stmt(s);
            }
        }
        os << ')';
    }

    void params(const std::vector<Param>& ps)
    {
        os << '(';
        bool first = true;
        for (const auto& p : ps)
        {
            if (!first)
            {
                os << ' ';
            }
            first = false;
            if (p.default_value)
            {
                os << "(= " << p.name << ' ';
                expr(*p.default_value);
                os << ')';
            }
            else
            {
                os << p.name;
            }
        }
        os << ')';
    }

    void stmt(const Stmt& s)
    {
        std::visit([this](const auto& node) { stmt_node(node); }, s.node);
    }

  private:
    void expr_node(const NoneExpr&) { os << "None"; }
    void expr_node(const BoolExpr& n) { os << (n.value ? "True" : "False"); }
    void expr_node(const IntExpr& n) { os << n.value; }
    void expr_node(const FloatExpr& n) { os << n.value; }
    void expr_node(const StringExpr& n) { quote_into(os, n.value); }
    void expr_node(const NameExpr& n) { os << n.name; }

    void expr_node(const FStringExpr& n)
    {
        os << "(fstring";
        for (const auto& part : n.parts)
        {
            os << ' ';
            if (!part.expr)
            {
                quote_into(os, part.literal);
                continue;
            }
            os << "{";
            expr(*part.expr);
            if (part.conversion != '\0')
            {
                os << '!' << part.conversion;
            }
            if (!part.format_spec.empty())
            {
                os << ':' << part.format_spec;
            }
            os << "}";
        }
        os << ')';
    }

    void expr_node(const UnaryExpr& n)
    {
        os << '(' << unary_name(n.op) << ' ';
        expr(*n.operand);
        os << ')';
    }

    void expr_node(const BinaryExpr& n)
    {
        os << '(' << binary_name(n.op) << ' ';
        expr(*n.lhs);
        os << ' ';
        expr(*n.rhs);
        os << ')';
    }

    void expr_node(const BoolOpExpr& n)
    {
        os << '(' << (n.op == BoolOp::And ? "and" : "or") << ' ';
        expr(*n.lhs);
        os << ' ';
        expr(*n.rhs);
        os << ')';
    }

    void expr_node(const CompareExpr& n)
    {
        os << "(compare ";
        expr(*n.first);
        for (const auto& link : n.links)
        {
            os << ' ' << compare_name(link.op) << ' ';
            expr(*link.rhs);
        }
        os << ')';
    }

    void expr_node(const IfExpr& n)
    {
        os << "(ifexp ";
        expr(*n.cond);
        os << ' ';
        expr(*n.then_value);
        os << ' ';
        expr(*n.else_value);
        os << ')';
    }

    void expr_node(const CallExpr& n)
    {
        os << "(call ";
        expr(*n.callee);
        for (const auto& arg : n.args)
        {
            os << ' ';
            if (arg.keyword.has_value())
            {
                os << "(kw " << *arg.keyword << ' ';
                expr(*arg.value);
                os << ')';
            }
            else if (arg.star)
            {
                os << "(* ";
                expr(*arg.value);
                os << ')';
            }
            else
            {
                expr(*arg.value);
            }
        }
        os << ')';
    }

    void expr_node(const AttributeExpr& n)
    {
        os << "(. ";
        expr(*n.base);
        os << ' ' << n.name << ')';
    }

    void expr_node(const SubscriptExpr& n)
    {
        os << "(index ";
        expr(*n.base);
        os << ' ';
        expr(*n.index);
        os << ')';
    }

    void optional_expr(const ExprPtr& e)
    {
        if (e)
        {
            expr(*e);
        }
        else
        {
            os << '_';
        }
    }

    void expr_node(const SliceExpr& n)
    {
        os << "(slice ";
        optional_expr(n.lower);
        os << ' ';
        optional_expr(n.upper);
        os << ' ';
        optional_expr(n.step);
        os << ')';
    }

    void expr_node(const StarredExpr& n)
    {
        os << "(* ";
        expr(*n.value);
        os << ')';
    }

    void expr_node(const ListExpr& n)
    {
        os << "(list";
        exprs(n.elements);
        os << ')';
    }

    void expr_node(const TupleExpr& n)
    {
        os << "(tuple";
        exprs(n.elements);
        os << ')';
    }

    void expr_node(const SetExpr& n)
    {
        os << "(set";
        exprs(n.elements);
        os << ')';
    }

    void expr_node(const DictExpr& n)
    {
        os << "(dict";
        for (std::size_t i = 0; i < n.keys.size(); ++i)
        {
            os << " (";
            expr(n.keys[i]);
            os << ' ';
            expr(n.values[i]);
            os << ')';
        }
        os << ')';
    }

    void expr_node(const ComprehensionExpr& n)
    {
        os << '(' << comprehension_name(n.kind) << ' ';
        expr(*n.element);
        if (n.value)
        {
            os << ' ';
            expr(*n.value);
        }
        for (const auto& clause : n.clauses)
        {
            os << " (for ";
            expr(*clause.target);
            os << ' ';
            expr(*clause.iter);
            for (const auto& cond : clause.conditions)
            {
                os << " (if ";
                expr(cond);
                os << ')';
            }
            os << ')';
        }
        os << ')';
    }

    void expr_node(const LambdaExpr& n)
    {
        os << "(lambda ";
        params(n.params);
        os << ' ';
        expr(*n.body);
        os << ')';
    }

    void stmt_node(const ExprStmt& n) { expr(n.expr); }

    void stmt_node(const AssignStmt& n)
    {
        os << "(assign";
        exprs(n.targets);
        os << ' ';
        expr(n.value);
        os << ')';
    }

    void stmt_node(const AugAssignStmt& n)
    {
        os << "(augassign " << binary_name(n.op) << ' ';
        expr(n.target);
        os << ' ';
        expr(n.value);
        os << ')';
    }

    void else_block(const std::unique_ptr<Block>& b)
    {
        if (b)
        {
            os << " (else ";
            block(b.get());
            os << ')';
        }
    }

    void stmt_node(const IfStmt& n)
    {
        os << "(if ";
        expr(n.cond);
        os << ' ';
        block(n.then_block.get());
        else_block(n.else_block);
        os << ')';
    }

    void stmt_node(const WhileStmt& n)
    {
        os << "(while ";
        expr(n.cond);
        os << ' ';
        block(n.body.get());
        else_block(n.else_block);
        os << ')';
    }

    void stmt_node(const ForStmt& n)
    {
        os << "(for ";
        expr(n.target);
        os << ' ';
        expr(n.iter);
        os << ' ';
        block(n.body.get());
        else_block(n.else_block);
        os << ')';
    }

    void stmt_node(const BreakStmt&) { os << "break"; }
    void stmt_node(const ContinueStmt&) { os << "continue"; }
    void stmt_node(const PassStmt&) { os << "pass"; }

    void stmt_node(const ReturnStmt& n)
    {
        os << "(return";
        if (n.value.has_value())
        {
            os << ' ';
            expr(*n.value);
        }
        os << ')';
    }

    void stmt_node(const FunctionDef& n)
    {
        os << "(def " << n.name << ' ';
        params(n.params);
        os << ' ';
        block(n.body.get());
        os << ')';
    }

    void names(std::string_view head, const std::vector<std::string>& ns)
    {
        os << '(' << head;
        for (const auto& name : ns)
        {
            os << ' ' << name;
        }
        os << ')';
    }

    void stmt_node(const GlobalStmt& n) { names("global", n.names); }
    void stmt_node(const NonlocalStmt& n) { names("nonlocal", n.names); }

    void stmt_node(const DelStmt& n)
    {
        os << "(del";
        exprs(n.targets);
        os << ')';
    }

    void stmt_node(const AssertStmt& n)
    {
        os << "(assert ";
        expr(n.test);
        if (n.message.has_value())
        {
            os << ' ';
            expr(*n.message);
        }
        os << ')';
    }
};

} // namespace

ParseResult parse(std::span<const Token> tokens)
{
    if (tokens.empty() || tokens.back().kind != TokenKind::Eof)
    {
        return std::vector<Diagnostic>{
            Diagnostic{.severity = sandpit::diag::Severity::Error,
                       .message = "token stream is not terminated by end of input",
                       .span = std::nullopt,
                       .notes = {}}};
    }
    Parser parser(tokens);
    return parser.parse_program();
}

ParseResult parse_source(std::string_view source)
{
    auto lexed = sandpit::lexer::lex(source);
    if (auto* err = std::get_if<Diagnostic>(&lexed))
    {
        return std::vector<Diagnostic>{std::move(*err)};
    }
    const auto& tokens = std::get<std::vector<Token>>(lexed);
    return parse(tokens);
}

std::string dump(const Program& program)
{
    Dumper dumper;
    bool first = true;
    for (const auto& stmt : program.body)
    {
        if (!first)
        {
            dumper.os << '\n';
        }
        first = false;
        dumper.stmt(stmt);
    }
    return dumper.os.str();
}

} // namespace sandpit::parser
