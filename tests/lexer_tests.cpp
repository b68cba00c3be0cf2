#include <cstdlib>
#include <iostream>
#include <sandpit/lexer/lexer.h>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_token(const std::vector<sandpit::lexer::Token>& tokens, std::size_t index,
                         sandpit::lexer::TokenKind kind, std::string_view lexeme)
{
    if (index >= tokens.size())
    {
        fail("missing token at index " + std::to_string(index));
    }

    const auto& t = tokens[index];
    if (t.kind != kind)
    {
        fail("token kind mismatch at index " + std::to_string(index) + ": got " +
             std::string(sandpit::lexer::to_string(t.kind)));
    }
    if (t.lexeme != lexeme)
    {
        fail("token lexeme mismatch at index " + std::to_string(index) + ": got '" +
             std::string(t.lexeme) + "'");
    }
}

// Token lexemes view into `src`; callers pass literals so the views stay valid.
static std::vector<sandpit::lexer::Token> lex_ok(std::string_view src)
{
    auto res = sandpit::lexer::lex(src);
    if (const auto* d = std::get_if<sandpit::diag::Diagnostic>(&res))
    {
        fail("unexpected lex error for '" + std::string(src) + "': " + d->message);
    }
    return std::get<std::vector<sandpit::lexer::Token>>(std::move(res));
}

static std::string lex_error(const std::string& src)
{
    const auto res = sandpit::lexer::lex(src);
    if (!std::holds_alternative<sandpit::diag::Diagnostic>(res))
    {
        fail("expected lex error for '" + src + "'");
    }
    return std::get<sandpit::diag::Diagnostic>(res).message;
}

int main()
{
    using namespace sandpit::lexer;

    {
        const auto toks = lex_ok("x = 1 + 2.5\n");
        expect_token(toks, 0, TokenKind::Identifier, "x");
        expect_token(toks, 1, TokenKind::Equal, "=");
        expect_token(toks, 2, TokenKind::IntLiteral, "1");
        expect_token(toks, 3, TokenKind::Plus, "+");
        expect_token(toks, 4, TokenKind::FloatLiteral, "2.5");
        expect_token(toks, 5, TokenKind::Newline, "\n");
        expect_token(toks, 6, TokenKind::Eof, "");
    }

    {
        // Indentation produces Indent/Dedent pairs; a missing final newline is synthesized.
        const auto toks = lex_ok("def f():\n    return 1\nf()");
        expect_token(toks, 0, TokenKind::KwDef, "def");
        expect_token(toks, 1, TokenKind::Identifier, "f");
        expect_token(toks, 2, TokenKind::LParen, "(");
        expect_token(toks, 3, TokenKind::RParen, ")");
        expect_token(toks, 4, TokenKind::Colon, ":");
        expect_token(toks, 5, TokenKind::Newline, "\n");
        expect_token(toks, 6, TokenKind::Indent, "    ");
        expect_token(toks, 7, TokenKind::KwReturn, "return");
        expect_token(toks, 8, TokenKind::IntLiteral, "1");
        expect_token(toks, 9, TokenKind::Newline, "\n");
        expect_token(toks, 10, TokenKind::Dedent, "");
        expect_token(toks, 11, TokenKind::Identifier, "f");
        if (toks.back().kind != TokenKind::Eof || toks[toks.size() - 2].kind != TokenKind::Newline)
        {
            fail("expected Newline then Eof at end of input");
        }
    }

    {
        // Keywords inside strings and comments stay inert.
        const auto toks = lex_ok("s = 'import os'  # import sys\n");
        expect_token(toks, 2, TokenKind::StringLiteral, "'import os'");
        expect_token(toks, 3, TokenKind::Newline, "\n");
        for (const auto& t : toks)
        {
            if (t.kind == TokenKind::KwImport)
            {
                fail("import inside a string or comment must not lex as a keyword");
            }
        }
    }

    {
        // Newlines inside brackets are implicit joins.
        const auto toks = lex_ok("xs = [1,\n      2]\n");
        expect_token(toks, 3, TokenKind::IntLiteral, "1");
        expect_token(toks, 4, TokenKind::Comma, ",");
        expect_token(toks, 5, TokenKind::IntLiteral, "2");
        expect_token(toks, 6, TokenKind::RBracket, "]");
    }

    {
        const auto toks = lex_ok("a //= 2 ** 3 != b\n");
        expect_token(toks, 1, TokenKind::SlashSlashEqual, "//=");
        expect_token(toks, 3, TokenKind::StarStar, "**");
        expect_token(toks, 5, TokenKind::BangEqual, "!=");
    }

    {
        const auto toks = lex_ok("f'{x!r:>4}' + \"\"\"a\nb\"\"\" + 0x1F + 1_000\n");
        expect_token(toks, 0, TokenKind::StringLiteral, "f'{x!r:>4}'");
        expect_token(toks, 2, TokenKind::StringLiteral, "\"\"\"a\nb\"\"\"");
        expect_token(toks, 4, TokenKind::IntLiteral, "0x1F");
        expect_token(toks, 6, TokenKind::IntLiteral, "1_000");
    }

    {
        // Blank and comment-only lines do not change indentation.
        const auto toks = lex_ok("if x:\n\n    # note\n    y = 1\n");
        expect_token(toks, 4, TokenKind::Indent, "    ");
        expect_token(toks, 5, TokenKind::Identifier, "y");
    }

    if (lex_error("s = 'abc\n").find("unterminated string literal") == std::string::npos)
    {
        fail("expected unterminated string diagnostic");
    }
    if (lex_error("s = '''abc").find("unterminated triple-quoted") == std::string::npos)
    {
        fail("expected unterminated triple-quoted diagnostic");
    }
    if (lex_error("if x:\n        a\n    b\n").find("unindent does not match") == std::string::npos)
    {
        fail("expected inconsistent dedent diagnostic");
    }
    if (lex_error("x = 012\n").find("leading zeros") == std::string::npos)
    {
        fail("expected leading zeros diagnostic");
    }
    if (lex_error("x = b'raw'\n").find("byte strings") == std::string::npos)
    {
        fail("expected byte string diagnostic");
    }
    if (lex_error("x = 1j\n").find("complex") == std::string::npos)
    {
        fail("expected complex literal diagnostic");
    }
    if (lex_error("x = $\n").find("invalid character") == std::string::npos)
    {
        fail("expected invalid character diagnostic");
    }

    {
        const auto res = lex("x = 'oops");
        const auto& d = std::get<sandpit::diag::Diagnostic>(res);
        if (!d.span.has_value() || d.span->start != 4)
        {
            fail("expected unterminated string span to start at the quote");
        }
    }

    std::cout << "OK\n";
    return 0;
}
