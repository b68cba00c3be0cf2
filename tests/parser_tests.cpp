#include <cstdlib>
#include <iostream>
#include <sandpit/parser/parser.h>
#include <string>
#include <variant>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_dump(const std::string& src, const std::string& expected)
{
    const auto res = sandpit::parser::parse_source(src);
    if (const auto* diags = std::get_if<std::vector<sandpit::diag::Diagnostic>>(&res))
    {
        fail("unexpected parse error for '" + src + "': " +
             (diags->empty() ? std::string("<none>") : diags->front().message));
    }
    const std::string got = sandpit::parser::dump(std::get<sandpit::parser::Program>(res));
    if (got != expected)
    {
        fail("dump mismatch for '" + src + "'\n  got:      " + got + "\n  expected: " + expected);
    }
}

static void expect_error(const std::string& src, const std::string& needle)
{
    const auto res = sandpit::parser::parse_source(src);
    const auto* diags = std::get_if<std::vector<sandpit::diag::Diagnostic>>(&res);
    if (diags == nullptr || diags->empty())
    {
        fail("expected parse error for '" + src + "'");
    }
    if (diags->front().message.find(needle) == std::string::npos)
    {
        fail("expected error containing '" + needle + "' for '" + src + "', got: " +
             diags->front().message);
    }
    if (!diags->front().span.has_value())
    {
        fail("expected parse error to carry a span for '" + src + "'");
    }
}

int main()
{
    expect_dump("x = 1 + 2 * 3\n", "(assign x (+ 1 (* 2 3)))");
    expect_dump("print(\"hi\")\n", "(call print \"hi\")");
    expect_dump("print(a, sep='')\n", "(call print a (kw sep \"\"))");
    expect_dump("a < b <= c\n", "(compare a < b <= c)");
    expect_dump("a, b = b, a\n", "(assign (tuple a b) (tuple b a))");
    expect_dump("x = y = 0\n", "(assign x y 0)");
    expect_dump("x += 1\n", "(augassign + x 1)");
    expect_dump("xs[1:]\n", "(index xs (slice 1 _ _))");
    expect_dump("a.b\n", "(. a b)");
    expect_dump("[i for i in xs if i]\n", "(listcomp i (for i xs (if i)))");
    expect_dump("f'a{x!r:>4}'\n", "(fstring \"a\" {x!r:>4})");
    expect_dump("def f(x, y=2):\n    return x\n", "(def f (x (= y 2)) (block (return x)))");
    expect_dump("while x:\n    pass\nelse:\n    pass\n",
                "(while x (block pass) (else (block pass)))");
    expect_dump("for i in range(3):\n    continue\n",
                "(for i (call range 3) (block continue))");
    expect_dump("x = 1\nprint(x)\n", "(assign x 1)\n(call print x)");
    expect_dump("a and b or c\n", "(or (and a b) c)");
    expect_dump("x = 1 if c else 2\n", "(assign x (ifexp c 1 2))");
    expect_dump("global g\n", "(global g)");
    expect_dump("del xs[0]\n", "(del (index xs 0))");

    expect_error("import os\n", "import statements are not allowed");
    expect_error("class A:\n    pass\n", "'class' definitions are not supported");
    expect_error("try:\n    pass\nexcept:\n    pass\n", "'try' statements are not supported");
    expect_error("with x:\n    pass\n", "'with' statements are not supported");
    expect_error("raise ValueError\n", "'raise' statements are not supported");
    expect_error("def f(x, x):\n    pass\n", "duplicate argument 'x'");
    expect_error("f(a=1, 2)\n", "positional argument follows keyword argument");
    expect_error("if x:\nprint(1)\n", "expected an indented block");
    expect_error("x = lambda: (yield)\n", "'yield' is not supported");
    expect_error("print(1))\n", "invalid syntax");

    {
        // Lexer failures surface as parse diagnostics.
        const auto res = sandpit::parser::parse_source("x = 'abc\n");
        if (!std::holds_alternative<std::vector<sandpit::diag::Diagnostic>>(res))
        {
            fail("expected lexer error to surface from parse_source");
        }
    }

    std::cout << "OK\n";
    return 0;
}
