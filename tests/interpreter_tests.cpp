#include <cstdlib>
#include <iostream>
#include <sandpit/runtime/interpreter.h>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_output(const std::string& src, const std::string& expected)
{
    const auto res = sandpit::runtime::run_source(src);
    if (!res.ok)
    {
        fail("unexpected failure for:\n" + src + "\n  error: " + res.error_text());
    }
    if (res.output != expected)
    {
        fail("output mismatch for:\n" + src + "\n  got:      '" + res.output +
             "'\n  expected: '" + expected + "'");
    }
}

static sandpit::runtime::RunResult expect_error(const std::string& src, const std::string& type,
                                                const std::string& message_part = "")
{
    const auto res = sandpit::runtime::run_source(src);
    if (res.ok)
    {
        fail("expected " + type + " for:\n" + src);
    }
    if (res.error_type != type)
    {
        fail("expected " + type + " for:\n" + src + "\n  got: " + res.error_text());
    }
    if (!message_part.empty() && res.error_message.find(message_part) == std::string::npos)
    {
        fail("expected message containing '" + message_part + "' for:\n" + src +
             "\n  got: " + res.error_text());
    }
    return res;
}

static void test_basics()
{
    expect_output("print('Hello')", "Hello\n");
    expect_output("print(1 + 2 * 3, 7 // 2, -7 // 2, 7 % 3, -7 % 3, 2 ** 10)", "7 3 -4 1 2 1024\n");
    expect_output("print(1 / 2, 0.1 + 0.2, 1e20, 1.5e-7)", "0.5 0.30000000000000004 1e+20 1.5e-07\n");
    expect_output("print(10 / 5, 2 ** -1, 3.0 * 2)", "2.0 0.5 6.0\n");
    expect_output("print(True + True, 1 == 1.0, 'a' < 'b' < 'c', 1 < 2 > 3)", "2 True True False\n");
    expect_output("print(None is None, [] is not [], 3 in [1, 2, 3], 'x' not in 'abc')",
                  "True True True True\n");
    expect_output("print(0 or 'fallback', 1 and 2, not [])", "fallback 2 True\n");
    expect_output("print(7 & 3, 7 | 8, 7 ^ 2, 1 << 4, -16 >> 2, ~5)", "3 15 5 16 -4 -6\n");
    expect_output("x = 5\nx += 2\nx *= 3\nx -= 1\nprint(x)", "20\n");
    expect_output("a, b = 1, 2\na, b = b, a\nprint(a, b)", "2 1\n");
    expect_output("first, *rest = [1, 2, 3]\nprint(first, rest)", "1 [2, 3]\n");
    expect_output("x = y = 3\nprint(x + y)", "6\n");
    expect_output("print('yes' if 0 else 'no')", "no\n");
}

static void test_strings()
{
    expect_output("s = 'héllo'\nprint(s[1], s[-1], s[1:3], s[::-1])", "é o él olléh\n");
    expect_output("print('a,b,,c'.split(','), ' x y '.split())", "['a', 'b', '', 'c'] ['x', 'y']\n");
    expect_output("print('-'.join(['a', 'b']), 'ab' * 3, 'Hi'.upper(), 'Hi'.lower())",
                  "a-b ababab HI hi\n");
    expect_output("print('  pad '.strip() + '|', 'abc'.replace('b', 'B'), 'hello'.find('l'))",
                  "pad| aBc 2\n");
    expect_output("print('x'.center(5, '*'), '7'.zfill(3), 'ab'.startswith('a'))", "**x** 007 True\n");
    expect_output("name = 'Ana'\nn = 3\nprint(f'{name} has {n * 2} points')", "Ana has 6 points\n");
    expect_output("v = 3.14159\nprint(f'{v:.2f}|{42:>5}|{7:03d}|{\"s\"!r}')", "3.14|   42|007|'s'\n");
    expect_output("x = 10\nprint(f'{x=}')", "x=10\n");
    expect_output("print('{} + {} = {}'.format(1, 2, 3), '{0}{0}'.format('ab'))", "1 + 2 = 3 abab\n");
    expect_output("print('{:,}'.format(1234567), '{:.1%}'.format(0.25))", "1,234,567 25.0%\n");
    expect_output("s = \"it's\"\nq = 'q'\nprint(f'{s!r}', str([1, 'a']), f'{q!r}')",
                  "\"it's\" [1, 'a'] 'q'\n");
    expect_output("print('abc'.count('b'), 'a-b-c'.split('-', 1), 'Title case'.title())",
                  "1 ['a', 'b-c'] Title Case\n");
    expect_output("print(\"\"\"two\nlines\"\"\")", "two\nlines\n");
}

static void test_containers()
{
    expect_output("xs = [3, 1, 2]\nxs.append(5)\nxs.sort()\nprint(xs, len(xs), xs[-1])",
                  "[1, 2, 3, 5] 4 5\n");
    expect_output("xs = [1, 2]\nys = xs\nys.append(3)\nprint(xs)", "[1, 2, 3]\n");
    expect_output("xs = [1, 2]\nxs += [3]\nprint(xs, xs * 2)", "[1, 2, 3] [1, 2, 3, 1, 2, 3]\n");
    expect_output("xs = list(range(10))\nprint(xs[2:8:2], xs[-3:], xs[:2])", "[2, 4, 6] [7, 8, 9] [0, 1]\n");
    expect_output("xs = [5, 3, 8]\nxs.sort(reverse=True)\nprint(xs)", "[8, 5, 3]\n");
    expect_output("pairs = [(2, 'b'), (1, 'z'), (2, 'a')]\npairs.sort(key=lambda p: p[0])\nprint(pairs)",
                  "[(1, 'z'), (2, 'b'), (2, 'a')]\n");
}

static void test_containers_more()
{
    expect_output("d = {'a': 1}\nd['b'] = 2\nprint(d, d.get('c', 0), list(d.keys()), 'a' in d)",
                  "{'a': 1, 'b': 2} 0 ['a', 'b'] True\n");
    expect_output("d = {'x': 1, 'y': 2}\nfor k, v in d.items():\n    print(k, v)", "x 1\ny 2\n");
    expect_output("s = {3, 1, 3}\ns.add(2)\nprint(len(s), 1 in s, s & {1, 2}, s | {9})",
                  "3 True {1, 2} {3, 1, 2, 9}\n");
    expect_output("t = (1, 2, 3)\na, b, c = t\nprint(t, (1,), (), a + c)", "(1, 2, 3) (1,) () 4\n");
    expect_output("xs = [1, 2, 3]\ndel xs[0]\nprint(xs, xs.pop(), xs)", "[2, 3] 3 [2]\n");
    expect_output("print([x * x for x in range(5) if x % 2 == 0])", "[0, 4, 16]\n");
    expect_output("print({k: v for k, v in [('a', 1), ('b', 2)]}, {x % 3 for x in range(6)})",
                  "{'a': 1, 'b': 2} {0, 1, 2}\n");
    expect_output("print(sum(x for x in range(4)), [(i, j) for i in range(2) for j in range(2)])",
                  "6 [(0, 0), (0, 1), (1, 0), (1, 1)]\n");
    expect_output("print([[0] * 2] * 2, [1, [2, [3]]])", "[[0, 0], [0, 0]] [1, [2, [3]]]\n");
    expect_output("xs = [1]\nxs.append(xs)\nprint(xs)", "[1, [...]]\n");
}

static void test_control_flow()
{
    expect_output("for i in range(3):\n    print(i)", "0\n1\n2\n");
    expect_output("i = 0\nwhile i < 5:\n    i += 1\n    if i == 2:\n        continue\n    if i == 4:\n"
                  "        break\n    print(i)\nelse:\n    print('no break')",
                  "1\n3\n");
    expect_output("for i in []:\n    pass\nelse:\n    print('done')", "done\n");
    expect_output("x = 7\nif x < 5:\n    print('small')\nelif x < 10:\n    print('medium')\nelse:\n"
                  "    print('large')",
                  "medium\n");
    expect_output("for i, ch in enumerate('ab'):\n    print(i, ch)", "0 a\n1 b\n");
    expect_output("assert True, 'fine'\nprint('after')", "after\n");
}

static void test_functions()
{
    expect_output("def add(a, b=10):\n    return a + b\nprint(add(1), add(1, 2), add(b=3, a=4))",
                  "11 3 7\n");
    expect_output("def fact(n):\n    return 1 if n <= 1 else n * fact(n - 1)\nprint(fact(20))",
                  "2432902008176640000\n");
    expect_output("def counter():\n    n = 0\n    def inc():\n        nonlocal n\n        n += 1\n"
                  "        return n\n    return inc\nc = counter()\nc()\nprint(c())",
                  "2\n");
    expect_output("total = 0\ndef bump():\n    global total\n    total += 5\nbump()\nprint(total)",
                  "5\n");
    expect_output("sq = lambda x: x * x\nprint(sq(4), (lambda: 'k')())", "16 k\n");
    expect_output("def f():\n    pass\nprint(f())", "None\n");
    expect_output("def f():\n    pass\ns = str(f)\nprint(s[:17], s[-1], len(s) > 18)",
                  "<function f at 0x > True\n");
    expect_output("def apply(fn, xs):\n    return [fn(x) for x in xs]\nprint(apply(str, [1, 2]))",
                  "['1', '2']\n");
}

static void test_errors()
{
    {
        const auto res = expect_error("print(1/0)", "ZeroDivisionError", "division by zero");
        if (!res.error_line.has_value() || *res.error_line != 1)
        {
            fail("expected ZeroDivisionError on line 1");
        }
    }
    {
        const auto res = expect_error("x = 1\ny = 2\nprint(z)", "NameError", "name 'z' is not defined");
        if (!res.error_line.has_value() || *res.error_line != 3)
        {
            fail("expected NameError on line 3");
        }
        if (res.error_text() != "NameError: name 'z' is not defined (line 3)")
        {
            fail("unexpected error_text: " + res.error_text());
        }
    }
    {
        // Output produced before the error is kept.
        const auto res = expect_error("print('partial')\n[][1]", "IndexError");
        if (res.output != "partial\n")
        {
            fail("expected partial output before the error, got: " + res.output);
        }
    }
    expect_error("'a' + 1", "TypeError");
    expect_error("{}['missing']", "KeyError", "'missing'");
    expect_error("int('abc')", "ValueError");
    expect_error("def f():\n    x += 1\nf()", "UnboundLocalError");
    {
        sandpit::runtime::RunOptions shallow;
        shallow.max_call_depth = 100;
        const auto res = sandpit::runtime::run_source("def f(n):\n    return f(n + 1)\nf(0)", shallow);
        if (res.ok || res.error_type != "RecursionError")
        {
            fail("expected RecursionError past the call depth limit, got: " + res.error_text());
        }
    }
    expect_error("assert 1 == 2, 'math broke'", "AssertionError", "math broke");
    expect_error("return 5", "SyntaxError", "'return' outside function");
    expect_error("break", "SyntaxError", "'break' outside loop");
    expect_error("x = (", "SyntaxError");
    expect_error("import os", "SyntaxError", "import");
    expect_error("print(2 ** 64)", "OverflowError");
    expect_error("(1).__class__", "AttributeError");
    expect_error("def f(a):\n    pass\nf(1, 2)", "TypeError", "takes 1 positional argument");
    expect_error("xs = [1]\nxs.nosuch()", "AttributeError");
    expect_error("len()", "TypeError");
}

static void test_nested_containers()
{
    expect_output("a = []\na.append(a)\nd = {}\nd['self'] = d\nprint(a == a, a, d)",
                  "True [[...]] {'self': {...}}\n");
    expect_error("a = []\na.append(a)\nb = []\nb.append(b)\nprint(a == b)", "RecursionError",
                 "in comparison");
    expect_error("a = []\na.append(a)\nb = []\nb.append(b)\nprint(a < b)", "RecursionError",
                 "in comparison");

    const std::string deep_x = "x = []\nfor i in range(100000):\n    x = [x]\n";
    const std::string deep_y = "y = []\nfor i in range(100000):\n    y = [y]\n";
    expect_error(deep_x + "print(x)", "RecursionError", "while getting the repr of an object");
    expect_error(deep_x + deep_y + "print(x == y)", "RecursionError", "in comparison");
    expect_error("t = ()\nfor i in range(100000):\n    t = (t,)\ns = {t}", "RecursionError");

    // Dropping the last reference to a deep structure frees it without recursing per level.
    expect_output("x = []\nfor i in range(200000):\n    x = [x]\nx = 0\nprint('freed')", "freed\n");
    expect_output("d = {}\nfor i in range(200000):\n    d = {'k': d}\nd = None\nprint('freed')",
                  "freed\n");
    expect_output("t = ()\nfor i in range(200000):\n    t = (t, [t])\nprint(len(t))", "2\n");
}

static void test_output_cap()
{
    sandpit::runtime::RunOptions options;
    options.max_output_bytes = 16;
    const auto res = sandpit::runtime::run_source("for i in range(100):\n    print('abcdef')", options);
    if (!res.ok)
    {
        fail("output cap must not fail the run: " + res.error_text());
    }
    if (!res.truncated)
    {
        fail("expected truncated output");
    }
    const std::string expected = "abcdef\nabcdef\nab" + std::string(sandpit::runtime::kTruncationMarker);
    if (res.output != expected)
    {
        fail("unexpected truncated output: '" + res.output + "'");
    }

    sandpit::runtime::OutputBuffer buffer(4);
    buffer.append("ab");
    buffer.append("\xC3\xA9\xC3\xA9"); // "éé": the second one does not fit
    if (!buffer.truncated() || buffer.finish() != "ab\xC3\xA9" + std::string(sandpit::runtime::kTruncationMarker))
    {
        fail("OutputBuffer must cut on a UTF-8 boundary");
    }
}

int main()
{
    test_basics();
    test_strings();
    test_containers();
    test_containers_more();
    test_control_flow();
    test_functions();
    test_errors();
    test_nested_containers();
    test_output_cap();
    std::cout << "OK\n";
    return 0;
}
