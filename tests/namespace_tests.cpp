#include <cstdlib>
#include <iostream>
#include <sandpit/runtime/interpreter.h>
#include <sandpit/runtime/namespace.h>
#include <string>
#include <string_view>
#include <vector>

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
        fail("unexpected failure for '" + src + "': " + res.error_text());
    }
    if (res.output != expected)
    {
        fail("output mismatch for '" + src + "': got '" + res.output + "' expected '" + expected +
             "'");
    }
}

static void expect_error(const std::string& src, const std::string& type)
{
    const auto res = sandpit::runtime::run_source(src);
    if (res.ok)
    {
        fail("expected '" + src + "' to fail with " + type);
    }
    if (res.error_type != type)
    {
        fail("expected " + type + " for '" + src + "', got: " + res.error_text());
    }
}

int main()
{
    using namespace sandpit::runtime;

    const auto& ns = restricted_namespace();
    const std::vector<std::string_view> expected = {
        "abs",   "bool", "dict", "enumerate", "float", "int", "len",   "list",
        "max",   "min",  "print", "range",    "set",   "str", "sum",   "tuple",
    };
    if (ns.names() != expected)
    {
        fail("unexpected namespace contents");
    }
    if (ns.size() != expected.size())
    {
        fail("namespace size mismatch");
    }

    for (std::string_view banned : {"open", "eval", "exec", "compile", "getattr", "setattr",
                                    "globals", "locals", "vars", "input", "__import__", "type",
                                    "object", "breakpoint", "help", "exit", "quit"})
    {
        if (ns.find(banned) != nullptr)
        {
            fail("namespace must not expose " + std::string(banned));
        }
    }

    if (ns.find("print") == nullptr || ns.find("print")->fn == nullptr)
    {
        fail("print must be bound");
    }

    {
        // A fresh build is identical to the shared table.
        const auto fresh = build_namespace();
        if (fresh.names() != ns.names())
        {
            fail("build_namespace must be deterministic");
        }
    }

    expect_output("print(abs(-3), abs(2.5))", "3 2.5\n");
    expect_output("print(len('héllo'), len([1, 2]), len({'a': 1}))", "5 2 1\n");
    expect_output("print(int('42') + 1, int(3.9), int(-3.9), int(True))", "43 3 -3 1\n");
    expect_output("print(float('1.5'), float(2))", "1.5 2.0\n");
    expect_output("print(str(1) + str(None), bool(0), bool('x'))", "1None False True\n");
    expect_output("print(list(range(2, 10, 3)), tuple([1]), set())", "[2, 5, 8] (1,) set()\n");
    expect_output("print(dict(a=1), dict([('b', 2)]))", "{'a': 1} {'b': 2}\n");
    expect_output("print(list(enumerate('ab', 1)))", "[(1, 'a'), (2, 'b')]\n");
    expect_output("print(min(3, 1, 2), max([4, 9]), min('b', 'a'))", "1 9 a\n");
    expect_output("print(max([], default=0), min([5], key=lambda v: -v))", "0 5\n");
    expect_output("print(sum([1, 2, 3]), sum([0.5, 0.25], 1))", "6 1.75\n");
    expect_output("print('a', 'b', sep='-', end='!\\n')", "a-b!\n");
    expect_output("print()", "\n");

    expect_error("open('/etc/passwd')", "NameError");
    expect_error("eval('1')", "NameError");
    expect_error("int('x')", "ValueError");
    expect_error("len(5)", "TypeError");
    expect_error("max([])", "ValueError");
    expect_error("range(1, 2, 0)", "ValueError");
    expect_error("print(sep=1)", "TypeError");

    std::cout << "OK\n";
    return 0;
}
