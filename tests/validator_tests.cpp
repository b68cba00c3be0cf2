#include <cstdlib>
#include <iostream>
#include <sandpit/validate/validator.h>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_accepted(const std::string& src)
{
    const auto res = sandpit::validate::validate(src);
    if (const auto* v = std::get_if<sandpit::validate::Violation>(&res))
    {
        fail("expected '" + src + "' to be accepted, got: " + v->reason);
    }
}

static sandpit::validate::Violation expect_rejected(const std::string& src,
                                                    sandpit::validate::ViolationKind kind)
{
    const auto res = sandpit::validate::validate(src);
    const auto* v = std::get_if<sandpit::validate::Violation>(&res);
    if (v == nullptr)
    {
        fail("expected '" + src + "' to be rejected");
    }
    if (v->kind != kind)
    {
        fail("unexpected violation kind for '" + src + "': " + v->reason);
    }
    return *v;
}

int main()
{
    using sandpit::validate::ViolationKind;

    expect_accepted("print('Hello')");
    expect_accepted("while True: pass");
    expect_accepted("print(1/0)");
    expect_accepted("# import os\nprint('import is just a word here')\n");
    expect_accepted("important = 1\nreimport = 2\nprint(important + reimport)\n");
    expect_accepted("_private = 1\nx_ = _private\n");

    {
        const auto v = expect_rejected("import os", ViolationKind::Import);
        if (v.reason.find("import") == std::string::npos)
        {
            fail("import rejection reason must mention import: " + v.reason);
        }
        if (v.span.start != 0 || v.span.end != 6)
        {
            fail("import rejection span should cover the keyword");
        }
    }

    expect_rejected("from os import path\n", ViolationKind::Import);
    expect_rejected("x = 1\nif x:\n    import sys\n", ViolationKind::Import);
    expect_rejected("import os as o; print(o)", ViolationKind::Import);

    {
        const auto v = expect_rejected("__import__('os')", ViolationKind::ReservedName);
        if (v.reason.find("__import__") == std::string::npos)
        {
            fail("reserved-name reason should name the identifier: " + v.reason);
        }
    }
    expect_rejected("print(().__class__)", ViolationKind::ReservedName);
    expect_rejected("x = __builtins__\n", ViolationKind::ReservedName);
    expect_rejected("getattr(1, '__class__')", ViolationKind::ReservedName);

    {
        // First violation in source order wins.
        const auto v = expect_rejected("y = __name__\nimport os\n", ViolationKind::ReservedName);
        if (v.span.start != 4)
        {
            fail("expected the first violation to be reported");
        }
    }

    {
        // Source that does not tokenize still gets a textual check.
        expect_rejected("import os\nx = 'unterminated", ViolationKind::Import);
        expect_rejected("x = 'unterminated __class__", ViolationKind::ReservedName);
        expect_accepted("x = 'unterminated");
    }

    if (!sandpit::validate::is_dunder("__init__") || sandpit::validate::is_dunder("__x") ||
        sandpit::validate::is_dunder("____") || sandpit::validate::is_dunder("_x_"))
    {
        fail("is_dunder classification");
    }

    {
        const auto v = expect_rejected("import os", ViolationKind::Import);
        const auto d = sandpit::validate::to_diagnostic(v);
        if (d.message != v.reason || !d.span.has_value() || d.span->start != 0)
        {
            fail("to_diagnostic should carry reason and span");
        }
    }

    std::cout << "OK\n";
    return 0;
}
