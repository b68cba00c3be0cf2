#include <cstdlib>
#include <iostream>
#include <sandpit/diag/diagnostic.h>
#include <sandpit/diag/render.h>
#include <sandpit/source/source_file.h>
#include <string>

static void expect_contains(const std::string& got, const std::string& needle, const char* what)
{
    if (got.find(needle) == std::string::npos)
    {
        std::cerr << "FAIL: " << what << ": expected output to contain: '" << needle << "'\n";
        std::cerr << "Got:\n" << got << "\n";
        std::exit(1);
    }
}

int main()
{
    const sandpit::source::SourceFile file{
        .path = "quiz.py",
        .contents = "abc\n"  // line 1
                    "defg\n" // line 2
                    "hi\n",  // line 3
    };

    {
        sandpit::diag::Diagnostic diag;
        diag.severity = sandpit::diag::Severity::Warning;
        diag.message = "something happened";
        diag.notes.push_back(sandpit::diag::Related{.message = "note 1", .span = std::nullopt});

        const std::string out = sandpit::diag::render(diag, file);
        expect_contains(out, "quiz.py: warning: something happened", "no-span header");
        expect_contains(out, "note: note 1", "no-span note");
    }

    {
        auto diag = sandpit::diag::error_at(sandpit::source::Span{.start = 5, .end = 7}, "bad");
        diag.notes.push_back(sandpit::diag::Related{
            .message = "first seen here", .span = sandpit::source::Span{.start = 9, .end = 10}});

        const std::string out = sandpit::diag::render(diag, file);
        expect_contains(out, "quiz.py:2:2: error: bad", "span header");
        expect_contains(out, "| defg", "source line");
        expect_contains(out, "|  ^^\n", "caret position and length");
        expect_contains(out, "note: first seen here (line 3)", "note with line");
    }

    {
        const auto diag =
            sandpit::diag::error_at(sandpit::source::Span{.start = 3, .end = 3}, "point");
        const std::string out = sandpit::diag::render(diag, file);
        expect_contains(out, "quiz.py:1:4: error: point", "zero-length header");
        expect_contains(out, "|    ^\n", "zero-length caret");
    }

    {
        // Spans running past the line are clipped to it.
        const auto diag =
            sandpit::diag::error_at(sandpit::source::Span{.start = 1, .end = 11}, "multi");
        const std::string out = sandpit::diag::render(diag, file);
        expect_contains(out, "quiz.py:1:2: error: multi", "multi-line header");
        expect_contains(out, "|  ^^\n", "multi-line caret clipped");
    }

    std::cout << "OK\n";
    return 0;
}
