#include <cstdlib>
#include <iostream>
#include <sandpit/source/line_map.h>
#include <string>
#include <string_view>

static void expect_eq(std::size_t got, std::size_t expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got=" << got << " expected=" << expected << "\n";
        std::exit(1);
    }
}

static void expect_text(std::string_view got, std::string_view expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got='" << got << "' expected='" << expected << "'\n";
        std::exit(1);
    }
}

int main()
{
    const std::string text = "a\n"  // line 1
                             "bc\n" // line 2
                             "def"; // line 3 (no trailing newline)

    sandpit::source::LineMap map(text);

    {
        const auto lc = map.offset_to_line_col(0);
        expect_eq(lc.line, 1, "offset 0 line");
        expect_eq(lc.col, 1, "offset 0 col");
    }

    {
        const auto lc = map.offset_to_line_col(1); // '\n'
        expect_eq(lc.line, 1, "offset 1 line");
        expect_eq(lc.col, 2, "offset 1 col");
    }

    {
        const auto lc = map.offset_to_line_col(2); // 'b'
        expect_eq(lc.line, 2, "offset 2 line");
        expect_eq(lc.col, 1, "offset 2 col");
    }

    {
        const auto lc = map.offset_to_line_col(text.size() + 123); // clamp past end
        expect_eq(lc.line, 3, "clamped end line");
        expect_eq(lc.col, 4, "clamped end col");
    }

    expect_eq(map.line_start_offset(0), 0, "line 0 start offset");
    expect_eq(map.line_start_offset(2), 2, "line 2 start offset");
    expect_eq(map.line_start_offset(3), 5, "line 3 start offset");
    expect_eq(map.line_start_offset(999), text.size(), "too-large line start offset");
    expect_eq(map.line_count(), 3, "line_count");

    expect_text(map.line_text(1), "a", "line 1 text");
    expect_text(map.line_text(3), "def", "line 3 text");

    {
        const std::string crlf = "x = 1\r\nprint(x)\r\n";
        sandpit::source::LineMap crlf_map(crlf);
        expect_text(crlf_map.line_text(1), "x = 1", "crlf line 1 text");
        expect_text(crlf_map.line_text(2), "print(x)", "crlf line 2 text");
        expect_eq(crlf_map.line_count(), 3, "crlf line_count");
    }

    std::cout << "OK\n";
    return 0;
}
