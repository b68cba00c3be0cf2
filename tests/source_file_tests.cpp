#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sandpit/source/source_file.h>
#include <sstream>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    namespace fs = std::filesystem;
    using namespace sandpit::source;

    const fs::path tmp = fs::temp_directory_path() / "sandpit_source_file_tests.py";
    (void)fs::remove(tmp);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            fail("failed to create temp file");
        }
        out << "print('hi')\nprint(2)";
    }

    {
        const auto res = load_source_file(tmp.string());
        if (!std::holds_alternative<SourceFile>(res))
        {
            fail("expected SourceFile for readable temp file");
        }
        const auto& sf = std::get<SourceFile>(res);
        if (sf.path != tmp.string())
        {
            fail("unexpected path");
        }
        if (sf.contents != "print('hi')\nprint(2)")
        {
            fail("unexpected contents");
        }
    }

    {
        const auto res = load_source_file("sandpit_missing_script_for_tests.py");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected LoadError for missing file");
        }
        if (std::get<LoadError>(res).message.find("failed to open") == std::string::npos)
        {
            fail("unexpected LoadError message: " + std::get<LoadError>(res).message);
        }
    }

    {
        std::istringstream in("x = 1\n");
        const auto res = load_source_stream(in, "<stdin>");
        if (!std::holds_alternative<SourceFile>(res))
        {
            fail("expected SourceFile from stream");
        }
        if (std::get<SourceFile>(res).path != "<stdin>" ||
            std::get<SourceFile>(res).contents != "x = 1\n")
        {
            fail("unexpected stream SourceFile");
        }
    }

    (void)fs::remove(tmp);
    std::cout << "OK\n";
    return 0;
}
