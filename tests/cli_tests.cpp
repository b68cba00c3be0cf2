#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sandpit/cli/cli.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static int run_cli_capture(const std::vector<std::string>& argv_storage, std::string& out,
                           std::string& err)
{
    std::ostringstream captured_out;
    std::ostringstream captured_err;

    auto* old_out = std::cout.rdbuf(captured_out.rdbuf());
    auto* old_err = std::cerr.rdbuf(captured_err.rdbuf());

    std::vector<std::string> args = argv_storage;
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args)
    {
        argv.push_back(s.data());
    }

    const int rc = sandpit::cli::run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    out = captured_out.str();
    err = captured_err.str();
    return rc;
}

static void expect_contains(const std::string& haystack, const std::string& needle,
                            const std::string& what)
{
    if (haystack.find(needle) == std::string::npos)
    {
        fail("expected " + what + " to contain '" + needle + "'\n---\n" + haystack + "\n---");
    }
}

static void expect_rc(int rc, int expected, const std::string& what, const std::string& err)
{
    if (rc != expected)
    {
        fail(what + ": exit code " + std::to_string(rc) + ", expected " + std::to_string(expected) +
             "\n---\n" + err + "\n---");
    }
}

static fs::path write_temp(const std::string& name, const std::string& contents)
{
    const fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        fail("failed to write " + path.string());
    }
    out << contents;
    return path;
}

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        fail("usage: cli_tests <runner>");
    }
    const std::string runner = argv[1];
    std::string out;
    std::string err;

    {
        const int rc = run_cli_capture({"sandpit", "--help"}, out, err);
        expect_rc(rc, 0, "--help", err);
        expect_contains(out, "usage:", "help output");
        expect_contains(out, "sandpit scores top --db <file>", "help output");
    }
    {
        const int rc = run_cli_capture({"sandpit"}, out, err);
        expect_rc(rc, 2, "no arguments", err);
        expect_contains(err, "usage:", "no-argument usage");
    }
    {
        const int rc = run_cli_capture({"sandpit", "frobnicate", "x.py"}, out, err);
        expect_rc(rc, 2, "unknown command", err);
        expect_contains(err, "error: unknown command: frobnicate", "unknown command");
    }
    {
        const int rc = run_cli_capture({"sandpit", "run", "--fast", "x.py"}, out, err);
        expect_rc(rc, 2, "unknown option", err);
        expect_contains(err, "error: unknown option: --fast", "unknown option");
    }
    {
        const int rc = run_cli_capture({"sandpit", "run", "--timeout-ms"}, out, err);
        expect_rc(rc, 2, "missing option value", err);
        expect_contains(err, "expected a value after --timeout-ms", "missing option value");
    }

    const fs::path hello = write_temp("sandpit_cli_hello.py", "name = 'Hello'\nprint(name)\n");
    const fs::path bad_import = write_temp("sandpit_cli_import.py", "x = 1\nimport os\n");
    const fs::path bad_syntax = write_temp("sandpit_cli_syntax.py", "if x\n    pass\n");
    const fs::path crash = write_temp("sandpit_cli_crash.py", "print('a')\nprint(1/0)\n");

    {
        const int rc = run_cli_capture({"sandpit", "check", hello.string()}, out, err);
        expect_rc(rc, 0, "check ok", err);
        expect_contains(out, "sandpit check: ok", "check output");
    }
    {
        const int rc = run_cli_capture({"sandpit", "check", bad_import.string()}, out, err);
        expect_rc(rc, 1, "check import", err);
        expect_contains(err, ":2:1: error: import statements are not allowed", "import diagnostic");
        expect_contains(err, "| import os", "import diagnostic source line");
        expect_contains(err, "| ^^^^^^", "import diagnostic caret");
    }
    {
        const int rc = run_cli_capture({"sandpit", "check", bad_syntax.string()}, out, err);
        expect_rc(rc, 1, "check syntax", err);
        expect_contains(err, ":1:", "syntax diagnostic location");
    }
    {
        const int rc = run_cli_capture({"sandpit", "lex", hello.string()}, out, err);
        expect_rc(rc, 0, "lex", err);
        expect_contains(out, "1:1 identifier name", "lex token listing");
        expect_contains(out, "sandpit lex: 10 tokens", "lex token count");
    }
    {
        const int rc = run_cli_capture({"sandpit", "parse", hello.string()}, out, err);
        expect_rc(rc, 0, "parse", err);
        if (out != "(assign name \"Hello\")\n(call print name)\n")
        {
            fail("parse output: " + out);
        }
    }

    {
        const int rc = run_cli_capture({"sandpit", "run", "--runner", runner, hello.string()}, out, err);
        expect_rc(rc, 0, "run hello", err);
        if (out != "Hello\n")
        {
            fail("run output: " + out);
        }
    }
    {
        const int rc =
            run_cli_capture({"sandpit", "run", "--runner=" + runner, "--json", crash.string()}, out, err);
        expect_rc(rc, 1, "run --json crash", err);
        expect_contains(out, R"("kind":"runtime_error")", "json envelope");
        expect_contains(out, R"("output":"a\n")", "json partial output");
    }
    {
        const int rc = run_cli_capture({"sandpit", "run", "--runner", runner, bad_import.string()}, out, err);
        expect_rc(rc, 1, "run import", err);
        expect_contains(err, "error: validation_error: import statements are not allowed", "run rejection");
    }
    {
        const int rc = run_cli_capture(
            {"sandpit", "run", "--runner", runner, "--timeout-ms", "999999", hello.string()}, out, err);
        expect_rc(rc, 1, "run bad timeout", err);
        expect_contains(err, "invalid configuration: timeout_ms", "config error");
    }
    {
        const int rc = run_cli_capture({"sandpit", "doctor", "--runner", runner}, out, err);
        expect_rc(rc, 0, "doctor", err);
        expect_contains(out, "handshake: ok", "doctor output");
    }
    {
        const int rc = run_cli_capture({"sandpit", "doctor", "--runner", "/nonexistent/runner"}, out, err);
        expect_rc(rc, 1, "doctor with missing runner", err);
        expect_contains(err, "runner handshake failed", "doctor failure");
    }

    const fs::path db = fs::temp_directory_path() / "sandpit_cli_scores.jsonl";
    (void)fs::remove(db);
    {
        expect_rc(run_cli_capture({"sandpit", "scores", "add", "--db", db.string(), "Mia", "75"}, out, err),
                  0, "scores add Mia", err);
        expect_contains(out, "saved #1", "scores add output");
        expect_rc(run_cli_capture({"sandpit", "scores", "add", "--db", db.string(), "Leo", "90"}, out, err),
                  0, "scores add Leo", err);
        expect_rc(run_cli_capture({"sandpit", "scores", "add", "--db", db.string(), "Ana", "90"}, out, err),
                  0, "scores add Ana", err);

        const int rc = run_cli_capture({"sandpit", "scores", "top", "--db", db.string(), "--limit", "2"}, out, err);
        expect_rc(rc, 0, "scores top", err);
        const auto leo = out.find("1. Leo 90");
        const auto ana = out.find("2. Ana 90");
        if (leo == std::string::npos || ana == std::string::npos || out.find("Mia") != std::string::npos)
        {
            fail("scores top output: " + out);
        }

        expect_rc(run_cli_capture({"sandpit", "scores", "add", "--db", db.string(), "Zed", "150"}, out, err),
                  1, "scores add out of range", err);
        expect_contains(err, "score must be between 0 and 100", "score range error");
        expect_rc(run_cli_capture({"sandpit", "scores", "add", "--db", db.string(), "Zed", "lots"}, out, err),
                  2, "scores add non-integer", err);
        expect_rc(run_cli_capture({"sandpit", "scores", "top", "Mia"}, out, err), 2, "scores without --db", err);
    }
    (void)fs::remove(db);

    for (const auto& p : {hello, bad_import, bad_syntax, crash})
    {
        (void)fs::remove(p);
    }

    std::cout << "OK\n";
    return 0;
}
