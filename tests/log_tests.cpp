#include <cstdlib>
#include <iostream>
#include <sandpit/log/log.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace sandpit::log;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    if (parse_level("debug") != Level::Debug || parse_level("warning") != Level::Warn ||
        parse_level("error") != Level::Error || parse_level("loud").has_value())
    {
        fail("parse_level");
    }

    if (format_record(Level::Info, "two\nlines") != "sandpit: info: two lines\n")
    {
        fail("format_record: " + format_record(Level::Info, "two\nlines"));
    }

    set_threshold(Level::Warn);
    if (enabled(Level::Info) || !enabled(Level::Warn) || !enabled(Level::Error))
    {
        fail("threshold filtering");
    }

    std::ostringstream captured;
    auto* old_err = std::cerr.rdbuf(captured.rdbuf());

    info("hidden");
    warn("shown");

    set_threshold(Level::Debug);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < 50; ++i)
                {
                    debug("thread " + std::to_string(t) + " record " + std::to_string(i));
                }
            });
    }
    for (auto& th : threads)
    {
        th.join();
    }

    std::cerr.rdbuf(old_err);
    const std::string out = captured.str();

    if (out.find("hidden") != std::string::npos)
    {
        fail("records below the threshold must be dropped");
    }
    if (out.rfind("sandpit: warn: shown\n", 0) != 0)
    {
        fail("warn record: " + out.substr(0, 40));
    }

    // Every line is one complete record.
    std::istringstream lines(out);
    std::string line;
    int count = 0;
    while (std::getline(lines, line))
    {
        ++count;
        if (line.rfind("sandpit: ", 0) != 0)
        {
            fail("interleaved record: " + line);
        }
    }
    if (count != 1 + 4 * 50)
    {
        fail("record count: " + std::to_string(count));
    }

    std::cout << "OK\n";
    return 0;
}
