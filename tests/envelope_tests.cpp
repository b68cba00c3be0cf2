#include <cstdlib>
#include <iostream>
#include <sandpit/result/envelope.h>
#include <string>

using namespace sandpit::result;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_json(const ExecutionOutcome& outcome, const std::string& expected)
{
    const std::string got = to_json(normalize(outcome));
    if (got != expected)
    {
        fail(std::string(outcome_name(outcome)) + " envelope\n  got:      " + got +
             "\n  expected: " + expected);
    }
}

int main()
{
    expect_json(Success{.captured_output = "Hello\n", .truncated = false},
                R"({"ok":true,"output":"Hello\n","timed_out":false})");
    expect_json(Success{.captured_output = "", .truncated = false},
                R"({"ok":true,"output":"","timed_out":false})");
    expect_json(ValidationRejected{.reason = "import statements are not allowed"},
                R"({"error":{"kind":"validation_error","message":"import statements are not allowed"},"ok":false,"timed_out":false})");
    expect_json(Timeout{.elapsed_ms = 2003},
                R"({"error":{"kind":"timeout","message":"Your code took too long to finish."},"ok":false,"timed_out":true})");
    expect_json(RuntimeFailure{.message = "ZeroDivisionError: division by zero (line 1)",
                               .partial_output = "a\n"},
                R"json({"error":{"kind":"runtime_error","message":"ZeroDivisionError: division by zero (line 1)"},"ok":false,"output":"a\n","timed_out":false})json");

    {
        // Isolation failures never leak their detail.
        const auto env = normalize(IsolationFailure{.detail = "failed to start runner '/opt/x/sandpit_runner': ENOENT"});
        if (env.ok || !env.error.has_value() || env.error->kind != kRuntimeKind ||
            env.error->message != kIsolationMessage || env.output.has_value())
        {
            fail("isolation failure envelope");
        }
    }

    {
        const std::string scrubbed = scrub_message("cannot open /home/alice/secret.txt: 1 / 2 and /tmp/x");
        if (scrubbed != "cannot open <path>: 1 / 2 and <path>")
        {
            fail("scrub paths: " + scrubbed);
        }
        if (scrub_message("a/b and / alone") != "a/b and / alone")
        {
            fail("relative paths and lone slashes are kept");
        }
    }

    {
        const std::string longer(kMaxMessageBytes + 100, 'e');
        const std::string capped = scrub_message(longer);
        if (capped.size() != kMaxMessageBytes || capped.substr(capped.size() - 3) != "...")
        {
            fail("message cap");
        }
        std::string accented;
        while (accented.size() < kMaxMessageBytes + 10)
        {
            accented += "\xC3\xA9";
        }
        const std::string cut = scrub_message(accented);
        if (cut.size() > kMaxMessageBytes || (static_cast<unsigned char>(cut[cut.size() - 4]) & 0xC0) == 0xC0)
        {
            fail("message cap must not split a UTF-8 sequence");
        }
    }

    {
        const auto env = normalize(RuntimeFailure{.message = "Error at /srv/app/run.py", .partial_output = ""});
        if (env.error->message != "Error at <path>")
        {
            fail("runtime messages are scrubbed: " + env.error->message);
        }
    }

    std::cout << "OK\n";
    return 0;
}
