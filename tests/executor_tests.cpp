#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sandpit/sandbox/executor.h>
#include <string>
#include <sys/wait.h>
#include <variant>

using namespace sandpit::result;
using sandpit::sandbox::Executor;
using sandpit::sandbox::ExecutorOptions;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static Executor make_executor(const std::string& runner, std::chrono::milliseconds deadline)
{
    return Executor(ExecutorOptions{.runner_path = runner, .deadline = deadline, .max_output_bytes = 65536});
}

template <typename T>
static T expect_outcome(const ExecutionOutcome& outcome, const std::string& what)
{
    const auto* value = std::get_if<T>(&outcome);
    if (value == nullptr)
    {
        std::string detail = outcome_name(outcome);
        if (const auto* iso = std::get_if<IsolationFailure>(&outcome))
        {
            detail += ": " + iso->detail;
        }
        if (const auto* rt = std::get_if<RuntimeFailure>(&outcome))
        {
            detail += ": " + rt->message;
        }
        fail(what + ": unexpected outcome " + detail);
    }
    return *value;
}

static void expect_no_children(const std::string& what)
{
    // Every runner must have been reaped by the executor.
    const pid_t pid = waitpid(-1, nullptr, WNOHANG);
    if (pid != -1 || errno != ECHILD)
    {
        fail(what + ": a runner process was left unreaped");
    }
}

int main(int argc, char** argv)
{
    if (argc != 7)
    {
        fail("usage: executor_tests <runner> <hang> <spam> <crash> <garbage> <early-exit>");
    }
    const std::string runner = argv[1];
    const std::string hang = argv[2];
    const std::string spam = argv[3];
    const std::string crash = argv[4];
    const std::string garbage = argv[5];
    const std::string early_exit = argv[6];

    using namespace std::chrono_literals;
    const auto executor = make_executor(runner, 5000ms);

    {
        const auto& ok = expect_outcome<Success>(executor.execute("print('Hello')"), "hello");
        if (ok.captured_output != "Hello\n" || ok.truncated)
        {
            fail("hello output: '" + ok.captured_output + "'");
        }
    }

    {
        const auto& rt = expect_outcome<RuntimeFailure>(executor.execute("print('a')\nprint(1/0)"),
                                                        "division by zero");
        if (rt.message.find("ZeroDivisionError") == std::string::npos || rt.partial_output != "a\n")
        {
            fail("runtime failure contents: " + rt.message);
        }
    }

    {
        const auto& rejected =
            expect_outcome<ValidationRejected>(executor.execute("import os"), "runner-side validation");
        if (rejected.reason.find("import") == std::string::npos)
        {
            fail("rejection reason: " + rejected.reason);
        }
    }

    if (executor.handshake().has_value())
    {
        fail("handshake with the real runner failed: " + *executor.handshake());
    }
    expect_no_children("real runner");

    {
        const auto start = std::chrono::steady_clock::now();
        const auto outcome = make_executor(hang, 300ms).execute("print(1)");
        const auto elapsed = std::chrono::steady_clock::now() - start;
        (void)expect_outcome<Timeout>(outcome, "hanging runner");
        if (elapsed > 800ms)
        {
            fail("timeout overran the deadline by more than 500 ms");
        }
        expect_no_children("hanging runner");
    }

    {
        const auto start = std::chrono::steady_clock::now();
        const auto outcome = make_executor(runner, 300ms).execute("while True:\n    pass");
        const auto elapsed = std::chrono::steady_clock::now() - start;
        (void)expect_outcome<Timeout>(outcome, "infinite loop script");
        if (elapsed > 800ms)
        {
            fail("script timeout overran the deadline by more than 500 ms");
        }
        expect_no_children("infinite loop script");
    }

    {
        const auto& rt = expect_outcome<RuntimeFailure>(make_executor(spam, 5000ms).execute("x"),
                                                        "spamming runner");
        if (rt.message != "Your program produced too much output.")
        {
            fail("spam message: " + rt.message);
        }
        expect_no_children("spamming runner");
    }

    {
        const auto& rt = expect_outcome<RuntimeFailure>(make_executor(crash, 5000ms).execute("x"),
                                                        "crashing runner");
        if (rt.message != "Your program crashed (signal 11).")
        {
            fail("crash message: " + rt.message);
        }
    }

    (void)expect_outcome<IsolationFailure>(make_executor(garbage, 5000ms).execute("x"), "garbage response");
    (void)expect_outcome<IsolationFailure>(make_executor(early_exit, 5000ms).execute("x"), "early exit");

    {
        const auto missing = make_executor("/nonexistent/sandpit_runner", 5000ms);
        (void)expect_outcome<IsolationFailure>(missing.execute("print(1)"), "missing runner");
        if (!missing.handshake().has_value())
        {
            fail("handshake with a missing runner must fail");
        }
    }
    expect_no_children("all runners");

    if (sandpit::sandbox::find_runner_path("/opt/custom_runner") != "/opt/custom_runner")
    {
        fail("a configured runner path wins");
    }

    std::cout << "OK\n";
    return 0;
}
