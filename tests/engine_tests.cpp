#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sandpit/engine/engine.h>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace sandpit::result;
using sandpit::engine::Engine;
using sandpit::engine::ExecutionRequest;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static sandpit::config::Config config_for(const std::string& runner, std::int64_t timeout_ms)
{
    sandpit::config::Config config;
    config.runner_path = runner;
    config.timeout_ms = timeout_ms;
    return config;
}

static ExecutionRequest request(std::string source)
{
    return ExecutionRequest{.source_text = std::move(source)};
}

static void test_examples(const Engine& engine)
{
    {
        const auto outcome = engine.execute(request("print('Hello')"));
        const auto* ok = std::get_if<Success>(&outcome);
        if (ok == nullptr || ok->captured_output != "Hello\n")
        {
            fail(std::string("print('Hello') should succeed, got ") + outcome_name(outcome));
        }
    }
    {
        const auto outcome = engine.execute(request("import os"));
        const auto* rejected = std::get_if<ValidationRejected>(&outcome);
        if (rejected == nullptr || rejected->reason.find("import") == std::string::npos)
        {
            fail("import os should be rejected with a reason mentioning import");
        }
    }
    {
        const auto start = std::chrono::steady_clock::now();
        const auto outcome = engine.execute(request("while True: pass"));
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (!std::holds_alternative<Timeout>(outcome))
        {
            fail(std::string("while True: pass should time out, got ") + outcome_name(outcome));
        }
        if (elapsed > std::chrono::milliseconds(engine.config().timeout_ms + 500))
        {
            fail("timeout exceeded the teardown allowance");
        }
    }
    {
        const auto outcome = engine.execute(request("print(1/0)"));
        if (!std::holds_alternative<RuntimeFailure>(outcome))
        {
            fail(std::string("print(1/0) should be a runtime failure, got ") + outcome_name(outcome));
        }
    }
}

static void test_envelopes(const Engine& engine)
{
    const auto hello = engine.run(request("print('Hello')"));
    if (!hello.ok || hello.output != "Hello\n" || hello.error.has_value() || hello.timed_out)
    {
        fail("hello envelope");
    }

    const auto rejected = engine.run(request("__import__('os')"));
    if (rejected.ok || rejected.error->kind != "validation_error")
    {
        fail("dunder access must be a validation_error");
    }

    const auto slow = engine.run(request("while True:\n    pass"));
    if (slow.ok || slow.error->kind != "timeout" || !slow.timed_out ||
        slow.error->message != std::string(kTimeoutMessage))
    {
        fail("timeout envelope");
    }

    const auto crashed = engine.run(request("print('x')\nprint(undefined_name)"));
    if (crashed.ok || crashed.error->kind != "runtime_error" ||
        crashed.error->message.find("NameError") == std::string::npos || crashed.output != "x\n")
    {
        fail("runtime_error envelope");
    }

    const auto empty = engine.run(request(""));
    if (empty.ok || empty.error->kind != "validation_error" ||
        empty.error->message != "source must not be empty")
    {
        fail("empty source must be rejected");
    }

    const auto too_long = engine.run(request("print(1)\n" + std::string(5000, '#')));
    if (too_long.ok || too_long.error->message.find("source is too long") == std::string::npos)
    {
        fail("oversized source must be rejected");
    }

    // Runtime name construction is stopped by the namespace, not the validator.
    const auto sneaky = engine.run(request("name = 'op' + 'en'\nprint(open)"));
    if (sneaky.ok || sneaky.error->kind != "runtime_error" ||
        sneaky.error->message.find("NameError") == std::string::npos)
    {
        fail("capabilities outside the namespace must be unreachable");
    }
}

static void test_concurrency(const Engine& engine)
{
    constexpr int kRequests = 8;
    std::vector<ExecutionOutcome> outcomes(kRequests);
    std::vector<std::thread> threads;
    for (int i = 0; i < kRequests; ++i)
    {
        threads.emplace_back(
            [&engine, &outcomes, i]
            {
                const std::string source = (i % 2 == 0) ? "while True:\n    pass"
                                                        : "print(" + std::to_string(i) + " * 10)";
                outcomes[static_cast<std::size_t>(i)] = engine.execute(request(source));
            });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    for (int i = 0; i < kRequests; ++i)
    {
        const auto& outcome = outcomes[static_cast<std::size_t>(i)];
        if (i % 2 == 0)
        {
            if (!std::holds_alternative<Timeout>(outcome))
            {
                fail("looping request " + std::to_string(i) + " got " + outcome_name(outcome));
            }
            continue;
        }
        const auto* ok = std::get_if<Success>(&outcome);
        if (ok == nullptr || ok->captured_output != std::to_string(i * 10) + "\n")
        {
            fail("normal request " + std::to_string(i) + " lost its own output");
        }
    }
}

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        fail("usage: engine_tests <runner>");
    }
    const Engine engine(config_for(argv[1], 1000));

    if (engine.handshake().has_value())
    {
        fail("runner handshake failed: " + *engine.handshake());
    }

    test_examples(engine);
    test_envelopes(engine);
    test_concurrency(engine);

    {
        // Validation happens before any runner is started.
        const Engine broken(config_for("/nonexistent/sandpit_runner", 1000));
        if (!std::holds_alternative<ValidationRejected>(broken.execute(request("import os"))))
        {
            fail("rejected source must never reach the executor");
        }
        const auto env = broken.run(request("print(1)"));
        if (env.ok || env.error->kind != "runtime_error" ||
            env.error->message != std::string(kIsolationMessage))
        {
            fail("a missing runner is reported as a generic runtime_error");
        }
    }

    std::cout << "OK\n";
    return 0;
}
