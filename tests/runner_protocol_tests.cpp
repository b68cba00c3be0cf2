#include <cstdlib>
#include <iostream>
#include <sandpit/json/json.h>
#include <sandpit/sandbox/protocol.h>
#include <sandpit/sandbox/runner.h>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static sandpit::sandbox::Response reply_to(const std::string& request, int expected_exit)
{
    const auto reply = sandpit::sandbox::handle_request(request);
    if (reply.exit_code != expected_exit)
    {
        fail("unexpected exit code " + std::to_string(reply.exit_code) + " for " + request);
    }
    if (reply.line.empty() || reply.line.back() != '\n' ||
        reply.line.find('\n') != reply.line.size() - 1)
    {
        fail("reply must be exactly one line: " + reply.line);
    }
    const auto decoded = sandpit::sandbox::decode_response(reply.line);
    if (!decoded.has_value())
    {
        fail("reply does not decode: " + reply.line);
    }
    return *decoded;
}

static std::string run_request(const std::string& source, std::size_t max_output = 65536)
{
    return sandpit::sandbox::encode_request(sandpit::sandbox::RunRequest{
        .id = "t1", .source = source, .max_output_bytes = max_output});
}

int main()
{
    using namespace sandpit::sandbox;

    {
        const std::string line = encode_request(HandshakeRequest{.id = "h"});
        if (line != "{\"id\":\"h\",\"op\":\"handshake\",\"protocol_version\":1}\n")
        {
            fail("handshake encoding: " + line);
        }
        const auto r = reply_to(line, 0);
        if (!r.ok || r.output != "ok" || r.id != "h")
        {
            fail("handshake reply");
        }
    }

    {
        const auto decoded = decode_request(run_request("print(1)", 1024));
        const auto* request = std::get_if<Request>(&decoded);
        if (request == nullptr || !std::holds_alternative<RunRequest>(*request))
        {
            fail("run request must decode");
        }
        const auto& run = std::get<RunRequest>(*request);
        if (run.id != "t1" || run.source != "print(1)" || run.max_output_bytes != 1024)
        {
            fail("run request fields");
        }
    }

    {
        const auto r = reply_to(run_request("print('Hello')"), 0);
        if (!r.ok || r.output != "Hello\n" || r.truncated || r.id != "t1")
        {
            fail("hello run reply");
        }
    }

    {
        const auto r = reply_to(run_request("print('before')\nprint(1/0)"), 0);
        if (r.ok || !r.error.has_value() || r.error->kind != kRuntimeError)
        {
            fail("expected runtime_error reply");
        }
        if (r.error->message != "ZeroDivisionError: division by zero (line 2)" || r.error->line != 2u)
        {
            fail("runtime error message: " + r.error->message);
        }
        if (r.output != "before\n")
        {
            fail("runtime error must carry partial output");
        }
    }

    {
        const auto r = reply_to(run_request("x = 1\nimport os"), 0);
        if (r.ok || r.error->kind != kValidationError || r.error->line != 2u)
        {
            fail("expected validation_error on line 2");
        }
    }

    {
        const auto r = reply_to(run_request("for i in range(1000):\n    print(i)", 1024), 0);
        if (!r.ok || !r.truncated || r.output.find("[output truncated]") == std::string::npos)
        {
            fail("expected truncated output");
        }
    }

    {
        const auto r = reply_to("not json", 2);
        if (r.ok || r.error->kind != kInvalidRequest)
        {
            fail("malformed request");
        }
    }
    {
        const auto r = reply_to(R"({"protocol_version":2,"id":"x","op":"handshake"})", 2);
        if (r.ok || r.error->kind != kVersionUnsupported || r.id != "x")
        {
            fail("unsupported version");
        }
    }
    {
        const auto r = reply_to(R"({"protocol_version":1,"id":"x","op":"explode"})", 2);
        if (r.error->kind != kInvalidRequest || r.error->message != "unknown op")
        {
            fail("unknown op");
        }
    }
    {
        const auto r = reply_to(R"({"protocol_version":1,"id":"x","op":"run","source":"1","max_output_bytes":0})", 2);
        if (r.error->kind != kInvalidRequest)
        {
            fail("zero output limit must be rejected");
        }
    }
    {
        const auto r = reply_to(R"({"protocol_version":1,"id":"x","op":"run","source":5})", 2);
        if (r.error->message != "source must be a string")
        {
            fail("non-string source");
        }
    }

    // Responses that are not version-1 envelopes do not decode.
    if (decode_response("garbage").has_value() ||
        decode_response(R"({"ok":true,"protocol_version":1})").has_value() ||
        decode_response(R"({"ok":false,"protocol_version":1,"error":{"kind":"x"}})").has_value() ||
        decode_response(R"({"ok":true,"protocol_version":3,"result":{"output":""}})").has_value())
    {
        fail("malformed responses must not decode");
    }

    {
        const std::string line =
            encode_failure("id", ResponseError{.kind = "runtime_error", .message = "m", .line = 4}, "p");
        if (line != "{\"error\":{\"kind\":\"runtime_error\",\"line\":4,\"message\":\"m\"},\"id\":\"id\","
                    "\"ok\":false,\"output\":\"p\",\"protocol_version\":1}\n")
        {
            fail("failure encoding: " + line);
        }
    }

    std::cout << "OK\n";
    return 0;
}
