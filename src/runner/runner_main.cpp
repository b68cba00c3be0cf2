#include <iostream>
#include <sandpit/sandbox/protocol.h>
#include <sandpit/sandbox/runner.h>
#include <string>

// sandpit_runner: reads one request line from stdin, writes one response line to stdout.
// Never logs; the executor discards stderr.
int main()
{
    std::ios::sync_with_stdio(false);

    std::string line;
    if (!std::getline(std::cin, line))
    {
        const sandpit::sandbox::ResponseError error{.kind = std::string(sandpit::sandbox::kInvalidRequest),
                                                    .message = "empty input",
                                                    .line = std::nullopt};
        std::cout << sandpit::sandbox::encode_failure("", error, "") << std::flush;
        return 2;
    }

    const auto reply = sandpit::sandbox::handle_request(line);
    std::cout << reply.line << std::flush;
    return reply.exit_code;
}
