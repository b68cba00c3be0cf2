#pragma once

#include <string>
#include <string_view>

/**
 * @file runner.h
 * @brief Request handling inside `sandpit_runner`, the process hosting the interpreter.
 */

namespace sandpit::sandbox
{

/** @brief The response line for one request plus the exit code the runner should use. */
struct RunnerReply
{
    std::string line;
    int exit_code = 0;
};

/**
 * @brief Handle one protocol request line.
 *
 * Run requests are validated again, then parsed and interpreted with a fresh restricted
 * namespace. Script faults are `runtime_error` responses (exit code 0); malformed requests
 * are `invalid_request` / `protocol_version_unsupported` (exit code 2).
 */
[[nodiscard]] RunnerReply handle_request(std::string_view line);

} // namespace sandpit::sandbox
