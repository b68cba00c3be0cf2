#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <sandpit/result/outcome.h>
#include <string>
#include <string_view>

/**
 * @file executor.h
 * @brief Runs scripts in a fresh `sandpit_runner` process per request.
 *
 * The runner is spawned with fork+execve, an empty environment, core dumps disabled and a
 * parent-death signal. The deadline starts at spawn; when it passes the runner is killed with
 * SIGKILL and reaped. Nothing the runner wrote before the kill is reported.
 */

namespace sandpit::sandbox
{

struct ExecutorOptions
{
    /** Runner executable; empty means find_runner_path(""). */
    std::string runner_path;
    std::chrono::milliseconds deadline{2000};
    std::size_t max_output_bytes = 65536;
};

class Executor
{
  public:
    explicit Executor(ExecutorOptions options);

    /** @brief Run `source` with the configured deadline. Thread-safe. */
    [[nodiscard]] sandpit::result::ExecutionOutcome execute(std::string_view source) const;

    [[nodiscard]] sandpit::result::ExecutionOutcome execute(std::string_view source,
                                                            std::chrono::milliseconds deadline) const;

    /** @brief Spawn a runner and exchange a handshake; returns an error detail on failure. */
    [[nodiscard]] std::optional<std::string> handshake() const;

    [[nodiscard]] const std::string& runner_path() const { return options_.runner_path; }

  private:
    ExecutorOptions options_;
};

/**
 * @brief Locate the runner executable.
 *
 * `configured` if non-empty, else $SANDPIT_RUNNER, else `sandpit_runner` next to the current
 * executable, else the bare name (resolved against PATH at spawn time).
 */
[[nodiscard]] std::string find_runner_path(std::string_view configured);

} // namespace sandpit::sandbox
