#pragma once

#include <optional>
#include <sandpit/config/config.h>
#include <sandpit/result/envelope.h>
#include <sandpit/result/outcome.h>
#include <sandpit/sandbox/executor.h>
#include <string>

/**
 * @file engine.h
 * @brief The core entry point: request checks, static validation, isolated execution and
 * normalization of one script.
 */

namespace sandpit::engine
{

struct ExecutionRequest
{
    std::string source_text;
};

/**
 * @brief Runs execution requests. Immutable after construction; `run` may be called from
 * many threads at once, each request getting its own runner process.
 */
class Engine
{
  public:
    explicit Engine(sandpit::config::Config config);

    /** @brief Execute and return the raw outcome. */
    [[nodiscard]] sandpit::result::ExecutionOutcome execute(const ExecutionRequest& request) const;

    /** @brief Execute and return the normalized caller-facing envelope. */
    [[nodiscard]] sandpit::result::ResponseEnvelope run(const ExecutionRequest& request) const;

    /** @brief Check that the runner can be started; returns an error detail otherwise. */
    [[nodiscard]] std::optional<std::string> handshake() const;

    [[nodiscard]] const sandpit::config::Config& config() const { return config_; }
    [[nodiscard]] const std::string& runner_path() const { return executor_.runner_path(); }

  private:
    sandpit::config::Config config_;
    sandpit::sandbox::Executor executor_;
};

} // namespace sandpit::engine
