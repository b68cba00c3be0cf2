#include <chrono>
#include <sandpit/engine/engine.h>
#include <sandpit/log/log.h>
#include <sandpit/validate/validator.h>
#include <utility>

namespace sandpit::engine
{

using namespace sandpit::result;

namespace
{

std::optional<std::string> check_request(const ExecutionRequest& request,
                                         const sandpit::config::Config& config)
{
    if (request.source_text.empty())
    {
        return std::string("source must not be empty");
    }
    if (request.source_text.size() > config.max_source_bytes)
    {
        return "source is too long (" + std::to_string(request.source_text.size()) +
               " bytes, limit is " + std::to_string(config.max_source_bytes) + ")";
    }
    return std::nullopt;
}

void log_outcome(const ExecutionOutcome& outcome)
{
    if (const auto* timeout = std::get_if<Timeout>(&outcome))
    {
        sandpit::log::info("request timed out after " + std::to_string(timeout->elapsed_ms) +
                           " ms");
    }
    else if (const auto* failure = std::get_if<IsolationFailure>(&outcome))
    {
        sandpit::log::error("isolation failure: " + failure->detail);
    }
    sandpit::log::debug(std::string("request finished: ") + outcome_name(outcome));
}

} // namespace

Engine::Engine(sandpit::config::Config config)
    : config_(std::move(config)),
      executor_(sandpit::sandbox::ExecutorOptions{
          .runner_path = config_.runner_path,
          .deadline = std::chrono::milliseconds(config_.timeout_ms),
          .max_output_bytes = config_.max_output_bytes})
{
}

ExecutionOutcome Engine::execute(const ExecutionRequest& request) const
{
    ExecutionOutcome outcome;
    if (auto problem = check_request(request, config_))
    {
        outcome = ValidationRejected{.reason = std::move(*problem)};
    }
    else if (const auto verdict = sandpit::validate::validate(request.source_text);
             std::holds_alternative<sandpit::validate::Violation>(verdict))
    {
        outcome = ValidationRejected{.reason = std::get<sandpit::validate::Violation>(verdict).reason};
    }
    else
    {
        outcome = executor_.execute(request.source_text);
    }
    log_outcome(outcome);
    return outcome;
}

ResponseEnvelope Engine::run(const ExecutionRequest& request) const
{
    return normalize(execute(request));
}

std::optional<std::string> Engine::handshake() const
{
    return executor_.handshake();
}

} // namespace sandpit::engine
