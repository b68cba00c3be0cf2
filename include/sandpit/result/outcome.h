#pragma once

#include <cstdint>
#include <string>
#include <variant>

/**
 * @file outcome.h
 * @brief The single outcome every execution request ends in.
 */

namespace sandpit::result
{

struct Success
{
    std::string captured_output;
    bool truncated = false;
};

struct ValidationRejected
{
    std::string reason;
};

struct Timeout
{
    std::int64_t elapsed_ms = 0;
};

/** @brief Script fault after validation; `partial_output` is what it printed before failing. */
struct RuntimeFailure
{
    std::string message;
    std::string partial_output;
};

/** @brief The isolation boundary itself failed. `detail` is for logs only. */
struct IsolationFailure
{
    std::string detail;
};

using ExecutionOutcome =
    std::variant<Success, ValidationRejected, Timeout, RuntimeFailure, IsolationFailure>;

/** @brief "success", "validation_rejected", "timeout", "runtime_failure", "isolation_failure". */
[[nodiscard]] const char* outcome_name(const ExecutionOutcome& outcome);

} // namespace sandpit::result
