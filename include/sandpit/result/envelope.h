#pragma once

#include <cstddef>
#include <optional>
#include <sandpit/result/outcome.h>
#include <string>
#include <string_view>

/**
 * @file envelope.h
 * @brief Converts execution outcomes into the uniform caller-facing response.
 */

namespace sandpit::result
{

inline constexpr std::string_view kValidationKind = "validation_error";
inline constexpr std::string_view kTimeoutKind = "timeout";
inline constexpr std::string_view kRuntimeKind = "runtime_error";

inline constexpr std::string_view kTimeoutMessage = "Your code took too long to finish.";
inline constexpr std::string_view kIsolationMessage =
    "Something went wrong while running your code. Please try again.";

/** @brief Longest error message handed to callers, in bytes. */
inline constexpr std::size_t kMaxMessageBytes = 500;

struct ErrorInfo
{
    std::string kind;
    std::string message;
};

struct ResponseEnvelope
{
    bool ok = false;
    std::optional<std::string> output;
    std::optional<ErrorInfo> error;
    bool timed_out = false;
};

[[nodiscard]] ResponseEnvelope normalize(const ExecutionOutcome& outcome);

/**
 * @brief Make a message safe to return: absolute host paths become `<path>` and the text is
 * capped at kMaxMessageBytes (on a UTF-8 boundary, with a trailing "...").
 */
[[nodiscard]] std::string scrub_message(std::string_view message);

/** @brief `{"error":{"kind":..,"message":..},"ok":false,"output":..,"timed_out":false}`. */
[[nodiscard]] std::string to_json(const ResponseEnvelope& envelope);

} // namespace sandpit::result
