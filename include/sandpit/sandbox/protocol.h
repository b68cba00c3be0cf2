#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file protocol.h
 * @brief Line-delimited JSON protocol between the executor and `sandpit_runner`.
 *
 * The executor writes exactly one request line to the runner's stdin and reads exactly one
 * response line from its stdout. Keys are serialized in sorted order.
 */

namespace sandpit::sandbox
{

inline constexpr int kProtocolVersion = 1;

/** @brief Error kinds a runner may report. */
inline constexpr std::string_view kInvalidRequest = "invalid_request";
inline constexpr std::string_view kVersionUnsupported = "protocol_version_unsupported";
inline constexpr std::string_view kValidationError = "validation_error";
inline constexpr std::string_view kRuntimeError = "runtime_error";

struct HandshakeRequest
{
    std::string id;
};

struct RunRequest
{
    std::string id;
    std::string source;
    std::size_t max_output_bytes = 65536;
};

using Request = std::variant<HandshakeRequest, RunRequest>;

/** @brief A request the runner could not accept; answered with an error response. */
struct RequestError
{
    std::string id;
    std::string kind;
    std::string message;
};

using DecodedRequest = std::variant<Request, RequestError>;

struct ResponseError
{
    std::string kind;
    std::string message;
    std::optional<std::size_t> line;
};

/** @brief Decoded runner response. `output` is also set on failures (partial output). */
struct Response
{
    std::string id;
    bool ok = false;
    std::string output;
    bool truncated = false;
    std::optional<ResponseError> error;
};

[[nodiscard]] std::string encode_request(const Request& request);
[[nodiscard]] DecodedRequest decode_request(std::string_view line);

[[nodiscard]] std::string encode_success(std::string_view id, std::string_view output, bool truncated);
[[nodiscard]] std::string encode_failure(std::string_view id, const ResponseError& error,
                                         std::string_view output);

/** @brief Decode a response line; nullopt when it is not a well-formed version-1 response. */
[[nodiscard]] std::optional<Response> decode_response(std::string_view line);

} // namespace sandpit::sandbox
