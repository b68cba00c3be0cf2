#include <sandpit/runtime/interpreter.h>
#include <sandpit/sandbox/protocol.h>
#include <sandpit/sandbox/runner.h>
#include <sandpit/source/line_map.h>
#include <sandpit/validate/validator.h>
#include <type_traits>

namespace sandpit::sandbox
{
namespace
{

RunnerReply run(const RunRequest& request)
{
    const auto verdict = sandpit::validate::validate(request.source);
    if (const auto* violation = std::get_if<sandpit::validate::Violation>(&verdict))
    {
        const sandpit::source::LineMap map(request.source);
        const ResponseError error{.kind = std::string(kValidationError),
                                  .message = violation->reason,
                                  .line = map.offset_to_line_col(violation->span.start).line};
        return RunnerReply{.line = encode_failure(request.id, error, ""), .exit_code = 0};
    }

    const sandpit::runtime::RunOptions options{.max_output_bytes = request.max_output_bytes,
                                               .max_call_depth = 1000};
    const auto result = sandpit::runtime::run_source(request.source, options);
    if (result.ok)
    {
        return RunnerReply{.line = encode_success(request.id, result.output, result.truncated),
                           .exit_code = 0};
    }
    const ResponseError error{
        .kind = std::string(kRuntimeError), .message = result.error_text(), .line = result.error_line};
    return RunnerReply{.line = encode_failure(request.id, error, result.output), .exit_code = 0};
}

} // namespace

RunnerReply handle_request(std::string_view line)
{
    const auto decoded = decode_request(line);
    if (const auto* bad = std::get_if<RequestError>(&decoded))
    {
        const ResponseError error{.kind = bad->kind, .message = bad->message, .line = std::nullopt};
        return RunnerReply{.line = encode_failure(bad->id, error, ""), .exit_code = 2};
    }
    return std::visit(
        [](const auto& request) -> RunnerReply
        {
            using Req = std::decay_t<decltype(request)>;
            if constexpr (std::is_same_v<Req, HandshakeRequest>)
            {
                return RunnerReply{.line = encode_success(request.id, "ok", false), .exit_code = 0};
            }
            else
            {
                return run(request);
            }
        },
        std::get<Request>(decoded));
}

} // namespace sandpit::sandbox
