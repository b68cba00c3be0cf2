#include <cstdint>
#include <sandpit/json/json.h>
#include <sandpit/sandbox/protocol.h>
#include <utility>

namespace sandpit::sandbox
{

using sandpit::json::Json;

namespace
{

// Upper bound accepted for max_output_bytes in a run request.
constexpr std::uint64_t kMaxOutputLimit = 16u * 1024u * 1024u;

Json version()
{
    return Json{static_cast<double>(kProtocolVersion)};
}

std::string line_of(const Json& value)
{
    return sandpit::json::serialize(value) + "\n";
}

} // namespace

std::string encode_request(const Request& request)
{
    Json::Object top;
    top.emplace("protocol_version", version());
    if (const auto* run = std::get_if<RunRequest>(&request))
    {
        top.emplace("id", Json{run->id});
        top.emplace("op", Json{std::string("run")});
        top.emplace("source", Json{run->source});
        top.emplace("max_output_bytes", Json{static_cast<double>(run->max_output_bytes)});
    }
    else
    {
        top.emplace("id", Json{std::get<HandshakeRequest>(request).id});
        top.emplace("op", Json{std::string("handshake")});
    }
    return line_of(Json{std::move(top)});
}

DecodedRequest decode_request(std::string_view line)
{
    const auto parsed = sandpit::json::parse_json(line);
    if (!parsed.has_value() || !parsed->is_object())
    {
        return RequestError{.id = "", .kind = std::string(kInvalidRequest), .message = "malformed json"};
    }
    const auto& obj = *parsed->as_object();
    const std::string id = sandpit::json::get_string(obj, "id").value_or("");

    const auto v = sandpit::json::get_unsigned(obj, "protocol_version");
    if (!v.has_value() || *v != static_cast<std::uint64_t>(kProtocolVersion))
    {
        return RequestError{.id = id,
                            .kind = std::string(kVersionUnsupported),
                            .message = "unsupported protocol version"};
    }

    const auto op = sandpit::json::get_string(obj, "op");
    if (!op.has_value())
    {
        return RequestError{.id = id, .kind = std::string(kInvalidRequest), .message = "missing op"};
    }
    if (*op == "handshake")
    {
        return Request{HandshakeRequest{.id = id}};
    }
    if (*op != "run")
    {
        return RequestError{.id = id, .kind = std::string(kInvalidRequest), .message = "unknown op"};
    }

    auto source = sandpit::json::get_string(obj, "source");
    if (!source.has_value())
    {
        return RequestError{
            .id = id, .kind = std::string(kInvalidRequest), .message = "source must be a string"};
    }
    RunRequest run{.id = id, .source = std::move(*source), .max_output_bytes = 65536};
    if (obj.contains("max_output_bytes"))
    {
        const auto limit = sandpit::json::get_unsigned(obj, "max_output_bytes");
        if (!limit.has_value() || *limit == 0 || *limit > kMaxOutputLimit)
        {
            return RequestError{.id = id,
                                .kind = std::string(kInvalidRequest),
                                .message = "max_output_bytes out of range"};
        }
        run.max_output_bytes = static_cast<std::size_t>(*limit);
    }
    return Request{std::move(run)};
}

std::string encode_success(std::string_view id, std::string_view output, bool truncated)
{
    Json::Object result;
    result.emplace("output", Json{std::string(output)});
    result.emplace("truncated", Json{truncated});

    Json::Object top;
    top.emplace("id", Json{std::string(id)});
    top.emplace("ok", Json{true});
    top.emplace("protocol_version", version());
    top.emplace("result", Json{std::move(result)});
    return line_of(Json{std::move(top)});
}

std::string encode_failure(std::string_view id, const ResponseError& error, std::string_view output)
{
    Json::Object err;
    err.emplace("kind", Json{error.kind});
    err.emplace("message", Json{error.message});
    if (error.line.has_value())
    {
        err.emplace("line", Json{static_cast<double>(*error.line)});
    }

    Json::Object top;
    top.emplace("error", Json{std::move(err)});
    top.emplace("id", Json{std::string(id)});
    top.emplace("ok", Json{false});
    top.emplace("output", Json{std::string(output)});
    top.emplace("protocol_version", version());
    return line_of(Json{std::move(top)});
}

std::optional<Response> decode_response(std::string_view line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    {
        line.remove_suffix(1);
    }
    const auto parsed = sandpit::json::parse_json(line);
    if (!parsed.has_value() || !parsed->is_object())
    {
        return std::nullopt;
    }
    const auto& obj = *parsed->as_object();
    const auto v = sandpit::json::get_unsigned(obj, "protocol_version");
    const auto ok = sandpit::json::get_bool(obj, "ok");
    if (!v.has_value() || *v != static_cast<std::uint64_t>(kProtocolVersion) || !ok.has_value())
    {
        return std::nullopt;
    }

    Response response;
    response.id = sandpit::json::get_string(obj, "id").value_or("");
    response.ok = *ok;
    if (response.ok)
    {
        const auto result = sandpit::json::get_object(obj, "result");
        if (!result.has_value())
        {
            return std::nullopt;
        }
        const auto& fields = *result->as_object();
        auto output = sandpit::json::get_string(fields, "output");
        if (!output.has_value())
        {
            return std::nullopt;
        }
        response.output = std::move(*output);
        response.truncated = sandpit::json::get_bool(fields, "truncated").value_or(false);
        return response;
    }

    const auto error = sandpit::json::get_object(obj, "error");
    if (!error.has_value())
    {
        return std::nullopt;
    }
    const auto& fields = *error->as_object();
    auto kind = sandpit::json::get_string(fields, "kind");
    auto message = sandpit::json::get_string(fields, "message");
    if (!kind.has_value() || !message.has_value())
    {
        return std::nullopt;
    }
    ResponseError err{.kind = std::move(*kind), .message = std::move(*message), .line = std::nullopt};
    if (const auto n = sandpit::json::get_unsigned(fields, "line"))
    {
        err.line = static_cast<std::size_t>(*n);
    }
    response.error = std::move(err);
    response.output = sandpit::json::get_string(obj, "output").value_or("");
    return response;
}

} // namespace sandpit::sandbox
