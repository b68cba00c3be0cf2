#include <cctype>
#include <sandpit/json/json.h>
#include <sandpit/result/envelope.h>
#include <type_traits>

namespace sandpit::result
{
namespace
{

bool path_char(char c)
{
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0 || c == '/' || c == '.' || c == '_' || c == '-' ||
           c == '+' || c == '~';
}

// An absolute path starts with '/' at the beginning of a word and has at least one more
// component ("/usr/bin/x", "/tmp/a"); a lone "/" as in "1 / 2" is left alone.
bool starts_path(std::string_view text, std::size_t i)
{
    if (text[i] != '/' || (i > 0 && path_char(text[i - 1])))
    {
        return false;
    }
    std::size_t j = i + 1;
    while (j < text.size() && path_char(text[j]) && text[j] != '/')
    {
        ++j;
    }
    return j > i + 1 && j < text.size() && text[j] == '/';
}

ErrorInfo error(std::string_view kind, std::string_view message)
{
    return ErrorInfo{.kind = std::string(kind), .message = scrub_message(message)};
}

} // namespace

const char* outcome_name(const ExecutionOutcome& outcome)
{
    static constexpr const char* kNames[] = {"success", "validation_rejected", "timeout",
                                             "runtime_failure", "isolation_failure"};
    return kNames[outcome.index()];
}

std::string scrub_message(std::string_view message)
{
    std::string out;
    out.reserve(message.size());
    std::size_t i = 0;
    while (i < message.size())
    {
        if (starts_path(message, i))
        {
            while (i < message.size() && path_char(message[i]))
            {
                ++i;
            }
            out += "<path>";
            continue;
        }
        out.push_back(message[i++]);
    }

    if (out.size() > kMaxMessageBytes)
    {
        std::size_t cut = kMaxMessageBytes - 3;
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
        {
            --cut;
        }
        out.resize(cut);
        out += "...";
    }
    return out;
}

ResponseEnvelope normalize(const ExecutionOutcome& outcome)
{
    return std::visit(
        [](const auto& o) -> ResponseEnvelope
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Success>)
            {
                return ResponseEnvelope{
                    .ok = true, .output = o.captured_output, .error = std::nullopt, .timed_out = false};
            }
            else if constexpr (std::is_same_v<T, ValidationRejected>)
            {
                return ResponseEnvelope{.ok = false,
                                        .output = std::nullopt,
                                        .error = error(kValidationKind, o.reason),
                                        .timed_out = false};
            }
            else if constexpr (std::is_same_v<T, Timeout>)
            {
                return ResponseEnvelope{.ok = false,
                                        .output = std::nullopt,
                                        .error = error(kTimeoutKind, kTimeoutMessage),
                                        .timed_out = true};
            }
            else if constexpr (std::is_same_v<T, RuntimeFailure>)
            {
                return ResponseEnvelope{.ok = false,
                                        .output = o.partial_output,
                                        .error = error(kRuntimeKind, o.message),
                                        .timed_out = false};
            }
            else
            {
                return ResponseEnvelope{.ok = false,
                                        .output = std::nullopt,
                                        .error = error(kRuntimeKind, kIsolationMessage),
                                        .timed_out = false};
            }
        },
        outcome);
}

std::string to_json(const ResponseEnvelope& envelope)
{
    using sandpit::json::Json;
    Json::Object top;
    top.emplace("ok", Json{envelope.ok});
    top.emplace("timed_out", Json{envelope.timed_out});
    if (envelope.output.has_value())
    {
        top.emplace("output", Json{*envelope.output});
    }
    if (envelope.error.has_value())
    {
        Json::Object err;
        err.emplace("kind", Json{envelope.error->kind});
        err.emplace("message", Json{envelope.error->message});
        top.emplace("error", Json{std::move(err)});
    }
    return sandpit::json::serialize(Json{std::move(top)});
}

} // namespace sandpit::result
