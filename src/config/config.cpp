#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sandpit/config/config.h>
#include <sandpit/json/json.h>
#include <sandpit/source/source_file.h>
#include <utility>

namespace sandpit::config
{
namespace
{

struct Range
{
    std::int64_t min;
    std::int64_t max;
};

constexpr Range kTimeoutRange{.min = 1, .max = 60000};
constexpr Range kOutputRange{.min = 1024, .max = 16 * 1024 * 1024};
constexpr Range kSourceRange{.min = 1, .max = 32768};

struct EnvKey
{
    const char* env;
    const char* key;
};

constexpr std::array kEnvKeys = {
    EnvKey{.env = "SANDPIT_TIMEOUT_MS", .key = "timeout_ms"},
    EnvKey{.env = "SANDPIT_MAX_OUTPUT_BYTES", .key = "max_output_bytes"},
    EnvKey{.env = "SANDPIT_MAX_SOURCE_BYTES", .key = "max_source_bytes"},
    EnvKey{.env = "SANDPIT_RUNNER", .key = "runner_path"},
};

std::optional<ConfigError> check_range(std::string_view key, std::int64_t value, Range range)
{
    if (value < range.min || value > range.max)
    {
        return ConfigError{.key = std::string(key),
                           .message = "must be between " + std::to_string(range.min) + " and " +
                                      std::to_string(range.max) + ", got " +
                                      std::to_string(value)};
    }
    return std::nullopt;
}

std::optional<std::int64_t> parse_integer(std::string_view text)
{
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty())
    {
        return std::nullopt;
    }
    return value;
}

ConfigResult set_integer(Config config, std::string_view key, std::int64_t value)
{
    if (key == "timeout_ms")
    {
        config.timeout_ms = value;
    }
    else if (key == "max_output_bytes" || key == "max_source_bytes")
    {
        if (value < 0)
        {
            return ConfigError{.key = std::string(key), .message = "must not be negative"};
        }
        (key == "max_output_bytes" ? config.max_output_bytes : config.max_source_bytes) =
            static_cast<std::size_t>(value);
    }
    else
    {
        return ConfigError{.key = std::string(key), .message = "unknown configuration key"};
    }
    if (auto error = check(config))
    {
        return *error;
    }
    return config;
}

} // namespace

std::optional<ConfigError> check(const Config& config)
{
    if (auto e = check_range("timeout_ms", config.timeout_ms, kTimeoutRange))
    {
        return e;
    }
    if (auto e = check_range("max_output_bytes", static_cast<std::int64_t>(config.max_output_bytes),
                             kOutputRange))
    {
        return e;
    }
    if (auto e = check_range("max_source_bytes", static_cast<std::int64_t>(config.max_source_bytes),
                             kSourceRange))
    {
        return e;
    }
    return std::nullopt;
}

ConfigResult set_value(const Config& base, std::string_view key, std::string_view text)
{
    if (key == "runner_path")
    {
        Config config = base;
        config.runner_path = std::string(text);
        return config;
    }
    if (key != "timeout_ms" && key != "max_output_bytes" && key != "max_source_bytes")
    {
        return ConfigError{.key = std::string(key), .message = "unknown configuration key"};
    }
    const auto value = parse_integer(text);
    if (!value.has_value())
    {
        return ConfigError{.key = std::string(key),
                           .message = "expected an integer, got '" + std::string(text) + "'"};
    }
    return set_integer(base, key, *value);
}

ConfigResult apply_json(const Config& base, std::string_view text)
{
    const auto parsed = sandpit::json::parse_json(text);
    if (!parsed.has_value() || !parsed->is_object())
    {
        return ConfigError{.key = "", .message = "config file must contain a JSON object"};
    }

    Config config = base;
    for (const auto& [key, value] : *parsed->as_object())
    {
        ConfigResult next = ConfigError{};
        if (key == "runner_path")
        {
            if (!value.is_string())
            {
                return ConfigError{.key = key, .message = "expected a string"};
            }
            next = set_value(config, key, *value.as_string());
        }
        else
        {
            const double* number = value.as_number();
            if (number == nullptr || std::floor(*number) != *number || std::fabs(*number) > 1e15)
            {
                if (key != "timeout_ms" && key != "max_output_bytes" && key != "max_source_bytes")
                {
                    return ConfigError{.key = key, .message = "unknown configuration key"};
                }
                return ConfigError{.key = key, .message = "expected an integer"};
            }
            next = set_integer(config, key, static_cast<std::int64_t>(*number));
        }
        if (auto* error = std::get_if<ConfigError>(&next))
        {
            return std::move(*error);
        }
        config = std::get<Config>(std::move(next));
    }
    return config;
}

ConfigResult load_file(const Config& base, const std::string& path)
{
    auto loaded = sandpit::source::load_source_file(path);
    if (auto* error = std::get_if<sandpit::source::LoadError>(&loaded))
    {
        return ConfigError{.key = "", .message = error->message};
    }
    return apply_json(base, std::get<sandpit::source::SourceFile>(loaded).contents);
}

ConfigResult apply_env(const Config& base, const EnvLookup& lookup)
{
    Config config = base;
    for (const auto& entry : kEnvKeys)
    {
        const auto text = lookup(entry.env);
        if (!text.has_value() || text->empty())
        {
            continue;
        }
        auto next = set_value(config, entry.key, *text);
        if (auto* error = std::get_if<ConfigError>(&next))
        {
            error->message = std::string(entry.env) + ": " + error->message;
            return std::move(*error);
        }
        config = std::get<Config>(std::move(next));
    }
    return config;
}

EnvLookup process_env()
{
    return [](const char* name) -> std::optional<std::string>
    {
        if (const char* value = std::getenv(name); value != nullptr)
        {
            return std::string(value);
        }
        return std::nullopt;
    };
}

} // namespace sandpit::config
