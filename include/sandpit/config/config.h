#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file config.h
 * @brief Engine configuration: defaults, then a JSON file, then SANDPIT_* environment
 * variables, then command-line flags (later sources win).
 */

namespace sandpit::config
{

struct Config
{
    std::int64_t timeout_ms = 2000;
    std::size_t max_output_bytes = 65536;
    std::size_t max_source_bytes = 4000;
    std::string runner_path; /**< Empty: discover the runner next to the executable. */
};

/** @brief A rejected setting; `key` uses the config-file spelling. */
struct ConfigError
{
    std::string key;
    std::string message;
};

using ConfigResult = std::variant<Config, ConfigError>;

/** @brief Range-check every field. */
[[nodiscard]] std::optional<ConfigError> check(const Config& config);

/** @brief Set one key from its textual value (as given in the environment or a flag). */
[[nodiscard]] ConfigResult set_value(const Config& base, std::string_view key, std::string_view text);

/** @brief Overlay a JSON object document (keys as in Config). Unknown keys are errors. */
[[nodiscard]] ConfigResult apply_json(const Config& base, std::string_view text);

/** @brief Overlay the JSON config file at `path`. */
[[nodiscard]] ConfigResult load_file(const Config& base, const std::string& path);

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/** @brief Overlay SANDPIT_TIMEOUT_MS, SANDPIT_MAX_OUTPUT_BYTES, SANDPIT_MAX_SOURCE_BYTES and
 * SANDPIT_RUNNER as returned by `lookup`. */
[[nodiscard]] ConfigResult apply_env(const Config& base, const EnvLookup& lookup);

/** @brief EnvLookup reading the process environment. */
[[nodiscard]] EnvLookup process_env();

} // namespace sandpit::config
