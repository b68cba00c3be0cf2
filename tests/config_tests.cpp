#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sandpit/config/config.h>
#include <string>
#include <variant>

using namespace sandpit::config;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static Config expect_config(const ConfigResult& result, const std::string& what)
{
    if (const auto* err = std::get_if<ConfigError>(&result))
    {
        fail(what + ": unexpected error " + err->key + ": " + err->message);
    }
    return std::get<Config>(result);
}

static ConfigError expect_error(const ConfigResult& result, const std::string& key,
                                const std::string& what)
{
    const auto* err = std::get_if<ConfigError>(&result);
    if (err == nullptr)
    {
        fail(what + ": expected a ConfigError");
    }
    if (err->key != key)
    {
        fail(what + ": error names key '" + err->key + "', expected '" + key + "'");
    }
    return *err;
}

static EnvLookup fake_env(std::map<std::string, std::string> vars)
{
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string>
    {
        const auto it = vars.find(name);
        if (it == vars.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
}

int main()
{
    const Config defaults;
    if (defaults.timeout_ms != 2000 || defaults.max_output_bytes != 65536 ||
        defaults.max_source_bytes != 4000 || !defaults.runner_path.empty() || check(defaults))
    {
        fail("defaults");
    }

    {
        const auto c = expect_config(set_value(defaults, "timeout_ms", "500"), "set timeout");
        if (c.timeout_ms != 500)
        {
            fail("timeout not applied");
        }
        expect_error(set_value(defaults, "timeout_ms", "0"), "timeout_ms", "timeout below range");
        expect_error(set_value(defaults, "timeout_ms", "60001"), "timeout_ms", "timeout above range");
        expect_error(set_value(defaults, "timeout_ms", "fast"), "timeout_ms", "non-numeric timeout");
        expect_error(set_value(defaults, "max_output_bytes", "10"), "max_output_bytes", "tiny output cap");
        expect_error(set_value(defaults, "max_source_bytes", "-5"), "max_source_bytes", "negative size");
        expect_error(set_value(defaults, "colour", "red"), "colour", "unknown key");
    }

    {
        const auto c = expect_config(
            apply_json(defaults, R"({"timeout_ms": 1500, "max_source_bytes": 8000, "runner_path": "/opt/r"})"),
            "json overlay");
        if (c.timeout_ms != 1500 || c.max_source_bytes != 8000 || c.runner_path != "/opt/r" ||
            c.max_output_bytes != 65536)
        {
            fail("json overlay values");
        }
        expect_error(apply_json(defaults, R"({"timeout_ms": 1.5})"), "timeout_ms", "fractional timeout");
        expect_error(apply_json(defaults, R"({"timeout_ms": "100"})"), "timeout_ms", "string timeout");
        expect_error(apply_json(defaults, R"({"verbose": true})"), "verbose", "unknown json key");
        expect_error(apply_json(defaults, R"({"runner_path": 3})"), "runner_path", "numeric runner path");
        expect_error(apply_json(defaults, "[1, 2]"), "", "non-object document");
    }

    {
        const auto c = expect_config(
            apply_env(defaults, fake_env({{"SANDPIT_TIMEOUT_MS", "750"}, {"SANDPIT_RUNNER", "/usr/lib/r"},
                                          {"SANDPIT_MAX_OUTPUT_BYTES", ""}})),
            "env overlay");
        if (c.timeout_ms != 750 || c.runner_path != "/usr/lib/r" || c.max_output_bytes != 65536)
        {
            fail("env overlay values");
        }
        const auto err = expect_error(apply_env(defaults, fake_env({{"SANDPIT_MAX_SOURCE_BYTES", "lots"}})),
                                      "max_source_bytes", "bad env value");
        if (err.message.rfind("SANDPIT_MAX_SOURCE_BYTES: ", 0) != 0)
        {
            fail("env errors name the variable: " + err.message);
        }
    }

    {
        namespace fs = std::filesystem;
        const fs::path path = fs::temp_directory_path() / "sandpit_config_tests.json";
        {
            std::ofstream out(path);
            out << "{\n  \"timeout_ms\": 3000\n}\n";
        }
        // Later sources win: file, then environment.
        const auto from_file = expect_config(load_file(defaults, path.string()), "config file");
        const auto layered = expect_config(
            apply_env(from_file, fake_env({{"SANDPIT_TIMEOUT_MS", "100"}})), "env over file");
        if (from_file.timeout_ms != 3000 || layered.timeout_ms != 100)
        {
            fail("layering order");
        }
        (void)fs::remove(path);
        expect_error(load_file(defaults, path.string()), "", "missing config file");
    }

    std::cout << "OK\n";
    return 0;
}
