#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file json.h
 * @brief Minimal JSON value, parser and serializer.
 *
 * Used for the runner protocol, the response envelope, config files and the score file.
 * Objects are ordered maps, so serialized keys always come out sorted.
 */

namespace sandpit::json
{

struct Json
{
    using Object = std::map<std::string, Json>;
    using Array = std::vector<Json>;

    std::variant<std::nullptr_t, bool, double, std::string, Object, Array> value;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value); }
    [[nodiscard]] bool is_number() const { return std::holds_alternative<double>(value); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value); }

    [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&value); }
    [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&value); }
    [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value); }
    [[nodiscard]] const double* as_number() const { return std::get_if<double>(&value); }
    [[nodiscard]] const bool* as_bool() const { return std::get_if<bool>(&value); }
};

/** @brief Parse one complete JSON document; nullopt on any syntax error or trailing data. */
[[nodiscard]] std::optional<Json> parse_json(std::string_view input);

/** @brief Escape `input` for use inside a JSON string literal (quotes not included). */
[[nodiscard]] std::string escape(std::string_view input);

/** @brief Compact single-line serialization; integral numbers print without a fraction. */
[[nodiscard]] std::string serialize(const Json& value);

[[nodiscard]] std::optional<std::string> get_string(const Json::Object& obj, const std::string& key);
[[nodiscard]] std::optional<double> get_number(const Json::Object& obj, const std::string& key);
[[nodiscard]] std::optional<bool> get_bool(const Json::Object& obj, const std::string& key);
[[nodiscard]] std::optional<Json> get_object(const Json::Object& obj, const std::string& key);

/** @brief Number member that is a whole value in [0, 2^53]; nullopt otherwise. */
[[nodiscard]] std::optional<std::uint64_t> get_unsigned(const Json::Object& obj,
                                                        const std::string& key);

} // namespace sandpit::json
