#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sandpit/json/json.h>
#include <sandpit/source/utf8.h>

namespace sandpit::json
{
namespace
{

// Nesting bound so hostile input cannot exhaust the stack.
constexpr std::size_t kMaxDepth = 64;

struct JsonParser
{
    std::string_view input;
    std::size_t pos = 0;
    std::size_t depth = 0;

    [[nodiscard]] bool eof() const { return pos >= input.size(); }

    void skip_ws()
    {
        while (!eof() && (input[pos] == ' ' || input[pos] == '\t' || input[pos] == '\n' ||
                          input[pos] == '\r'))
        {
            ++pos;
        }
    }

    bool consume(char expected)
    {
        skip_ws();
        if (eof() || input[pos] != expected)
        {
            return false;
        }
        ++pos;
        return true;
    }

    bool consume_word(std::string_view word)
    {
        if (input.substr(pos, word.size()) != word)
        {
            return false;
        }
        pos += word.size();
        return true;
    }

    std::optional<Json> parse_value()
    {
        skip_ws();
        if (eof())
        {
            return std::nullopt;
        }
        const char c = input[pos];
        if (c == 'n')
        {
            return consume_word("null") ? std::optional<Json>(Json{nullptr}) : std::nullopt;
        }
        if (c == 't')
        {
            return consume_word("true") ? std::optional<Json>(Json{true}) : std::nullopt;
        }
        if (c == 'f')
        {
            return consume_word("false") ? std::optional<Json>(Json{false}) : std::nullopt;
        }
        if (c == '"')
        {
            auto s = parse_string();
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Json{std::move(*s)};
        }
        if (c == '{' || c == '[')
        {
            if (++depth > kMaxDepth)
            {
                return std::nullopt;
            }
            auto nested = c == '{' ? parse_object() : parse_array();
            --depth;
            return nested;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        {
            return parse_number();
        }
        return std::nullopt;
    }

    std::optional<std::uint32_t> parse_hex4()
    {
        if (pos + 4 > input.size())
        {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        const auto* first = input.data() + pos;
        const auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
        if (ec != std::errc{} || ptr != first + 4)
        {
            return std::nullopt;
        }
        pos += 4;
        return value;
    }

    std::optional<std::string> parse_string()
    {
        if (!consume('"'))
        {
            return std::nullopt;
        }
        std::string out;
        while (!eof())
        {
            const char c = input[pos++];
            if (c == '"')
            {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20)
            {
                return std::nullopt;
            }
            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }
            if (eof())
            {
                return std::nullopt;
            }
            const char esc = input[pos++];
            switch (esc)
            {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
            {
                auto unit = parse_hex4();
                if (!unit.has_value())
                {
                    return std::nullopt;
                }
                char32_t cp = *unit;
                if (cp >= 0xD800 && cp <= 0xDBFF)
                {
                    // High surrogate: must be followed by an escaped low surrogate.
                    if (!consume_word("\\u"))
                    {
                        return std::nullopt;
                    }
                    auto low = parse_hex4();
                    if (!low.has_value() || *low < 0xDC00 || *low > 0xDFFF)
                    {
                        return std::nullopt;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                }
                else if (cp >= 0xDC00 && cp <= 0xDFFF)
                {
                    return std::nullopt;
                }
                sandpit::source::append_utf8(out, cp);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<Json> parse_number()
    {
        const std::size_t start = pos;
        if (!eof() && input[pos] == '-')
        {
            ++pos;
        }
        const std::size_t int_start = pos;
        while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
        if (pos == int_start || (input[int_start] == '0' && pos - int_start > 1))
        {
            return std::nullopt;
        }
        if (!eof() && input[pos] == '.')
        {
            ++pos;
            const std::size_t frac_start = pos;
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
            if (pos == frac_start)
            {
                return std::nullopt;
            }
        }
        if (!eof() && (input[pos] == 'e' || input[pos] == 'E'))
        {
            ++pos;
            if (!eof() && (input[pos] == '+' || input[pos] == '-'))
            {
                ++pos;
            }
            const std::size_t exp_start = pos;
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
            if (pos == exp_start)
            {
                return std::nullopt;
            }
        }
        const std::string num(input.substr(start, pos - start));
        char* end_ptr = nullptr;
        const double value = std::strtod(num.c_str(), &end_ptr);
        if (end_ptr != num.c_str() + num.size())
        {
            return std::nullopt;
        }
        return Json{value};
    }

    std::optional<Json> parse_array()
    {
        if (!consume('['))
        {
            return std::nullopt;
        }
        Json::Array items;
        if (consume(']'))
        {
            return Json{std::move(items)};
        }
        while (true)
        {
            auto value = parse_value();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            items.push_back(std::move(*value));
            if (consume(']'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{std::move(items)};
    }

    std::optional<Json> parse_object()
    {
        if (!consume('{'))
        {
            return std::nullopt;
        }
        Json::Object obj;
        if (consume('}'))
        {
            return Json{std::move(obj)};
        }
        while (true)
        {
            skip_ws();
            auto key = parse_string();
            if (!key.has_value())
            {
                return std::nullopt;
            }
            if (!consume(':'))
            {
                return std::nullopt;
            }
            auto val = parse_value();
            if (!val.has_value())
            {
                return std::nullopt;
            }
            obj.insert_or_assign(std::move(*key), std::move(*val));
            if (consume('}'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{std::move(obj)};
    }
};

std::string serialize_number(double v)
{
    if (!std::isfinite(v))
    {
        return "null";
    }
    if (std::floor(v) == v && std::fabs(v) < 9007199254740992.0)
    {
        return std::to_string(static_cast<long long>(v));
    }
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, ec == std::errc{} ? ptr : buf);
}

} // namespace

std::optional<Json> parse_json(std::string_view input)
{
    JsonParser parser{.input = input, .pos = 0, .depth = 0};
    auto result = parser.parse_value();
    if (!result.has_value())
    {
        return std::nullopt;
    }
    parser.skip_ws();
    if (!parser.eof())
    {
        return std::nullopt;
    }
    return result;
}

std::string escape(std::string_view input)
{
    std::string out;
    out.reserve(input.size() + 8);
    for (char c : input)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string serialize(const Json& value)
{
    if (value.is_null())
    {
        return "null";
    }
    if (value.is_bool())
    {
        return *value.as_bool() ? "true" : "false";
    }
    if (value.is_number())
    {
        return serialize_number(*value.as_number());
    }
    if (value.is_string())
    {
        return "\"" + escape(*value.as_string()) + "\"";
    }
    if (value.is_array())
    {
        const auto& arr = *value.as_array();
        std::string out = "[";
        for (std::size_t i = 0; i < arr.size(); ++i)
        {
            if (i > 0)
            {
                out += ',';
            }
            out += serialize(arr[i]);
        }
        out += "]";
        return out;
    }
    const auto& obj = *value.as_object();
    std::string out = "{";
    bool first = true;
    for (const auto& [key, val] : obj)
    {
        if (!first)
        {
            out += ',';
        }
        first = false;
        out += "\"" + escape(key) + "\":" + serialize(val);
    }
    out += "}";
    return out;
}

std::optional<std::string> get_string(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_string())
    {
        return std::nullopt;
    }
    return *it->second.as_string();
}

std::optional<double> get_number(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_number())
    {
        return std::nullopt;
    }
    return *it->second.as_number();
}

std::optional<bool> get_bool(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_bool())
    {
        return std::nullopt;
    }
    return *it->second.as_bool();
}

std::optional<Json> get_object(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_object())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> get_unsigned(const Json::Object& obj, const std::string& key)
{
    const auto v = get_number(obj, key);
    if (!v.has_value() || !std::isfinite(*v) || std::floor(*v) != *v || *v < 0 ||
        *v > 9007199254740992.0)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*v);
}

} // namespace sandpit::json
