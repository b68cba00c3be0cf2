#include <algorithm>
#include <array>
#include <cctype>
#include <numeric>
#include <sandpit/runtime/error.h>
#include <sandpit/runtime/methods.h>
#include <sandpit/runtime/operations.h>
#include <sandpit/source/utf8.h>

namespace sandpit::runtime
{
namespace
{

constexpr std::array kStrMethods = {
    "capitalize", "center",    "count",   "endswith", "find",    "format",     "index",
    "isalnum",    "isalpha",   "isdecimal", "isdigit", "islower", "isnumeric", "isspace",
    "isupper",    "join",      "ljust",   "lower",    "lstrip",  "partition",  "replace",
    "rfind",      "rjust",     "rstrip",  "split",    "splitlines", "startswith", "strip",
    "swapcase",   "title",     "upper",   "zfill",
};

constexpr std::array kListMethods = {
    "append", "clear", "copy", "count", "extend", "index",
    "insert", "pop",   "remove", "reverse", "sort",
};

constexpr std::array kTupleMethods = {"count", "index"};

constexpr std::array kDictMethods = {
    "clear", "copy", "get", "items", "keys", "pop", "popitem", "setdefault", "update", "values",
};

constexpr std::array kSetMethods = {
    "add",          "clear",    "copy",       "difference", "discard",
    "intersection", "isdisjoint", "issubset", "issuperset", "pop",
    "remove",       "symmetric_difference", "union", "update",
};

template <typename Names> bool listed(const Names& names, std::string_view name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

const std::string& str_arg(const Value& v, std::string_view method)
{
    if (!v.is(ValueKind::Str))
    {
        type_error(std::string(method) + "() argument must be str, not " + type_name(v));
    }
    return v.as_str();
}

// Code point index of byte offset `byte` in `text`.
std::int64_t cp_index(const std::string& text, std::size_t byte)
{
    return static_cast<std::int64_t>(
        sandpit::source::code_point_count(std::string_view(text).substr(0, byte)));
}

std::string map_ascii(const std::string& text, int (*fn)(int))
{
    std::string out = text;
    for (auto& c : out)
    {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x80)
        {
            c = static_cast<char>(fn(u));
        }
    }
    return out;
}

std::string strip_chars(const std::string& text, const CallArgs& args, bool left, bool right)
{
    std::string_view view = text;
    const bool custom = !args.positional.empty() && !args.positional[0].is_none();
    const std::string chars = custom ? str_arg(args.positional[0], "strip") : std::string{};
    auto strip_this = [&](char c)
    { return custom ? chars.find(c) != std::string::npos : is_space(c); };
    while (left && !view.empty() && strip_this(view.front()))
    {
        view.remove_prefix(1);
    }
    while (right && !view.empty() && strip_this(view.back()))
    {
        view.remove_suffix(1);
    }
    return std::string(view);
}

Value split(const std::string& text, CallArgs& args)
{
    auto sep_kw = take_keyword(args, "sep");
    auto max_kw = take_keyword(args, "maxsplit");
    reject_remaining_keywords(args, "split");
    if (args.positional.size() > 2)
    {
        type_error("split() takes at most 2 arguments");
    }
    if (!args.positional.empty())
    {
        sep_kw = args.positional[0];
    }
    if (args.positional.size() == 2)
    {
        max_kw = args.positional[1];
    }
    std::int64_t max_split = max_kw.has_value() ? to_index(*max_kw, "maxsplit") : -1;

    std::vector<Value> parts;
    if (!sep_kw.has_value() || sep_kw->is_none())
    {
        std::size_t i = 0;
        while (i < text.size())
        {
            while (i < text.size() && is_space(text[i]))
            {
                ++i;
            }
            if (i >= text.size())
            {
                break;
            }
            if (max_split == 0)
            {
                std::string rest = text.substr(i);
                while (!rest.empty() && is_space(rest.back()))
                {
                    rest.pop_back();
                }
                parts.push_back(Value::str(std::move(rest)));
                break;
            }
            std::size_t j = i;
            while (j < text.size() && !is_space(text[j]))
            {
                ++j;
            }
            parts.push_back(Value::str(text.substr(i, j - i)));
            if (max_split > 0)
            {
                --max_split;
            }
            i = j;
        }
        return Value::list(std::move(parts));
    }

    const std::string& sep = str_arg(*sep_kw, "split");
    if (sep.empty())
    {
        value_error("empty separator");
    }
    std::size_t start = 0;
    while (true)
    {
        const std::size_t hit = (max_split == 0) ? std::string::npos : text.find(sep, start);
        if (hit == std::string::npos)
        {
            parts.push_back(Value::str(text.substr(start)));
            break;
        }
        parts.push_back(Value::str(text.substr(start, hit - start)));
        start = hit + sep.size();
        if (max_split > 0)
        {
            --max_split;
        }
    }
    return Value::list(std::move(parts));
}

std::string justify(const std::string& text, CallArgs& args, std::string_view method, char align)
{
    expect_args(args, method, 1, 2);
    const std::int64_t width = to_index(args.positional[0], "width");
    std::string fill = " ";
    if (args.positional.size() == 2)
    {
        fill = str_arg(args.positional[1], method);
        if (sandpit::source::code_point_count(fill) != 1)
        {
            type_error("The fill character must be exactly one character long");
        }
    }
    const auto len = static_cast<std::int64_t>(sandpit::source::code_point_count(text));
    if (width <= len)
    {
        return text;
    }
    const auto missing = static_cast<std::size_t>(width - len);
    check_string_length(missing * fill.size() + text.size());
    auto repeat = [&fill](std::size_t n)
    {
        std::string out;
        for (std::size_t i = 0; i < n; ++i)
        {
            out += fill;
        }
        return out;
    };
    switch (align)
    {
    case '<':
        return text + repeat(missing);
    case '>':
        return repeat(missing) + text;
    default:
    {
        // CPython puts the extra fill character on the left when both the text length and
        // the padding are odd.
        const std::size_t left = missing / 2 + (missing & static_cast<std::size_t>(width) & 1);
        return repeat(left) + text + repeat(missing - left);
    }
    }
}

template <typename Pred> bool all_chars(const std::string& text, Pred pred)
{
    if (text.empty())
    {
        return false;
    }
    return std::all_of(text.begin(), text.end(),
                       [&pred](char c) { return pred(static_cast<unsigned char>(c)); });
}

// `str.format(*args, **kwargs)`.
std::string str_format(const std::string& fmt, const CallArgs& args)
{
    std::string out;
    std::size_t auto_index = 0;
    enum class Numbering
    {
        Unknown,
        Automatic,
        Manual,
    } numbering = Numbering::Unknown;

    std::size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i];
        if (c == '}')
        {
            if (i + 1 < fmt.size() && fmt[i + 1] == '}')
            {
                out.push_back('}');
                i += 2;
                continue;
            }
            value_error("Single '}' encountered in format string");
        }
        if (c != '{')
        {
            out.push_back(c);
            ++i;
            continue;
        }
        if (i + 1 < fmt.size() && fmt[i + 1] == '{')
        {
            out.push_back('{');
            i += 2;
            continue;
        }

        const std::size_t close = fmt.find('}', i + 1);
        if (close == std::string::npos)
        {
            value_error("Single '{' encountered in format string");
        }
        std::string_view field(fmt.data() + i + 1, close - i - 1);
        if (field.find('{') != std::string_view::npos)
        {
            value_error("nested replacement fields are not supported");
        }
        i = close + 1;

        std::string_view spec;
        char conversion = '\0';
        if (const std::size_t colon = field.find(':'); colon != std::string_view::npos)
        {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        if (const std::size_t bang = field.find('!'); bang != std::string_view::npos)
        {
            const std::string_view conv = field.substr(bang + 1);
            if (conv.size() != 1 || (conv[0] != 'r' && conv[0] != 's' && conv[0] != 'a'))
            {
                value_error("Unknown conversion specifier " + std::string(conv));
            }
            conversion = conv[0];
            field = field.substr(0, bang);
        }

        Value value;
        if (field.empty())
        {
            if (numbering == Numbering::Manual)
            {
                value_error("cannot switch from manual field specification to automatic field "
                            "numbering");
            }
            numbering = Numbering::Automatic;
            if (auto_index >= args.positional.size())
            {
                raise("IndexError", "Replacement index " + std::to_string(auto_index) +
                                        " out of range for positional args tuple");
            }
            value = args.positional[auto_index++];
        }
        else if (std::all_of(field.begin(), field.end(),
                             [](char d) { return d >= '0' && d <= '9'; }))
        {
            if (numbering == Numbering::Automatic)
            {
                value_error("cannot switch from automatic field numbering to manual field "
                            "specification");
            }
            numbering = Numbering::Manual;
            const std::size_t index = std::stoul(std::string(field));
            if (index >= args.positional.size())
            {
                raise("IndexError", "Replacement index " + std::to_string(index) +
                                        " out of range for positional args tuple");
            }
            value = args.positional[index];
        }
        else
        {
            const auto it = std::find_if(args.keywords.begin(), args.keywords.end(),
                                         [field](const auto& kw) { return kw.first == field; });
            if (it == args.keywords.end())
            {
                raise("KeyError", quote_string(field));
            }
            value = it->second;
        }

        if (conversion == 'r' || conversion == 'a')
        {
            value = Value::str(repr(value));
        }
        else if (conversion == 's')
        {
            value = Value::str(to_str(value));
        }
        out += format_value(value, spec);
        check_string_length(out.size());
    }
    return out;
}

Value str_method(const Value& self, std::string_view name, CallArgs& args)
{
    const std::string& s = self.as_str();

    if (name == "format")
    {
        return Value::str(str_format(s, args));
    }
    if (name == "upper" || name == "lower" || name == "swapcase" || name == "capitalize" ||
        name == "title")
    {
        expect_args(args, name, 0, 0);
        if (name == "upper")
        {
            return Value::str(map_ascii(s, ::toupper));
        }
        if (name == "lower")
        {
            return Value::str(map_ascii(s, ::tolower));
        }
        std::string out = s;
        bool start_of_word = true;
        for (std::size_t i = 0; i < out.size(); ++i)
        {
            const auto u = static_cast<unsigned char>(out[i]);
            if (u >= 0x80)
            {
                start_of_word = false;
                continue;
            }
            if (name == "swapcase")
            {
                out[i] = static_cast<char>(std::isupper(u) ? std::tolower(u) : std::toupper(u));
            }
            else if (name == "capitalize")
            {
                out[i] = static_cast<char>(i == 0 ? std::toupper(u) : std::tolower(u));
            }
            else
            {
                out[i] = static_cast<char>(start_of_word ? std::toupper(u) : std::tolower(u));
                start_of_word = std::isalpha(u) == 0;
            }
        }
        return Value::str(std::move(out));
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip")
    {
        expect_args(args, name, 0, 1);
        return Value::str(strip_chars(s, args, name != "rstrip", name != "lstrip"));
    }
    if (name == "split")
    {
        return split(s, args);
    }
    if (name == "splitlines")
    {
        expect_args(args, name, 0, 0);
        std::vector<Value> lines;
        std::size_t start = 0;
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '\n' || s[i] == '\r')
            {
                lines.push_back(Value::str(s.substr(start, i - start)));
                if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n')
                {
                    ++i;
                }
                start = i + 1;
            }
        }
        if (start < s.size())
        {
            lines.push_back(Value::str(s.substr(start)));
        }
        return Value::list(std::move(lines));
    }
    if (name == "join")
    {
        expect_args(args, name, 1, 1);
        std::string out;
        std::size_t index = 0;
        for_each(args.positional[0],
                 [&](const Value& item)
                 {
                     if (!item.is(ValueKind::Str))
                     {
                         type_error("sequence item " + std::to_string(index) +
                                    ": expected str instance, " + type_name(item) + " found");
                     }
                     if (index > 0)
                     {
                         out += s;
                     }
                     out += item.as_str();
                     check_string_length(out.size());
                     ++index;
                     return true;
                 });
        return Value::str(std::move(out));
    }
    if (name == "replace")
    {
        expect_args(args, name, 2, 3);
        const std::string& from = str_arg(args.positional[0], name);
        const std::string& to = str_arg(args.positional[1], name);
        std::int64_t limit = args.positional.size() == 3 ? to_index(args.positional[2], "count") : -1;
        std::string out;
        if (from.empty())
        {
            const auto cps = sandpit::source::split_code_points(s);
            for (std::size_t i = 0; i <= cps.size(); ++i)
            {
                if (limit != 0)
                {
                    out += to;
                    if (limit > 0)
                    {
                        --limit;
                    }
                }
                if (i < cps.size())
                {
                    out += cps[i];
                }
                check_string_length(out.size());
            }
            return Value::str(std::move(out));
        }
        std::size_t pos = 0;
        while (limit != 0)
        {
            const std::size_t hit = s.find(from, pos);
            if (hit == std::string::npos)
            {
                break;
            }
            out.append(s, pos, hit - pos);
            out += to;
            check_string_length(out.size());
            pos = hit + from.size();
            if (limit > 0)
            {
                --limit;
            }
        }
        out.append(s, pos, std::string::npos);
        return Value::str(std::move(out));
    }
    if (name == "startswith" || name == "endswith")
    {
        expect_args(args, name, 1, 1);
        std::vector<Value> candidates;
        if (args.positional[0].is(ValueKind::Tuple))
        {
            candidates = args.positional[0].as_tuple().items;
        }
        else
        {
            candidates.push_back(args.positional[0]);
        }
        for (const auto& c : candidates)
        {
            if (!c.is(ValueKind::Str))
            {
                type_error(std::string(name) +
                           " first arg must be str or a tuple of str, not " + type_name(c));
            }
            const bool hit = name == "startswith" ? s.starts_with(c.as_str())
                                                  : s.ends_with(c.as_str());
            if (hit)
            {
                return Value::boolean(true);
            }
        }
        return Value::boolean(false);
    }
    if (name == "find" || name == "rfind" || name == "index")
    {
        expect_args(args, name, 1, 1);
        const std::string& needle = str_arg(args.positional[0], name);
        const std::size_t hit = name == "rfind" ? s.rfind(needle) : s.find(needle);
        if (hit == std::string::npos)
        {
            if (name == "index")
            {
                value_error("substring not found");
            }
            return Value::integer(-1);
        }
        return Value::integer(cp_index(s, hit));
    }
    if (name == "count")
    {
        expect_args(args, name, 1, 1);
        const std::string& needle = str_arg(args.positional[0], name);
        if (needle.empty())
        {
            return Value::integer(length_of(self) + 1);
        }
        std::int64_t n = 0;
        for (std::size_t pos = s.find(needle); pos != std::string::npos;
             pos = s.find(needle, pos + needle.size()))
        {
            ++n;
        }
        return Value::integer(n);
    }
    if (name == "partition")
    {
        expect_args(args, name, 1, 1);
        const std::string& sep = str_arg(args.positional[0], name);
        if (sep.empty())
        {
            value_error("empty separator");
        }
        const std::size_t hit = s.find(sep);
        if (hit == std::string::npos)
        {
            return Value::tuple({Value::str(s), Value::str(""), Value::str("")});
        }
        return Value::tuple({Value::str(s.substr(0, hit)), Value::str(sep),
                             Value::str(s.substr(hit + sep.size()))});
    }
    if (name == "isdigit" || name == "isnumeric" || name == "isdecimal")
    {
        expect_args(args, name, 0, 0);
        return Value::boolean(all_chars(s, [](unsigned char c) { return std::isdigit(c) != 0; }));
    }
    if (name == "isalpha")
    {
        expect_args(args, name, 0, 0);
        return Value::boolean(all_chars(s, [](unsigned char c) { return std::isalpha(c) != 0; }));
    }
    if (name == "isalnum")
    {
        expect_args(args, name, 0, 0);
        return Value::boolean(all_chars(s, [](unsigned char c) { return std::isalnum(c) != 0; }));
    }
    if (name == "isspace")
    {
        expect_args(args, name, 0, 0);
        return Value::boolean(all_chars(s, [](unsigned char c) { return std::isspace(c) != 0; }));
    }
    if (name == "isupper" || name == "islower")
    {
        expect_args(args, name, 0, 0);
        const bool want_upper = name == "isupper";
        bool cased = false;
        for (char ch : s)
        {
            const auto u = static_cast<unsigned char>(ch);
            if (std::isupper(u) != 0 || std::islower(u) != 0)
            {
                cased = true;
                if ((std::isupper(u) != 0) != want_upper)
                {
                    return Value::boolean(false);
                }
            }
        }
        return Value::boolean(cased);
    }
    if (name == "center")
    {
        return Value::str(justify(s, args, name, '^'));
    }
    if (name == "ljust")
    {
        return Value::str(justify(s, args, name, '<'));
    }
    if (name == "rjust")
    {
        return Value::str(justify(s, args, name, '>'));
    }
    if (name == "zfill")
    {
        expect_args(args, name, 1, 1);
        const std::int64_t width = to_index(args.positional[0], "width");
        const auto len = static_cast<std::int64_t>(sandpit::source::code_point_count(s));
        if (width <= len)
        {
            return self;
        }
        const auto missing = static_cast<std::size_t>(width - len);
        check_string_length(missing + s.size());
        const bool signed_text = !s.empty() && (s[0] == '+' || s[0] == '-');
        std::string out = signed_text ? s.substr(0, 1) : std::string{};
        out.append(missing, '0');
        out += signed_text ? s.substr(1) : s;
        return Value::str(std::move(out));
    }
    raise("AttributeError", "'str' object has no attribute '" + std::string(name) + "'");
}

std::int64_t find_index(const std::vector<Value>& items, CallArgs& args, std::string_view kind)
{
    expect_args(args, "index", 1, 3);
    const auto n = static_cast<std::int64_t>(items.size());
    auto bound = [n](const Value& v)
    {
        std::int64_t b = to_index(v, "slice indices");
        if (b < 0)
        {
            b = std::max<std::int64_t>(0, b + n);
        }
        return std::min(b, n);
    };
    const std::int64_t start = args.positional.size() > 1 ? bound(args.positional[1]) : 0;
    const std::int64_t stop = args.positional.size() > 2 ? bound(args.positional[2]) : n;
    for (std::int64_t i = start; i < stop; ++i)
    {
        if (values_equal(items[static_cast<std::size_t>(i)], args.positional[0]))
        {
            return i;
        }
    }
    if (kind == "tuple")
    {
        value_error("tuple.index(x): x not in tuple");
    }
    value_error(repr(args.positional[0]) + " is not in list");
}

std::int64_t count_of(const std::vector<Value>& items, CallArgs& args)
{
    expect_args(args, "count", 1, 1);
    return static_cast<std::int64_t>(
        std::count_if(items.begin(), items.end(),
                      [&args](const Value& v) { return values_equal(v, args.positional[0]); }));
}

void sort_list(CallContext& ctx, std::vector<Value>& items, CallArgs& args)
{
    auto key = take_keyword(args, "key");
    auto reverse = take_keyword(args, "reverse");
    reject_remaining_keywords(args, "sort");
    if (!args.positional.empty())
    {
        type_error("sort() takes no positional arguments");
    }
    const bool descending = reverse.has_value() && truthy(*reverse);

    std::vector<Value> keys;
    if (key.has_value() && !key->is_none())
    {
        keys.reserve(items.size());
        for (const auto& item : items)
        {
            keys.push_back(ctx.call(*key, CallArgs{.positional = {item}, .keywords = {}}));
        }
    }
    else
    {
        keys = items;
    }

    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    if (descending)
    {
        std::reverse(order.begin(), order.end());
    }
    std::stable_sort(order.begin(), order.end(),
                     [&keys](std::size_t a, std::size_t b) { return less_than(keys[a], keys[b]); });
    if (descending)
    {
        std::reverse(order.begin(), order.end());
    }

    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (std::size_t i : order)
    {
        sorted.push_back(items[i]);
    }
    items = std::move(sorted);
}

Value list_method(CallContext& ctx, const Value& self, std::string_view name, CallArgs& args)
{
    auto& items = self.as_list().items;

    if (name == "append")
    {
        expect_args(args, name, 1, 1);
        check_sequence_length(items.size() + 1);
        items.push_back(args.positional[0]);
        return Value::none();
    }
    if (name == "extend")
    {
        expect_args(args, name, 1, 1);
        std::vector<Value> more = to_vector(args.positional[0]);
        check_sequence_length(items.size() + more.size());
        items.insert(items.end(), more.begin(), more.end());
        return Value::none();
    }
    if (name == "insert")
    {
        expect_args(args, name, 2, 2);
        check_sequence_length(items.size() + 1);
        const auto n = static_cast<std::int64_t>(items.size());
        std::int64_t at = to_index(args.positional[0], "list indices");
        if (at < 0)
        {
            at = std::max<std::int64_t>(0, at + n);
        }
        at = std::min(at, n);
        items.insert(items.begin() + at, args.positional[1]);
        return Value::none();
    }
    if (name == "pop")
    {
        expect_args(args, name, 0, 1);
        if (items.empty())
        {
            raise("IndexError", "pop from empty list");
        }
        const auto n = static_cast<std::int64_t>(items.size());
        std::int64_t at = args.positional.empty() ? n - 1 : to_index(args.positional[0], "list indices");
        if (at < 0)
        {
            at += n;
        }
        if (at < 0 || at >= n)
        {
            raise("IndexError", "pop index out of range");
        }
        Value out = items[static_cast<std::size_t>(at)];
        items.erase(items.begin() + at);
        return out;
    }
    if (name == "remove")
    {
        expect_args(args, name, 1, 1);
        const auto it = std::find_if(items.begin(), items.end(), [&args](const Value& v)
                                     { return values_equal(v, args.positional[0]); });
        if (it == items.end())
        {
            value_error("list.remove(x): x not in list");
        }
        items.erase(it);
        return Value::none();
    }
    if (name == "index")
    {
        return Value::integer(find_index(items, args, "list"));
    }
    if (name == "count")
    {
        return Value::integer(count_of(items, args));
    }
    if (name == "sort")
    {
        sort_list(ctx, items, args);
        return Value::none();
    }
    if (name == "reverse")
    {
        expect_args(args, name, 0, 0);
        std::reverse(items.begin(), items.end());
        return Value::none();
    }
    if (name == "clear")
    {
        expect_args(args, name, 0, 0);
        items.clear();
        return Value::none();
    }
    if (name == "copy")
    {
        expect_args(args, name, 0, 0);
        return Value::list(items);
    }
    raise("AttributeError", "'list' object has no attribute '" + std::string(name) + "'");
}

Value dict_method(const Value& self, std::string_view name, CallArgs& args)
{
    auto& table = self.as_dict().table;

    if (name == "get")
    {
        expect_args(args, name, 1, 2);
        const Value* found = table.find(args.positional[0]);
        if (found != nullptr)
        {
            return *found;
        }
        return args.positional.size() == 2 ? args.positional[1] : Value::none();
    }
    if (name == "keys")
    {
        expect_args(args, name, 0, 0);
        return Value::list(table.keys());
    }
    if (name == "values" || name == "items")
    {
        expect_args(args, name, 0, 0);
        std::vector<Value> out;
        for (auto& entry : table.entries())
        {
            out.push_back(name == "values" ? entry.value
                                           : Value::tuple({entry.key, entry.value}));
        }
        return Value::list(std::move(out));
    }
    if (name == "pop")
    {
        expect_args(args, name, 1, 2);
        if (auto entry = table.erase(args.positional[0]))
        {
            return entry->value;
        }
        if (args.positional.size() == 2)
        {
            return args.positional[1];
        }
        raise("KeyError", repr(args.positional[0]));
    }
    if (name == "popitem")
    {
        expect_args(args, name, 0, 0);
        auto entry = table.pop_last();
        if (!entry.has_value())
        {
            raise("KeyError", "'popitem(): dictionary is empty'");
        }
        return Value::tuple({entry->key, entry->value});
    }
    if (name == "setdefault")
    {
        expect_args(args, name, 1, 2);
        if (const Value* found = table.find(args.positional[0]))
        {
            return *found;
        }
        Value fallback = args.positional.size() == 2 ? args.positional[1] : Value::none();
        table.insert_or_assign(args.positional[0], fallback);
        return fallback;
    }
    if (name == "update")
    {
        if (args.positional.size() > 1)
        {
            type_error("update expected at most 1 argument, got " +
                       std::to_string(args.positional.size()));
        }
        if (!args.positional.empty())
        {
            dict_update(table, args.positional[0]);
        }
        for (auto& [key, value] : args.keywords)
        {
            table.insert_or_assign(Value::str(key), value);
        }
        return Value::none();
    }
    if (name == "clear")
    {
        expect_args(args, name, 0, 0);
        table.clear();
        return Value::none();
    }
    if (name == "copy")
    {
        expect_args(args, name, 0, 0);
        Value out = Value::dict();
        for (auto& entry : table.entries())
        {
            out.as_dict().table.insert_or_assign(entry.key, entry.value);
        }
        return out;
    }
    raise("AttributeError", "'dict' object has no attribute '" + std::string(name) + "'");
}

Value set_from(const std::vector<Value>& keys)
{
    Value out = Value::set();
    for (const auto& k : keys)
    {
        out.as_set().table.insert_or_assign(k, Value::none());
    }
    return out;
}

Value as_set_value(const Value& v)
{
    if (v.is(ValueKind::Set))
    {
        return v;
    }
    return set_from(to_vector(v));
}

Value set_method(const Value& self, std::string_view name, CallArgs& args)
{
    auto& table = self.as_set().table;

    if (name == "add")
    {
        expect_args(args, name, 1, 1);
        table.insert_or_assign(args.positional[0], Value::none());
        return Value::none();
    }
    if (name == "remove")
    {
        expect_args(args, name, 1, 1);
        if (!table.erase(args.positional[0]).has_value())
        {
            raise("KeyError", repr(args.positional[0]));
        }
        return Value::none();
    }
    if (name == "discard")
    {
        expect_args(args, name, 1, 1);
        (void)table.erase(args.positional[0]);
        return Value::none();
    }
    if (name == "pop")
    {
        expect_args(args, name, 0, 0);
        auto entry = table.pop_first();
        if (!entry.has_value())
        {
            raise("KeyError", "'pop from an empty set'");
        }
        return entry->key;
    }
    if (name == "clear")
    {
        expect_args(args, name, 0, 0);
        table.clear();
        return Value::none();
    }
    if (name == "copy")
    {
        expect_args(args, name, 0, 0);
        return set_from(table.keys());
    }
    if (name == "union" || name == "intersection" || name == "difference" ||
        name == "symmetric_difference")
    {
        expect_no_keywords(args, name);
        if (name == "symmetric_difference" && args.positional.size() != 1)
        {
            type_error("symmetric_difference() takes exactly one argument (" +
                       std::to_string(args.positional.size()) + " given)");
        }
        const auto op = name == "union"          ? sandpit::parser::BinaryOp::BitOr
                        : name == "intersection" ? sandpit::parser::BinaryOp::BitAnd
                        : name == "difference"   ? sandpit::parser::BinaryOp::Sub
                                                 : sandpit::parser::BinaryOp::BitXor;
        Value out = set_from(table.keys());
        for (const auto& other : args.positional)
        {
            out = binary_op(op, out, as_set_value(other));
        }
        return out;
    }
    if (name == "update")
    {
        expect_no_keywords(args, name);
        for (const auto& other : args.positional)
        {
            for_each(other,
                     [&table](const Value& item)
                     {
                         table.insert_or_assign(item, Value::none());
                         return true;
                     });
        }
        return Value::none();
    }
    if (name == "issubset" || name == "issuperset" || name == "isdisjoint")
    {
        expect_args(args, name, 1, 1);
        const Value other = as_set_value(args.positional[0]);
        if (name == "issubset")
        {
            return Value::boolean(compare(sandpit::parser::CompareOp::LtE, self, other));
        }
        if (name == "issuperset")
        {
            return Value::boolean(compare(sandpit::parser::CompareOp::GtE, self, other));
        }
        for (const auto& k : table.keys())
        {
            if (other.as_set().table.contains(k))
            {
                return Value::boolean(false);
            }
        }
        return Value::boolean(true);
    }
    raise("AttributeError", "'set' object has no attribute '" + std::string(name) + "'");
}

} // namespace

bool has_method(const Value& self, std::string_view name)
{
    switch (self.kind())
    {
    case ValueKind::Str:
        return listed(kStrMethods, name);
    case ValueKind::List:
        return listed(kListMethods, name);
    case ValueKind::Tuple:
        return listed(kTupleMethods, name);
    case ValueKind::Dict:
        return listed(kDictMethods, name);
    case ValueKind::Set:
        return listed(kSetMethods, name);
    default:
        return false;
    }
}

Value call_method(CallContext& ctx, const Value& self, std::string_view name, CallArgs& args)
{
    switch (self.kind())
    {
    case ValueKind::Str:
        return str_method(self, name, args);
    case ValueKind::List:
        return list_method(ctx, self, name, args);
    case ValueKind::Tuple:
        if (name == "index")
        {
            return Value::integer(find_index(self.as_tuple().items, args, "tuple"));
        }
        if (name == "count")
        {
            return Value::integer(count_of(self.as_tuple().items, args));
        }
        break;
    case ValueKind::Dict:
        return dict_method(self, name, args);
    case ValueKind::Set:
        return set_method(self, name, args);
    default:
        break;
    }
    raise("AttributeError",
          "'" + type_name(self) + "' object has no attribute '" + std::string(name) + "'");
}

} // namespace sandpit::runtime
