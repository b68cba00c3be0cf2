#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sandpit/runtime/error.h>
#include <sandpit/runtime/namespace.h>
#include <sandpit/runtime/operations.h>

namespace sandpit::runtime
{

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

void expect_no_keywords(const CallArgs& args, std::string_view fn)
{
    if (!args.keywords.empty())
    {
        type_error(std::string(fn) + "() takes no keyword arguments");
    }
}

void expect_args(const CallArgs& args, std::string_view fn, std::size_t min, std::size_t max)
{
    expect_no_keywords(args, fn);
    const std::size_t n = args.positional.size();
    if (n >= min && n <= max)
    {
        return;
    }
    if (min == max)
    {
        type_error(std::string(fn) + "() takes exactly " +
                   (min == 1 ? std::string("one argument") : std::to_string(min) + " arguments") +
                   " (" + std::to_string(n) + " given)");
    }
    if (n < min)
    {
        type_error(std::string(fn) + "() expected at least " + std::to_string(min) +
                   " argument" + (min == 1 ? "" : "s") + ", got " + std::to_string(n));
    }
    type_error(std::string(fn) + "() expected at most " + std::to_string(max) + " argument" +
               (max == 1 ? "" : "s") + ", got " + std::to_string(n));
}

std::optional<Value> take_keyword(CallArgs& args, std::string_view name)
{
    for (auto it = args.keywords.begin(); it != args.keywords.end(); ++it)
    {
        if (it->first == name)
        {
            Value out = std::move(it->second);
            args.keywords.erase(it);
            return out;
        }
    }
    return std::nullopt;
}

void reject_remaining_keywords(const CallArgs& args, std::string_view fn)
{
    if (!args.keywords.empty())
    {
        type_error("'" + args.keywords.front().first + "' is an invalid keyword argument for " +
                   std::string(fn) + "()");
    }
}

namespace
{

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::string lower_ascii(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::int64_t parse_int_text(std::string_view original, std::int64_t base)
{
    auto invalid = [&]()
    {
        value_error("invalid literal for int() with base " + std::to_string(base) + ": " +
                    quote_string(original));
    };

    std::string_view text = trim(original);
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    int radix = static_cast<int>(base);
    if (text.size() >= 2 && text[0] == '0')
    {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        const int prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
        if (prefixed != 0 && (base == 0 || base == prefixed))
        {
            radix = prefixed;
            text.remove_prefix(2);
            if (!text.empty() && text.front() == '_')
            {
                text.remove_prefix(1);
            }
        }
    }
    if (radix == 0)
    {
        radix = 10;
        if (text.size() > 1 && text.front() == '0' &&
            text.find_first_not_of("0_") != std::string_view::npos)
        {
            invalid();
        }
    }

    std::string digits;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '_')
        {
            if (i == 0 || i + 1 == text.size() || text[i + 1] == '_')
            {
                invalid();
            }
            continue;
        }
        digits.push_back(text[i]);
    }
    if (digits.empty())
    {
        invalid();
    }
    if (negative)
    {
        digits.insert(digits.begin(), '-');
    }

    std::int64_t value = 0;
    const auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), value, radix);
    if (ec == std::errc::result_out_of_range)
    {
        raise("OverflowError", "int too large to convert (ints are limited to 64 bits)");
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        invalid();
    }
    return value;
}

double parse_float_text(std::string_view original)
{
    const std::string_view text = trim(original);
    auto invalid = [&]() { value_error("could not convert string to float: " + quote_string(original)); };

    std::string cleaned;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '_')
        {
            const bool ok = i > 0 && i + 1 < text.size() &&
                            std::isdigit(static_cast<unsigned char>(text[i - 1])) != 0 &&
                            std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0;
            if (!ok)
            {
                invalid();
            }
            continue;
        }
        cleaned.push_back(text[i]);
    }

    std::string_view body = cleaned;
    bool negative = false;
    if (!body.empty() && (body.front() == '+' || body.front() == '-'))
    {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    const std::string word = lower_ascii(body);
    if (word == "inf" || word == "infinity")
    {
        return negative ? -HUGE_VAL : HUGE_VAL;
    }
    if (word == "nan")
    {
        return std::nan("");
    }
    // strtod accepts hex floats and other forms Python does not.
    if (body.empty() || word.find_first_not_of("0123456789.e+-") != std::string::npos)
    {
        invalid();
    }

    char* end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end != cleaned.c_str() + cleaned.size())
    {
        invalid();
    }
    return value;
}

std::int64_t float_to_int(double value)
{
    if (std::isnan(value))
    {
        value_error("cannot convert float NaN to integer");
    }
    if (std::isinf(value))
    {
        raise("OverflowError", "cannot convert float infinity to integer");
    }
    const double truncated = std::trunc(value);
    if (truncated < -9223372036854775808.0 || truncated >= 9223372036854775808.0)
    {
        raise("OverflowError", "int too large to convert (ints are limited to 64 bits)");
    }
    return static_cast<std::int64_t>(truncated);
}

std::int64_t range_arg(const Value& v)
{
    if (!v.is_integral())
    {
        type_error("'" + type_name(v) + "' object cannot be interpreted as an integer");
    }
    return v.integral();
}

// ---------------------------------------------------------------------------
// Builtins
// ---------------------------------------------------------------------------

Value builtin_print(CallContext& ctx, CallArgs& args)
{
    auto text_option = [&args](std::string_view name, std::string fallback)
    {
        auto v = take_keyword(args, name);
        if (!v.has_value() || v->is_none())
        {
            return fallback;
        }
        if (!v->is(ValueKind::Str))
        {
            type_error(std::string(name) + " must be None or a string, not " + type_name(*v));
        }
        return v->as_str();
    };
    const std::string sep = text_option("sep", " ");
    const std::string end = text_option("end", "\n");
    (void)take_keyword(args, "flush");
    reject_remaining_keywords(args, "print");

    std::string line;
    for (std::size_t i = 0; i < args.positional.size(); ++i)
    {
        if (i > 0)
        {
            line += sep;
        }
        line += to_str(args.positional[i]);
    }
    line += end;
    ctx.write(line);
    return Value::none();
}

Value builtin_range(CallContext&, CallArgs& args)
{
    expect_args(args, "range", 1, 3);
    RangeValue r;
    if (args.positional.size() == 1)
    {
        r.stop = range_arg(args.positional[0]);
    }
    else
    {
        r.start = range_arg(args.positional[0]);
        r.stop = range_arg(args.positional[1]);
        if (args.positional.size() == 3)
        {
            r.step = range_arg(args.positional[2]);
            if (r.step == 0)
            {
                value_error("range() arg 3 must not be zero");
            }
        }
    }
    return Value::range(r);
}

Value builtin_len(CallContext&, CallArgs& args)
{
    expect_args(args, "len", 1, 1);
    return Value::integer(length_of(args.positional[0]));
}

Value builtin_int(CallContext&, CallArgs& args)
{
    auto base_kw = take_keyword(args, "base");
    reject_remaining_keywords(args, "int");
    if (args.positional.size() > 2 || (base_kw.has_value() && args.positional.size() > 1))
    {
        type_error("int() takes at most 2 arguments (" + std::to_string(args.positional.size()) +
                   " given)");
    }
    if (args.positional.size() == 2)
    {
        base_kw = args.positional[1];
    }
    if (args.positional.empty())
    {
        if (base_kw.has_value())
        {
            type_error("int() missing string argument");
        }
        return Value::integer(0);
    }

    const Value& x = args.positional[0];
    if (base_kw.has_value())
    {
        const std::int64_t base = range_arg(*base_kw);
        if (base != 0 && (base < 2 || base > 36))
        {
            value_error("int() base must be >= 2 and <= 36, or 0");
        }
        if (!x.is(ValueKind::Str))
        {
            type_error("int() can't convert non-string with explicit base");
        }
        return Value::integer(parse_int_text(x.as_str(), base));
    }
    switch (x.kind())
    {
    case ValueKind::Bool:
    case ValueKind::Int:
        return Value::integer(x.integral());
    case ValueKind::Float:
        return Value::integer(float_to_int(x.as_float()));
    case ValueKind::Str:
        return Value::integer(parse_int_text(x.as_str(), 10));
    default:
        type_error("int() argument must be a string, a bytes-like object or a real number, not '" +
                   type_name(x) + "'");
    }
}

Value builtin_float(CallContext&, CallArgs& args)
{
    expect_args(args, "float", 0, 1);
    if (args.positional.empty())
    {
        return Value::floating(0.0);
    }
    const Value& x = args.positional[0];
    if (x.is_number())
    {
        return Value::floating(x.number());
    }
    if (x.is(ValueKind::Str))
    {
        return Value::floating(parse_float_text(x.as_str()));
    }
    type_error("float() argument must be a string or a real number, not '" + type_name(x) + "'");
}

Value builtin_str(CallContext&, CallArgs& args)
{
    expect_args(args, "str", 0, 1);
    return Value::str(args.positional.empty() ? std::string{} : to_str(args.positional[0]));
}

Value builtin_bool(CallContext&, CallArgs& args)
{
    expect_args(args, "bool", 0, 1);
    return Value::boolean(!args.positional.empty() && truthy(args.positional[0]));
}

Value builtin_list(CallContext&, CallArgs& args)
{
    expect_args(args, "list", 0, 1);
    return Value::list(args.positional.empty() ? std::vector<Value>{}
                                               : to_vector(args.positional[0]));
}

Value builtin_tuple(CallContext&, CallArgs& args)
{
    expect_args(args, "tuple", 0, 1);
    if (!args.positional.empty() && args.positional[0].is(ValueKind::Tuple))
    {
        return args.positional[0];
    }
    return Value::tuple(args.positional.empty() ? std::vector<Value>{}
                                                : to_vector(args.positional[0]));
}

Value builtin_set(CallContext&, CallArgs& args)
{
    expect_args(args, "set", 0, 1);
    Value out = Value::set();
    if (!args.positional.empty())
    {
        for_each(args.positional[0],
                 [&out](const Value& item)
                 {
                     out.as_set().table.insert_or_assign(item, Value::none());
                     return true;
                 });
    }
    return out;
}

Value builtin_dict(CallContext&, CallArgs& args)
{
    if (args.positional.size() > 1)
    {
        type_error("dict expected at most 1 argument, got " +
                   std::to_string(args.positional.size()));
    }
    Value out = Value::dict();
    auto& table = out.as_dict().table;
    if (!args.positional.empty())
    {
        dict_update(table, args.positional[0]);
    }
    for (auto& [key, value] : args.keywords)
    {
        table.insert_or_assign(Value::str(key), value);
    }
    return out;
}

Value builtin_enumerate(CallContext&, CallArgs& args)
{
    auto start_kw = take_keyword(args, "start");
    reject_remaining_keywords(args, "enumerate");
    if (args.positional.empty() || args.positional.size() > 2 ||
        (start_kw.has_value() && args.positional.size() == 2))
    {
        type_error("enumerate() takes from 1 to 2 positional arguments");
    }
    if (args.positional.size() == 2)
    {
        start_kw = args.positional[1];
    }
    std::int64_t counter = start_kw.has_value() ? range_arg(*start_kw) : 0;

    std::vector<Value> items;
    for_each(args.positional[0],
             [&items, &counter](const Value& item)
             {
                 check_sequence_length(items.size() + 1);
                 items.push_back(Value::tuple({Value::integer(counter), item}));
                 counter = checked_add(counter, 1);
                 return true;
             });
    return Value::iterator(std::move(items), "enumerate");
}

Value builtin_abs(CallContext& ctx, CallArgs& args)
{
    (void)ctx;
    expect_args(args, "abs", 1, 1);
    const Value& x = args.positional[0];
    if (x.is_integral())
    {
        const std::int64_t v = x.integral();
        return Value::integer(v < 0 ? checked_sub(0, v) : v);
    }
    if (x.is(ValueKind::Float))
    {
        return Value::floating(std::fabs(x.as_float()));
    }
    type_error("bad operand type for abs(): '" + type_name(x) + "'");
}

Value min_max(CallContext& ctx, CallArgs& args, std::string_view name, bool want_max)
{
    auto key = take_keyword(args, "key");
    auto fallback = take_keyword(args, "default");
    reject_remaining_keywords(args, name);
    if (args.positional.empty())
    {
        type_error(std::string(name) + " expected at least 1 argument, got 0");
    }
    if (fallback.has_value() && args.positional.size() > 1)
    {
        type_error("Cannot specify a default for " + std::string(name) +
                   "() with multiple positional arguments");
    }

    const std::vector<Value> items =
        args.positional.size() == 1 ? to_vector(args.positional[0]) : args.positional;
    if (items.empty())
    {
        if (fallback.has_value())
        {
            return *fallback;
        }
        value_error(std::string(name) + "() iterable argument is empty");
    }

    const bool use_key = key.has_value() && !key->is_none();
    auto key_of = [&](const Value& item)
    { return use_key ? ctx.call(*key, CallArgs{.positional = {item}, .keywords = {}}) : item; };

    std::size_t best = 0;
    Value best_key = key_of(items[0]);
    for (std::size_t i = 1; i < items.size(); ++i)
    {
        Value k = key_of(items[i]);
        const bool better = want_max ? less_than(best_key, k) : less_than(k, best_key);
        if (better)
        {
            best = i;
            best_key = std::move(k);
        }
    }
    return items[best];
}

Value builtin_min(CallContext& ctx, CallArgs& args)
{
    return min_max(ctx, args, "min", false);
}

Value builtin_max(CallContext& ctx, CallArgs& args)
{
    return min_max(ctx, args, "max", true);
}

Value builtin_sum(CallContext&, CallArgs& args)
{
    auto start_kw = take_keyword(args, "start");
    reject_remaining_keywords(args, "sum");
    if (args.positional.empty() || args.positional.size() > 2 ||
        (start_kw.has_value() && args.positional.size() == 2))
    {
        type_error("sum() takes at most 2 arguments");
    }
    if (args.positional.size() == 2)
    {
        start_kw = args.positional[1];
    }
    Value total = start_kw.value_or(Value::integer(0));
    if (total.is(ValueKind::Str))
    {
        type_error("sum() can't sum strings [use ''.join(seq) instead]");
    }
    for_each(args.positional[0],
             [&total](const Value& item)
             {
                 total = binary_op(sandpit::parser::BinaryOp::Add, total, item);
                 return true;
             });
    return total;
}

} // namespace

RestrictedNamespace::RestrictedNamespace(std::vector<Builtin> entries) : entries_(std::move(entries))
{
    std::sort(entries_.begin(), entries_.end(),
              [](const Builtin& a, const Builtin& b) { return a.name < b.name; });
}

const Builtin* RestrictedNamespace::find(std::string_view name) const
{
    const auto it = std::lower_bound(entries_.begin(), entries_.end(), name,
                                     [](const Builtin& b, std::string_view n) { return b.name < n; });
    if (it == entries_.end() || it->name != name)
    {
        return nullptr;
    }
    return &*it;
}

std::vector<std::string_view> RestrictedNamespace::names() const
{
    std::vector<std::string_view> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_)
    {
        out.push_back(entry.name);
    }
    return out;
}

RestrictedNamespace build_namespace()
{
    return RestrictedNamespace({
        Builtin{.name = "print", .fn = builtin_print},
        Builtin{.name = "range", .fn = builtin_range},
        Builtin{.name = "len", .fn = builtin_len},
        Builtin{.name = "int", .fn = builtin_int},
        Builtin{.name = "float", .fn = builtin_float},
        Builtin{.name = "str", .fn = builtin_str},
        Builtin{.name = "bool", .fn = builtin_bool},
        Builtin{.name = "list", .fn = builtin_list},
        Builtin{.name = "dict", .fn = builtin_dict},
        Builtin{.name = "set", .fn = builtin_set},
        Builtin{.name = "tuple", .fn = builtin_tuple},
        Builtin{.name = "enumerate", .fn = builtin_enumerate},
        Builtin{.name = "abs", .fn = builtin_abs},
        Builtin{.name = "min", .fn = builtin_min},
        Builtin{.name = "max", .fn = builtin_max},
        Builtin{.name = "sum", .fn = builtin_sum},
    });
}

const RestrictedNamespace& restricted_namespace()
{
    static const RestrictedNamespace instance = build_namespace();
    return instance;
}

} // namespace sandpit::runtime
