#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sandpit/runtime/error.h>
#include <sandpit/runtime/operations.h>
#include <sandpit/source/utf8.h>

namespace sandpit::runtime
{

using sandpit::parser::BinaryOp;
using sandpit::parser::CompareOp;
using sandpit::parser::UnaryOp;

namespace
{

constexpr std::int64_t kIntMin = std::numeric_limits<std::int64_t>::min();

[[noreturn]] void overflow()
{
    raise("OverflowError", "integer result is too large (ints are limited to 64 bits)");
}

std::string_view op_symbol(BinaryOp op)
{
    switch (op)
    {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::FloorDiv:
        return "//";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Pow:
        return "** or pow()";
    case BinaryOp::BitAnd:
        return "&";
    case BinaryOp::BitOr:
        return "|";
    case BinaryOp::BitXor:
        return "^";
    case BinaryOp::LShift:
        return "<<";
    case BinaryOp::RShift:
        return ">>";
    }
    return "?";
}

[[noreturn]] void unsupported(BinaryOp op, const Value& lhs, const Value& rhs)
{
    type_error("unsupported operand type(s) for " + std::string(op_symbol(op)) + ": '" +
               type_name(lhs) + "' and '" + type_name(rhs) + "'");
}

std::int64_t floor_div(std::int64_t a, std::int64_t b)
{
    if (a == kIntMin && b == -1)
    {
        overflow();
    }
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
    {
        --q;
    }
    return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b)
{
    if (b == -1)
    {
        return 0;
    }
    std::int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0)))
    {
        r += b;
    }
    return r;
}

double float_mod(double a, double b)
{
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0) != (b < 0)))
    {
        r += b;
    }
    else if (r == 0.0)
    {
        r = std::copysign(0.0, b);
    }
    return r;
}

std::int64_t int_pow(std::int64_t base, std::int64_t exp)
{
    std::int64_t result = 1;
    while (exp > 0)
    {
        if ((exp & 1) != 0)
        {
            result = checked_mul(result, base);
        }
        exp >>= 1;
        if (exp > 0)
        {
            base = checked_mul(base, base);
        }
    }
    return result;
}

Value float_pow(double a, double b)
{
    if (a == 0.0 && b < 0.0)
    {
        raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
    }
    if (a < 0.0 && std::floor(b) != b && std::isfinite(b))
    {
        value_error("math domain error (complex results are not supported)");
    }
    const double r = std::pow(a, b);
    if (std::isinf(r) && std::isfinite(a) && std::isfinite(b))
    {
        raise("OverflowError", "(34, 'Numerical result out of range')");
    }
    return Value::floating(r);
}

std::string repeat_string(const std::string& text, std::int64_t times)
{
    if (times <= 0 || text.empty())
    {
        return {};
    }
    if (static_cast<std::uint64_t>(times) > kMaxStringBytes / text.size())
    {
        raise("MemoryError", "string is too large");
    }
    std::string out;
    out.reserve(text.size() * static_cast<std::size_t>(times));
    for (std::int64_t i = 0; i < times; ++i)
    {
        out += text;
    }
    return out;
}

std::vector<Value> repeat_items(const std::vector<Value>& items, std::int64_t times)
{
    if (times <= 0 || items.empty())
    {
        return {};
    }
    if (static_cast<std::uint64_t>(times) > kMaxSequenceLength / items.size())
    {
        raise("MemoryError", "sequence is too large");
    }
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<std::size_t>(times));
    for (std::int64_t i = 0; i < times; ++i)
    {
        out.insert(out.end(), items.begin(), items.end());
    }
    return out;
}

std::vector<Value> concat(const std::vector<Value>& a, const std::vector<Value>& b)
{
    check_sequence_length(a.size() + b.size());
    std::vector<Value> out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

Value set_from_keys(const std::vector<Value>& keys)
{
    Value out = Value::set();
    for (const auto& key : keys)
    {
        out.as_set().table.insert_or_assign(key, Value::none());
    }
    return out;
}

Value set_op(BinaryOp op, const Value& lhs, const Value& rhs)
{
    const auto& a = lhs.as_set().table;
    const auto& b = rhs.as_set().table;
    std::vector<Value> keys;
    switch (op)
    {
    case BinaryOp::BitOr:
        keys = a.keys();
        for (const auto& k : b.keys())
        {
            if (!a.contains(k))
            {
                keys.push_back(k);
            }
        }
        break;
    case BinaryOp::BitAnd:
        for (const auto& k : a.keys())
        {
            if (b.contains(k))
            {
                keys.push_back(k);
            }
        }
        break;
    case BinaryOp::Sub:
        for (const auto& k : a.keys())
        {
            if (!b.contains(k))
            {
                keys.push_back(k);
            }
        }
        break;
    default:
        for (const auto& k : a.keys())
        {
            if (!b.contains(k))
            {
                keys.push_back(k);
            }
        }
        for (const auto& k : b.keys())
        {
            if (!a.contains(k))
            {
                keys.push_back(k);
            }
        }
        break;
    }
    return set_from_keys(keys);
}

Value int_binary(BinaryOp op, std::int64_t a, std::int64_t b)
{
    switch (op)
    {
    case BinaryOp::Add:
        return Value::integer(checked_add(a, b));
    case BinaryOp::Sub:
        return Value::integer(checked_sub(a, b));
    case BinaryOp::Mul:
        return Value::integer(checked_mul(a, b));
    case BinaryOp::Div:
        if (b == 0)
        {
            raise("ZeroDivisionError", "division by zero");
        }
        return Value::floating(static_cast<double>(a) / static_cast<double>(b));
    case BinaryOp::FloorDiv:
        if (b == 0)
        {
            raise("ZeroDivisionError", "integer division or modulo by zero");
        }
        return Value::integer(floor_div(a, b));
    case BinaryOp::Mod:
        if (b == 0)
        {
            raise("ZeroDivisionError", "integer modulo by zero");
        }
        return Value::integer(floor_mod(a, b));
    case BinaryOp::Pow:
        if (b < 0)
        {
            return float_pow(static_cast<double>(a), static_cast<double>(b));
        }
        return Value::integer(int_pow(a, b));
    case BinaryOp::BitAnd:
        return Value::integer(a & b);
    case BinaryOp::BitOr:
        return Value::integer(a | b);
    case BinaryOp::BitXor:
        return Value::integer(a ^ b);
    case BinaryOp::LShift:
        if (b < 0)
        {
            value_error("negative shift count");
        }
        if (a == 0)
        {
            return Value::integer(0);
        }
        if (b >= 63)
        {
            overflow();
        }
        {
            const std::int64_t shifted =
                static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << b);
            if ((shifted >> b) != a)
            {
                overflow();
            }
            return Value::integer(shifted);
        }
    case BinaryOp::RShift:
        if (b < 0)
        {
            value_error("negative shift count");
        }
        if (b >= 63)
        {
            return Value::integer(a < 0 ? -1 : 0);
        }
        return Value::integer(a >> b);
    }
    return Value::none();
}

Value float_binary(BinaryOp op, const Value& lhs, const Value& rhs)
{
    const double a = lhs.number();
    const double b = rhs.number();
    switch (op)
    {
    case BinaryOp::Add:
        return Value::floating(a + b);
    case BinaryOp::Sub:
        return Value::floating(a - b);
    case BinaryOp::Mul:
        return Value::floating(a * b);
    case BinaryOp::Div:
        if (b == 0.0)
        {
            raise("ZeroDivisionError", "float division by zero");
        }
        return Value::floating(a / b);
    case BinaryOp::FloorDiv:
        if (b == 0.0)
        {
            raise("ZeroDivisionError", "float floor division by zero");
        }
        return Value::floating(std::floor(a / b));
    case BinaryOp::Mod:
        if (b == 0.0)
        {
            raise("ZeroDivisionError", "float modulo by zero");
        }
        return Value::floating(float_mod(a, b));
    case BinaryOp::Pow:
        return float_pow(a, b);
    default:
        unsupported(op, lhs, rhs);
    }
}

// Position of code point `index` in `text` (which is known to have `count` code points).
std::vector<std::string_view> code_points(const std::string& text)
{
    return sandpit::source::split_code_points(text);
}

std::int64_t normalize_index(std::int64_t index, std::int64_t length, std::string_view what)
{
    if (index < 0)
    {
        index += length;
    }
    if (index < 0 || index >= length)
    {
        raise("IndexError", std::string(what) + " index out of range");
    }
    return index;
}

std::optional<std::int64_t> slice_bound(const Value& v)
{
    if (v.is_none())
    {
        return std::nullopt;
    }
    return to_index(v, "slice indices");
}

// Python ordering for `<`, `<=`, `>`, `>=`.
bool ordered(CompareOp op, const Value& lhs, const Value& rhs)
{
    auto by_three_way = [op](auto a, auto b)
    {
        switch (op)
        {
        case CompareOp::Lt:
            return a < b;
        case CompareOp::LtE:
            return a <= b;
        case CompareOp::Gt:
            return a > b;
        default:
            return a >= b;
        }
    };

    if (lhs.is_number() && rhs.is_number())
    {
        if (lhs.is_integral() && rhs.is_integral())
        {
            return by_three_way(lhs.integral(), rhs.integral());
        }
        return by_three_way(lhs.number(), rhs.number());
    }
    if (lhs.is(ValueKind::Str) && rhs.is(ValueKind::Str))
    {
        return by_three_way(lhs.as_str().compare(rhs.as_str()), 0);
    }

    const std::vector<Value>* a = nullptr;
    const std::vector<Value>* b = nullptr;
    if (lhs.is(ValueKind::List) && rhs.is(ValueKind::List))
    {
        a = &lhs.as_list().items;
        b = &rhs.as_list().items;
    }
    else if (lhs.is(ValueKind::Tuple) && rhs.is(ValueKind::Tuple))
    {
        a = &lhs.as_tuple().items;
        b = &rhs.as_tuple().items;
    }
    if (a != nullptr)
    {
        RecursionGuard depth("in comparison");
        const std::size_t n = std::min(a->size(), b->size());
        for (std::size_t i = 0; i < n; ++i)
        {
            if (!values_equal((*a)[i], (*b)[i]))
            {
                return ordered(op, (*a)[i], (*b)[i]);
            }
        }
        return by_three_way(a->size(), b->size());
    }

    if (lhs.is(ValueKind::Set) && rhs.is(ValueKind::Set))
    {
        const auto& x = lhs.as_set().table;
        const auto& y = rhs.as_set().table;
        auto subset = [](const OrderedTable& small, const OrderedTable& big)
        {
            for (const auto& k : small.keys())
            {
                if (!big.contains(k))
                {
                    return false;
                }
            }
            return true;
        };
        switch (op)
        {
        case CompareOp::Lt:
            return x.size() < y.size() && subset(x, y);
        case CompareOp::LtE:
            return subset(x, y);
        case CompareOp::Gt:
            return x.size() > y.size() && subset(y, x);
        default:
            return subset(y, x);
        }
    }

    std::string_view symbol = ">=";
    switch (op)
    {
    case CompareOp::Lt:
        symbol = "<";
        break;
    case CompareOp::LtE:
        symbol = "<=";
        break;
    case CompareOp::Gt:
        symbol = ">";
        break;
    default:
        break;
    }
    type_error("'" + std::string(symbol) + "' not supported between instances of '" +
               type_name(lhs) + "' and '" + type_name(rhs) + "'");
}

bool same_object(const Value& lhs, const Value& rhs)
{
    const void* a = lhs.identity();
    const void* b = rhs.identity();
    if (a != nullptr || b != nullptr)
    {
        return a == b;
    }
    return lhs.kind() == rhs.kind() && values_equal(lhs, rhs);
}

} // namespace

std::int64_t checked_add(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_add_overflow(a, b, &out))
    {
        overflow();
    }
    return out;
}

std::int64_t checked_sub(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_sub_overflow(a, b, &out))
    {
        overflow();
    }
    return out;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_mul_overflow(a, b, &out))
    {
        overflow();
    }
    return out;
}

std::int64_t to_index(const Value& value, std::string_view what)
{
    if (!value.is_integral())
    {
        type_error(std::string(what) + " must be integers or slices, not " + type_name(value));
    }
    return value.integral();
}

SliceIndices adjust_slice(const SliceValue& slice, std::int64_t length)
{
    SliceIndices out;
    if (!slice.step.is_none())
    {
        out.step = to_index(slice.step, "slice indices");
        if (out.step == 0)
        {
            value_error("slice step cannot be zero");
        }
    }

    auto clamp = [&](std::optional<std::int64_t> bound, std::int64_t fallback)
    {
        if (!bound.has_value())
        {
            return fallback;
        }
        std::int64_t v = *bound;
        if (v < 0)
        {
            v += length;
            if (v < 0)
            {
                v = (out.step < 0) ? -1 : 0;
            }
        }
        else if (v >= length)
        {
            v = (out.step < 0) ? length - 1 : length;
        }
        return v;
    };

    out.start = clamp(slice_bound(slice.lower), out.step < 0 ? length - 1 : 0);
    out.stop = clamp(slice_bound(slice.upper), out.step < 0 ? -1 : length);

    if (out.step > 0)
    {
        out.count = (out.stop > out.start) ? (out.stop - out.start - 1) / out.step + 1 : 0;
    }
    else
    {
        out.count = (out.start > out.stop) ? (out.start - out.stop - 1) / (-out.step) + 1 : 0;
    }
    return out;
}

Value binary_op(BinaryOp op, const Value& lhs, const Value& rhs)
{
    if (lhs.is_number() && rhs.is_number())
    {
        if (lhs.is_integral() && rhs.is_integral())
        {
            if (lhs.is(ValueKind::Bool) && rhs.is(ValueKind::Bool) &&
                (op == BinaryOp::BitAnd || op == BinaryOp::BitOr || op == BinaryOp::BitXor))
            {
                const bool a = lhs.as_bool();
                const bool b = rhs.as_bool();
                return Value::boolean(op == BinaryOp::BitAnd ? (a && b)
                                      : op == BinaryOp::BitOr ? (a || b)
                                                              : (a != b));
            }
            return int_binary(op, lhs.integral(), rhs.integral());
        }
        return float_binary(op, lhs, rhs);
    }

    const ValueKind lk = lhs.kind();
    const ValueKind rk = rhs.kind();
    switch (op)
    {
    case BinaryOp::Add:
        if (lk == ValueKind::Str)
        {
            if (rk != ValueKind::Str)
            {
                type_error("can only concatenate str (not \"" + type_name(rhs) + "\") to str");
            }
            check_string_length(lhs.as_str().size() + rhs.as_str().size());
            return Value::str(lhs.as_str() + rhs.as_str());
        }
        if (lk == ValueKind::List && rk == ValueKind::List)
        {
            return Value::list(concat(lhs.as_list().items, rhs.as_list().items));
        }
        if (lk == ValueKind::List)
        {
            type_error("can only concatenate list (not \"" + type_name(rhs) + "\") to list");
        }
        if (lk == ValueKind::Tuple && rk == ValueKind::Tuple)
        {
            return Value::tuple(concat(lhs.as_tuple().items, rhs.as_tuple().items));
        }
        if (lk == ValueKind::Tuple)
        {
            type_error("can only concatenate tuple (not \"" + type_name(rhs) + "\") to tuple");
        }
        break;
    case BinaryOp::Mul:
    {
        const Value* seq = &lhs;
        const Value* count = &rhs;
        if (lhs.is_integral())
        {
            std::swap(seq, count);
        }
        if (!count->is_integral())
        {
            if (seq->is(ValueKind::Str) || seq->is(ValueKind::List) || seq->is(ValueKind::Tuple))
            {
                type_error("can't multiply sequence by non-int of type '" + type_name(*count) +
                           "'");
            }
            break;
        }
        const std::int64_t n = count->integral();
        if (seq->is(ValueKind::Str))
        {
            return Value::str(repeat_string(seq->as_str(), n));
        }
        if (seq->is(ValueKind::List))
        {
            return Value::list(repeat_items(seq->as_list().items, n));
        }
        if (seq->is(ValueKind::Tuple))
        {
            return Value::tuple(repeat_items(seq->as_tuple().items, n));
        }
        break;
    }
    case BinaryOp::Mod:
        if (lk == ValueKind::Str)
        {
            return Value::str(percent_format(lhs.as_str(), rhs));
        }
        break;
    case BinaryOp::Sub:
    case BinaryOp::BitAnd:
    case BinaryOp::BitXor:
        if (lk == ValueKind::Set && rk == ValueKind::Set)
        {
            return set_op(op, lhs, rhs);
        }
        break;
    case BinaryOp::BitOr:
        if (lk == ValueKind::Set && rk == ValueKind::Set)
        {
            return set_op(op, lhs, rhs);
        }
        if (lk == ValueKind::Dict && rk == ValueKind::Dict)
        {
            Value out = Value::dict();
            for (const auto& entry : lhs.as_dict().table.entries())
            {
                out.as_dict().table.insert_or_assign(entry.key, entry.value);
            }
            for (const auto& entry : rhs.as_dict().table.entries())
            {
                out.as_dict().table.insert_or_assign(entry.key, entry.value);
            }
            return out;
        }
        break;
    default:
        break;
    }
    unsupported(op, lhs, rhs);
}

Value unary_op(UnaryOp op, const Value& operand)
{
    switch (op)
    {
    case UnaryOp::Not:
        return Value::boolean(!truthy(operand));
    case UnaryOp::Neg:
        if (operand.is_integral())
        {
            if (operand.integral() == kIntMin)
            {
                overflow();
            }
            return Value::integer(-operand.integral());
        }
        if (operand.is(ValueKind::Float))
        {
            return Value::floating(-operand.as_float());
        }
        type_error("bad operand type for unary -: '" + type_name(operand) + "'");
    case UnaryOp::Pos:
        if (operand.is_integral())
        {
            return Value::integer(operand.integral());
        }
        if (operand.is(ValueKind::Float))
        {
            return operand;
        }
        type_error("bad operand type for unary +: '" + type_name(operand) + "'");
    case UnaryOp::Invert:
        if (operand.is_integral())
        {
            return Value::integer(~operand.integral());
        }
        type_error("bad operand type for unary ~: '" + type_name(operand) + "'");
    }
    return Value::none();
}

bool compare(CompareOp op, const Value& lhs, const Value& rhs)
{
    switch (op)
    {
    case CompareOp::Eq:
        return values_equal(lhs, rhs);
    case CompareOp::NotEq:
        return !values_equal(lhs, rhs);
    case CompareOp::In:
        return contains(rhs, lhs);
    case CompareOp::NotIn:
        return !contains(rhs, lhs);
    case CompareOp::Is:
        return same_object(lhs, rhs);
    case CompareOp::IsNot:
        return !same_object(lhs, rhs);
    default:
        return ordered(op, lhs, rhs);
    }
}

bool less_than(const Value& lhs, const Value& rhs)
{
    return ordered(CompareOp::Lt, lhs, rhs);
}

bool contains(const Value& container, const Value& item)
{
    switch (container.kind())
    {
    case ValueKind::Str:
        if (!item.is(ValueKind::Str))
        {
            type_error("'in <string>' requires string as left operand, not " + type_name(item));
        }
        return container.as_str().find(item.as_str()) != std::string::npos;
    case ValueKind::List:
    {
        const auto& items = container.as_list().items;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (same_object(items[i], item) || values_equal(items[i], item))
            {
                return true;
            }
        }
        return false;
    }
    case ValueKind::Tuple:
        for (const auto& v : container.as_tuple().items)
        {
            if (same_object(v, item) || values_equal(v, item))
            {
                return true;
            }
        }
        return false;
    case ValueKind::Dict:
        return container.as_dict().table.contains(item);
    case ValueKind::Set:
        return container.as_set().table.contains(item);
    case ValueKind::Range:
    {
        const auto& r = container.as_range();
        std::int64_t v = 0;
        if (item.is_integral())
        {
            v = item.integral();
        }
        else if (item.is(ValueKind::Float) && std::floor(item.as_float()) == item.as_float() &&
                 std::abs(item.as_float()) < 9.2e18)
        {
            v = static_cast<std::int64_t>(item.as_float());
        }
        else
        {
            return false;
        }
        if (r.step > 0 ? (v < r.start || v >= r.stop) : (v > r.start || v <= r.stop))
        {
            return false;
        }
        const std::uint64_t distance = r.step > 0
                                           ? static_cast<std::uint64_t>(v) -
                                                 static_cast<std::uint64_t>(r.start)
                                           : static_cast<std::uint64_t>(r.start) -
                                                 static_cast<std::uint64_t>(v);
        const std::uint64_t stride = r.step > 0 ? static_cast<std::uint64_t>(r.step)
                                                : static_cast<std::uint64_t>(-(r.step + 1)) + 1;
        return distance % stride == 0;
    }
    case ValueKind::Iterator:
    {
        auto& it = container.as_iterator();
        while (it.pos < it.items.size())
        {
            const Value& v = it.items[it.pos++];
            if (values_equal(v, item))
            {
                return true;
            }
        }
        return false;
    }
    default:
        type_error("argument of type '" + type_name(container) + "' is not iterable");
    }
}

std::int64_t length_of(const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::Str:
    {
        const auto& s = value.as_str();
        return static_cast<std::int64_t>(sandpit::source::is_ascii(s)
                                             ? s.size()
                                             : sandpit::source::code_point_count(s));
    }
    case ValueKind::List:
        return static_cast<std::int64_t>(value.as_list().items.size());
    case ValueKind::Tuple:
        return static_cast<std::int64_t>(value.as_tuple().items.size());
    case ValueKind::Dict:
        return static_cast<std::int64_t>(value.as_dict().table.size());
    case ValueKind::Set:
        return static_cast<std::int64_t>(value.as_set().table.size());
    case ValueKind::Range:
        return value.as_range().length();
    default:
        type_error("object of type '" + type_name(value) + "' has no len()");
    }
}

Value get_item(const Value& base, const Value& index)
{
    switch (base.kind())
    {
    case ValueKind::Str:
    {
        const std::int64_t i = to_index(index, "string indices");
        const auto& s = base.as_str();
        if (sandpit::source::is_ascii(s))
        {
            const auto at = normalize_index(i, static_cast<std::int64_t>(s.size()), "string");
            return Value::str(std::string(1, s[static_cast<std::size_t>(at)]));
        }
        const auto cps = code_points(s);
        const auto at = normalize_index(i, static_cast<std::int64_t>(cps.size()), "string");
        return Value::str(std::string(cps[static_cast<std::size_t>(at)]));
    }
    case ValueKind::List:
    {
        const auto& items = base.as_list().items;
        const auto at = normalize_index(to_index(index, "list indices"),
                                        static_cast<std::int64_t>(items.size()), "list");
        return items[static_cast<std::size_t>(at)];
    }
    case ValueKind::Tuple:
    {
        const auto& items = base.as_tuple().items;
        const auto at = normalize_index(to_index(index, "tuple indices"),
                                        static_cast<std::int64_t>(items.size()), "tuple");
        return items[static_cast<std::size_t>(at)];
    }
    case ValueKind::Range:
    {
        const auto& r = base.as_range();
        const auto at = normalize_index(to_index(index, "range indices"), r.length(), "range object");
        return Value::integer(r.at(at));
    }
    case ValueKind::Dict:
    {
        const Value* found = base.as_dict().table.find(index);
        if (found == nullptr)
        {
            raise("KeyError", repr(index));
        }
        return *found;
    }
    default:
        type_error("'" + type_name(base) + "' object is not subscriptable");
    }
}

Value get_slice(const Value& base, const SliceValue& slice)
{
    auto pick = [&slice](const auto& items)
    {
        const auto idx = adjust_slice(slice, static_cast<std::int64_t>(items.size()));
        std::vector<std::decay_t<decltype(items[0])>> out;
        out.reserve(static_cast<std::size_t>(idx.count));
        for (std::int64_t k = 0, i = idx.start; k < idx.count; ++k, i += idx.step)
        {
            out.push_back(items[static_cast<std::size_t>(i)]);
        }
        return out;
    };

    switch (base.kind())
    {
    case ValueKind::Str:
    {
        const auto& s = base.as_str();
        std::string out;
        if (sandpit::source::is_ascii(s))
        {
            for (char c : pick(s))
            {
                out.push_back(c);
            }
        }
        else
        {
            for (const auto& cp : pick(code_points(s)))
            {
                out += cp;
            }
        }
        return Value::str(std::move(out));
    }
    case ValueKind::List:
        return Value::list(pick(base.as_list().items));
    case ValueKind::Tuple:
        return Value::tuple(pick(base.as_tuple().items));
    case ValueKind::Range:
    {
        const auto& r = base.as_range();
        const auto idx = adjust_slice(slice, r.length());
        const std::int64_t step = checked_mul(r.step, idx.step);
        const std::int64_t start = r.at(idx.start);
        return Value::range(RangeValue{
            .start = start, .stop = start + idx.count * step, .step = step});
    }
    default:
        type_error("'" + type_name(base) + "' object is not subscriptable");
    }
}

void set_item(const Value& base, const Value& index, Value value)
{
    switch (base.kind())
    {
    case ValueKind::List:
    {
        auto& items = base.as_list().items;
        const auto at = normalize_index(to_index(index, "list indices"),
                                        static_cast<std::int64_t>(items.size()),
                                        "list assignment");
        items[static_cast<std::size_t>(at)] = std::move(value);
        return;
    }
    case ValueKind::Dict:
        base.as_dict().table.insert_or_assign(index, std::move(value));
        return;
    default:
        type_error("'" + type_name(base) + "' object does not support item assignment");
    }
}

void set_slice(const Value& base, const SliceValue& slice, const Value& iterable)
{
    if (!base.is(ValueKind::List))
    {
        type_error("'" + type_name(base) + "' object does not support item assignment");
    }
    std::vector<Value> replacement = to_vector(iterable);
    auto& items = base.as_list().items;
    const auto idx = adjust_slice(slice, static_cast<std::int64_t>(items.size()));

    if (idx.step == 1)
    {
        const auto start = static_cast<std::size_t>(idx.start);
        const auto stop = static_cast<std::size_t>(std::max(idx.start, idx.stop));
        check_sequence_length(items.size() - (stop - start) + replacement.size());
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(start),
                    items.begin() + static_cast<std::ptrdiff_t>(stop));
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(start), replacement.begin(),
                     replacement.end());
        return;
    }

    if (static_cast<std::int64_t>(replacement.size()) != idx.count)
    {
        value_error("attempt to assign sequence of size " + std::to_string(replacement.size()) +
                    " to extended slice of size " + std::to_string(idx.count));
    }
    for (std::int64_t k = 0, i = idx.start; k < idx.count; ++k, i += idx.step)
    {
        items[static_cast<std::size_t>(i)] = std::move(replacement[static_cast<std::size_t>(k)]);
    }
}

void del_item(const Value& base, const Value& index)
{
    switch (base.kind())
    {
    case ValueKind::List:
    {
        auto& items = base.as_list().items;
        const auto at = normalize_index(to_index(index, "list indices"),
                                        static_cast<std::int64_t>(items.size()),
                                        "list assignment");
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
        return;
    }
    case ValueKind::Dict:
        if (!base.as_dict().table.erase(index).has_value())
        {
            raise("KeyError", repr(index));
        }
        return;
    default:
        type_error("'" + type_name(base) + "' object doesn't support item deletion");
    }
}

void del_slice(const Value& base, const SliceValue& slice)
{
    if (!base.is(ValueKind::List))
    {
        type_error("'" + type_name(base) + "' object doesn't support item deletion");
    }
    auto& items = base.as_list().items;
    const auto idx = adjust_slice(slice, static_cast<std::int64_t>(items.size()));
    std::vector<bool> doomed(items.size(), false);
    for (std::int64_t k = 0, i = idx.start; k < idx.count; ++k, i += idx.step)
    {
        doomed[static_cast<std::size_t>(i)] = true;
    }
    std::vector<Value> kept;
    kept.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (!doomed[i])
        {
            kept.push_back(std::move(items[i]));
        }
    }
    items = std::move(kept);
}

void for_each(const Value& iterable, const std::function<bool(const Value&)>& fn)
{
    switch (iterable.kind())
    {
    case ValueKind::Str:
    {
        const auto& s = iterable.as_str();
        for (const auto& cp : sandpit::source::split_code_points(s))
        {
            if (!fn(Value::str(std::string(cp))))
            {
                return;
            }
        }
        return;
    }
    case ValueKind::List:
    {
        // Hold a reference so the list survives rebinding of its name inside the loop.
        const Value keep = iterable;
        auto& items = keep.as_list().items;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const Value item = items[i];
            if (!fn(item))
            {
                return;
            }
        }
        return;
    }
    case ValueKind::Tuple:
    {
        const Value keep = iterable;
        for (const auto& item : keep.as_tuple().items)
        {
            if (!fn(item))
            {
                return;
            }
        }
        return;
    }
    case ValueKind::Dict:
        for (const auto& key : iterable.as_dict().table.keys())
        {
            if (!fn(key))
            {
                return;
            }
        }
        return;
    case ValueKind::Set:
        for (const auto& key : iterable.as_set().table.keys())
        {
            if (!fn(key))
            {
                return;
            }
        }
        return;
    case ValueKind::Range:
    {
        const RangeValue r = iterable.as_range();
        const std::int64_t n = r.length();
        for (std::int64_t i = 0; i < n; ++i)
        {
            if (!fn(Value::integer(r.at(i))))
            {
                return;
            }
        }
        return;
    }
    case ValueKind::Iterator:
    {
        const Value keep = iterable;
        auto& it = keep.as_iterator();
        while (it.pos < it.items.size())
        {
            const Value item = it.items[it.pos++];
            if (!fn(item))
            {
                return;
            }
        }
        return;
    }
    default:
        type_error("'" + type_name(iterable) + "' object is not iterable");
    }
}

std::vector<Value> to_vector(const Value& iterable)
{
    switch (iterable.kind())
    {
    case ValueKind::List:
        return iterable.as_list().items;
    case ValueKind::Tuple:
        return iterable.as_tuple().items;
    case ValueKind::Range:
        check_sequence_length(static_cast<std::size_t>(iterable.as_range().length()));
        break;
    default:
        break;
    }
    std::vector<Value> out;
    for_each(iterable,
             [&out](const Value& item)
             {
                 check_sequence_length(out.size() + 1);
                 out.push_back(item);
                 return true;
             });
    return out;
}

void dict_update(OrderedTable& table, const Value& source)
{
    if (source.is(ValueKind::Dict))
    {
        for (const auto& entry : source.as_dict().table.entries())
        {
            table.insert_or_assign(entry.key, entry.value);
        }
        return;
    }
    std::size_t index = 0;
    for_each(source,
             [&table, &index](const Value& item)
             {
                 std::vector<Value> pair;
                 if (item.is(ValueKind::List) || item.is(ValueKind::Tuple) ||
                     item.is(ValueKind::Str) || item.is(ValueKind::Range) ||
                     item.is(ValueKind::Set) || item.is(ValueKind::Dict) ||
                     item.is(ValueKind::Iterator))
                 {
                     pair = to_vector(item);
                 }
                 else
                 {
                     type_error("cannot convert dictionary update sequence element #" +
                                std::to_string(index) + " to a sequence");
                 }
                 if (pair.size() != 2)
                 {
                     value_error("dictionary update sequence element #" + std::to_string(index) +
                                 " has length " + std::to_string(pair.size()) +
                                 "; 2 is required");
                 }
                 table.insert_or_assign(pair[0], pair[1]);
                 ++index;
                 return true;
             });
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

namespace
{

struct FormatSpec
{
    std::string fill = " ";
    char align = '\0';
    char sign = '-';
    bool alternate = false;
    std::size_t width = 0;
    char grouping = '\0';
    std::optional<int> precision;
    char type = '\0';
};

bool is_align(char c)
{
    return c == '<' || c == '>' || c == '^' || c == '=';
}

FormatSpec parse_spec(std::string_view spec)
{
    FormatSpec out;
    std::size_t i = 0;
    const auto cps = sandpit::source::split_code_points(spec);
    if (cps.size() >= 2 && cps[1].size() == 1 && is_align(cps[1][0]))
    {
        out.fill = std::string(cps[0]);
        out.align = cps[1][0];
        i = cps[0].size() + 1;
    }
    else if (!spec.empty() && is_align(spec[0]))
    {
        out.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' '))
    {
        out.sign = spec[i++];
    }
    if (i < spec.size() && spec[i] == '#')
    {
        out.alternate = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0')
    {
        if (out.align == '\0')
        {
            out.fill = "0";
            out.align = '=';
        }
        ++i;
    }
    std::size_t width = 0;
    while (i < spec.size() && spec[i] >= '0' && spec[i] <= '9')
    {
        width = width * 10 + static_cast<std::size_t>(spec[i] - '0');
        if (width > 1'000'000)
        {
            value_error("Too many decimal digits in format string");
        }
        ++i;
    }
    out.width = width;
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_'))
    {
        out.grouping = spec[i++];
    }
    if (i < spec.size() && spec[i] == '.')
    {
        ++i;
        int precision = 0;
        bool any = false;
        while (i < spec.size() && spec[i] >= '0' && spec[i] <= '9')
        {
            precision = precision * 10 + (spec[i] - '0');
            if (precision > 10'000)
            {
                value_error("precision too big");
            }
            any = true;
            ++i;
        }
        if (!any)
        {
            value_error("Format specifier missing precision");
        }
        out.precision = precision;
    }
    if (i < spec.size())
    {
        out.type = spec[i++];
    }
    if (i != spec.size())
    {
        value_error("Invalid format specifier '" + std::string(spec) + "'");
    }
    return out;
}

std::string group_digits(const std::string& digits, char sep, std::size_t every)
{
    std::string out;
    const std::size_t n = digits.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        if (i > 0 && (n - i) % every == 0)
        {
            out.push_back(sep);
        }
        out.push_back(digits[i]);
    }
    return out;
}

// Applies grouping to the integer part of a formatted number body (digits[.frac][e...]).
std::string group_number(const std::string& body, char sep)
{
    std::size_t int_end = 0;
    while (int_end < body.size() && body[int_end] >= '0' && body[int_end] <= '9')
    {
        ++int_end;
    }
    return group_digits(body.substr(0, int_end), sep, 3) + body.substr(int_end);
}

std::string pad(const std::string& sign_prefix, const std::string& body, const FormatSpec& spec,
                char default_align)
{
    const std::size_t used = sandpit::source::code_point_count(sign_prefix) +
                             sandpit::source::code_point_count(body);
    if (spec.width <= used)
    {
        return sign_prefix + body;
    }
    const std::size_t missing = spec.width - used;
    check_string_length(missing * spec.fill.size());
    auto fill = [&spec](std::size_t count)
    {
        std::string out;
        for (std::size_t i = 0; i < count; ++i)
        {
            out += spec.fill;
        }
        return out;
    };
    const char align = spec.align == '\0' ? default_align : spec.align;
    switch (align)
    {
    case '<':
        return sign_prefix + body + fill(missing);
    case '^':
        return fill(missing / 2) + sign_prefix + body + fill(missing - missing / 2);
    case '=':
        return sign_prefix + fill(missing) + body;
    default:
        return fill(missing) + sign_prefix + body;
    }
}

std::string sign_for(bool negative, char sign)
{
    if (negative)
    {
        return "-";
    }
    if (sign == '+')
    {
        return "+";
    }
    if (sign == ' ')
    {
        return " ";
    }
    return "";
}

std::string printf_double(const char* fmt, int precision, double value)
{
    const int n = std::snprintf(nullptr, 0, fmt, precision, value);
    std::string out(static_cast<std::size_t>(n > 0 ? n : 0), '\0');
    std::snprintf(out.data(), out.size() + 1, fmt, precision, value);
    return out;
}

std::string format_int(std::int64_t value, const FormatSpec& spec)
{
    const bool negative = value < 0;
    const std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(value + 1)) + 1
                                             : static_cast<std::uint64_t>(value);
    std::string body;
    std::string prefix;
    std::size_t group_every = 3;
    switch (spec.type)
    {
    case 'b':
    case 'o':
    case 'x':
    case 'X':
    {
        const unsigned base = spec.type == 'b' ? 2 : spec.type == 'o' ? 8 : 16;
        const char* digits = spec.type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
        std::uint64_t m = magnitude;
        do
        {
            body.insert(body.begin(), digits[m % base]);
            m /= base;
        } while (m > 0);
        if (spec.alternate)
        {
            prefix = std::string("0") + (spec.type == 'X' ? 'X' : spec.type);
        }
        group_every = 4;
        break;
    }
    case 'c':
    {
        if (negative || magnitude > 0x10FFFF)
        {
            raise("OverflowError", "%c arg not in range(0x110000)");
        }
        sandpit::source::append_utf8(body, static_cast<char32_t>(magnitude));
        return pad("", body, spec, '<');
    }
    default:
        body = std::to_string(magnitude);
        break;
    }
    if (spec.grouping != '\0')
    {
        body = group_digits(body, spec.grouping, group_every);
    }
    return pad(sign_for(negative, spec.sign) + prefix, body, spec, '>');
}

std::string format_double(double value, FormatSpec spec)
{
    char type = spec.type;
    const bool negative = std::signbit(value) && !std::isnan(value);
    const double magnitude = std::fabs(value);
    std::string body;

    if (std::isnan(value) || std::isinf(value))
    {
        body = std::isnan(value) ? "nan" : "inf";
        if (type == 'F' || type == 'E' || type == 'G')
        {
            body = std::isnan(value) ? "NAN" : "INF";
        }
        if (type == '%')
        {
            body += "%";
        }
        return pad(sign_for(negative, spec.sign), body, spec, '>');
    }

    switch (type)
    {
    case 'f':
    case 'F':
        body = printf_double("%.*f", spec.precision.value_or(6), magnitude);
        break;
    case 'e':
    case 'E':
        body = printf_double(type == 'e' ? "%.*e" : "%.*E", spec.precision.value_or(6), magnitude);
        break;
    case 'g':
    case 'G':
    {
        const int p = spec.precision.has_value() ? std::max(*spec.precision, 1) : 6;
        body = printf_double(spec.alternate ? (type == 'g' ? "%#.*g" : "%#.*G")
                                            : (type == 'g' ? "%.*g" : "%.*G"),
                             p, magnitude);
        break;
    }
    case '%':
        body = printf_double("%.*f", spec.precision.value_or(6), magnitude * 100.0) + "%";
        break;
    case '\0':
        if (!spec.precision.has_value())
        {
            body = format_float(magnitude);
        }
        else
        {
            body = printf_double("%.*g", std::max(*spec.precision, 1), magnitude);
            if (body.find_first_of(".e") == std::string::npos)
            {
                body += ".0";
            }
        }
        break;
    default:
        value_error(std::string("Unknown format code '") + type + "' for object of type 'float'");
    }
    if (spec.grouping != '\0')
    {
        body = group_number(body, spec.grouping);
    }
    return pad(sign_for(negative, spec.sign), body, spec, '>');
}

} // namespace

std::string format_value(const Value& value, std::string_view spec_text)
{
    if (spec_text.empty())
    {
        return to_str(value);
    }
    const FormatSpec spec = parse_spec(spec_text);

    if (value.is_integral())
    {
        switch (spec.type)
        {
        case '\0':
        case 'd':
        case 'n':
        case 'b':
        case 'o':
        case 'x':
        case 'X':
        case 'c':
            return format_int(value.integral(), spec);
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
        case '%':
            return format_double(static_cast<double>(value.integral()), spec);
        default:
            value_error(std::string("Unknown format code '") + spec.type +
                        "' for object of type 'int'");
        }
    }
    if (value.is(ValueKind::Float))
    {
        if (spec.type == 'd' || spec.type == 'x' || spec.type == 'b' || spec.type == 'o')
        {
            value_error(std::string("Unknown format code '") + spec.type +
                        "' for object of type 'float'");
        }
        return format_double(value.as_float(), spec);
    }
    if (value.is(ValueKind::Str))
    {
        if (spec.type != '\0' && spec.type != 's')
        {
            value_error(std::string("Unknown format code '") + spec.type +
                        "' for object of type 'str'");
        }
        if (spec.sign != '-')
        {
            value_error("Sign not allowed in string format specifier");
        }
        std::string body = value.as_str();
        if (spec.precision.has_value())
        {
            const auto cps = sandpit::source::split_code_points(body);
            if (cps.size() > static_cast<std::size_t>(*spec.precision))
            {
                std::string cut;
                for (std::size_t i = 0; i < static_cast<std::size_t>(*spec.precision); ++i)
                {
                    cut += cps[i];
                }
                body = std::move(cut);
            }
        }
        return pad("", body, spec, '<');
    }
    type_error("unsupported format string passed to " + type_name(value) + ".__format__");
}

std::string percent_format(std::string_view text, const Value& args)
{
    std::vector<Value> values;
    if (args.is(ValueKind::Tuple))
    {
        values = args.as_tuple().items;
    }
    else
    {
        values.push_back(args);
    }
    std::size_t next = 0;
    std::string out;

    std::size_t i = 0;
    while (i < text.size())
    {
        const char c = text[i];
        if (c != '%')
        {
            out.push_back(c);
            ++i;
            continue;
        }
        ++i;
        if (i >= text.size())
        {
            value_error("incomplete format");
        }
        if (text[i] == '%')
        {
            out.push_back('%');
            ++i;
            continue;
        }

        FormatSpec spec;
        spec.align = '>';
        while (i < text.size() && std::string_view("-+ #0").find(text[i]) != std::string_view::npos)
        {
            switch (text[i])
            {
            case '-':
                spec.align = '<';
                break;
            case '+':
                spec.sign = '+';
                break;
            case ' ':
                if (spec.sign != '+')
                {
                    spec.sign = ' ';
                }
                break;
            case '#':
                spec.alternate = true;
                break;
            default:
                if (spec.align != '<')
                {
                    spec.fill = "0";
                    spec.align = '=';
                }
                break;
            }
            ++i;
        }
        while (i < text.size() && text[i] >= '0' && text[i] <= '9')
        {
            spec.width = spec.width * 10 + static_cast<std::size_t>(text[i] - '0');
            if (spec.width > 1'000'000)
            {
                value_error("width too big");
            }
            ++i;
        }
        if (i < text.size() && text[i] == '.')
        {
            ++i;
            int precision = 0;
            while (i < text.size() && text[i] >= '0' && text[i] <= '9')
            {
                precision = std::min(precision * 10 + (text[i] - '0'), 10'000);
                ++i;
            }
            spec.precision = precision;
        }
        if (i >= text.size())
        {
            value_error("incomplete format");
        }
        const char conv = text[i++];
        if (next >= values.size())
        {
            type_error("not enough arguments for format string");
        }
        const Value& arg = values[next++];

        switch (conv)
        {
        case 's':
        case 'r':
        case 'a':
        {
            std::string body = conv == 's' ? to_str(arg) : repr(arg);
            if (spec.precision.has_value() &&
                body.size() > static_cast<std::size_t>(*spec.precision))
            {
                body.resize(static_cast<std::size_t>(*spec.precision));
            }
            if (spec.align == '=')
            {
                spec.fill = " ";
                spec.align = '>';
            }
            out += pad("", body, spec, '>');
            break;
        }
        case 'd':
        case 'i':
        case 'u':
        case 'x':
        case 'X':
        case 'o':
        {
            std::int64_t v = 0;
            if (arg.is_integral())
            {
                v = arg.integral();
            }
            else if (arg.is(ValueKind::Float) && std::isfinite(arg.as_float()))
            {
                v = static_cast<std::int64_t>(arg.as_float());
            }
            else
            {
                type_error(std::string("%") + conv + " format: a real number is required, not " +
                           type_name(arg));
            }
            spec.type = (conv == 'x' || conv == 'X' || conv == 'o') ? conv : 'd';
            spec.precision.reset();
            out += format_int(v, spec);
            break;
        }
        case 'f':
        case 'F':
        case 'e':
        case 'E':
        case 'g':
        case 'G':
            if (!arg.is_number())
            {
                type_error("must be real number, not " + type_name(arg));
            }
            spec.type = conv;
            out += format_double(arg.number(), spec);
            break;
        case 'c':
            if (arg.is(ValueKind::Str))
            {
                out += pad("", arg.as_str(), spec, '>');
            }
            else
            {
                spec.type = 'c';
                out += format_int(to_index(arg, "%c"), spec);
            }
            break;
        default:
            value_error(std::string("unsupported format character '") + conv + "'");
        }
    }
    if (next < values.size())
    {
        type_error("not all arguments converted during string formatting");
    }
    return out;
}

} // namespace sandpit::runtime
