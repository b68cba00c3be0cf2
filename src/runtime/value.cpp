#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>
#include <optional>
#include <sandpit/runtime/error.h>
#include <sandpit/runtime/namespace.h>
#include <sandpit/runtime/value.h>
#include <system_error>
#include <utility>

namespace sandpit::runtime
{
namespace
{

constexpr std::size_t kNoneHash = 0x5eed5eedU;

std::size_t combine_hash(std::size_t seed, std::size_t value)
{
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

// Exact comparison of a float with an int64, as Python does.
bool float_equals_int(double f, std::int64_t i)
{
    if (!std::isfinite(f) || std::floor(f) != f)
    {
        return false;
    }
    if (f < -9223372036854775808.0 || f >= 9223372036854775808.0)
    {
        return false;
    }
    return static_cast<std::int64_t>(f) == i;
}

std::string address_of(const void* p)
{
    if (p == nullptr)
    {
        return "0x0";
    }
    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%p", p);
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
}

thread_local std::size_t recursion_depth = 0;
thread_local std::size_t recursion_limit = kDefaultRecursionLimit;

thread_local std::vector<Value> pending_release;
thread_local bool releasing = false;

bool holds_object(const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::List:
    case ValueKind::Tuple:
    case ValueKind::Dict:
    case ValueKind::Set:
    case ValueKind::Function:
    case ValueKind::BoundMethod:
    case ValueKind::Iterator:
        return true;
    default:
        return false;
    }
}

// Containers currently being printed; a container that contains itself prints as `[...]`.
thread_local std::vector<const void*> repr_stack;

class ReprGuard
{
  public:
    explicit ReprGuard(const void* p) : active_(std::find(repr_stack.begin(), repr_stack.end(), p) != repr_stack.end())
    {
        if (!active_)
        {
            repr_stack.push_back(p);
        }
    }
    ~ReprGuard()
    {
        if (!active_)
        {
            repr_stack.pop_back();
        }
    }
    ReprGuard(const ReprGuard&) = delete;
    ReprGuard& operator=(const ReprGuard&) = delete;

    [[nodiscard]] bool recursive() const { return active_; }

  private:
    bool active_;
};

std::string join_reprs(const std::vector<Value>& items)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += repr(items[i]);
    }
    return out;
}

} // namespace

RecursionGuard::RecursionGuard(std::string_view context)
{
    if (recursion_depth >= recursion_limit)
    {
        std::string message = "maximum recursion depth exceeded";
        if (!context.empty())
        {
            message += " ";
            message += context;
        }
        raise("RecursionError", std::move(message));
    }
    ++recursion_depth;
}

RecursionGuard::~RecursionGuard()
{
    --recursion_depth;
}

RecursionLimit::RecursionLimit(std::size_t limit) : saved_(std::exchange(recursion_limit, limit)) {}

RecursionLimit::~RecursionLimit()
{
    recursion_limit = saved_;
}

void release_values(std::vector<Value>& values)
{
    for (auto& value : values)
    {
        if (holds_object(value))
        {
            pending_release.push_back(std::move(value));
        }
    }
    values.clear();
    if (releasing)
    {
        return;
    }

    releasing = true;
    while (!pending_release.empty())
    {
        // Destroying `next` may enqueue its own elements; the loop picks them up.
        Value next = std::move(pending_release.back());
        pending_release.pop_back();
    }
    releasing = false;
}

ListObject::~ListObject()
{
    release_values(items);
}

TupleObject::~TupleObject()
{
    release_values(items);
}

DictObject::~DictObject()
{
    auto values = table.take_all();
    release_values(values);
}

SetObject::~SetObject()
{
    auto values = table.take_all();
    release_values(values);
}

IteratorObject::~IteratorObject()
{
    release_values(items);
}

std::int64_t RangeValue::length() const
{
    std::uint64_t span = 0;
    std::uint64_t stride = 0;
    if (step > 0 && start < stop)
    {
        span = static_cast<std::uint64_t>(stop) - static_cast<std::uint64_t>(start);
        stride = static_cast<std::uint64_t>(step);
    }
    else if (step < 0 && start > stop)
    {
        span = static_cast<std::uint64_t>(start) - static_cast<std::uint64_t>(stop);
        stride = static_cast<std::uint64_t>(-(step + 1)) + 1;
    }
    else
    {
        return 0;
    }
    const std::uint64_t n = (span - 1) / stride + 1;
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    return static_cast<std::int64_t>(std::min(n, kMax));
}

Value Value::list(std::vector<Value> items)
{
    auto obj = std::make_shared<ListObject>();
    obj->items = std::move(items);
    return Value(Storage(std::in_place_index<5>, std::move(obj)));
}

Value Value::tuple(std::vector<Value> items)
{
    auto obj = std::make_shared<TupleObject>();
    obj->items = std::move(items);
    return Value(Storage(std::in_place_index<6>, std::move(obj)));
}

Value Value::dict()
{
    return Value(Storage(std::in_place_index<7>, std::make_shared<DictObject>()));
}

Value Value::set()
{
    return Value(Storage(std::in_place_index<8>, std::make_shared<SetObject>()));
}

Value Value::function(std::shared_ptr<FunctionObject> fn)
{
    return Value(Storage(std::in_place_index<10>, std::move(fn)));
}

Value Value::bound_method(Value self, std::string name)
{
    auto obj = std::make_shared<BoundMethodObject>();
    obj->self = std::move(self);
    obj->name = std::move(name);
    return Value(Storage(std::in_place_index<12>, std::move(obj)));
}

Value Value::iterator(std::vector<Value> items, std::string_view type_name)
{
    auto obj = std::make_shared<IteratorObject>();
    obj->items = std::move(items);
    obj->type_name = type_name;
    return Value(Storage(std::in_place_index<13>, std::move(obj)));
}

const void* Value::identity() const
{
    return std::visit(
        [](const auto& v) -> const void*
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, const Builtin*>)
            {
                return v;
            }
            else if constexpr (std::is_same_v<T, std::shared_ptr<ListObject>> ||
                               std::is_same_v<T, std::shared_ptr<TupleObject>> ||
                               std::is_same_v<T, std::shared_ptr<DictObject>> ||
                               std::is_same_v<T, std::shared_ptr<SetObject>> ||
                               std::is_same_v<T, std::shared_ptr<FunctionObject>> ||
                               std::is_same_v<T, std::shared_ptr<BoundMethodObject>> ||
                               std::is_same_v<T, std::shared_ptr<IteratorObject>>)
            {
                return v.get();
            }
            else
            {
                return nullptr;
            }
        },
        storage_);
}

// ---------------------------------------------------------------------------
// OrderedTable
// ---------------------------------------------------------------------------

std::optional<std::size_t> OrderedTable::find_slot(const Value& key) const
{
    const std::size_t h = hash_value(key);
    const auto [first, last] = index_.equal_range(h);
    for (auto it = first; it != last; ++it)
    {
        const auto& slot = slots_[it->second];
        if (slot.has_value() && values_equal(slot->key, key))
        {
            return it->second;
        }
    }
    return std::nullopt;
}

const Value* OrderedTable::find(const Value& key) const
{
    const auto slot = find_slot(key);
    return slot.has_value() ? &slots_[*slot]->value : nullptr;
}

Value* OrderedTable::find(const Value& key)
{
    const auto slot = find_slot(key);
    return slot.has_value() ? &slots_[*slot]->value : nullptr;
}

bool OrderedTable::insert_or_assign(Value key, Value value)
{
    if (const auto slot = find_slot(key))
    {
        slots_[*slot]->value = std::move(value);
        return false;
    }
    check_sequence_length(live_ + 1);
    const std::size_t h = hash_value(key);
    index_.emplace(h, slots_.size());
    slots_.push_back(Entry{.key = std::move(key), .value = std::move(value)});
    ++live_;
    return true;
}

std::optional<OrderedTable::Entry> OrderedTable::erase(const Value& key)
{
    const auto slot = find_slot(key);
    if (!slot.has_value())
    {
        return std::nullopt;
    }
    const std::size_t h = hash_value(key);
    const auto [first, last] = index_.equal_range(h);
    for (auto it = first; it != last; ++it)
    {
        if (it->second == *slot)
        {
            index_.erase(it);
            break;
        }
    }
    std::optional<Entry> out = std::move(slots_[*slot]);
    slots_[*slot].reset();
    --live_;
    if (slots_.size() > 16 && live_ * 2 < slots_.size())
    {
        compact();
    }
    return out;
}

std::optional<OrderedTable::Entry> OrderedTable::pop_last()
{
    for (std::size_t i = slots_.size(); i > 0; --i)
    {
        if (slots_[i - 1].has_value())
        {
            const Value key = slots_[i - 1]->key;
            return erase(key);
        }
    }
    return std::nullopt;
}

std::optional<OrderedTable::Entry> OrderedTable::pop_first()
{
    for (const auto& slot : slots_)
    {
        if (slot.has_value())
        {
            const Value key = slot->key;
            return erase(key);
        }
    }
    return std::nullopt;
}

void OrderedTable::clear()
{
    slots_.clear();
    index_.clear();
    live_ = 0;
}

std::vector<OrderedTable::Entry> OrderedTable::entries() const
{
    std::vector<Entry> out;
    out.reserve(live_);
    for (const auto& slot : slots_)
    {
        if (slot.has_value())
        {
            out.push_back(*slot);
        }
    }
    return out;
}

std::vector<Value> OrderedTable::keys() const
{
    std::vector<Value> out;
    out.reserve(live_);
    for (const auto& slot : slots_)
    {
        if (slot.has_value())
        {
            out.push_back(slot->key);
        }
    }
    return out;
}

std::vector<Value> OrderedTable::take_all()
{
    std::vector<Value> out;
    out.reserve(live_ * 2);
    for (auto& slot : slots_)
    {
        if (slot.has_value())
        {
            out.push_back(std::move(slot->key));
            out.push_back(std::move(slot->value));
        }
    }
    clear();
    return out;
}

void OrderedTable::compact()
{
    std::vector<std::optional<Entry>> kept;
    kept.reserve(live_);
    index_.clear();
    for (auto& slot : slots_)
    {
        if (slot.has_value())
        {
            index_.emplace(hash_value(slot->key), kept.size());
            kept.push_back(std::move(slot));
        }
    }
    slots_ = std::move(kept);
}

// ---------------------------------------------------------------------------
// Value semantics
// ---------------------------------------------------------------------------

void check_sequence_length(std::size_t length)
{
    if (length > kMaxSequenceLength)
    {
        raise("MemoryError", "sequence is too large");
    }
}

void check_string_length(std::size_t bytes)
{
    if (bytes > kMaxStringBytes)
    {
        raise("MemoryError", "string is too large");
    }
}

std::string type_name(const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::None:
        return "NoneType";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::Int:
        return "int";
    case ValueKind::Float:
        return "float";
    case ValueKind::Str:
        return "str";
    case ValueKind::List:
        return "list";
    case ValueKind::Tuple:
        return "tuple";
    case ValueKind::Dict:
        return "dict";
    case ValueKind::Set:
        return "set";
    case ValueKind::Range:
        return "range";
    case ValueKind::Function:
        return "function";
    case ValueKind::Builtin:
    case ValueKind::BoundMethod:
        return "builtin_function_or_method";
    case ValueKind::Iterator:
        return std::string(value.as_iterator().type_name);
    }
    return "object";
}

bool truthy(const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::None:
        return false;
    case ValueKind::Bool:
        return value.as_bool();
    case ValueKind::Int:
        return value.as_int() != 0;
    case ValueKind::Float:
        return value.as_float() != 0.0;
    case ValueKind::Str:
        return !value.as_str().empty();
    case ValueKind::List:
        return !value.as_list().items.empty();
    case ValueKind::Tuple:
        return !value.as_tuple().items.empty();
    case ValueKind::Dict:
        return !value.as_dict().table.empty();
    case ValueKind::Set:
        return !value.as_set().table.empty();
    case ValueKind::Range:
        return value.as_range().length() > 0;
    default:
        return true;
    }
}

namespace
{

bool sequences_equal(const std::vector<Value>& a, const std::vector<Value>& b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!values_equal(a[i], b[i]))
        {
            return false;
        }
    }
    return true;
}

} // namespace

bool values_equal(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number())
    {
        if (a.is_integral() && b.is_integral())
        {
            return a.integral() == b.integral();
        }
        if (a.is(ValueKind::Float) && b.is(ValueKind::Float))
        {
            return a.as_float() == b.as_float();
        }
        return a.is(ValueKind::Float) ? float_equals_int(a.as_float(), b.integral())
                                      : float_equals_int(b.as_float(), a.integral());
    }
    if (a.kind() != b.kind())
    {
        return false;
    }

    std::optional<RecursionGuard> depth;
    if (holds_object(a))
    {
        depth.emplace("in comparison");
    }

    switch (a.kind())
    {
    case ValueKind::None:
        return true;
    case ValueKind::Str:
        return a.as_str() == b.as_str();
    case ValueKind::List:
        return a.identity() == b.identity() || sequences_equal(a.as_list().items, b.as_list().items);
    case ValueKind::Tuple:
        return a.identity() == b.identity() ||
               sequences_equal(a.as_tuple().items, b.as_tuple().items);
    case ValueKind::Dict:
    {
        const auto& x = a.as_dict().table;
        const auto& y = b.as_dict().table;
        if (x.size() != y.size())
        {
            return false;
        }
        for (const auto& entry : x.entries())
        {
            const Value* other = y.find(entry.key);
            if (other == nullptr || !values_equal(entry.value, *other))
            {
                return false;
            }
        }
        return true;
    }
    case ValueKind::Set:
    {
        const auto& x = a.as_set().table;
        const auto& y = b.as_set().table;
        if (x.size() != y.size())
        {
            return false;
        }
        for (const auto& key : x.keys())
        {
            if (!y.contains(key))
            {
                return false;
            }
        }
        return true;
    }
    case ValueKind::Range:
    {
        const auto& x = a.as_range();
        const auto& y = b.as_range();
        const auto n = x.length();
        if (n != y.length())
        {
            return false;
        }
        return n == 0 || (x.start == y.start && (n == 1 || x.step == y.step));
    }
    case ValueKind::BoundMethod:
    {
        const auto& x = a.as_bound_method();
        const auto& y = b.as_bound_method();
        return x.name == y.name && x.self.identity() == y.self.identity() &&
               (x.self.identity() != nullptr || values_equal(x.self, y.self));
    }
    default:
        return a.identity() == b.identity();
    }
}

std::size_t hash_value(const Value& value)
{
    switch (value.kind())
    {
    case ValueKind::None:
        return kNoneHash;
    case ValueKind::Bool:
    case ValueKind::Int:
        return std::hash<std::int64_t>{}(value.integral());
    case ValueKind::Float:
    {
        const double f = value.as_float();
        if (std::isfinite(f) && std::floor(f) == f && f >= -9223372036854775808.0 &&
            f < 9223372036854775808.0)
        {
            return std::hash<std::int64_t>{}(static_cast<std::int64_t>(f));
        }
        return std::hash<double>{}(f);
    }
    case ValueKind::Str:
        return std::hash<std::string>{}(value.as_str());
    case ValueKind::Tuple:
    {
        RecursionGuard depth("while hashing");
        std::size_t seed = 0x345678U;
        for (const auto& item : value.as_tuple().items)
        {
            seed = combine_hash(seed, hash_value(item));
        }
        return seed;
    }
    case ValueKind::Range:
    {
        const auto& r = value.as_range();
        const auto n = r.length();
        std::size_t seed = std::hash<std::int64_t>{}(n);
        if (n > 0)
        {
            seed = combine_hash(seed, std::hash<std::int64_t>{}(r.start));
        }
        if (n > 1)
        {
            seed = combine_hash(seed, std::hash<std::int64_t>{}(r.step));
        }
        return seed;
    }
    case ValueKind::List:
    case ValueKind::Dict:
    case ValueKind::Set:
        type_error("unhashable type: '" + type_name(value) + "'");
    case ValueKind::BoundMethod:
        return combine_hash(std::hash<std::string>{}(value.as_bound_method().name),
                            std::hash<const void*>{}(value.as_bound_method().self.identity()));
    default:
        return std::hash<const void*>{}(value.identity());
    }
}

std::string format_float(double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value < 0 ? "-inf" : "inf";
    }

    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    std::string_view text(buf, static_cast<std::size_t>(res.ptr - buf));

    std::string out;
    if (!text.empty() && text.front() == '-')
    {
        out.push_back('-');
        text.remove_prefix(1);
    }

    const std::size_t e_pos = text.find('e');
    std::string digits;
    for (char c : text.substr(0, e_pos))
    {
        if (c != '.')
        {
            digits.push_back(c);
        }
    }
    int exponent = 0;
    const std::string_view exp_text = text.substr(e_pos + 1);
    const char* exp_begin = exp_text.data() + (exp_text.front() == '+' ? 1 : 0);
    (void)std::from_chars(exp_begin, exp_text.data() + exp_text.size(), exponent);

    if (exponent >= -4 && exponent < 16)
    {
        const int decpt = exponent + 1;
        const int ndigits = static_cast<int>(digits.size());
        if (decpt <= 0)
        {
            out += "0.";
            out.append(static_cast<std::size_t>(-decpt), '0');
            out += digits;
        }
        else if (decpt >= ndigits)
        {
            out += digits;
            out.append(static_cast<std::size_t>(decpt - ndigits), '0');
            out += ".0";
        }
        else
        {
            out += digits.substr(0, static_cast<std::size_t>(decpt));
            out.push_back('.');
            out += digits.substr(static_cast<std::size_t>(decpt));
        }
        return out;
    }

    out.push_back(digits.front());
    if (digits.size() > 1)
    {
        out.push_back('.');
        out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(exponent < 0 ? '-' : '+');
    const int magnitude = exponent < 0 ? -exponent : exponent;
    if (magnitude < 10)
    {
        out.push_back('0');
    }
    out += std::to_string(magnitude);
    return out;
}

std::string quote_string(std::string_view text)
{
    const bool has_single = text.find('\'') != std::string_view::npos;
    const bool has_double = text.find('"') != std::string_view::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(text.size() + 2);
    out.push_back(quote);
    for (char c : text)
    {
        const auto u = static_cast<unsigned char>(c);
        if (c == quote || c == '\\')
        {
            out.push_back('\\');
            out.push_back(c);
        }
        else if (c == '\n')
        {
            out += "\\n";
        }
        else if (c == '\r')
        {
            out += "\\r";
        }
        else if (c == '\t')
        {
            out += "\\t";
        }
        else if (u < 0x20 || u == 0x7f)
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", u);
            out += buf;
        }
        else
        {
            out.push_back(c);
        }
    }
    out.push_back(quote);
    return out;
}

std::string repr(const Value& value)
{
    std::optional<RecursionGuard> depth;
    if (holds_object(value))
    {
        depth.emplace("while getting the repr of an object");
    }

    switch (value.kind())
    {
    case ValueKind::None:
        return "None";
    case ValueKind::Bool:
        return value.as_bool() ? "True" : "False";
    case ValueKind::Int:
        return std::to_string(value.as_int());
    case ValueKind::Float:
        return format_float(value.as_float());
    case ValueKind::Str:
        return quote_string(value.as_str());
    case ValueKind::List:
    {
        ReprGuard guard(value.identity());
        if (guard.recursive())
        {
            return "[...]";
        }
        return "[" + join_reprs(value.as_list().items) + "]";
    }
    case ValueKind::Tuple:
    {
        const auto& items = value.as_tuple().items;
        if (items.size() == 1)
        {
            return "(" + repr(items.front()) + ",)";
        }
        return "(" + join_reprs(items) + ")";
    }
    case ValueKind::Dict:
    {
        ReprGuard guard(value.identity());
        if (guard.recursive())
        {
            return "{...}";
        }
        std::string out = "{";
        bool first = true;
        for (const auto& entry : value.as_dict().table.entries())
        {
            if (!first)
            {
                out += ", ";
            }
            first = false;
            out += repr(entry.key);
            out += ": ";
            out += repr(entry.value);
        }
        out += "}";
        return out;
    }
    case ValueKind::Set:
    {
        const auto keys = value.as_set().table.keys();
        if (keys.empty())
        {
            return "set()";
        }
        return "{" + join_reprs(keys) + "}";
    }
    case ValueKind::Range:
    {
        const auto& r = value.as_range();
        std::string out = "range(" + std::to_string(r.start) + ", " + std::to_string(r.stop);
        if (r.step != 1)
        {
            out += ", " + std::to_string(r.step);
        }
        return out + ")";
    }
    case ValueKind::Function:
        return "<function " + value.as_function()->name + " at " + address_of(value.identity()) +
               ">";
    case ValueKind::Builtin:
        return "<built-in function " + std::string(value.as_builtin()->name) + ">";
    case ValueKind::BoundMethod:
    {
        const auto& method = value.as_bound_method();
        return "<built-in method " + method.name + " of " + type_name(method.self) +
               " object at " + address_of(method.self.identity()) + ">";
    }
    case ValueKind::Iterator:
    {
        const auto& it = value.as_iterator();
        if (it.type_name == "generator")
        {
            return "<generator object <genexpr> at " + address_of(value.identity()) + ">";
        }
        return "<" + std::string(it.type_name) + " object at " + address_of(value.identity()) +
               ">";
    }
    }
    return "<object>";
}

std::string to_str(const Value& value)
{
    if (value.is(ValueKind::Str))
    {
        return value.as_str();
    }
    return repr(value);
}

} // namespace sandpit::runtime
