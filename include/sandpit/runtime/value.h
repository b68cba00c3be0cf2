#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

/**
 * @file value.h
 * @brief Runtime values of the script interpreter.
 *
 * Scalars and strings are stored inline; containers, functions and iterators are shared
 * objects so that aliasing behaves like Python (`b = a; b.append(1)` changes `a`).
 */

namespace sandpit::parser
{
struct Param;
struct Block;
struct Expr;
} // namespace sandpit::parser

namespace sandpit::runtime
{

struct ListObject;
struct TupleObject;
struct DictObject;
struct SetObject;
struct FunctionObject;
struct BoundMethodObject;
struct IteratorObject;
struct Builtin;
struct Scope;
struct LocalInfo;

/** @brief Lazy `range(start, stop, step)`; step is never zero. */
struct RangeValue
{
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;

    [[nodiscard]] std::int64_t length() const;
    [[nodiscard]] std::int64_t at(std::int64_t index) const { return start + index * step; }
};

/** @brief Kind of a runtime value; the order matches Value::Storage alternatives. */
enum class ValueKind
{
    None,
    Bool,
    Int,
    Float,
    Str,
    List,
    Tuple,
    Dict,
    Set,
    Range,
    Function,
    Builtin,
    BoundMethod,
    Iterator,
};

class Value
{
  public:
    using Storage =
        std::variant<std::monostate, bool, std::int64_t, double, std::string,
                     std::shared_ptr<ListObject>, std::shared_ptr<TupleObject>,
                     std::shared_ptr<DictObject>, std::shared_ptr<SetObject>, RangeValue,
                     std::shared_ptr<FunctionObject>, const Builtin*,
                     std::shared_ptr<BoundMethodObject>, std::shared_ptr<IteratorObject>>;

    Value() = default;

    static Value none() { return Value{}; }
    static Value boolean(bool v) { return Value(Storage(std::in_place_index<1>, v)); }
    static Value integer(std::int64_t v) { return Value(Storage(std::in_place_index<2>, v)); }
    static Value floating(double v) { return Value(Storage(std::in_place_index<3>, v)); }
    static Value str(std::string v)
    {
        return Value(Storage(std::in_place_index<4>, std::move(v)));
    }
    static Value list(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value dict();
    static Value set();
    static Value range(RangeValue r) { return Value(Storage(std::in_place_index<9>, r)); }
    static Value function(std::shared_ptr<FunctionObject> fn);
    static Value builtin(const Builtin* fn) { return Value(Storage(std::in_place_index<11>, fn)); }
    static Value bound_method(Value self, std::string name);
    static Value iterator(std::vector<Value> items, std::string_view type_name);

    [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }
    [[nodiscard]] bool is(ValueKind k) const { return kind() == k; }
    [[nodiscard]] bool is_none() const { return kind() == ValueKind::None; }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(storage_); }
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(storage_); }
    [[nodiscard]] double as_float() const { return std::get<double>(storage_); }
    [[nodiscard]] const std::string& as_str() const { return std::get<std::string>(storage_); }
    [[nodiscard]] const RangeValue& as_range() const { return std::get<RangeValue>(storage_); }
    [[nodiscard]] const Builtin* as_builtin() const { return std::get<const Builtin*>(storage_); }

    [[nodiscard]] ListObject& as_list() const
    {
        return *std::get<std::shared_ptr<ListObject>>(storage_);
    }
    [[nodiscard]] const TupleObject& as_tuple() const
    {
        return *std::get<std::shared_ptr<TupleObject>>(storage_);
    }
    [[nodiscard]] DictObject& as_dict() const
    {
        return *std::get<std::shared_ptr<DictObject>>(storage_);
    }
    [[nodiscard]] SetObject& as_set() const
    {
        return *std::get<std::shared_ptr<SetObject>>(storage_);
    }
    [[nodiscard]] const std::shared_ptr<FunctionObject>& as_function() const
    {
        return std::get<std::shared_ptr<FunctionObject>>(storage_);
    }
    [[nodiscard]] const BoundMethodObject& as_bound_method() const
    {
        return *std::get<std::shared_ptr<BoundMethodObject>>(storage_);
    }
    [[nodiscard]] IteratorObject& as_iterator() const
    {
        return *std::get<std::shared_ptr<IteratorObject>>(storage_);
    }

    /** @brief True for int and bool (bool is a subtype of int, as in Python). */
    [[nodiscard]] bool is_integral() const
    {
        return kind() == ValueKind::Int || kind() == ValueKind::Bool;
    }
    [[nodiscard]] bool is_number() const { return is_integral() || kind() == ValueKind::Float; }

    /** @brief int/bool value widened to int64 (caller checks is_integral()). */
    [[nodiscard]] std::int64_t integral() const
    {
        return kind() == ValueKind::Bool ? (as_bool() ? 1 : 0) : as_int();
    }

    /** @brief Numeric value as double (caller checks is_number()). */
    [[nodiscard]] double number() const
    {
        return kind() == ValueKind::Float ? as_float() : static_cast<double>(integral());
    }

    /** @brief Address of the shared object, or null for inline values. Used for `is`. */
    [[nodiscard]] const void* identity() const;

  private:
    explicit Value(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

/**
 * @brief Insertion-ordered hash table used by dict and set.
 *
 * Erased entries leave a tombstone so iteration order is stable; the table compacts when
 * tombstones dominate.
 */
class OrderedTable
{
  public:
    struct Entry
    {
        Value key;
        Value value;
    };

    [[nodiscard]] const Value* find(const Value& key) const;
    [[nodiscard]] Value* find(const Value& key);
    [[nodiscard]] bool contains(const Value& key) const { return find(key) != nullptr; }

    /** @brief Insert or overwrite; returns true when the key was new. */
    bool insert_or_assign(Value key, Value value);

    /** @brief Remove `key`; returns the removed entry when present. */
    std::optional<Entry> erase(const Value& key);

    /** @brief Remove and return the most recently inserted entry. */
    std::optional<Entry> pop_last();

    /** @brief Remove and return the first entry (set.pop order). */
    std::optional<Entry> pop_first();

    void clear();

    [[nodiscard]] std::size_t size() const { return live_; }
    [[nodiscard]] bool empty() const { return live_ == 0; }

    /** @brief Copy of the live entries in insertion order. */
    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] std::vector<Value> keys() const;

    /** @brief Move every key and value out, leaving the table empty. */
    [[nodiscard]] std::vector<Value> take_all();

  private:
    std::vector<std::optional<Entry>> slots_;
    std::unordered_multimap<std::size_t, std::size_t> index_;
    std::size_t live_ = 0;

    [[nodiscard]] std::optional<std::size_t> find_slot(const Value& key) const;
    void compact();
};

// Container destructors hand their elements to release_values(), so dropping a deeply
// nested list does not recurse once per level.

struct ListObject
{
    std::vector<Value> items;
    ~ListObject();
};

struct TupleObject
{
    std::vector<Value> items;
    ~TupleObject();
};

struct DictObject
{
    OrderedTable table;
    ~DictObject();
};

struct SetObject
{
    OrderedTable table;
    ~SetObject();
};

/** @brief User function (from `def` or `lambda`). The AST must outlive the value. */
struct FunctionObject
{
    std::string name;
    const std::vector<sandpit::parser::Param>* params = nullptr;
    const sandpit::parser::Block* body = nullptr;
    const sandpit::parser::Expr* lambda_body = nullptr;
    std::vector<std::optional<Value>> defaults;
    std::shared_ptr<Scope> closure;
    const LocalInfo* locals = nullptr;
};

/** @brief Method looked up on a builtin value, e.g. `items.append`. */
struct BoundMethodObject
{
    Value self;
    std::string name;
};

/** @brief One-shot iterator over precomputed items (enumerate, generator expressions). */
struct IteratorObject
{
    std::vector<Value> items;
    std::size_t pos = 0;
    std::string_view type_name = "iterator";
    ~IteratorObject();
};

/**
 * @brief Drop `values`, destroying nested containers from a per-thread worklist.
 *
 * Re-entrant calls made while the worklist drains only enqueue.
 */
void release_values(std::vector<Value>& values);

/** @brief Nesting limit used when no RecursionLimit is installed. */
inline constexpr std::size_t kDefaultRecursionLimit = 1000;

/**
 * @brief One level of script recursion on the current thread.
 *
 * Function calls and container traversals (`==`, `<`, `repr`, `hash`) share the count, and
 * the guard raises RecursionError once it reaches the installed limit.
 */
class RecursionGuard
{
  public:
    explicit RecursionGuard(std::string_view context = {});
    ~RecursionGuard();
    RecursionGuard(const RecursionGuard&) = delete;
    RecursionGuard& operator=(const RecursionGuard&) = delete;
};

/** @brief Installs the recursion limit for the current thread while in scope. */
class RecursionLimit
{
  public:
    explicit RecursionLimit(std::size_t limit);
    ~RecursionLimit();
    RecursionLimit(const RecursionLimit&) = delete;
    RecursionLimit& operator=(const RecursionLimit&) = delete;

  private:
    std::size_t saved_;
};

/** @brief Upper bound on element counts of sequences built by scripts (MemoryError). */
inline constexpr std::size_t kMaxSequenceLength = 10'000'000;

/** @brief Upper bound on string sizes built by scripts, in bytes (MemoryError). */
inline constexpr std::size_t kMaxStringBytes = 64u * 1024u * 1024u;

/** @brief Raise MemoryError when a sequence would grow beyond kMaxSequenceLength. */
void check_sequence_length(std::size_t length);

/** @brief Raise MemoryError when a string would grow beyond kMaxStringBytes. */
void check_string_length(std::size_t bytes);

/** @brief Python type name: "int", "str", "NoneType", ... */
[[nodiscard]] std::string type_name(const Value& value);

[[nodiscard]] bool truthy(const Value& value);

/** @brief Python `==`: numbers compare across int/float/bool, containers element-wise. */
[[nodiscard]] bool values_equal(const Value& a, const Value& b);

/** @brief Hash consistent with values_equal; raises TypeError for unhashable values. */
[[nodiscard]] std::size_t hash_value(const Value& value);

/** @brief Python `repr()`. */
[[nodiscard]] std::string repr(const Value& value);

/** @brief Python `str()`. */
[[nodiscard]] std::string to_str(const Value& value);

/** @brief Python's shortest round-trip float repr ("0.1", "1e+16", "inf"). */
[[nodiscard]] std::string format_float(double value);

/** @brief Python repr of a string, choosing quotes like CPython. */
[[nodiscard]] std::string quote_string(std::string_view text);

} // namespace sandpit::runtime
