#pragma once

#include <cstdint>
#include <functional>
#include <sandpit/parser/ast.h>
#include <sandpit/runtime/value.h>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file operations.h
 * @brief Python operator semantics over runtime values.
 *
 * Every function raises ScriptError (TypeError, ZeroDivisionError, OverflowError, ...) the way
 * the corresponding Python operation would.
 */

namespace sandpit::runtime
{

/** @brief Evaluated bounds of `a[lower:upper:step]`; absent bounds are None. */
struct SliceValue
{
    Value lower;
    Value upper;
    Value step;
};

/** @brief Concrete slice positions after clamping to a sequence length. */
struct SliceIndices
{
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;
    std::int64_t count = 0;
};

[[nodiscard]] SliceIndices adjust_slice(const SliceValue& slice, std::int64_t length);

[[nodiscard]] Value binary_op(sandpit::parser::BinaryOp op, const Value& lhs, const Value& rhs);
[[nodiscard]] Value unary_op(sandpit::parser::UnaryOp op, const Value& operand);
[[nodiscard]] bool compare(sandpit::parser::CompareOp op, const Value& lhs, const Value& rhs);

/** @brief Strict weak ordering used by sort, min and max (`lhs < rhs`). */
[[nodiscard]] bool less_than(const Value& lhs, const Value& rhs);

/** @brief Python `item in container`. */
[[nodiscard]] bool contains(const Value& container, const Value& item);

[[nodiscard]] Value get_item(const Value& base, const Value& index);
[[nodiscard]] Value get_slice(const Value& base, const SliceValue& slice);
void set_item(const Value& base, const Value& index, Value value);
void set_slice(const Value& base, const SliceValue& slice, const Value& iterable);
void del_item(const Value& base, const Value& index);
void del_slice(const Value& base, const SliceValue& slice);

/** @brief Python `len()`; raises TypeError for values without a length. */
[[nodiscard]] std::int64_t length_of(const Value& value);

/**
 * @brief Visit the items of an iterable in order until `fn` returns false.
 *
 * Lists are walked by index so appends during iteration are seen, as in Python.
 */
void for_each(const Value& iterable, const std::function<bool(const Value&)>& fn);

/** @brief Materialize an iterable into a vector (bounded by kMaxSequenceLength). */
[[nodiscard]] std::vector<Value> to_vector(const Value& iterable);

/** @brief `dict.update(source)` for a dict or an iterable of key/value pairs. */
void dict_update(OrderedTable& table, const Value& source);

/** @brief Integer value of an index operand; TypeError naming `what` otherwise. */
[[nodiscard]] std::int64_t to_index(const Value& value, std::string_view what);

/** @brief Apply a format spec (`format(value, spec)`, f-string `{value:spec}`). */
[[nodiscard]] std::string format_value(const Value& value, std::string_view spec);

/** @brief printf-style `text % args`. */
[[nodiscard]] std::string percent_format(std::string_view text, const Value& args);

/** @brief Checked 64-bit arithmetic; raises OverflowError. */
[[nodiscard]] std::int64_t checked_add(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_sub(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_mul(std::int64_t a, std::int64_t b);

} // namespace sandpit::runtime
