#pragma once

#include <cstddef>
#include <optional>
#include <sandpit/runtime/value.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file call.h
 * @brief Calling convention shared by builtins, methods and the interpreter.
 */

namespace sandpit::runtime
{

/** @brief Evaluated call arguments: positionals in order plus `name=value` keywords. */
struct CallArgs
{
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;
};

/**
 * @brief What a builtin may ask of the running interpreter.
 *
 * Calling back into script code (sort keys, min/max keys) and writing captured output are the
 * only services offered; there is deliberately nothing that reaches the host.
 */
class CallContext
{
  public:
    virtual ~CallContext() = default;

    /** @brief Call any callable value. */
    virtual Value call(const Value& callee, CallArgs args) = 0;

    /** @brief Append text to the captured output. */
    virtual void write(std::string_view text) = 0;
};

/** @brief Raise TypeError unless `min <= positional count <= max` and no keywords remain. */
void expect_args(const CallArgs& args, std::string_view fn, std::size_t min, std::size_t max);

/** @brief Raise TypeError when keywords were passed to `fn`. */
void expect_no_keywords(const CallArgs& args, std::string_view fn);

/** @brief Remove and return keyword `name` if present. */
[[nodiscard]] std::optional<Value> take_keyword(CallArgs& args, std::string_view name);

/** @brief Raise TypeError naming the first keyword left in `args`. */
void reject_remaining_keywords(const CallArgs& args, std::string_view fn);

} // namespace sandpit::runtime
