#pragma once

#include <optional>
#include <sandpit/source/span.h>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @file error.h
 * @brief Script-level exceptions raised while interpreting (ZeroDivisionError, TypeError, ...).
 *
 * ScriptError never escapes the runtime: `run_program` converts it into a RunResult.
 */

namespace sandpit::runtime
{

class ScriptError : public std::runtime_error
{
  public:
    ScriptError(std::string type, std::string message)
        : std::runtime_error(type + ": " + message), type_(std::move(type)),
          message_(std::move(message))
    {
    }

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /** @brief Location of the statement that raised, filled in while unwinding. */
    std::optional<sandpit::source::Span> span;

  private:
    std::string type_;
    std::string message_;
};

[[noreturn]] inline void raise(std::string type, std::string message)
{
    throw ScriptError(std::move(type), std::move(message));
}

[[noreturn]] inline void type_error(std::string message)
{
    raise("TypeError", std::move(message));
}

[[noreturn]] inline void value_error(std::string message)
{
    raise("ValueError", std::move(message));
}

} // namespace sandpit::runtime
