#pragma once

#include <cstddef>
#include <optional>
#include <sandpit/parser/ast.h>
#include <string>
#include <string_view>

/**
 * @file interpreter.h
 * @brief Tree-walking evaluator for parsed scripts.
 *
 * A run starts with empty globals; the only other names reachable are those of the restricted
 * namespace. Output written by `print` is captured in a bounded buffer and returned in the
 * RunResult, together with the script error (if any) that ended the run.
 */

namespace sandpit::runtime
{

/** @brief Appended to captured output when the output cap was hit. */
inline constexpr std::string_view kTruncationMarker = "\n[output truncated]\n";

struct RunOptions
{
    std::size_t max_output_bytes = 65536;
    std::size_t max_call_depth = 1000;
};

/**
 * @brief Byte-capped output sink.
 *
 * Text past the cap is dropped; the kept prefix never ends inside a UTF-8 sequence.
 */
class OutputBuffer
{
  public:
    explicit OutputBuffer(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    void append(std::string_view text);

    [[nodiscard]] bool truncated() const { return truncated_; }

    /** @brief Captured text, with kTruncationMarker appended when truncated. */
    [[nodiscard]] std::string finish() const;

  private:
    std::size_t max_bytes_;
    std::string text_;
    bool truncated_ = false;
};

struct RunResult
{
    bool ok = true;
    std::string output;
    bool truncated = false;
    std::string error_type;
    std::string error_message;
    std::optional<std::size_t> error_line;

    /** @brief "ZeroDivisionError: division by zero (line 3)"; empty when ok. */
    [[nodiscard]] std::string error_text() const;
};

/** @brief Run a parsed program; `source` is only used to map error spans to lines. */
[[nodiscard]] RunResult run_program(const sandpit::parser::Program& program,
                                    std::string_view source, const RunOptions& options);

/** @brief Parse and run `source`; a syntax error becomes a failed RunResult (SyntaxError). */
[[nodiscard]] RunResult run_source(std::string_view source, const RunOptions& options = {});

} // namespace sandpit::runtime
