#pragma once

#include <cstddef>
#include <sandpit/runtime/call.h>
#include <sandpit/runtime/value.h>
#include <string_view>
#include <vector>

/**
 * @file namespace.h
 * @brief The restricted namespace: the only names a script can reach besides its own.
 *
 * print, range, len, int, float, str, bool, list, dict, set, tuple, enumerate, abs, min, max
 * and sum. None of them touches files, processes, the environment or object internals.
 */

namespace sandpit::runtime
{

using BuiltinFn = Value (*)(CallContext& ctx, CallArgs& args);

/** @brief A primitive reachable by name from scripts. */
struct Builtin
{
    std::string_view name;
    BuiltinFn fn = nullptr;
};

/** @brief Immutable name -> primitive table. */
class RestrictedNamespace
{
  public:
    explicit RestrictedNamespace(std::vector<Builtin> entries);

    /** @brief The primitive bound to `name`, or nullptr. */
    [[nodiscard]] const Builtin* find(std::string_view name) const;

    /** @brief All bound names in sorted order. */
    [[nodiscard]] std::vector<std::string_view> names() const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }

  private:
    std::vector<Builtin> entries_;
};

/** @brief Build a fresh namespace table. */
[[nodiscard]] RestrictedNamespace build_namespace();

/** @brief The process-wide namespace, built once on first use. Read-only and thread-safe. */
[[nodiscard]] const RestrictedNamespace& restricted_namespace();

} // namespace sandpit::runtime
