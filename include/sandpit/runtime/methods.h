#pragma once

#include <sandpit/runtime/call.h>
#include <sandpit/runtime/value.h>
#include <string_view>

/**
 * @file methods.h
 * @brief Methods of the builtin types (str, list, tuple, dict, set).
 *
 * Attribute access on script values resolves only to these methods.
 */

namespace sandpit::runtime
{

/** @brief True when `self` has a method called `name`. */
[[nodiscard]] bool has_method(const Value& self, std::string_view name);

/** @brief Invoke method `name` on `self`. */
Value call_method(CallContext& ctx, const Value& self, std::string_view name, CallArgs& args);

} // namespace sandpit::runtime
