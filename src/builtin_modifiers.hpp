#pragma once

#include <string>
#include <string_view>

#include "rawpath/rawpath.hpp"

namespace rawpath {
namespace detail {

void add_builtin_modifiers(ModifierRegistry& registry);

// Invokes fn. The built-in @search and @dig evaluate their argument path with
// options instead of the defaults.
std::string call_modifier(const ModifierFn& fn, std::string_view json, std::string_view arg,
                          const Options& options);

}  // namespace detail
}  // namespace rawpath
