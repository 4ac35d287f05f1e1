#pragma once

#include <string>
#include <string_view>

#include "rawpath/rawpath.hpp"

namespace rawpath {
namespace detail {

// Runs the '@name[:arg]' at the start of path over json. rest receives the
// path after the invocation. Returns false when modifiers are disabled.
bool exec_modifier(std::string_view json, std::string_view path, const Options& options,
                   std::string_view* rest, std::string* out);

}  // namespace detail
}  // namespace rawpath
