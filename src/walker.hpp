#pragma once

#include <string_view>

#include "rawpath/rawpath.hpp"

namespace rawpath {
namespace detail {

// Evaluates path against json. storage owns json when json is synthesized and
// is attached to every Value that borrows from it.
Value walk(std::string_view json, std::string_view path, const Options& options, const Storage& storage);

// First top-level value of json.
Value parse_value(std::string_view json, const Storage& storage);

// True when s (the text after a '.') starts a component that is applied to
// the value found so far: a registered '@modifier' or a '['/'{' selector.
bool is_dot_piper(std::string_view s, const Options& options);

// Splits path at the first '|' that is not inside a query or escaped.
bool split_possible_pipe(std::string_view path, std::string_view* left, std::string_view* right);

}  // namespace detail
}  // namespace rawpath
