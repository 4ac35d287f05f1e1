#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rawpath/rawpath.hpp"

namespace rawpath {
namespace detail {

struct SubSelector {
  std::string_view name;
  std::string_view path;
};

// Splits a '[p1,p2]' or '{"n1":p1,n2:p2}' selection. path[0] is the opening
// bracket; rest receives the text after the closing one.
bool parse_sub_selectors(std::string_view path, std::vector<SubSelector>* selectors, std::string_view* rest);

// Evaluates each selector against json and assembles the array or object
// named by kind ('[' or '{').
Value build_selection(std::string_view json, const Storage& storage, char kind,
                      const std::vector<SubSelector>& selectors, const Options& options);

// Reads the '!literal' at the start of path.
bool exec_literal(std::string_view path, std::string_view* rest, std::string* out);

}  // namespace detail
}  // namespace rawpath
