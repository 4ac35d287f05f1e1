#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "rawpath/value.hpp"

namespace rawpath {
namespace detail {

// A '#(path op value)' predicate.
struct Query {
  bool on = false;
  // '#(...)#': collect every match.
  bool all = false;
  std::string_view path;
  std::string_view op;
  std::string value;
};

// Pieces of a predicate: for '#(first=="Murphy").last', path is 'first',
// op is '=', value is '"Murphy"' and remain is '.last'. end is the index one
// past the closing bracket.
struct QuerySplit {
  std::string_view path;
  std::string_view op;
  std::string_view value;
  std::string_view remain;
  size_t end = 0;
  bool escaped = false;
  bool ok = false;
};

QuerySplit split_query(std::string_view query);

bool query_matches(const Query& query, Value value);

}  // namespace detail
}  // namespace rawpath
