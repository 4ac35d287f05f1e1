#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "rawpath/json.hpp"
#include "rawpath/modifier.hpp"
#include "rawpath/pretty.hpp"
#include "rawpath/value.hpp"

namespace rawpath {

struct Options {
  // nullptr selects ModifierRegistry::builtins().
  const ModifierRegistry* modifiers = nullptr;
  // When set, '@' has no special meaning and is matched as part of keys.
  bool disable_modifiers = false;

  const ModifierRegistry& registry() const {
    return modifiers ? *modifiers : ModifierRegistry::builtins();
  }
};

// Searches json for path. Never throws for malformed input; a failed lookup
// returns a Value for which exists() is false.
//
//   {"name":{"first":"Tom"},"children":["Sara","Alex"],"friends":[{"age":44},{"age":68}]}
//   "name.first"            >> "Tom"
//   "children.#"            >> 2
//   "children.1"            >> "Alex"
//   "friends.#.age"         >> [44,68]
//   "friends.#(age>50).age" >> 68
//   "children|@reverse"     >> ["Alex","Sara"]
Value get(std::string_view json, std::string_view path, const Options& options = Options{});

std::vector<Value> get_many(std::string_view json, const std::vector<std::string_view>& paths,
                            const Options& options = Options{});

// The first top-level value of json.
Value parse(std::string_view json);

bool is_valid(std::string_view json);

// Feeds each top-level value of a JSON Lines document to fn until fn returns
// false or the input is exhausted.
void for_each_line(std::string_view json, const std::function<bool(const Value&)>& fn);

std::string path(const Value& value, std::string_view document);

std::vector<std::string> paths(const Value& value, std::string_view document);

// Backslash-escapes characters that are not safe in a bare path segment.
std::string escape_path_component(std::string_view component);

// Encodes text as a JSON string literal.
std::string quote(std::string_view text);

}  // namespace rawpath
