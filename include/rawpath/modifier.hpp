#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace rawpath {

// (input json, argument text) -> output json. An empty output means "no value".
using ModifierFn = std::function<std::string(std::string_view json, std::string_view arg)>;

// Named transforms reachable from a path with '@name' or '@name:arg'.
//
// A registry is populated once and then only read: lookups from concurrent
// queries are safe, add() must not race with them.
class ModifierRegistry {
 public:
  ModifierRegistry() = default;

  // Shared immutable registry holding the built-in modifiers.
  static const ModifierRegistry& builtins();

  // Extendable copy of the built-in registry.
  static ModifierRegistry with_builtins();

  // Binds name to fn, replacing any previous binding. Throws
  // std::invalid_argument for an empty name or function.
  void add(std::string name, ModifierFn fn);

  bool exists(std::string_view name) const;

  const ModifierFn* find(std::string_view name) const;

  size_t size() const { return fns_.size(); }

 private:
  std::map<std::string, ModifierFn, std::less<>> fns_;
};

}  // namespace rawpath
