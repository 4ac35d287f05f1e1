#include "rawpath/modifier.hpp"

#include <stdexcept>

#include "builtin_modifiers.hpp"

namespace rawpath {

const ModifierRegistry& ModifierRegistry::builtins() {
  static const ModifierRegistry registry = [] {
    ModifierRegistry r;
    detail::add_builtin_modifiers(r);
    return r;
  }();
  return registry;
}

ModifierRegistry ModifierRegistry::with_builtins() {
  return builtins();
}

void ModifierRegistry::add(std::string name, ModifierFn fn) {
  if (name.empty()) {
    throw std::invalid_argument("modifier name must not be empty");
  }
  if (!fn) {
    throw std::invalid_argument("modifier '" + name + "' has no function");
  }
  fns_[std::move(name)] = std::move(fn);
}

bool ModifierRegistry::exists(std::string_view name) const {
  return fns_.find(name) != fns_.end();
}

const ModifierFn* ModifierRegistry::find(std::string_view name) const {
  auto it = fns_.find(name);
  if (it == fns_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace rawpath
