#include "pipeline.hpp"

#include "builtin_modifiers.hpp"
#include "scanner.hpp"
#include "walker.hpp"

namespace rawpath {
namespace detail {

bool exec_modifier(std::string_view json, std::string_view path, const Options& options,
                   std::string_view* rest, std::string* out) {
  if (options.disable_modifiers) {
    return false;
  }
  std::string_view name = path.substr(1);
  std::string_view after;
  bool has_arg = false;
  for (size_t i = 1; i < path.size(); ++i) {
    if (path[i] == ':') {
      name = path.substr(1, i - 1);
      after = path.substr(i + 1);
      has_arg = !after.empty();
      break;
    }
    if (path[i] == '|' || path[i] == '.') {
      name = path.substr(1, i - 1);
      after = path.substr(i);
      break;
    }
  }
  const ModifierFn* fn = options.registry().find(name);
  if (fn == nullptr) {
    // Unknown names pass the input through.
    *rest = after;
    *out = std::string(json);
    return true;
  }
  std::string_view arg;
  if (has_arg) {
    bool parsed = false;
    char c = after[0];
    if ((c == '{' || c == '[' || c == '"') && parse_value(after, nullptr).exists()) {
      arg = squash(after);
      after.remove_prefix(arg.size());
      parsed = true;
    }
    if (!parsed) {
      size_t i = 0;
      for (; i < after.size(); ++i) {
        c = after[i];
        if (c == '|') {
          break;
        }
        if (c == '{' || c == '[' || c == '"' || c == '(') {
          i += squash(after.substr(i)).size() - 1;
        }
      }
      arg = after.substr(0, i);
      after.remove_prefix(i);
    }
  }
  *rest = after;
  *out = call_modifier(*fn, json, arg, options);
  return true;
}

}  // namespace detail
}  // namespace rawpath
