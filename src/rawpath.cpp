#include "rawpath/rawpath.hpp"

#include "scanner.hpp"
#include "walker.hpp"

namespace rawpath {

Value get(std::string_view json, std::string_view path, const Options& options) {
  return detail::walk(json, path, options, nullptr);
}

std::vector<Value> get_many(std::string_view json, const std::vector<std::string_view>& paths,
                            const Options& options) {
  std::vector<Value> out;
  out.reserve(paths.size());
  for (auto path : paths) {
    out.push_back(get(json, path, options));
  }
  return out;
}

Value parse(std::string_view json) {
  return detail::parse_value(json, nullptr);
}

void for_each_line(std::string_view json, const std::function<bool(const Value&)>& fn) {
  size_t i = 0;
  while (i < json.size()) {
    detail::Token tok = detail::scan_value(json, i);
    if (!tok.ok) {
      return;
    }
    Value line = detail::make_value(tok, nullptr);
    detail::ValueAccess::origin(line) = detail::offset_of(json, tok.raw);
    i = tok.next;
    if (!fn(line)) {
      return;
    }
  }
}

std::string quote(std::string_view text) {
  std::string out;
  detail::append_json_string(out, text);
  return out;
}

}  // namespace rawpath
