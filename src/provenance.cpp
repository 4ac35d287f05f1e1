#include <string>
#include <vector>

#include "rawpath/rawpath.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace {

bool is_safe_path_char(unsigned char c) {
  return c <= ' ' || c > '~' || c == '_' || c == '-' || c == ':' ||
         (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// Steps backwards from the value at origin to the document root, collecting
// one raw component (quoted key or index) per enclosing level, innermost
// first. Returns false when origin does not address a member or element.
bool collect_components(std::string_view json, size_t origin, std::vector<std::string>* comps) {
  auto i = static_cast<std::ptrdiff_t>(origin) - 1;
  for (; i >= 0; --i) {
    char c = json[i];
    if (static_cast<unsigned char>(c) <= ' ') {
      continue;
    }
    if (c == ':') {
      while (i >= 0 && json[i] != '"') {
        --i;
      }
      std::string_view key = detail::reverse_squash(json.substr(0, i + 1));
      i -= static_cast<std::ptrdiff_t>(key.size());
      comps->emplace_back(key);
      // Skip the preceding siblings back to the opening brace.
      std::string_view siblings = detail::reverse_squash(json.substr(0, i + 1));
      i -= static_cast<std::ptrdiff_t>(siblings.size());
      ++i;
    } else if (c == ',' || c == '[') {
      size_t index = 0;
      if (c == ',') {
        ++index;
        --i;
      }
      for (; i >= 0; --i) {
        char d = json[i];
        if (d == ':') {
          return false;
        }
        if (d == ',') {
          ++index;
        } else if (d == '[') {
          comps->push_back(std::to_string(index));
          break;
        } else if (d == ']' || d == '}' || d == '"') {
          std::string_view nested = detail::reverse_squash(json.substr(0, i + 1));
          i -= static_cast<std::ptrdiff_t>(nested.size()) - 1;
        }
      }
      if (i < 0) {
        return false;
      }
    } else {
      // An object key, or the tail of an earlier top-level value.
      return false;
    }
  }
  return true;
}

}  // namespace

std::string escape_path_component(std::string_view component) {
  std::string out;
  out.reserve(component.size());
  for (char c : component) {
    if (!is_safe_path_char(static_cast<unsigned char>(c))) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

std::string Value::path(std::string_view document) const {
  if (raw_.empty() || origin_ + raw_.size() > document.size()) {
    return std::string();
  }
  if (document.substr(origin_, raw_.size()) != raw_) {
    return std::string();
  }
  std::vector<std::string> comps;
  if (!collect_components(document, origin_, &comps)) {
    return std::string();
  }
  if (comps.empty()) {
    return "@this";
  }
  std::string out;
  for (auto it = comps.rbegin(); it != comps.rend(); ++it) {
    Value comp = rawpath::parse(*it);
    if (!comp.exists()) {
      return std::string();
    }
    if (!out.empty()) {
      out.push_back('.');
    }
    out += escape_path_component(comp.as_string());
  }
  return out;
}

std::vector<std::string> Value::paths(std::string_view document) const {
  std::vector<std::string> out;
  if (offsets_.empty()) {
    return out;
  }
  for_each([&out, document](const Value&, const Value& element) {
    out.push_back(element.path(document));
    return true;
  });
  if (out.size() != offsets_.size()) {
    out.clear();
  }
  return out;
}

std::string path(const Value& value, std::string_view document) {
  return value.path(document);
}

std::vector<std::string> paths(const Value& value, std::string_view document) {
  return value.paths(document);
}

}  // namespace rawpath
