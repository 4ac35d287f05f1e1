#include "selector.hpp"

#include <initializer_list>
#include <string>

#include "scanner.hpp"
#include "walker.hpp"

namespace rawpath {
namespace detail {
namespace {

// Last '.' or '|' separated component of path.
std::string_view name_of_last(std::string_view path) {
  for (size_t i = path.size(); i-- > 0;) {
    if ((path[i] == '|' || path[i] == '.') && !(i > 0 && path[i - 1] == '\\')) {
      return path.substr(i + 1);
    }
  }
  return path;
}

bool is_simple_name(std::string_view component) {
  for (char c : component) {
    if (c < ' ') {
      return false;
    }
    switch (c) {
      case '[': case ']': case '{': case '}': case '(': case ')':
      case '#': case '|': case '!':
        return false;
      default:
        break;
    }
  }
  return true;
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char x = a[i] >= 'A' && a[i] <= 'Z' ? static_cast<char>(a[i] + 32) : a[i];
    if (x != b[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool parse_sub_selectors(std::string_view path, std::vector<SubSelector>* selectors, std::string_view* rest) {
  size_t modifier = 0;
  size_t colon = 0;
  size_t start = 1;
  int depth = 1;
  auto push = [&](size_t i) {
    SubSelector sel;
    if (colon == 0) {
      sel.path = path.substr(start, i - start);
    } else {
      sel.name = path.substr(start, colon - start);
      sel.path = path.substr(colon + 1, i - colon - 1);
    }
    selectors->push_back(sel);
    colon = 0;
    modifier = 0;
    start = i + 1;
  };
  for (size_t i = 1; i < path.size(); ++i) {
    switch (path[i]) {
      case '\\':
        ++i;
        break;
      case '@':
        if (modifier == 0 && (path[i - 1] == '.' || path[i - 1] == '|')) {
          modifier = i;
        }
        break;
      case ':':
        if (modifier == 0 && colon == 0 && depth == 1) {
          colon = i;
        }
        break;
      case ',':
        if (depth == 1) {
          push(i);
        }
        break;
      case '"':
        for (++i; i < path.size(); ++i) {
          if (path[i] == '\\') {
            ++i;
          } else if (path[i] == '"') {
            break;
          }
        }
        break;
      case '[': case '(': case '{':
        ++depth;
        break;
      case ']': case ')': case '}':
        if (--depth == 0) {
          push(i);
          *rest = path.substr(i + 1);
          return true;
        }
        break;
      default:
        break;
    }
  }
  return false;
}

Value build_selection(std::string_view json, const Storage& storage, char kind,
                      const std::vector<SubSelector>& selectors, const Options& options) {
  std::string out(1, kind);
  bool first = true;
  for (const auto& sel : selectors) {
    Value res = walk(json, sel.path, options, storage);
    if (!res.exists()) {
      continue;
    }
    if (!first) {
      out.push_back(',');
    }
    first = false;
    if (kind == '{') {
      if (!sel.name.empty()) {
        if (sel.name[0] == '"' && is_valid(sel.name)) {
          out += sel.name;
        } else {
          append_json_string(out, sel.name);
        }
      } else {
        std::string_view last = name_of_last(sel.path);
        append_json_string(out, is_simple_name(last) ? last : std::string_view("_"));
      }
      out.push_back(':');
    }
    if (res.raw().empty()) {
      std::string text = res.as_string();
      out += text.empty() ? "null" : text;
    } else {
      out += res.raw();
    }
  }
  out.push_back(kind == '[' ? ']' : '}');
  return make_owned(Kind::Composite, std::move(out));
}

bool exec_literal(std::string_view path, std::string_view* rest, std::string* out) {
  std::string_view name = path.substr(1);
  if (!name.empty()) {
    char c = name[0];
    if (c == '{' || c == '[') {
      std::string_view raw;
      scan_squash(name, 0, &raw);
      *out = std::string(raw);
      *rest = name.substr(raw.size());
      return true;
    }
    if (c == '"') {
      std::string_view raw;
      bool escaped = false;
      bool ok = false;
      scan_string(name, 1, &raw, &escaped, &ok);
      if (!ok) {
        return false;
      }
      *out = std::string(raw);
      *rest = name.substr(raw.size());
      return true;
    }
    if (c == '+' || c == '-' || is_digit(c)) {
      // A '.' followed by a digit is a decimal point, any other ends the number.
      size_t i = 1;
      while (i < name.size() && name[i] != '|' &&
             !(name[i] == '.' && !(i + 1 < name.size() && is_digit(name[i + 1])))) {
        ++i;
      }
      *out = std::string(name.substr(0, i));
      *rest = name.substr(i);
      return true;
    }
  }
  size_t end = path.find_first_of(".|", 1);
  if (end == std::string_view::npos) {
    end = path.size();
  }
  name = path.substr(1, end - 1);
  *rest = path.substr(end);
  for (const char* word : {"true", "false", "null"}) {
    if (iequals(name, word)) {
      *out = word;
      return true;
    }
  }
  if (iequals(name, "nan") || iequals(name, "inf")) {
    *out = std::string(name);
    return true;
  }
  return false;
}

}  // namespace detail
}  // namespace rawpath
