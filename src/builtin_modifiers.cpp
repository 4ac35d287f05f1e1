#include "builtin_modifiers.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "rawpath/rawpath.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace detail {
namespace {

// Strips the brackets around a composite.
std::string_view unwrap(std::string_view json) {
  json = trim(json);
  if (json.size() >= 2 && (json[0] == '[' || json[0] == '{')) {
    json = json.substr(1, json.size() - 2);
  }
  return json;
}

std::string keep_whitespace(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (is_space(c)) {
      out.push_back(c);
    }
  }
  return out;
}

// Value of the named member of an argument object, or a non-existent Value.
Value arg_member(std::string_view arg, std::string_view name) {
  Value found;
  parse(arg).for_each([&](const Value& key, const Value& value) {
    if (key.as_string() == name) {
      found = value;
      return false;
    }
    return true;
  });
  return found;
}

bool arg_flag(std::string_view arg, std::string_view name) {
  return !arg.empty() && arg_member(arg, name).as_bool();
}

std::string mod_this(std::string_view json, std::string_view) {
  return std::string(json);
}

std::string mod_pretty(std::string_view json, std::string_view arg) {
  PrettyOptions options;
  if (!arg.empty()) {
    parse(arg).for_each([&options](const Value& key, const Value& value) {
      std::string name = key.as_string();
      if (name == "sortKeys" || name == "sort_keys") {
        options.sort_keys = value.as_bool();
      } else if (name == "indent") {
        options.indent = keep_whitespace(value.as_string());
      } else if (name == "prefix") {
        options.prefix = keep_whitespace(value.as_string());
      } else if (name == "width") {
        options.width = static_cast<int>(value.as_int());
      }
      return true;
    });
  }
  return pretty(json, options);
}

std::string mod_minify(std::string_view json, std::string_view) {
  return minify(json);
}

std::string mod_reverse(std::string_view json, std::string_view) {
  Value res = parse(json);
  if (!res.is_array() && !res.is_object()) {
    return std::string(json);
  }
  bool object = res.is_object();
  std::vector<std::pair<std::string_view, std::string_view>> members;
  res.for_each([&members](const Value& key, const Value& value) {
    members.emplace_back(key.raw(), value.raw());
    return true;
  });
  std::string out(1, object ? '{' : '[');
  for (auto it = members.rbegin(); it != members.rend(); ++it) {
    if (it != members.rbegin()) {
      out.push_back(',');
    }
    if (object) {
      out += it->first;
      out.push_back(':');
    }
    out += it->second;
  }
  out.push_back(object ? '}' : ']');
  return out;
}

std::string flatten(const Value& res, bool deep) {
  std::string out = "[";
  bool first = true;
  res.for_each([&](const Value&, const Value& value) {
    std::string raw;
    if (value.is_array()) {
      raw = deep ? std::string(unwrap(flatten(value, deep))) : std::string(unwrap(value.raw()));
    } else {
      raw = std::string(value.raw());
    }
    raw = std::string(trim(raw));
    if (!raw.empty()) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out += raw;
    }
    return true;
  });
  out.push_back(']');
  return out;
}

std::string mod_flatten(std::string_view json, std::string_view arg) {
  Value res = parse(json);
  if (!res.is_array()) {
    return std::string(json);
  }
  bool deep = arg_flag(arg, "deep");
  if (deep && exceeds_max_depth(res.raw())) {
    return std::string(json);
  }
  return flatten(res, deep);
}

std::string mod_keys(std::string_view json, std::string_view) {
  Value v = parse(json);
  if (!v.exists()) {
    return "[]";
  }
  bool object = v.is_object();
  std::string out = "[";
  bool first = true;
  v.for_each([&](const Value& key, const Value&) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += object ? key.raw() : std::string_view("null");
    return true;
  });
  out.push_back(']');
  return out;
}

std::string mod_values(std::string_view json, std::string_view) {
  Value v = parse(json);
  if (!v.exists()) {
    return "[]";
  }
  if (v.is_array()) {
    return std::string(json);
  }
  std::string out = "[";
  bool first = true;
  v.for_each([&](const Value&, const Value& value) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += value.raw();
    return true;
  });
  out.push_back(']');
  return out;
}

std::string mod_join(std::string_view json, std::string_view arg) {
  Value res = parse(json);
  if (!res.is_array()) {
    return std::string(json);
  }
  std::string out = "{";
  if (arg_flag(arg, "preserve")) {
    bool first = true;
    res.for_each([&](const Value&, const Value& value) {
      if (!value.is_object()) {
        return true;
      }
      std::string_view body = unwrap(value.raw());
      if (trim(body).empty()) {
        return true;
      }
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out += body;
      return true;
    });
  } else {
    // First-seen key order, last value wins.
    std::vector<std::pair<std::string, std::pair<std::string_view, std::string_view>>> members;
    res.for_each([&](const Value&, const Value& object) {
      if (!object.is_object()) {
        return true;
      }
      object.for_each([&](const Value& key, const Value& value) {
        std::string name = key.as_string();
        auto it = std::find_if(members.begin(), members.end(), [&name](const auto& m) {
          return m.first == name;
        });
        if (it == members.end()) {
          members.emplace_back(std::move(name), std::make_pair(key.raw(), value.raw()));
        } else {
          it->second.second = value.raw();
        }
        return true;
      });
      return true;
    });
    for (size_t i = 0; i < members.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      out += members[i].second.first;
      out.push_back(':');
      out += members[i].second.second;
    }
  }
  out.push_back('}');
  return out;
}

std::string mod_valid(std::string_view json, std::string_view) {
  if (!is_valid(json)) {
    return std::string();
  }
  return std::string(json);
}

std::string mod_fromstr(std::string_view json, std::string_view) {
  if (!is_valid(json)) {
    return std::string();
  }
  return parse(json).as_string();
}

std::string mod_tostr(std::string_view json, std::string_view) {
  return quote(json);
}

std::string mod_group(std::string_view json, std::string_view) {
  Value res = parse(json);
  if (!res.is_object()) {
    return std::string();
  }
  std::vector<std::string> rows;
  size_t shortest = std::string::npos;
  res.for_each([&rows, &shortest](const Value& key, const Value& column) {
    if (!column.is_array()) {
      return true;
    }
    size_t idx = 0;
    column.for_each([&](const Value&, const Value& cell) {
      if (idx == rows.size()) {
        rows.emplace_back();
      }
      std::string& row = rows[idx++];
      row.push_back(',');
      row += key.raw();
      row.push_back(':');
      row += cell.raw();
      return true;
    });
    shortest = std::min(shortest, idx);
    return true;
  });
  // Rows past the shortest column would be incomplete.
  if (shortest != std::string::npos && rows.size() > shortest) {
    rows.resize(shortest);
  }
  std::string out = "[";
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out.push_back('{');
    out.append(rows[i], 1, std::string::npos);
    out.push_back('}');
  }
  out.push_back(']');
  return out;
}

void dig(std::vector<Value>& found, const Value& parent, std::string_view path, const Options& options) {
  Value res = parent.get(path, options);
  if (res.exists()) {
    found.push_back(res);
  }
  if (parent.kind() == Kind::Composite) {
    parent.for_each([&](const Value&, const Value& child) {
      dig(found, child, path, options);
      return true;
    });
  }
}

std::string dig_with(std::string_view json, std::string_view arg, const Options& options) {
  Value root = parse(json);
  if (exceeds_max_depth(root.raw())) {
    return std::string();
  }
  std::vector<Value> found;
  dig(found, root, arg, options);
  std::string out = "[";
  for (size_t i = 0; i < found.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += found[i].raw().empty() ? found[i].as_string() : std::string(found[i].raw());
  }
  out.push_back(']');
  return out;
}

std::string search_with(std::string_view json, std::string_view arg, const Options& options) {
  Value res = get(json, arg, options);
  if (!res.exists()) {
    return std::string();
  }
  return res.raw().empty() ? res.as_string() : std::string(res.raw());
}

// Registered forms of the path-evaluating built-ins. call_modifier swaps in
// the caller's options when it sees these.
std::string mod_dig(std::string_view json, std::string_view arg) {
  return dig_with(json, arg, Options{});
}

std::string mod_search(std::string_view json, std::string_view arg) {
  return search_with(json, arg, Options{});
}

// Applies fn to the payload of a string input and re-encodes the result.
// Other inputs pass through unchanged.
template <typename Fn>
std::string on_string(std::string_view json, Fn fn) {
  Value v = parse(json);
  if (v.kind() != Kind::String) {
    return std::string(json);
  }
  return quote(fn(v.as_string()));
}

std::string mod_uppercase(std::string_view json, std::string_view) {
  return on_string(json, [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    return s;
  });
}

std::string mod_lowercase(std::string_view json, std::string_view) {
  return on_string(json, [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return s;
  });
}

// Reverses by UTF-8 sequence so multibyte characters stay intact.
std::string mod_flip(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    std::vector<std::string_view> runes;
    std::string_view view = s;
    for (size_t i = 0; i < view.size();) {
      size_t n = 1;
      while (i + n < view.size() && (static_cast<unsigned char>(view[i + n]) & 0xC0) == 0x80) {
        ++n;
      }
      runes.push_back(view.substr(i, n));
      i += n;
    }
    std::string out;
    out.reserve(s.size());
    for (auto it = runes.rbegin(); it != runes.rend(); ++it) {
      out += *it;
    }
    return out;
  });
}

std::string mod_trim(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    return std::string(trim(s));
  });
}

// Splits an identifier into words at separators and lower-to-upper case
// boundaries.
std::vector<std::string> words_of(const std::string& s) {
  std::vector<std::string> words;
  std::string word;
  for (size_t i = 0; i < s.size(); ++i) {
    auto c = static_cast<unsigned char>(s[i]);
    if (!std::isalnum(c)) {
      if (!word.empty()) {
        words.push_back(std::move(word));
        word.clear();
      }
      continue;
    }
    if (std::isupper(c) && !word.empty() &&
        (std::islower(static_cast<unsigned char>(s[i - 1])) ||
         (i + 1 < s.size() && std::islower(static_cast<unsigned char>(s[i + 1]))))) {
      words.push_back(std::move(word));
      word.clear();
    }
    word.push_back(static_cast<char>(std::tolower(c)));
  }
  if (!word.empty()) {
    words.push_back(std::move(word));
  }
  return words;
}

std::string join_words(const std::vector<std::string>& words, char sep) {
  std::string out;
  for (const auto& w : words) {
    if (!out.empty()) {
      out.push_back(sep);
    }
    out += w;
  }
  return out;
}

std::string mod_snakecase(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    return join_words(words_of(s), '_');
  });
}

std::string mod_kebabcase(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    return join_words(words_of(s), '-');
  });
}

std::string mod_camelcase(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    std::string out;
    for (auto w : words_of(s)) {
      if (!out.empty()) {
        w[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(w[0])));
      }
      out += w;
    }
    return out;
  });
}

std::string replace_text(const std::string& s, std::string_view arg, bool all) {
  Value target = arg_member(arg, "target");
  if (target.kind() != Kind::String) {
    return s;
  }
  std::string from = target.as_string();
  std::string to = arg_member(arg, "replacement").as_string();
  if (from.empty()) {
    return s;
  }
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t hit = s.find(from, pos);
    if (hit == std::string::npos) {
      break;
    }
    out.append(s, pos, hit - pos);
    out += to;
    pos = hit + from.size();
    if (!all) {
      break;
    }
  }
  out.append(s, pos, std::string::npos);
  return out;
}

std::string mod_replace(std::string_view json, std::string_view arg) {
  return on_string(json, [arg](const std::string& s) {
    return replace_text(s, arg, false);
  });
}

std::string mod_replace_all(std::string_view json, std::string_view arg) {
  return on_string(json, [arg](const std::string& s) {
    return replace_text(s, arg, true);
  });
}

std::string mod_hex(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() * 2);
    for (unsigned char c : s) {
      out.push_back(digits[c >> 4]);
      out.push_back(digits[c & 0xF]);
    }
    return out;
  });
}

std::string mod_bin(std::string_view json, std::string_view) {
  return on_string(json, [](const std::string& s) {
    std::string out;
    out.reserve(s.size() * 8);
    for (unsigned char c : s) {
      for (int bit = 7; bit >= 0; --bit) {
        out.push_back((c >> bit) & 1 ? '1' : '0');
      }
    }
    return out;
  });
}

std::string mod_insert_at(std::string_view json, std::string_view arg) {
  return on_string(json, [arg](std::string s) {
    int64_t index = arg_member(arg, "index").as_int();
    std::string text = arg_member(arg, "insert").as_string();
    size_t at = index < 0 ? 0 : std::min(static_cast<size_t>(index), s.size());
    s.insert(at, text);
    return s;
  });
}

std::string mod_wc(std::string_view json, std::string_view) {
  Value v = parse(json);
  if (v.kind() != Kind::String) {
    return std::string(json);
  }
  std::string s = v.as_string();
  size_t count = 0;
  bool in_word = false;
  for (unsigned char c : s) {
    if (std::isspace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return std::to_string(count);
}

std::string pad(std::string_view json, std::string_view arg, bool left) {
  return on_string(json, [arg, left](std::string s) {
    Value padding = arg_member(arg, "padding");
    std::string fill = padding.exists() ? padding.as_string() : std::string(" ");
    int64_t length = arg_member(arg, "length").as_int();
    if (fill.empty() || length <= 0 || s.size() >= static_cast<size_t>(length)) {
      return s;
    }
    size_t need = static_cast<size_t>(length) - s.size();
    std::string run;
    while (run.size() < need) {
      run += fill;
    }
    run.resize(need);
    return left ? run + s : s + run;
  });
}

std::string mod_pad_left(std::string_view json, std::string_view arg) {
  return pad(json, arg, true);
}

std::string mod_pad_right(std::string_view json, std::string_view arg) {
  return pad(json, arg, false);
}

}  // namespace

std::string call_modifier(const ModifierFn& fn, std::string_view json, std::string_view arg,
                          const Options& options) {
  using PlainFn = std::string (*)(std::string_view, std::string_view);
  if (const PlainFn* target = fn.target<PlainFn>()) {
    if (*target == &mod_search) {
      return search_with(json, arg, options);
    }
    if (*target == &mod_dig) {
      return dig_with(json, arg, options);
    }
  }
  return fn(json, arg);
}

void add_builtin_modifiers(ModifierRegistry& registry) {
  registry.add("this", mod_this);
  registry.add("pretty", mod_pretty);
  registry.add("minify", mod_minify);
  registry.add("ugly", mod_minify);
  registry.add("reverse", mod_reverse);
  registry.add("flatten", mod_flatten);
  registry.add("join", mod_join);
  registry.add("keys", mod_keys);
  registry.add("values", mod_values);
  registry.add("valid", mod_valid);
  registry.add("tostr", mod_tostr);
  registry.add("fromstr", mod_fromstr);
  registry.add("group", mod_group);
  registry.add("dig", mod_dig);
  registry.add("search", mod_search);
  registry.add("uppercase", mod_uppercase);
  registry.add("lowercase", mod_lowercase);
  registry.add("flip", mod_flip);
  registry.add("trim", mod_trim);
  registry.add("snakecase", mod_snakecase);
  registry.add("camelcase", mod_camelcase);
  registry.add("kebabcase", mod_kebabcase);
  registry.add("replace", mod_replace);
  registry.add("replaceAll", mod_replace_all);
  registry.add("hex", mod_hex);
  registry.add("bin", mod_bin);
  registry.add("insertAt", mod_insert_at);
  registry.add("wc", mod_wc);
  registry.add("padLeft", mod_pad_left);
  registry.add("padRight", mod_pad_right);
}

}  // namespace detail
}  // namespace rawpath
