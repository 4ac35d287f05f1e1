#include "rawpath/pretty.hpp"

#include <algorithm>
#include <vector>

#include "rawpath/rawpath.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace {

// Bytes of raw that appear in any single-line rendering of it.
size_t visible_size(std::string_view raw) {
  size_t n = 0;
  for (char c : raw) {
    if (!detail::is_space(c)) {
      ++n;
    }
  }
  return n;
}

struct Member {
  std::string_view key;
  Value value;
};

class Printer {
 public:
  explicit Printer(const PrettyOptions& options) : options_(options) {}

  std::string print(const Value& root) {
    out_ = options_.prefix;
    write(root, 0, options_.prefix.size());
    return std::move(out_);
  }

 private:
  const PrettyOptions& options_;
  std::string out_;

  std::vector<Member> members(const Value& v) const {
    std::vector<Member> out;
    v.for_each([&out](const Value& key, const Value& value) {
      out.push_back(Member{key.raw(), value});
      return true;
    });
    if (options_.sort_keys && v.is_object()) {
      std::stable_sort(out.begin(), out.end(), [](const Member& a, const Member& b) {
        std::string ka = detail::string_payload(a.key);
        std::string kb = detail::string_payload(b.key);
        if (ka != kb) {
          return ka < kb;
        }
        return a.value.raw() < b.value.raw();
      });
    }
    return out;
  }

  // One-line rendering with ", " and ": " separators.
  std::string inline_form(const Value& v) const {
    if (v.kind() != Kind::Composite) {
      return std::string(v.raw());
    }
    bool object = v.is_object();
    std::string line(1, object ? '{' : '[');
    bool first = true;
    for (const auto& m : members(v)) {
      if (!first) {
        line += ", ";
      }
      first = false;
      if (object) {
        line += m.key;
        line += ": ";
      }
      line += inline_form(m.value);
    }
    line.push_back(object ? '}' : ']');
    return line;
  }

  void newline(size_t depth) {
    out_.push_back('\n');
    out_ += options_.prefix;
    for (size_t i = 0; i < depth; ++i) {
      out_ += options_.indent;
    }
  }

  void write(const Value& v, size_t depth, size_t column) {
    if (v.kind() != Kind::Composite) {
      out_ += v.raw();
      return;
    }
    bool object = v.is_object();
    std::vector<Member> list = members(v);
    if (list.empty()) {
      out_ += object ? "{}" : "[]";
      return;
    }
    size_t width = options_.width > 0 ? static_cast<size_t>(options_.width) : 0;
    if (!object && column + visible_size(v.raw()) <= width) {
      std::string line = inline_form(v);
      if (column + line.size() <= width) {
        out_ += line;
        return;
      }
    }
    out_.push_back(object ? '{' : '[');
    size_t inner = options_.prefix.size() + (depth + 1) * options_.indent.size();
    for (size_t i = 0; i < list.size(); ++i) {
      if (i > 0) {
        out_.push_back(',');
      }
      newline(depth + 1);
      size_t col = inner;
      if (object) {
        out_ += list[i].key;
        out_ += ": ";
        col += list[i].key.size() + 2;
      }
      write(list[i].value, depth + 1, col);
    }
    newline(depth);
    out_.push_back(object ? '}' : ']');
  }
};

}  // namespace

std::string pretty(std::string_view json, const PrettyOptions& options) {
  Value root = parse(json);
  if (!root.exists() || detail::exceeds_max_depth(root.raw())) {
    return std::string(json);
  }
  Printer printer(options);
  return printer.print(root);
}

std::string minify(std::string_view json) {
  std::string out;
  out.reserve(json.size());
  for (size_t i = 0; i < json.size(); ++i) {
    char c = json[i];
    if (static_cast<unsigned char>(c) <= ' ') {
      continue;
    }
    out.push_back(c);
    if (c != '"') {
      continue;
    }
    for (++i; i < json.size(); ++i) {
      out.push_back(json[i]);
      if (json[i] == '\\' && i + 1 < json.size()) {
        out.push_back(json[++i]);
      } else if (json[i] == '"') {
        break;
      }
    }
  }
  return out;
}

}  // namespace rawpath
