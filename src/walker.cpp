#include "walker.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "match.hpp"
#include "pipeline.hpp"
#include "query.hpp"
#include "scanner.hpp"
#include "selector.hpp"

namespace rawpath {
namespace detail {
namespace {

struct Walker {
  std::string_view json;
  const Options& options;
  const Storage& storage;
  Value value;
  std::string_view pipe;
  bool piped = false;
  // value holds a computed count rather than a span of json.
  bool calc = false;
};

// One object key segment.
struct KeySegment {
  std::string part;
  std::string_view path;
  std::string_view pipe;
  bool piped = false;
  bool wild = false;
  bool more = false;
  // Unescaped '#': member count.
  bool count = false;
};

// One array segment.
struct IndexSegment {
  std::string_view part;
  std::string_view path;
  std::string_view pipe;
  bool piped = false;
  bool more = false;
  // Part starts with '#'.
  bool arch = false;
  // '#.rest' broadcast.
  bool broadcast = false;
  std::string_view broadcast_path;
  Query query;
};

using Step = std::pair<size_t, bool>;

Step parse_object(Walker& w, size_t i, std::string_view path);
Step parse_array(Walker& w, size_t i, std::string_view path);

// Ends the current segment at the '.' found at index i of path.
template <typename Segment>
void end_at_dot(Segment& seg, std::string_view path, size_t i, bool allow_pipe, const Options& options) {
  if (allow_pipe && i + 1 < path.size() && is_dot_piper(path.substr(i + 1), options)) {
    seg.pipe = path.substr(i + 1);
    seg.piped = true;
  } else {
    seg.path = path.substr(i + 1);
    seg.more = true;
  }
}

KeySegment parse_key_segment(std::string_view path, const Options& options) {
  KeySegment seg;
  for (size_t i = 0; i < path.size(); ++i) {
    char c = path[i];
    if (c == '|') {
      seg.part = std::string(path.substr(0, i));
      seg.pipe = path.substr(i + 1);
      seg.piped = true;
      seg.count = seg.part == "#";
      return seg;
    }
    if (c == '.') {
      seg.part = std::string(path.substr(0, i));
      end_at_dot(seg, path, i, true, options);
      seg.count = seg.part == "#";
      return seg;
    }
    if (c == '*' || c == '?') {
      seg.wild = true;
      continue;
    }
    if (c == '\\') {
      // Escaped form: the part is rebuilt without the backslashes.
      std::string part(path.substr(0, i));
      ++i;
      if (i < path.size()) {
        part.push_back(path[i]);
        ++i;
        for (; i < path.size(); ++i) {
          c = path[i];
          if (c == '\\') {
            ++i;
            if (i < path.size()) {
              part.push_back(path[i]);
            }
            continue;
          }
          if (c == '.') {
            seg.part = std::move(part);
            end_at_dot(seg, path, i, true, options);
            return seg;
          }
          if (c == '|') {
            seg.part = std::move(part);
            seg.pipe = path.substr(i + 1);
            seg.piped = true;
            return seg;
          }
          if (c == '*' || c == '?') {
            seg.wild = true;
          }
          part.push_back(c);
        }
      }
      seg.part = std::move(part);
      return seg;
    }
  }
  seg.part = std::string(path);
  seg.count = seg.part == "#";
  return seg;
}

std::string unquote_operand(std::string_view value, bool escaped) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
    if (escaped) {
      return unescape(value);
    }
  }
  return std::string(value);
}

IndexSegment parse_index_segment(std::string_view path, const Options& options) {
  IndexSegment seg;
  for (size_t i = 0; i < path.size(); ++i) {
    char c = path[i];
    if (c == '|') {
      seg.part = path.substr(0, i);
      seg.pipe = path.substr(i + 1);
      seg.piped = true;
      return seg;
    }
    if (c == '.') {
      seg.part = path.substr(0, i);
      end_at_dot(seg, path, i, !seg.arch, options);
      return seg;
    }
    if (c != '#') {
      continue;
    }
    seg.arch = true;
    if (i != 0 || path.size() < 2) {
      continue;
    }
    if (path[1] == '.') {
      seg.broadcast = true;
      seg.broadcast_path = path.substr(2);
    } else if (path[1] == '[' || path[1] == '(') {
      seg.query.on = true;
      QuerySplit split = split_query(path);
      if (!split.ok) {
        break;
      }
      seg.query.path = split.path;
      seg.query.op = split.op;
      seg.query.value = unquote_operand(split.value, split.escaped);
      i = split.end - 1;
      if (i + 1 < path.size() && path[i + 1] == '#') {
        seg.query.all = true;
      }
    }
  }
  seg.part = path;
  seg.path = std::string_view();
  return seg;
}

// Walks an object body from i to its closing brace and counts the members.
Step count_members(std::string_view json, size_t i, size_t* count) {
  *count = 0;
  while (i < json.size()) {
    char c = json[i];
    if (c == '}') {
      return {i + 1, true};
    }
    if (c != '"') {
      ++i;
      continue;
    }
    std::string_view key;
    bool escaped = false;
    bool ok = false;
    i = scan_string(json, i + 1, &key, &escaped, &ok);
    if (!ok) {
      break;
    }
    while (i < json.size() && (is_space(json[i]) || json[i] == ':')) {
      ++i;
    }
    Token tok = scan_value(json, i);
    if (!tok.ok) {
      break;
    }
    i = tok.next;
    ++*count;
  }
  return {i, false};
}

Value count_value(size_t n) {
  return make_owned(Kind::Number, std::to_string(n));
}

Step parse_object(Walker& w, size_t i, std::string_view path) {
  KeySegment seg = parse_key_segment(path, w.options);
  if (!seg.more && seg.piped) {
    w.pipe = seg.pipe;
    w.piped = true;
  }
  const std::string_view json = w.json;
  if (seg.count && !seg.more) {
    size_t n = 0;
    Step step = count_members(json, i, &n);
    if (!step.second) {
      return step;
    }
    w.value = count_value(n);
    w.calc = true;
    return step;
  }
  while (i < json.size()) {
    std::string_view key;
    bool key_escaped = false;
    bool ok = false;
    for (; i < json.size(); ++i) {
      if (json[i] == '"') {
        std::string_view raw;
        i = scan_string(json, i + 1, &raw, &key_escaped, &ok);
        key = ok ? raw.substr(1, raw.size() - 2) : raw.substr(1);
        break;
      }
      if (json[i] == '}') {
        return {i + 1, false};
      }
    }
    if (!ok) {
      return {i, false};
    }
    bool match;
    if (seg.wild) {
      match = key_escaped ? match_pattern(unescape(key), seg.part) : match_pattern(key, seg.part);
    } else {
      match = key_escaped ? unescape(key) == seg.part : key == seg.part;
    }
    bool hit = match && !seg.more;
    for (; i < json.size(); ++i) {
      Token tok;
      char c = json[i];
      switch (c) {
        default:
          continue;
        case '{':
        case '[': {
          if (match && !hit) {
            Step step = c == '{' ? parse_object(w, i + 1, seg.path) : parse_array(w, i + 1, seg.path);
            i = step.first;
            if (step.second) {
              return step;
            }
          } else {
            tok = scan_value(json, i);
          }
          break;
        }
        case '"':
          tok = scan_value(json, i);
          if (!tok.ok) {
            return {json.size(), false};
          }
          break;
        case 'n':
        case 't':
        case 'f':
        case '+': case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
        case 'i': case 'I': case 'N':
          tok = scan_value(json, i);
          break;
      }
      if (tok.ok) {
        i = tok.next;
        if (hit) {
          w.value = make_value(tok, w.storage);
          return {i, true};
        }
      }
      break;
    }
  }
  return {i, false};
}

Step parse_array(Walker& w, size_t i, std::string_view path) {
  IndexSegment seg = parse_index_segment(path, w.options);
  int64_t index = -1;
  if (!seg.arch) {
    uint64_t n = 0;
    if (parse_uint(seg.part, &n)) {
      index = static_cast<int64_t>(n);
    }
  }
  if (!seg.more && seg.piped) {
    w.pipe = seg.pipe;
    w.piped = true;
  }
  const std::string_view json = w.json;

  std::string collected;
  std::vector<size_t> collected_offsets;
  std::vector<size_t> starts;

  // Returns true when element settles the result.
  auto test_element = [&](Value element) {
    if (seg.query.all && collected.empty()) {
      collected.push_back('[');
    }
    ValueAccess::origin(element) = offset_of(json, element.raw());
    Value candidate;
    if (element.kind() == Kind::Composite) {
      candidate = element.get(seg.query.path, w.options);
    } else {
      if (!seg.query.path.empty()) {
        return false;
      }
      candidate = element;
    }
    if (!query_matches(seg.query, candidate)) {
      return false;
    }
    Value res = element;
    if (seg.more) {
      std::string_view left;
      std::string_view right;
      if (split_possible_pipe(seg.path, &left, &right)) {
        seg.path = left;
        w.pipe = right;
        w.piped = true;
      }
      res = element.get(seg.path, w.options);
    }
    if (!seg.query.all) {
      w.value = res;
      return true;
    }
    std::string text = res.raw().empty() ? res.as_string() : std::string(res.raw());
    if (!text.empty()) {
      if (collected.size() > 1) {
        collected.push_back(',');
      }
      collected += text;
      collected_offsets.push_back(res.origin());
    }
    return false;
  };

  // '#.rest': evaluates rest against each recorded element start.
  auto broadcast = [&]() {
    std::string_view rest = seg.broadcast_path;
    std::string_view left;
    std::string_view right;
    if (split_possible_pipe(rest, &left, &right)) {
      rest = left;
      w.pipe = right;
      w.piped = true;
    }
    std::string out = "[";
    std::vector<size_t> offsets;
    bool first = true;
    for (size_t start : starts) {
      while (start < json.size() && is_space(json[start])) {
        ++start;
      }
      if (start >= json.size() || json[start] == ']') {
        continue;
      }
      Token tok = scan_value(json, start);
      if (!tok.ok) {
        continue;
      }
      Value element = make_value(tok, w.storage);
      ValueAccess::origin(element) = offset_of(json, tok.raw);
      Value res = element.get(rest, w.options);
      if (!res.exists()) {
        continue;
      }
      if (!first) {
        out.push_back(',');
      }
      first = false;
      if (res.raw().empty()) {
        out += res.as_string();
      } else {
        out += res.raw();
      }
      offsets.push_back(res.origin());
    }
    out.push_back(']');
    w.value = make_owned(Kind::Composite, std::move(out));
    if (!w.storage) {
      ValueAccess::offsets(w.value) = std::move(offsets);
    }
  };

  size_t h = 0;
  bool match = false;
  bool hit = false;
  while (i < json.size() + 1) {
    if (!seg.arch) {
      match = index >= 0 && static_cast<uint64_t>(index) == h;
      hit = match && !seg.more;
    }
    ++h;
    if (seg.broadcast) {
      starts.push_back(i);
    }
    for (;; ++i) {
      if (i > json.size()) {
        break;
      }
      // The end of input closes a JSON Lines document.
      char c = i == json.size() ? ']' : json[i];
      Token tok;
      switch (c) {
        default:
          continue;
        case ']':
          if (seg.arch && seg.part == "#") {
            if (seg.broadcast) {
              broadcast();
            } else {
              w.value = count_value(h - 1);
              w.calc = true;
            }
            return {i + 1, true};
          }
          if (!w.value.exists()) {
            if (!collected.empty()) {
              collected.push_back(']');
              w.value = make_owned(Kind::Composite, std::move(collected));
              if (!w.storage) {
                ValueAccess::offsets(w.value) = std::move(collected_offsets);
              }
            } else if (seg.query.all) {
              w.value = make_owned(Kind::Composite, "[]");
            }
          }
          return {i + 1, false};
        case '{':
        case '[': {
          if (match && !hit) {
            Step step = c == '{' ? parse_object(w, i + 1, seg.path) : parse_array(w, i + 1, seg.path);
            i = step.first;
            if (step.second) {
              return step;
            }
          } else {
            tok = scan_value(json, i);
          }
          break;
        }
        case '"':
          tok = scan_value(json, i);
          if (!tok.ok) {
            return {json.size(), false};
          }
          break;
        case 'n':
        case 't':
        case 'f':
        case '+': case '-':
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
        case 'i': case 'I': case 'N':
          tok = scan_value(json, i);
          break;
      }
      if (tok.ok) {
        i = tok.next;
        if (seg.query.on) {
          if (test_element(make_value(tok, w.storage))) {
            return {i, true};
          }
        } else if (hit && !seg.broadcast) {
          w.value = make_value(tok, w.storage);
          return {i, true};
        }
      }
      break;
    }
  }
  return {i, false};
}

}  // namespace

bool is_dot_piper(std::string_view s, const Options& options) {
  if (options.disable_modifiers || s.empty()) {
    return false;
  }
  char c = s[0];
  if (c == '@') {
    size_t i = 1;
    while (i < s.size() && s[i] != '.' && s[i] != '|' && s[i] != ':') {
      ++i;
    }
    return options.registry().exists(s.substr(1, i - 1));
  }
  return c == '[' || c == '{';
}

bool split_possible_pipe(std::string_view path, std::string_view* left, std::string_view* right) {
  if (path.find('|') == std::string_view::npos) {
    return false;
  }
  if (path[0] == '{') {
    std::string_view sel;
    size_t end = scan_squash(path, 0, &sel);
    if (end < path.size() && path[end] == '|') {
      *left = path.substr(0, end);
      *right = path.substr(end + 1);
      return true;
    }
    return false;
  }
  for (size_t i = 0; i < path.size(); ++i) {
    char c = path[i];
    if (c == '\\') {
      ++i;
    } else if (c == '.') {
      if (i == path.size() - 1) {
        return false;
      }
      if (path[i + 1] != '#') {
        continue;
      }
      i += 2;
      if (i == path.size()) {
        return false;
      }
      if (path[i] == '[' || path[i] == '(') {
        // Skip the predicate, a '|' inside it is an operand character.
        std::string_view predicate;
        i = scan_squash(path, i, &predicate) - 1;
      }
    } else if (c == '|') {
      *left = path.substr(0, i);
      *right = path.substr(i + 1);
      return true;
    }
  }
  return false;
}

Value parse_value(std::string_view json, const Storage& storage) {
  for (size_t i = 0; i < json.size(); ++i) {
    char c = json[i];
    if (static_cast<unsigned char>(c) <= ' ') {
      continue;
    }
    Value value;
    if (c == '{' || c == '[') {
      std::string_view raw;
      scan_squash(json, i, &raw);
      value = Value(Kind::Composite, raw, 0, storage);
    } else if (c == '"') {
      std::string_view raw;
      bool escaped = false;
      bool ok = false;
      scan_string(json, i + 1, &raw, &escaped, &ok);
      value = Value(Kind::String, raw, 0, storage);
    } else if (c == 't' || c == 'f' || (c == 'n' && !(i + 1 < json.size() && json[i + 1] != 'u'))) {
      std::string_view raw = lower_prefix(json.substr(i));
      value = Value(c == 't' ? Kind::True : c == 'f' ? Kind::False : Kind::Null, raw, 0, storage);
    } else if (c == '-' || c == '+' || (c >= '0' && c <= '9') || c == 'i' || c == 'I' || c == 'N' || c == 'n') {
      double number = 0;
      std::string_view raw = numeric_prefix(json.substr(i), &number);
      value = Value(Kind::Number, raw, number, storage);
    } else {
      return Value();
    }
    if (!storage) {
      ValueAccess::origin(value) = i;
    }
    return value;
  }
  return Value();
}

Value walk(std::string_view json, std::string_view path, const Options& options, const Storage& storage) {
  if (path.size() > 1) {
    bool modifier = path[0] == '@' && !options.disable_modifiers;
    if (modifier || path[0] == '!') {
      std::string_view rest;
      std::string out;
      bool ok = modifier ? exec_modifier(json, path, options, &rest, &out) : exec_literal(path, &rest, &out);
      if (ok) {
        auto buffer = std::make_shared<const std::string>(std::move(out));
        if (!rest.empty() && (rest[0] == '|' || rest[0] == '.')) {
          return walk(*buffer, rest.substr(1), options, buffer);
        }
        return parse_value(*buffer, buffer);
      }
    }
    if (path[0] == '[' || path[0] == '{') {
      std::vector<SubSelector> selectors;
      std::string_view rest;
      if (parse_sub_selectors(path, &selectors, &rest) &&
          (rest.empty() || rest[0] == '|' || rest[0] == '.')) {
        Value res = build_selection(json, storage, path[0], selectors, options);
        if (!rest.empty()) {
          res = res.get(rest.substr(1), options);
        }
        return res;
      }
    }
  }

  Walker w{json, options, storage};
  bool lines = path.size() >= 2 && path[0] == '.' && path[1] == '.';
  if (lines) {
    parse_array(w, 0, path.substr(2));
  } else {
    for (size_t i = 0; i < json.size(); ++i) {
      if (json[i] == '{') {
        parse_object(w, i + 1, path);
        break;
      }
      if (json[i] == '[') {
        parse_array(w, i + 1, path);
        break;
      }
    }
  }
  if (w.piped) {
    // The piped path sees the value as a fresh root.
    Value res = w.value.get(w.pipe, options);
    ValueAccess::origin(res) = 0;
    ValueAccess::offsets(res).clear();
    return res;
  }
  if (lines) {
    // Offsets into a stream of documents do not address a member of any one of them.
    ValueAccess::origin(w.value) = 0;
    ValueAccess::offsets(w.value).clear();
    return w.value;
  }
  if (!w.calc && !w.storage && ValueAccess::origin(w.value) == 0 && !w.value.raw().empty()) {
    ValueAccess::origin(w.value) = offset_of(json, w.value.raw());
  }
  return w.value;
}

}  // namespace detail
}  // namespace rawpath
