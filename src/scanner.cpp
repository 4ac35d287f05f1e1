#include "scanner.hpp"

#include <cstdlib>
#include <functional>
#include <limits>
#include <utility>

namespace rawpath {
namespace detail {
namespace {

const char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool parse_hex4(std::string_view text, uint32_t* out) {
  if (text.size() < 4) {
    return false;
  }
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    int digit = hex_value(text[i]);
    if (digit < 0) {
      return false;
    }
    value = (value << 4) | static_cast<uint32_t>(digit);
  }
  *out = value;
  return true;
}

void append_utf8(std::string& out, uint32_t codepoint) {
  if ((codepoint >= 0xD800 && codepoint <= 0xDFFF) || codepoint > 0x10FFFF) {
    codepoint = 0xFFFD;
  }
  if (codepoint <= 0x7F) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else if (codepoint <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

// Decodes the UTF-8 sequence at text[i]. Returns -1 for an invalid sequence,
// in which case len is 1.
int32_t decode_rune(std::string_view text, size_t i, size_t* len) {
  auto b0 = static_cast<unsigned char>(text[i]);
  *len = 1;
  size_t need = 0;
  uint32_t cp = 0;
  uint32_t min = 0;
  if (b0 < 0x80) {
    return b0;
  } else if ((b0 & 0xE0) == 0xC0) {
    need = 1;
    cp = b0 & 0x1F;
    min = 0x80;
  } else if ((b0 & 0xF0) == 0xE0) {
    need = 2;
    cp = b0 & 0x0F;
    min = 0x800;
  } else if ((b0 & 0xF8) == 0xF0) {
    need = 3;
    cp = b0 & 0x07;
    min = 0x10000;
  } else {
    return -1;
  }
  if (i + need >= text.size()) {
    return -1;
  }
  for (size_t k = 1; k <= need; ++k) {
    auto b = static_cast<unsigned char>(text[i + k]);
    if ((b & 0xC0) != 0x80) {
      return -1;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return -1;
  }
  *len = need + 1;
  return static_cast<int32_t>(cp);
}

}  // namespace

Value make_value(const Token& token, const Storage& storage) {
  return Value(token.kind, token.raw, token.number, storage);
}

Value make_owned(Kind kind, std::string text) {
  auto buffer = std::make_shared<const std::string>(std::move(text));
  double number = kind == Kind::Number ? parse_float(*buffer) : 0;
  return Value(kind, std::string_view(*buffer), number, buffer);
}

size_t scan_squash(std::string_view json, size_t i, std::string_view* out) {
  size_t start = i;
  int depth = 1;
  ++i;
  for (; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      ++i;
      for (; i < json.size(); ++i) {
        if (json[i] == '\\') {
          ++i;
        } else if (json[i] == '"') {
          break;
        }
      }
    } else if (c == '{' || c == '[' || c == '(') {
      ++depth;
    } else if (c == '}' || c == ']' || c == ')') {
      --depth;
      if (depth == 0) {
        ++i;
        *out = json.substr(start, i - start);
        return i;
      }
    }
  }
  *out = json.substr(start);
  return json.size();
}

std::string_view squash(std::string_view json) {
  if (json.empty()) {
    return json;
  }
  if (json[0] != '"') {
    std::string_view out;
    scan_squash(json, 0, &out);
    return out;
  }
  std::string_view raw;
  bool escaped = false;
  bool ok = false;
  scan_string(json, 1, &raw, &escaped, &ok);
  return raw;
}

size_t scan_string(std::string_view json, size_t i, std::string_view* raw, bool* escaped, bool* ok) {
  size_t start = i - 1;
  *escaped = false;
  for (; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      *raw = json.substr(start, i + 1 - start);
      *ok = true;
      return i + 1;
    }
    if (c == '\\') {
      *escaped = true;
      ++i;
    }
  }
  *raw = json.substr(start);
  *ok = false;
  return json.size();
}

size_t scan_number(std::string_view json, size_t i, std::string_view* raw) {
  size_t start = i;
  ++i;
  for (; i < json.size(); ++i) {
    char c = json[i];
    if (static_cast<unsigned char>(c) <= ' ' || c == ',' || c == ']' || c == '}') {
      break;
    }
  }
  *raw = json.substr(start, i - start);
  return i;
}

size_t scan_literal(std::string_view json, size_t i, std::string_view* raw) {
  size_t start = i;
  ++i;
  for (; i < json.size(); ++i) {
    if (json[i] < 'a' || json[i] > 'z') {
      break;
    }
  }
  *raw = json.substr(start, i - start);
  return i;
}

Token scan_value(std::string_view json, size_t i) {
  Token tok;
  for (; i < json.size(); ++i) {
    char c = json[i];
    if (c == '{' || c == '[') {
      tok.next = scan_squash(json, i, &tok.raw);
      tok.kind = Kind::Composite;
      tok.ok = true;
      return tok;
    }
    if (static_cast<unsigned char>(c) <= ' ') {
      continue;
    }
    bool number = false;
    switch (c) {
      case '"': {
        bool escaped = false;
        tok.next = scan_string(json, i + 1, &tok.raw, &escaped, &tok.ok);
        if (!tok.ok) {
          tok.raw = std::string_view();
          return tok;
        }
        tok.kind = Kind::String;
        return tok;
      }
      case 'n':
        if (i + 1 < json.size() && json[i + 1] != 'u') {
          number = true;
          break;
        }
        [[fallthrough]];
      case 't':
      case 'f':
        tok.next = scan_literal(json, i, &tok.raw);
        tok.kind = c == 't' ? Kind::True : c == 'f' ? Kind::False : Kind::Null;
        tok.ok = true;
        return tok;
      case '+': case '-':
      case '0': case '1': case '2': case '3': case '4':
      case '5': case '6': case '7': case '8': case '9':
      case 'i': case 'I': case 'N':
        number = true;
        break;
      default:
        break;
    }
    if (number) {
      tok.next = scan_number(json, i, &tok.raw);
      tok.kind = Kind::Number;
      tok.number = parse_float(tok.raw);
      tok.ok = true;
      return tok;
    }
  }
  tok.next = json.size();
  return tok;
}

std::string_view lower_prefix(std::string_view json) {
  for (size_t i = 1; i < json.size(); ++i) {
    if (json[i] < 'a' || json[i] > 'z') {
      return json.substr(0, i);
    }
  }
  return json;
}

std::string_view numeric_prefix(std::string_view json, double* number) {
  std::string_view raw = json;
  for (size_t i = 1; i < json.size(); ++i) {
    char c = json[i];
    if (static_cast<unsigned char>(c) <= ' ' || c == ',' || c == ']' || c == '}') {
      raw = json.substr(0, i);
      break;
    }
  }
  *number = parse_float(raw);
  return raw;
}

namespace {

// Copies text for strtod, cutting hexadecimal forms back to their leading
// zero since JSON has no hex numbers.
std::string float_buffer(std::string_view text) {
  std::string buf(text);
  size_t p = 0;
  if (p < buf.size() && (buf[p] == '+' || buf[p] == '-')) {
    ++p;
  }
  if (p + 1 < buf.size() && buf[p] == '0' && (buf[p + 1] == 'x' || buf[p + 1] == 'X')) {
    buf.resize(p + 1);
  }
  return buf;
}

}  // namespace

double parse_float(std::string_view text) {
  std::string buf = float_buffer(text);
  char* end_ptr = nullptr;
  double value = std::strtod(buf.c_str(), &end_ptr);
  if (end_ptr == buf.c_str()) {
    return 0;
  }
  return value;
}

bool parse_float_strict(std::string_view text, double* out) {
  if (text.empty()) {
    return false;
  }
  std::string buf = float_buffer(text);
  if (buf.size() != text.size()) {
    return false;
  }
  char* end_ptr = nullptr;
  double value = std::strtod(buf.c_str(), &end_ptr);
  if (end_ptr != buf.c_str() + buf.size()) {
    return false;
  }
  *out = value;
  return true;
}

bool parse_uint(std::string_view text, uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  uint64_t n = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (n > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return false;
    }
    n = n * 10 + digit;
  }
  *out = n;
  return true;
}

bool parse_int(std::string_view text, int64_t* out) {
  bool negative = !text.empty() && text[0] == '-';
  if (negative) {
    text.remove_prefix(1);
  }
  uint64_t n = 0;
  if (!parse_uint(text, &n)) {
    return false;
  }
  if (negative) {
    if (n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1) {
      return false;
    }
    *out = static_cast<int64_t>(0 - n);
    return true;
  }
  if (n > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return false;
  }
  *out = static_cast<int64_t>(n);
  return true;
}

std::string unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (static_cast<unsigned char>(c) < ' ') {
      return out;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    ++i;
    if (i >= text.size()) {
      return out;
    }
    switch (text[i]) {
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case '"': out.push_back('"'); break;
      case 'u': {
        uint32_t cp = 0;
        if (!parse_hex4(text.substr(i + 1), &cp)) {
          return out;
        }
        i += 4;
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < text.size() && text[i + 1] == '\\' &&
            text[i + 2] == 'u') {
          uint32_t low = 0;
          if (parse_hex4(text.substr(i + 3), &low) && low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            i += 6;
          }
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return out;
    }
  }
  return out;
}

std::string string_payload(std::string_view raw) {
  if (raw.empty()) {
    return std::string();
  }
  std::string_view inner = raw.substr(1);
  if (!inner.empty() && inner.back() == '"') {
    size_t slashes = 0;
    for (size_t j = inner.size() - 1; j > 0 && inner[j - 1] == '\\'; --j) {
      ++slashes;
    }
    if (slashes % 2 == 0) {
      inner.remove_suffix(1);
    }
  }
  if (inner.find('\\') == std::string_view::npos) {
    return std::string(inner);
  }
  return unescape(inner);
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && static_cast<unsigned char>(text.front()) <= ' ') {
    text.remove_prefix(1);
  }
  while (!text.empty() && static_cast<unsigned char>(text.back()) <= ' ') {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view reverse_squash(std::string_view json) {
  if (json.empty()) {
    return json;
  }
  auto i = static_cast<std::ptrdiff_t>(json.size()) - 1;
  int depth = 0;
  if (json[i] != '"') {
    ++depth;
  }
  if (json[i] == '}' || json[i] == ']' || json[i] == ')') {
    --i;
  }
  for (; i >= 0; --i) {
    switch (json[i]) {
      case '"':
        --i;
        for (; i >= 0; --i) {
          if (json[i] != '"') {
            continue;
          }
          int escapes = 0;
          while (i > 0 && json[i - 1] == '\\') {
            --i;
            ++escapes;
          }
          if (escapes % 2 == 1) {
            continue;
          }
          i += escapes;
          break;
        }
        if (depth == 0) {
          if (i < 0) {
            i = 0;
          }
          return json.substr(static_cast<size_t>(i));
        }
        break;
      case '}':
      case ']':
      case ')':
        ++depth;
        break;
      case '{':
      case '[':
      case '(':
        --depth;
        if (depth == 0) {
          return json.substr(static_cast<size_t>(i));
        }
        break;
      default:
        break;
    }
  }
  return json;
}

size_t offset_of(std::string_view json, std::string_view raw) {
  if (raw.empty() || json.empty()) {
    return 0;
  }
  std::less<const char*> before;
  const char* begin = json.data();
  const char* end = begin + json.size();
  if (before(raw.data(), begin) || !before(raw.data(), end)) {
    return 0;
  }
  return static_cast<size_t>(raw.data() - begin);
}

void append_json_string(std::string& out, std::string_view text) {
  auto append_u = [&out](uint32_t x) {
    out += "\\u";
    out.push_back(kHexDigits[(x >> 12) & 0xF]);
    out.push_back(kHexDigits[(x >> 8) & 0xF]);
    out.push_back(kHexDigits[(x >> 4) & 0xF]);
    out.push_back(kHexDigits[x & 0xF]);
  };
  out.reserve(out.size() + text.size() + 2);
  out.push_back('"');
  for (size_t i = 0; i < text.size(); ++i) {
    auto c = static_cast<unsigned char>(text[i]);
    if (c < ' ') {
      switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: append_u(c); break;
      }
    } else if (c == '<' || c == '>' || c == '&') {
      append_u(c);
    } else if (c == '\\') {
      out += "\\\\";
    } else if (c == '"') {
      out += "\\\"";
    } else if (c > 127) {
      size_t len = 1;
      int32_t rune = decode_rune(text, i, &len);
      if (rune < 0) {
        out += "\\ufffd";
      } else if (rune == 0x2028 || rune == 0x2029) {
        append_u(static_cast<uint32_t>(rune));
      } else {
        out.append(text.substr(i, len));
      }
      i += len - 1;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  out.push_back('"');
}

bool exceeds_max_depth(std::string_view json) {
  int depth = 0;
  for (size_t i = 0; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      std::string_view raw;
      bool escaped = false;
      bool ok = false;
      i = scan_string(json, i + 1, &raw, &escaped, &ok) - 1;
    } else if (c == '{' || c == '[') {
      if (++depth > kMaxDepth) {
        return true;
      }
    } else if ((c == '}' || c == ']') && depth > 0) {
      --depth;
    }
  }
  return false;
}

}  // namespace detail
}  // namespace rawpath
