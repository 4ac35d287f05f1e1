#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "rawpath/value.hpp"

namespace rawpath {
namespace detail {

// Deepest bracket nesting that recursive consumers of a document accept.
constexpr int kMaxDepth = 10000;

// Span of one value located by scan_value.
struct Token {
  Kind kind = Kind::Null;
  std::string_view raw;
  double number = 0;
  size_t next = 0;
  bool ok = false;
};

// Grants the engine write access to Value internals.
struct ValueAccess {
  static size_t& origin(Value& v) { return v.origin_; }
  static std::vector<size_t>& offsets(Value& v) { return v.offsets_; }
  static const Storage& storage(const Value& v) { return v.storage_; }
  static void set_number(Value& v, double n) { v.number_ = n; }
};

Value make_value(const Token& token, const Storage& storage);

// Synthesized value owning text.
Value make_owned(Kind kind, std::string text);

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Starting at json[i] == '{', '[' or '(', returns the index one past the
// matching close bracket and stores the balanced span in out. Unbalanced
// input yields the rest of json.
size_t scan_squash(std::string_view json, size_t i, std::string_view* out);

// Balanced value starting at json[0], which is a bracket or a quote.
std::string_view squash(std::string_view json);

// Scans a string whose opening quote is at i - 1. raw includes both quotes.
// escaped reports whether a backslash was seen. Returns the index past the
// closing quote, or json.size() with ok = false when unterminated.
size_t scan_string(std::string_view json, size_t i, std::string_view* raw, bool* escaped, bool* ok);

// Number or word starting at i, up to a structural delimiter.
size_t scan_number(std::string_view json, size_t i, std::string_view* raw);
size_t scan_literal(std::string_view json, size_t i, std::string_view* raw);

// Next complete value at or after i. Stray structural characters are skipped.
Token scan_value(std::string_view json, size_t i);

// Leading run of lowercase letters, at least one character.
std::string_view lower_prefix(std::string_view json);

// Numeric prefix of json ending at whitespace, ',', ']' or '}'.
std::string_view numeric_prefix(std::string_view json, double* number);

// Longest valid floating point prefix of text; 0 when there is none.
double parse_float(std::string_view text);

// Whole-text float parse.
bool parse_float_strict(std::string_view text, double* out);

bool parse_uint(std::string_view text, uint64_t* out);
bool parse_int(std::string_view text, int64_t* out);

// Resolves JSON escape sequences; stops at the first malformed escape.
std::string unescape(std::string_view text);

// Text between the quotes of a raw string token, unescaped.
std::string string_payload(std::string_view raw);

std::string_view trim(std::string_view text);

// Balanced value ending at the last character of json, found walking
// backwards.
std::string_view reverse_squash(std::string_view json);

// Byte offset of raw inside json, 0 when raw is not a subrange of json.
size_t offset_of(std::string_view json, std::string_view raw);

void append_json_string(std::string& out, std::string_view text);

// True when brackets outside strings nest more than kMaxDepth levels.
bool exceeds_max_depth(std::string_view json);

}  // namespace detail
}  // namespace rawpath
