#include "query.hpp"

#include "match.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace detail {
namespace {

bool parse_bool_text(const std::string& text, bool* out) {
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c + 32) : c);
  }
  if (lower == "1" || lower == "t" || lower == "true") {
    *out = true;
    return true;
  }
  if (lower == "0" || lower == "f" || lower == "false") {
    *out = false;
    return true;
  }
  return false;
}

bool truthy(const Value& v) {
  switch (v.kind()) {
    case Kind::True:
      return true;
    case Kind::String: {
      bool b = false;
      return parse_bool_text(v.as_string(), &b) && b;
    }
    case Kind::Number:
      return v.number() != 0;
    default:
      return false;
  }
}

bool falsy(const Value& v) {
  switch (v.kind()) {
    case Kind::Null:
    case Kind::False:
      return true;
    case Kind::String: {
      bool b = false;
      return parse_bool_text(v.as_string(), &b) && !b;
    }
    case Kind::Number:
      return v.number() == 0;
    default:
      return false;
  }
}

template <typename T>
bool compare(const T& lhs, std::string_view op, const T& rhs) {
  if (op == "=") return lhs == rhs;
  if (op == "!=") return lhs != rhs;
  if (op == "<") return lhs < rhs;
  if (op == "<=") return lhs <= rhs;
  if (op == ">") return lhs > rhs;
  if (op == ">=") return lhs >= rhs;
  return false;
}

}  // namespace

QuerySplit split_query(std::string_view query) {
  QuerySplit out;
  if (query.size() < 2 || query[0] != '#' || (query[1] != '(' && query[1] != '[')) {
    return out;
  }
  size_t i = 2;
  size_t j = 0;  // start of the operator
  int depth = 1;
  for (; i < query.size(); ++i) {
    char c = query[i];
    if (depth == 1 && j == 0 && (c == '!' || c == '=' || c == '<' || c == '>' || c == '%')) {
      j = i;
      continue;
    }
    if (c == '\\') {
      ++i;
    } else if (c == '[' || c == '(') {
      ++depth;
    } else if (c == ']' || c == ')') {
      if (--depth == 0) {
        break;
      }
    } else if (c == '"') {
      for (++i; i < query.size(); ++i) {
        if (query[i] == '\\') {
          out.escaped = true;
          ++i;
        } else if (query[i] == '"') {
          break;
        }
      }
    }
  }
  if (depth > 0) {
    return out;
  }
  out.remain = query.substr(i + 1);
  out.end = i + 1;
  out.ok = true;
  if (j == 0) {
    out.path = trim(query.substr(2, i - 2));
    return out;
  }
  out.path = trim(query.substr(2, j - 2));
  std::string_view value = trim(query.substr(j, i - j));
  size_t op = 1;
  if (value.size() >= 2) {
    char a = value[0];
    char b = value[1];
    if ((a == '!' && (b == '=' || b == '%')) || (a == '<' && b == '=') || (a == '>' && b == '=')) {
      op = 2;
    } else if (a == '=' && b == '=') {
      value.remove_prefix(1);
    }
  }
  out.op = value.substr(0, op);
  out.value = trim(value.substr(op));
  return out;
}

bool query_matches(const Query& query, Value value) {
  std::string_view operand = query.value;
  if (!operand.empty() && operand[0] == '~') {
    std::string_view name = operand.substr(1);
    bool known = true;
    bool ish = false;
    if (name == "*") {
      ish = value.exists();
    } else if (name == "null") {
      ish = value.kind() == Kind::Null;
    } else if (name == "true") {
      ish = truthy(value);
    } else if (name == "false") {
      ish = falsy(value);
    } else {
      known = false;
    }
    if (known) {
      operand = "true";
      value = ish ? Value(Kind::True, "true") : Value(Kind::False, "false");
    } else {
      operand = std::string_view();
      value = Value();
    }
  }
  if (!value.exists()) {
    return false;
  }
  if (query.op.empty()) {
    return true;
  }
  const std::string_view op = query.op;
  switch (value.kind()) {
    case Kind::String: {
      std::string text = value.as_string();
      if (op == "%") {
        return match_pattern(text, operand);
      }
      if (op == "!%") {
        return !match_pattern(text, operand);
      }
      return compare(text, op, std::string(operand));
    }
    case Kind::Number: {
      double rhs = 0;
      if (!parse_float_strict(operand, &rhs)) {
        rhs = 0;
      }
      return compare(value.number(), op, rhs);
    }
    case Kind::True:
      if (op == "=") return operand == "true";
      if (op == "!=") return operand != "true";
      if (op == ">") return operand == "false";
      return op == ">=";
    case Kind::False:
      if (op == "=") return operand == "false";
      if (op == "!=") return operand != "false";
      if (op == "<") return operand == "true";
      return op == "<=";
    default:
      return false;
  }
}

}  // namespace detail
}  // namespace rawpath
