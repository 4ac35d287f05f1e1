#include "rawpath/value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

#include "rawpath/rawpath.hpp"
#include "scanner.hpp"
#include "walker.hpp"

namespace rawpath {
namespace {

constexpr double kMaxSafeInteger = 9007199254740991.0;  // 2^53 - 1

bool safe_int(double f, int64_t* out) {
  if (!(f >= -kMaxSafeInteger && f <= kMaxSafeInteger)) {
    return false;
  }
  *out = static_cast<int64_t>(f);
  return true;
}

// strconv.ParseBool semantics over lowercased text.
bool parse_bool(std::string text, bool* out) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (text == "1" || text == "t" || text == "true") {
    *out = true;
    return true;
  }
  if (text == "0" || text == "f" || text == "false") {
    *out = false;
    return true;
  }
  return false;
}

template <typename T>
T clamp_cast(double f) {
  if (std::isnan(f)) {
    return 0;
  }
  if (f <= static_cast<double>(std::numeric_limits<T>::min())) {
    return std::numeric_limits<T>::min();
  }
  if (f >= static_cast<double>(std::numeric_limits<T>::max())) {
    return std::numeric_limits<T>::max();
  }
  return static_cast<T>(f);
}

std::string format_float(double f) {
  char buf[400];
  auto res = std::to_chars(buf, buf + sizeof(buf), f, std::chars_format::fixed);
  if (res.ec != std::errc()) {
    return std::string();
  }
  return std::string(buf, res.ptr);
}

bool is_plain_integer(std::string_view raw) {
  size_t i = 0;
  if (!raw.empty() && raw[0] == '-') {
    ++i;
  }
  for (; i < raw.size(); ++i) {
    if (raw[i] < '0' || raw[i] > '9') {
      return false;
    }
  }
  return true;
}

bool less_insensitive(const std::string& a, const std::string& b) {
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    auto ca = static_cast<unsigned char>(a[i]);
    auto cb = static_cast<unsigned char>(b[i]);
    if (ca >= 'A' && ca <= 'Z') {
      ca += 32;
    }
    if (cb >= 'A' && cb <= 'Z') {
      cb += 32;
    }
    if (ca != cb) {
      return ca < cb;
    }
  }
  return a.size() < b.size();
}

size_t count_elements(std::string_view raw) {
  size_t count = 0;
  size_t i = 1;
  while (i < raw.size()) {
    detail::Token tok = detail::scan_value(raw, i);
    if (!tok.ok || tok.next > raw.size() - 1) {
      break;
    }
    ++count;
    i = tok.next;
  }
  return count;
}

// Days since 1970-01-01 of a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, int m, int d) {
  y -= m <= 2;
  int64_t era = (y >= 0 ? y : y - 399) / 400;
  int64_t yoe = y - era * 400;
  int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

bool read_digits(std::string_view text, size_t pos, size_t count, int* out) {
  if (pos + count > text.size()) {
    return false;
  }
  int n = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    n = n * 10 + (text[i] - '0');
  }
  *out = n;
  return true;
}

int days_in_month(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return month == 2 && leap ? 29 : kDays[month - 1];
}

// YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
bool parse_rfc3339(std::string_view text, std::chrono::system_clock::time_point* out) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!read_digits(text, 0, 4, &year) || text.size() < 20 || text[4] != '-' ||
      !read_digits(text, 5, 2, &month) || text[7] != '-' || !read_digits(text, 8, 2, &day) ||
      text[10] != 'T' || !read_digits(text, 11, 2, &hour) || text[13] != ':' ||
      !read_digits(text, 14, 2, &minute) || text[16] != ':' || !read_digits(text, 17, 2, &second)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
      minute > 59 || second > 59) {
    return false;
  }
  size_t i = 19;
  int64_t nanos = 0;
  if (text[i] == '.') {
    size_t start = ++i;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
      if (i - start < 9) {
        nanos = nanos * 10 + (text[i] - '0');
      }
      ++i;
    }
    if (i == start) {
      return false;
    }
    for (size_t n = i - start; n < 9; ++n) {
      nanos *= 10;
    }
  }
  int64_t offset = 0;
  if (i < text.size() && text[i] == 'Z') {
    ++i;
  } else if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    int oh = 0, om = 0;
    if (!read_digits(text, i + 1, 2, &oh) || i + 3 >= text.size() || text[i + 3] != ':' ||
        !read_digits(text, i + 4, 2, &om) || oh > 23 || om > 59) {
      return false;
    }
    offset = (text[i] == '-' ? -1 : 1) * (oh * 3600 + om * 60);
    i += 6;
  } else {
    return false;
  }
  if (i != text.size()) {
    return false;
  }
  int64_t secs = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
  secs -= offset;
  auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
  *out = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
  return true;
}

}  // namespace

const char* kind_name(Kind kind) {
  switch (kind) {
    case Kind::Null: return "Null";
    case Kind::False: return "False";
    case Kind::Number: return "Number";
    case Kind::String: return "String";
    case Kind::True: return "True";
    case Kind::Composite: return "JSON";
  }
  return "";
}

Value::Value(Kind kind, std::string_view raw, double number, Storage storage)
    : kind_(kind), raw_(raw), number_(number), storage_(std::move(storage)) {}

bool Value::as_bool() const {
  switch (kind_) {
    case Kind::True:
      return true;
    case Kind::String: {
      bool b = false;
      return parse_bool(as_string(), &b) && b;
    }
    case Kind::Number:
      return number_ != 0;
    default:
      return false;
  }
}

int64_t Value::as_int() const {
  switch (kind_) {
    case Kind::True:
      return 1;
    case Kind::String: {
      int64_t n = 0;
      return detail::parse_int(as_string(), &n) ? n : 0;
    }
    case Kind::Number: {
      int64_t n = 0;
      if (safe_int(number_, &n)) {
        return n;
      }
      if (detail::parse_int(raw_, &n)) {
        return n;
      }
      return clamp_cast<int64_t>(number_);
    }
    default:
      return 0;
  }
}

uint64_t Value::as_uint() const {
  switch (kind_) {
    case Kind::True:
      return 1;
    case Kind::String: {
      uint64_t n = 0;
      return detail::parse_uint(as_string(), &n) ? n : 0;
    }
    case Kind::Number: {
      int64_t i = 0;
      if (safe_int(number_, &i) && i >= 0) {
        return static_cast<uint64_t>(i);
      }
      uint64_t u = 0;
      if (detail::parse_uint(raw_, &u)) {
        return u;
      }
      return clamp_cast<uint64_t>(number_);
    }
    default:
      return 0;
  }
}

double Value::as_double() const {
  switch (kind_) {
    case Kind::True:
      return 1;
    case Kind::String: {
      double f = 0;
      return detail::parse_float_strict(as_string(), &f) ? f : 0;
    }
    case Kind::Number:
      return number_;
    default:
      return 0;
  }
}

std::string Value::as_string() const {
  switch (kind_) {
    case Kind::False:
      return "false";
    case Kind::True:
      return "true";
    case Kind::Number:
      if (!raw_.empty() && is_plain_integer(raw_)) {
        return std::string(raw_);
      }
      return format_float(number_);
    case Kind::String:
      return detail::string_payload(raw_);
    case Kind::Composite:
      return std::string(raw_);
    default:
      return std::string();
  }
}

std::chrono::system_clock::time_point Value::as_time() const {
  std::chrono::system_clock::time_point t;
  if (!parse_rfc3339(as_string(), &t)) {
    return std::chrono::system_clock::time_point();
  }
  return t;
}

bool Value::less(const Value& other, bool case_sensitive) const {
  if (kind_ != other.kind_) {
    return kind_ < other.kind_;
  }
  if (kind_ == Kind::String) {
    if (case_sensitive) {
      return as_string() < other.as_string();
    }
    return less_insensitive(as_string(), other.as_string());
  }
  if (kind_ == Kind::Number) {
    return number_ < other.number_;
  }
  return raw_ < other.raw_;
}

void Value::for_each(const std::function<bool(const Value& key, const Value& value)>& fn) const {
  if (!exists()) {
    return;
  }
  if (kind_ != Kind::Composite) {
    fn(Value(), *this);
    return;
  }
  std::string_view json = raw_;
  size_t i = 0;
  bool object = false;
  for (; i < json.size(); ++i) {
    if (json[i] == '{' || json[i] == '[') {
      object = json[i] == '{';
      ++i;
      break;
    }
    if (!detail::is_space(json[i])) {
      return;
    }
  }
  bool use_offsets = !offsets_.empty() && count_elements(json) == offsets_.size();
  size_t index = 0;
  while (i < json.size()) {
    Value key;
    if (object) {
      while (i < json.size() && json[i] != '"' && json[i] != '}') {
        ++i;
      }
      if (i >= json.size() || json[i] == '}') {
        return;
      }
      size_t s = i;
      std::string_view raw;
      bool escaped = false;
      bool ok = false;
      i = detail::scan_string(json, i + 1, &raw, &escaped, &ok);
      if (!ok) {
        return;
      }
      key = detail::make_value(detail::Token{Kind::String, raw, 0, i, true}, storage_);
      detail::ValueAccess::origin(key) = storage_ ? 0 : s + origin_;
    } else {
      key = Value(Kind::Number, std::string_view(), static_cast<double>(index));
    }
    while (i < json.size() &&
           (static_cast<unsigned char>(json[i]) <= ' ' || json[i] == ',' || json[i] == ':')) {
      ++i;
    }
    if (i >= json.size() || json[i] == ']' || json[i] == '}') {
      return;
    }
    detail::Token tok = detail::scan_value(json, i);
    if (!tok.ok) {
      return;
    }
    Value value = detail::make_value(tok, storage_);
    if (use_offsets) {
      detail::ValueAccess::origin(value) = offsets_[index];
    } else if (!storage_) {
      detail::ValueAccess::origin(value) = detail::offset_of(json, tok.raw) + origin_;
    }
    i = tok.next;
    if (!fn(key, value)) {
      return;
    }
    ++index;
  }
}

std::vector<Value> Value::array() const {
  std::vector<Value> out;
  if (kind_ == Kind::Null) {
    return out;
  }
  if (!is_array()) {
    out.push_back(*this);
    return out;
  }
  for_each([&out](const Value&, const Value& value) {
    out.push_back(value);
    return true;
  });
  return out;
}

std::vector<std::pair<std::string, Value>> Value::map() const {
  std::vector<std::pair<std::string, Value>> out;
  if (!is_object()) {
    return out;
  }
  for_each([&out](const Value& key, const Value& value) {
    std::string name = key.as_string();
    auto it = std::find_if(out.begin(), out.end(), [&name](const auto& member) {
      return member.first == name;
    });
    if (it == out.end()) {
      out.emplace_back(std::move(name), value);
    }
    return true;
  });
  return out;
}

Json Value::decode() const {
  return rawpath::decode(*this);
}

Value Value::get(std::string_view path) const {
  return get(path, Options{});
}

Value Value::get(std::string_view path, const Options& options) const {
  Value res = detail::walk(raw_, path, options, storage_);
  if (storage_) {
    // The text is synthesized, offsets would not point into any document.
    res.origin_ = 0;
    res.offsets_.clear();
    return res;
  }
  if (!res.offsets_.empty()) {
    for (auto& offset : res.offsets_) {
      offset += origin_;
    }
  } else if (res.origin_ != 0) {
    res.origin_ += origin_;
  }
  return res;
}

}  // namespace rawpath
