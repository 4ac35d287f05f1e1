#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rawpath {

struct Json;
struct Options;

// Ordering of the enumerators is the ordering used by Value::less.
enum class Kind {
  Null,
  False,
  Number,
  String,
  True,
  Composite,
};

const char* kind_name(Kind kind);

using Storage = std::shared_ptr<const std::string>;

namespace detail {
struct ValueAccess;
}  // namespace detail

// One JSON-typed result. A Value taken directly from caller text borrows that
// text through raw(); synthesized values own their text through a shared
// buffer. origin() is the byte offset of raw() in the queried document, 0 when
// unknown.
class Value {
 public:
  Value() = default;
  Value(Kind kind, std::string_view raw, double number = 0, Storage storage = nullptr);

  Kind kind() const { return kind_; }
  std::string_view raw() const { return raw_; }
  double number() const { return number_; }
  size_t origin() const { return origin_; }
  const std::vector<size_t>& match_offsets() const { return offsets_; }

  bool exists() const { return kind_ != Kind::Null || !raw_.empty(); }
  bool is_object() const { return kind_ == Kind::Composite && !raw_.empty() && raw_.front() == '{'; }
  bool is_array() const { return kind_ == Kind::Composite && !raw_.empty() && raw_.front() == '['; }
  bool is_bool() const { return kind_ == Kind::True || kind_ == Kind::False; }

  bool as_bool() const;
  int64_t as_int() const;
  uint64_t as_uint() const;
  double as_double() const;
  std::string as_string() const;
  // RFC 3339 timestamp held in the value's text; the epoch when it does not
  // parse.
  std::chrono::system_clock::time_point as_time() const;

  bool less(const Value& other, bool case_sensitive) const;

  // Visits (key, value) pairs. Array keys are Number indexes, a scalar is
  // visited once with an empty key. Returning false stops the iteration.
  void for_each(const std::function<bool(const Value& key, const Value& value)>& fn) const;

  std::vector<Value> array() const;
  std::vector<std::pair<std::string, Value>> map() const;
  Json decode() const;

  Value get(std::string_view path) const;
  Value get(std::string_view path, const Options& options) const;

  std::string path(std::string_view document) const;
  std::vector<std::string> paths(std::string_view document) const;

 private:
  friend struct detail::ValueAccess;

  Kind kind_ = Kind::Null;
  std::string_view raw_;
  double number_ = 0;
  size_t origin_ = 0;
  std::vector<size_t> offsets_;
  Storage storage_;
};

}  // namespace rawpath
