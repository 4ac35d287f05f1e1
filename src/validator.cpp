#include <cstring>

#include "rawpath/rawpath.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace {

// Strict RFC 8259 grammar check. Every step reports failure by returning
// false; nothing is materialized.
class Validator {
 public:
  explicit Validator(std::string_view input) : input_(input), pos_(0) {}

  bool validate() {
    if (!value()) {
      return false;
    }
    skip_ws();
    return pos_ == input_.size();
  }

 private:
  std::string_view input_;
  size_t pos_;
  int depth_ = 0;

  void skip_ws() {
    while (pos_ < input_.size()) {
      char c = input_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        break;
      }
      ++pos_;
    }
  }

  char peek() const {
    if (pos_ >= input_.size()) {
      return '\0';
    }
    return input_[pos_];
  }

  bool is_digit() const {
    return pos_ < input_.size() && input_[pos_] >= '0' && input_[pos_] <= '9';
  }

  bool value() {
    skip_ws();
    switch (peek()) {
      case '{':
        return nested(&Validator::object);
      case '[':
        return nested(&Validator::array);
      case '"':
        return string();
      case 't':
        return expect("true");
      case 'f':
        return expect("false");
      case 'n':
        return expect("null");
      default:
        return number();
    }
  }

  bool nested(bool (Validator::*body)()) {
    if (++depth_ > detail::kMaxDepth) {
      return false;
    }
    bool ok = (this->*body)();
    --depth_;
    return ok;
  }

  bool object() {
    ++pos_;
    skip_ws();
    if (peek() == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      skip_ws();
      if (peek() != '"' || !string()) {
        return false;
      }
      skip_ws();
      if (peek() != ':') {
        return false;
      }
      ++pos_;
      if (!value()) {
        return false;
      }
      skip_ws();
      char c = peek();
      ++pos_;
      if (c == '}') {
        return true;
      }
      if (c != ',') {
        return false;
      }
    }
  }

  bool array() {
    ++pos_;
    skip_ws();
    if (peek() == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      if (!value()) {
        return false;
      }
      skip_ws();
      char c = peek();
      ++pos_;
      if (c == ']') {
        return true;
      }
      if (c != ',') {
        return false;
      }
    }
  }

  bool expect(const char* keyword) {
    size_t len = std::strlen(keyword);
    if (input_.substr(pos_, len) != keyword) {
      return false;
    }
    pos_ += len;
    return true;
  }

  bool hex4() {
    for (int i = 0; i < 4; ++i, ++pos_) {
      char c = peek();
      bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
      if (!hex) {
        return false;
      }
    }
    return true;
  }

  bool string() {
    ++pos_;
    while (pos_ < input_.size()) {
      char c = input_[pos_++];
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        return false;
      }
      if (c != '\\') {
        continue;
      }
      switch (peek()) {
        case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't':
          ++pos_;
          break;
        case 'u':
          ++pos_;
          if (!hex4()) {
            return false;
          }
          break;
        default:
          return false;
      }
    }
    return false;
  }

  bool number() {
    if (peek() == '-') {
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else {
      if (!is_digit()) {
        return false;
      }
      while (is_digit()) {
        ++pos_;
      }
    }
    if (peek() == '.') {
      ++pos_;
      if (!is_digit()) {
        return false;
      }
      while (is_digit()) {
        ++pos_;
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      if (!is_digit()) {
        return false;
      }
      while (is_digit()) {
        ++pos_;
      }
    }
    return true;
  }
};

}  // namespace

bool is_valid(std::string_view json) {
  Validator validator(json);
  return validator.validate();
}

}  // namespace rawpath
