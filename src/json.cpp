#include "rawpath/json.hpp"

#include <algorithm>

#include "rawpath/value.hpp"
#include "scanner.hpp"

namespace rawpath {
namespace {

// Object members match by name regardless of their order.
bool same_members(const Json::Object& lhs, const Json& rhs) {
  const auto& other = rhs.as_object();
  if (lhs.size() != other.size()) {
    return false;
  }
  return std::all_of(lhs.begin(), lhs.end(), [&rhs](const auto& member) {
    const Json* match = rhs.find(member.first);
    return match != nullptr && json_equal(*member.second, *match);
  });
}

Json decode_tree(const Value& value) {
  switch (value.kind()) {
    case Kind::Null:
      return Json(nullptr);
    case Kind::False:
      return Json(false);
    case Kind::True:
      return Json(true);
    case Kind::Number:
      return Json(value.number());
    case Kind::String:
      return Json(value.as_string());
    case Kind::Composite:
      break;
  }
  if (value.is_array()) {
    Json::Array arr;
    value.for_each([&arr](const Value&, const Value& element) {
      arr.push_back(std::make_shared<Json>(decode_tree(element)));
      return true;
    });
    return Json(std::move(arr));
  }
  Json::Object obj;
  for (auto& [key, member] : value.map()) {
    obj.emplace_back(key, std::make_shared<Json>(decode_tree(member)));
  }
  return Json(std::move(obj));
}

}  // namespace

bool json_equal(const Json& lhs, const Json& rhs) {
  if (lhs.value.index() != rhs.value.index()) {
    return false;
  }
  if (lhs.is_array()) {
    return std::equal(lhs.as_array().begin(), lhs.as_array().end(), rhs.as_array().begin(),
                      rhs.as_array().end(), [](const auto& a, const auto& b) {
                        return json_equal(*a, *b);
                      });
  }
  if (lhs.is_object()) {
    return same_members(lhs.as_object(), rhs);
  }
  return lhs.value == rhs.value;
}

const Json* Json::find(std::string_view key) const {
  if (!is_object()) {
    return nullptr;
  }
  for (const auto& [name, member] : as_object()) {
    if (name == key) {
      return member.get();
    }
  }
  return nullptr;
}

Json decode(const Value& value) {
  if (detail::exceeds_max_depth(value.raw())) {
    return Json();
  }
  return decode_tree(value);
}

}  // namespace rawpath
