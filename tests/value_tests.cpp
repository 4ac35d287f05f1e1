#include "rawpath/rawpath.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

const char* kDoc = R"({
  "i": 42, "f": -1.5, "exp": 1e3,
  "big": 9223372036854775807, "ubig": 18446744073709551615,
  "s": "12", "yes": "true", "e": "aé\n",
  "t": true, "no": false, "z": null,
  "obj": {"a": 1, "b": [2], "a": 3},
  "arr": [10, "x", null]
})";

rawpath::Value at(const char* path) {
  return rawpath::get(kDoc, path);
}

}  // namespace

TEST(Value, Kinds) {
  EXPECT_EQ(at("i").kind(), rawpath::Kind::Number);
  EXPECT_EQ(at("s").kind(), rawpath::Kind::String);
  EXPECT_EQ(at("t").kind(), rawpath::Kind::True);
  EXPECT_EQ(at("no").kind(), rawpath::Kind::False);
  EXPECT_EQ(at("obj").kind(), rawpath::Kind::Composite);
  EXPECT_TRUE(at("obj").is_object());
  EXPECT_TRUE(at("arr").is_array());
  EXPECT_TRUE(at("t").is_bool());
  EXPECT_STREQ(rawpath::kind_name(rawpath::Kind::Composite), "JSON");
  EXPECT_STREQ(rawpath::kind_name(rawpath::Kind::Null), "Null");
}

TEST(Value, ExistsDistinguishesNullFromMissing) {
  EXPECT_TRUE(at("z").exists());
  EXPECT_EQ(at("z").kind(), rawpath::Kind::Null);
  EXPECT_FALSE(at("nothing").exists());
  EXPECT_EQ(at("nothing").raw(), "");
  EXPECT_FALSE(rawpath::Value().exists());
}

TEST(Value, NumberConversions) {
  EXPECT_EQ(at("i").as_int(), 42);
  EXPECT_EQ(at("i").as_uint(), 42u);
  EXPECT_EQ(at("i").as_string(), "42");
  EXPECT_EQ(at("f").as_double(), -1.5);
  EXPECT_EQ(at("f").as_int(), -1);
  EXPECT_EQ(at("f").as_string(), "-1.5");
  EXPECT_EQ(at("exp").as_string(), "1000");
  EXPECT_TRUE(at("i").as_bool());
}

TEST(Value, LargeIntegersKeepPrecision) {
  EXPECT_EQ(at("big").as_int(), std::numeric_limits<int64_t>::max());
  EXPECT_EQ(at("ubig").as_uint(), std::numeric_limits<uint64_t>::max());
}

TEST(Value, StringConversions) {
  EXPECT_EQ(at("s").as_int(), 12);
  EXPECT_EQ(at("s").as_double(), 12.0);
  EXPECT_EQ(at("s").raw(), "\"12\"");
  EXPECT_TRUE(at("yes").as_bool());
  EXPECT_FALSE(at("s").as_bool());
  EXPECT_EQ(at("e").as_string(), "a\xc3\xa9\n");
}

TEST(Value, LiteralConversions) {
  EXPECT_EQ(at("t").as_string(), "true");
  EXPECT_EQ(at("t").as_int(), 1);
  EXPECT_EQ(at("no").as_string(), "false");
  EXPECT_EQ(at("z").as_string(), "");
  EXPECT_EQ(at("z").as_int(), 0);
  EXPECT_EQ(at("obj").as_string(), at("obj").raw());
}

TEST(Value, LessOrdersByKindThenValue) {
  EXPECT_TRUE(at("z").less(at("no"), true));
  EXPECT_TRUE(at("no").less(at("i"), true));
  EXPECT_TRUE(at("i").less(at("s"), true));
  EXPECT_TRUE(at("s").less(at("t"), true));
  EXPECT_TRUE(at("f").less(at("i"), true));
  EXPECT_FALSE(at("i").less(at("f"), true));

  auto lower = rawpath::parse(R"("apple")");
  auto upper = rawpath::parse(R"("Banana")");
  EXPECT_FALSE(lower.less(upper, true));
  EXPECT_TRUE(lower.less(upper, false));
}

TEST(Value, ForEachObject) {
  std::vector<std::string> keys;
  at("obj").for_each([&keys](const rawpath::Value& key, const rawpath::Value&) {
    keys.push_back(key.as_string());
    return true;
  });
  std::vector<std::string> want = {"a", "b", "a"};
  EXPECT_EQ(keys, want);
}

TEST(Value, ForEachArrayAndStop) {
  std::vector<int64_t> indexes;
  at("arr").for_each([&indexes](const rawpath::Value& key, const rawpath::Value&) {
    indexes.push_back(key.as_int());
    return indexes.size() < 2;
  });
  std::vector<int64_t> want = {0, 1};
  EXPECT_EQ(indexes, want);
}

TEST(Value, ForEachScalarVisitsItself) {
  int calls = 0;
  at("i").for_each([&calls](const rawpath::Value& key, const rawpath::Value& value) {
    ++calls;
    EXPECT_FALSE(key.exists());
    EXPECT_EQ(value.as_int(), 42);
    return true;
  });
  EXPECT_EQ(calls, 1);

  at("nothing").for_each([&calls](const rawpath::Value&, const rawpath::Value&) {
    ++calls;
    return true;
  });
  EXPECT_EQ(calls, 1);
}

TEST(Value, ArrayAndMap) {
  auto arr = at("arr").array();
  ASSERT_EQ(arr.size(), 3u);
  EXPECT_EQ(arr[0].as_int(), 10);
  EXPECT_EQ(arr[1].as_string(), "x");
  EXPECT_EQ(arr[2].kind(), rawpath::Kind::Null);

  auto single = at("i").array();
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].as_int(), 42);
  EXPECT_TRUE(at("nothing").array().empty());

  auto members = at("obj").map();
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0].first, "a");
  EXPECT_EQ(members[0].second.as_int(), 1);
  EXPECT_EQ(members[1].first, "b");
  EXPECT_TRUE(at("arr").map().empty());
}

TEST(Value, GetOnValue) {
  auto obj = at("obj");
  EXPECT_EQ(obj.get("b.0").as_int(), 2);
  EXPECT_EQ(obj.get("a").as_int(), 1);
  EXPECT_FALSE(at("i").get("a").exists());
  EXPECT_FALSE(rawpath::Value().get("a").exists());
}

TEST(Value, SynthesizedValueOutlivesItsSource) {
  rawpath::Value held;
  {
    std::string doc = R"({"a":[1,2,3]})";
    held = rawpath::get(doc, "a|@reverse");
  }
  EXPECT_EQ(held.raw(), "[3,2,1]");
  EXPECT_EQ(held.get("0").as_int(), 3);
}

TEST(Value, TimeFromRfc3339) {
  using std::chrono::system_clock;
  EXPECT_EQ(system_clock::to_time_t(rawpath::parse(R"("2006-01-02T15:04:05Z")").as_time()), 1136214245);
  EXPECT_EQ(system_clock::to_time_t(rawpath::parse(R"("2006-01-02T15:04:05+07:00")").as_time()), 1136189045);
  EXPECT_EQ(system_clock::to_time_t(rawpath::parse(R"("2024-02-29T00:00:00Z")").as_time()), 1709164800);

  auto fraction = rawpath::parse(R"("2006-01-02T15:04:05.25-01:30")").as_time();
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(fraction.time_since_epoch());
  EXPECT_EQ(millis.count(), (1136214245LL + 5400) * 1000 + 250);
}

TEST(Value, TimeRejectsMalformedText) {
  const std::chrono::system_clock::time_point epoch{};
  for (const char* text : {R"("2023-02-29T00:00:00Z")", R"("2006-01-02 15:04:05Z")", R"("2006-01-02T15:04:05")",
                           R"("2006-01-02T24:00:00Z")", R"("2006-01-02T15:04:05.Z")", "5"}) {
    EXPECT_EQ(rawpath::parse(text).as_time(), epoch) << text;
  }
}
