#include "rawpath/rawpath.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const char* kDoc = R"({
  "name": {"first": "Tom", "last": "Anderson"},
  "friends": [
    {"first": "Dale", "last": "Murphy", "age": 44},
    {"first": "Roger", "last": "Craig", "age": 68},
    {"first": "Jane", "last": "Murphy", "age": 47}
  ],
  "a.b": {"c*": 1}
})";

}  // namespace

TEST(Provenance, DirectMember) {
  auto v = rawpath::get(kDoc, "friends.1.last");
  ASSERT_TRUE(v.exists());
  EXPECT_EQ(v.path(kDoc), "friends.1.last");
  EXPECT_EQ(rawpath::path(v, kDoc), "friends.1.last");
  EXPECT_EQ(rawpath::get(kDoc, "name").path(kDoc), "name");
}

TEST(Provenance, QueryMatch) {
  auto v = rawpath::get(kDoc, R"(friends.#(age>60))");
  EXPECT_EQ(v.path(kDoc), "friends.1");
  EXPECT_EQ(rawpath::get(kDoc, R"(friends.#(age>60).first)").path(kDoc), "friends.1.first");
}

TEST(Provenance, BroadcastPaths) {
  auto v = rawpath::get(kDoc, "friends.#.first");
  std::vector<std::string> want = {"friends.0.first", "friends.1.first", "friends.2.first"};
  EXPECT_EQ(v.paths(kDoc), want);
  EXPECT_EQ(rawpath::paths(v, kDoc), want);
  EXPECT_EQ(v.path(kDoc), "");
}

TEST(Provenance, QueryAllPaths) {
  auto v = rawpath::get(kDoc, R"(friends.#(last=="Murphy")#)");
  std::vector<std::string> want = {"friends.0", "friends.2"};
  EXPECT_EQ(v.paths(kDoc), want);
}

TEST(Provenance, EscapesReservedCharacters) {
  auto v = rawpath::get(kDoc, R"(a\.b.c\*)");
  ASSERT_EQ(v.as_int(), 1);
  EXPECT_EQ(v.path(kDoc), R"(a\.b.c\*)");
  EXPECT_EQ(rawpath::get(kDoc, v.path(kDoc)).as_int(), 1);
}

TEST(Provenance, RootIsThis) {
  EXPECT_EQ(rawpath::parse(kDoc).path(kDoc), "@this");
}

TEST(Provenance, NestedGetKeepsDocumentOffsets) {
  auto friends = rawpath::get(kDoc, "friends");
  auto last = friends.get("2.last");
  EXPECT_EQ(last.as_string(), "Murphy");
  EXPECT_EQ(last.path(kDoc), "friends.2.last");
}

TEST(Provenance, ForEachElementsKnowTheirPaths) {
  std::vector<std::string> got;
  rawpath::get(kDoc, "friends").for_each([&got](const rawpath::Value&, const rawpath::Value& friend_) {
    got.push_back(friend_.get("age").path(kDoc));
    return true;
  });
  std::vector<std::string> want = {"friends.0.age", "friends.1.age", "friends.2.age"};
  EXPECT_EQ(got, want);
}

TEST(Provenance, SynthesizedValuesHaveNoPath) {
  EXPECT_EQ(rawpath::get(kDoc, "[name.first,name.last]").path(kDoc), "");
  EXPECT_EQ(rawpath::get(kDoc, "friends.#").path(kDoc), "");
  EXPECT_EQ(rawpath::get(kDoc, "friends|@reverse").path(kDoc), "");
  EXPECT_TRUE(rawpath::get(kDoc, "friends|@reverse").paths(kDoc).empty());
  EXPECT_EQ(rawpath::get(kDoc, "missing").path(kDoc), "");
}

TEST(Provenance, OtherDocumentHasNoPath) {
  auto v = rawpath::get(kDoc, "friends.1.last");
  EXPECT_EQ(v.path(R"({"x":1})"), "");
}

TEST(EscapePathComponent, EscapesUnsafeBytes) {
  EXPECT_EQ(rawpath::escape_path_component("plain_key-1:2"), "plain_key-1:2");
  EXPECT_EQ(rawpath::escape_path_component("a.b*c?"), R"(a\.b\*c\?)");
  EXPECT_EQ(rawpath::escape_path_component("x|y#"), R"(x\|y\#)");
  EXPECT_EQ(rawpath::escape_path_component(""), "");
}

TEST(Provenance, JsonLinesResultsHaveNoPath) {
  const char* lines = "{\"n\":1}\n{\"n\":2}\n{\"n\":3}";
  EXPECT_EQ(rawpath::get(lines, "..2").path(lines), "");
  EXPECT_EQ(rawpath::get(lines, "..1.n").path(lines), "");
  auto all = rawpath::get(lines, "..#.n");
  EXPECT_EQ(all.raw(), "[1,2,3]");
  EXPECT_TRUE(all.paths(lines).empty());
}

TEST(Provenance, OnlyTheFirstLineIsAddressable) {
  const char* lines = "{\"n\":1}\n{\"n\":2}\n{\"n\":3}";
  std::vector<std::string> got;
  rawpath::for_each_line(lines, [&got, lines](const rawpath::Value& line) {
    got.push_back(line.get("n").path(lines));
    return true;
  });
  std::vector<std::string> want = {"n", "", ""};
  EXPECT_EQ(got, want);
}
