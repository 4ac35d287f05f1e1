#include "rawpath/rawpath.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace {

std::string apply(const char* json, const char* path) {
  return std::string(rawpath::get(json, path).raw());
}

const char* kText = R"({"s":"Hello World","pad":"7","ws":"  x  ","n":5})";

}  // namespace

TEST(Modifier, ThisAndReverse) {
  EXPECT_EQ(apply("[1,2]", "@this"), "[1,2]");
  EXPECT_EQ(apply("[3,1,2]", "@reverse"), "[2,1,3]");
  EXPECT_EQ(apply(R"({"a":1,"b":2})", "@reverse"), R"({"b":2,"a":1})");
  EXPECT_EQ(apply("[3,1,2]", "@reverse|@reverse"), "[3,1,2]");
  EXPECT_EQ(apply("[3,1,2]", "@reverse|0"), "2");
}

TEST(Modifier, Flatten) {
  EXPECT_EQ(apply("[1,[2],[3,4],[5,[6,7]]]", "@flatten"), "[1,2,3,4,5,[6,7]]");
  EXPECT_EQ(apply("[1,[2],[3,4],[5,[6,7]]]", R"(@flatten:{"deep":true})"), "[1,2,3,4,5,6,7]");
  EXPECT_EQ(apply(R"({"a":1})", "@flatten"), R"({"a":1})");
}

TEST(Modifier, Join) {
  const char* doc = R"([{"a":1,"b":2},{"a":3},"skip"])";
  EXPECT_EQ(apply(doc, "@join"), R"({"a":3,"b":2})");
  EXPECT_EQ(apply(doc, R"(@join:{"preserve":true})"), R"({"a":1,"b":2,"a":3})");
}

TEST(Modifier, KeysAndValues) {
  EXPECT_EQ(apply(R"({"a":1,"b":[2]})", "@keys"), R"(["a","b"])");
  EXPECT_EQ(apply(R"({"a":1,"b":[2]})", "@values"), "[1,[2]]");
  EXPECT_EQ(apply("[7,8]", "@keys"), "[null,null]");
  EXPECT_EQ(apply("[7,8]", "@values"), "[7,8]");
}

TEST(Modifier, ValidGate) {
  EXPECT_EQ(rawpath::get(R"({"a":1})", "@valid.a").as_int(), 1);
  EXPECT_FALSE(rawpath::get(R"({"a":})", "@valid").exists());
  EXPECT_FALSE(rawpath::get(R"({"a":})", "@valid.a").exists());
}

TEST(Modifier, StringConversions) {
  auto str = rawpath::get(R"({"a":1})", "@tostr");
  EXPECT_EQ(str.kind(), rawpath::Kind::String);
  EXPECT_EQ(str.as_string(), R"({"a":1})");
  EXPECT_EQ(rawpath::get(R"("{\"a\":1}")", "@fromstr.a").as_int(), 1);
  EXPECT_EQ(apply("5", "@fromstr"), "5");
}

TEST(Modifier, Group) {
  const char* doc = R"({"id":[1,2,3],"name":["a","b"],"note":"x"})";
  EXPECT_EQ(apply(doc, "@group"), R"([{"id":1,"name":"a"},{"id":2,"name":"b"}])");
  EXPECT_FALSE(rawpath::get("[1]", "@group").exists());
}

TEST(Modifier, DigAndSearch) {
  const char* doc = R"({"a":{"id":1,"b":{"id":2}},"c":[{"id":3}]})";
  EXPECT_EQ(apply(doc, "@dig:id"), "[1,2,3]");
  EXPECT_EQ(apply(doc, "@search:a.b.id"), "2");
  EXPECT_FALSE(rawpath::get(doc, "@search:nope").exists());
}

TEST(Modifier, StringCase) {
  EXPECT_EQ(rawpath::get(kText, "s|@uppercase").as_string(), "HELLO WORLD");
  EXPECT_EQ(rawpath::get(kText, "s|@lowercase").as_string(), "hello world");
  EXPECT_EQ(rawpath::get(kText, "s|@flip").as_string(), "dlroW olleH");
  EXPECT_EQ(rawpath::get(kText, "ws|@trim").as_string(), "x");
  EXPECT_EQ(rawpath::get(kText, "s|@snakecase").as_string(), "hello_world");
  EXPECT_EQ(rawpath::get(kText, "s|@camelcase").as_string(), "helloWorld");
  EXPECT_EQ(rawpath::get(kText, "s|@kebabcase").as_string(), "hello-world");
  EXPECT_EQ(rawpath::get(R"("parseHTTPResponse")", "@snakecase").as_string(), "parse_http_response");
}

TEST(Modifier, StringEdits) {
  EXPECT_EQ(rawpath::get(kText, R"(s|@replace:{"target":"o","replacement":"0"})").as_string(), "Hell0 World");
  EXPECT_EQ(rawpath::get(kText, R"(s|@replaceAll:{"target":"o","replacement":"0"})").as_string(),
            "Hell0 W0rld");
  EXPECT_EQ(rawpath::get(kText, R"(s|@insertAt:{"index":5,"insert":","})").as_string(), "Hello, World");
  EXPECT_EQ(rawpath::get(kText, R"(pad|@padLeft:{"padding":"0","length":3})").as_string(), "007");
  EXPECT_EQ(rawpath::get(kText, R"(pad|@padRight:{"padding":"-","length":4})").as_string(), "7---");
  EXPECT_EQ(rawpath::get(kText, "s|@wc").as_int(), 2);
}

TEST(Modifier, Encodings) {
  EXPECT_EQ(rawpath::get(R"("Hi")", "@hex").as_string(), "4869");
  EXPECT_EQ(rawpath::get(R"("A")", "@bin").as_string(), "01000001");
}

TEST(Modifier, StringModifiersIgnoreOtherKinds) {
  EXPECT_EQ(apply(kText, "n|@uppercase"), "5");
  EXPECT_EQ(apply("[1]", "@flip"), "[1]");
}

TEST(Modifier, OutputsAreJsonEncoded) {
  EXPECT_EQ(apply(R"("a<b")", "@uppercase"), R"("A\u003cB")");
}

TEST(Modifier, UnknownNamePassesThrough) {
  EXPECT_EQ(apply("[1,2]", "@nosuch"), "[1,2]");
  EXPECT_EQ(rawpath::get("[1,2]", "@nosuch|1").as_int(), 2);
}

TEST(Modifier, PrettyAndMinify) {
  const char* doc = R"({"a":[1,2],"b":{"c":true}})";
  EXPECT_EQ(apply(doc, "@pretty"), "{\n  \"a\": [1, 2],\n  \"b\": {\n    \"c\": true\n  }\n}");
  EXPECT_EQ(apply(R"({"b":1,"a":2})", R"(@pretty:{"sortKeys":true,"indent":"\t"})"),
            "{\n\t\"a\": 2,\n\t\"b\": 1\n}");
  EXPECT_EQ(apply("{ \"a\" : [ 1 , 2 ] }", "@minify"), R"({"a":[1,2]})");
  EXPECT_EQ(apply("{ \"a\" : 1 }", "@ugly"), R"({"a":1})");
}

TEST(ModifierRegistry, BuiltinsArePresent) {
  const auto& builtins = rawpath::ModifierRegistry::builtins();
  for (const char* name : {"this", "pretty", "minify", "ugly", "reverse", "flatten", "join", "keys",
                           "values", "valid", "tostr", "fromstr", "group", "dig", "search"}) {
    EXPECT_TRUE(builtins.exists(name)) << name;
  }
  EXPECT_FALSE(builtins.exists("nosuch"));
}

TEST(ModifierRegistry, AddRejectsEmptyNameOrFunction) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  EXPECT_THROW(registry.add("", [](std::string_view json, std::string_view) { return std::string(json); }),
               std::invalid_argument);
  EXPECT_THROW(registry.add("none", rawpath::ModifierFn()), std::invalid_argument);
  EXPECT_EQ(registry.size(), rawpath::ModifierRegistry::builtins().size());
}

TEST(ModifierRegistry, CustomModifierThroughOptions) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  registry.add("twice", [](std::string_view json, std::string_view) {
    return "[" + std::string(json) + "," + std::string(json) + "]";
  });
  rawpath::Options options;
  options.modifiers = &registry;

  const char* doc = R"({"a":1})";
  EXPECT_EQ(rawpath::get(doc, "a|@twice", options).raw(), "[1,1]");
  EXPECT_EQ(rawpath::get(doc, "a.@twice", options).raw(), "[1,1]");
  EXPECT_EQ(rawpath::get(doc, "@reverse", options).raw(), R"({"a":1})");
  EXPECT_FALSE(rawpath::ModifierRegistry::builtins().exists("twice"));
  EXPECT_FALSE(rawpath::get(doc, "a.@twice").exists());
}

TEST(ModifierRegistry, AddReplacesExisting) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  registry.add("reverse", [](std::string_view, std::string_view) { return std::string("0"); });
  rawpath::Options options;
  options.modifiers = &registry;
  EXPECT_EQ(rawpath::get("[1,2]", "@reverse", options).raw(), "0");
}

TEST(ModifierRegistry, ArgumentIsPassedThrough) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  std::string seen;
  registry.add("echo", [&seen](std::string_view json, std::string_view arg) {
    seen = std::string(arg);
    return std::string(json);
  });
  rawpath::Options options;
  options.modifiers = &registry;
  rawpath::get("[1]", "@echo:plain text|0", options);
  EXPECT_EQ(seen, "plain text");
  rawpath::get("[1]", R"(@echo:{"k":[1,2]}|0)", options);
  EXPECT_EQ(seen, R"({"k":[1,2]})");
}

TEST(ModifierRegistry, SearchAndDigUseCallerOptions) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  registry.add("wrap", [](std::string_view json, std::string_view) {
    return "[" + std::string(json) + "]";
  });
  rawpath::Options options;
  options.modifiers = &registry;

  const char* doc = R"({"a":{"b":1},"c":{"b":2}})";
  EXPECT_EQ(rawpath::get(doc, "a.b.@wrap", options).raw(), "[1]");
  EXPECT_EQ(rawpath::get(doc, "@search:a.b.@wrap", options).raw(), "[1]");
  EXPECT_EQ(rawpath::get(doc, "@dig:b.@wrap", options).raw(), "[[1],[2]]");
  EXPECT_FALSE(rawpath::get(doc, "@search:a.b.@wrap").exists());

}

TEST(ModifierRegistry, ReplacedSearchIsCalledDirectly) {
  auto registry = rawpath::ModifierRegistry::with_builtins();
  registry.add("search", [](std::string_view, std::string_view) { return std::string("0"); });
  rawpath::Options options;
  options.modifiers = &registry;
  EXPECT_EQ(rawpath::get(R"({"a":1})", "@search:a", options).raw(), "0");
}

TEST(Modifier, DeeplyNestedInputPassesThrough) {
  std::string nested = std::string(30000, '[') + std::string(30000, ']');
  std::string doc = "{\"a\":" + nested + "}";
  EXPECT_EQ(rawpath::get(doc, R"(a.@flatten:{"deep":true})").raw(), nested);
  EXPECT_EQ(rawpath::get(doc, "a.@pretty").raw(), nested);
  EXPECT_FALSE(rawpath::get(doc, "@dig:x").exists());

  std::string shallow = std::string(50, '[') + std::string(50, ']');
  EXPECT_EQ(rawpath::get(shallow, R"(@flatten:{"deep":true})").raw(), "[]");
}
