#include "rawpath/rawpath.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(Validator, AcceptsWellFormedDocuments) {
  EXPECT_TRUE(rawpath::is_valid(R"({"a":[1,2.5,-3e+2,true,false,null,"xé\n"],"b":{}})"));
  EXPECT_TRUE(rawpath::is_valid("  0  "));
  EXPECT_TRUE(rawpath::is_valid("[]"));
  EXPECT_TRUE(rawpath::is_valid(R"("\/\\\"")"));
}

TEST(Validator, RejectsMalformedDocuments) {
  EXPECT_FALSE(rawpath::is_valid(""));
  EXPECT_FALSE(rawpath::is_valid("   "));
  EXPECT_FALSE(rawpath::is_valid("[1,2,]"));
  EXPECT_FALSE(rawpath::is_valid(R"({"a":1,})"));
  EXPECT_FALSE(rawpath::is_valid(R"({"a" 1})"));
  EXPECT_FALSE(rawpath::is_valid(R"({a:1})"));
  EXPECT_FALSE(rawpath::is_valid("01"));
  EXPECT_FALSE(rawpath::is_valid("1."));
  EXPECT_FALSE(rawpath::is_valid("-"));
  EXPECT_FALSE(rawpath::is_valid("1e"));
  EXPECT_FALSE(rawpath::is_valid("tru"));
  EXPECT_FALSE(rawpath::is_valid("1 2"));
  EXPECT_FALSE(rawpath::is_valid(R"("\x")"));
  EXPECT_FALSE(rawpath::is_valid(R"("\u12")"));
  EXPECT_FALSE(rawpath::is_valid("\"a\nb\""));
  EXPECT_FALSE(rawpath::is_valid("\"open"));
  EXPECT_FALSE(rawpath::is_valid("[1"));
}

TEST(Validator, BoundsNestingDepth) {
  std::string shallow = std::string(100, '[') + std::string(100, ']');
  EXPECT_TRUE(rawpath::is_valid(shallow));
  std::string deep = std::string(20000, '[') + std::string(20000, ']');
  EXPECT_FALSE(rawpath::is_valid(deep));
}
