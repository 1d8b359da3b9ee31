// tests/unit/json/test_json_dump.cpp - Unit tests for JSON dumps of values
//
#include <gtest/gtest.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "formlets/html/fragment.hpp"
#include "formlets/json/json_dump.hpp"
#include "formlets/value/callable.hpp"

using nlohmann::json;

namespace formlets
{

class JsonDumpTest : public ::testing::Test
{
protected:
  static FunctionPtr add()
  {
    return fn([](int64_t a, int64_t b) { return a + b; }, "add");
  }
};

TEST_F(JsonDumpTest, Plain)
{
  const json j = to_json(*make_plain(int64_t{3}, std::string("age")));
  EXPECT_EQ(j["kind"], "plain");
  EXPECT_EQ(j["origin"], "age");
  EXPECT_EQ(j["payload"], 3);
}

TEST_F(JsonDumpTest, PlainWithoutOrigin)
{
  const json j = to_json(*make_plain("text"));
  EXPECT_TRUE(j["origin"].is_null());
  EXPECT_EQ(j["payload"], "text");
}

TEST_F(JsonDumpTest, Function)
{
  const FunctionPtr f = add()->catch_and_reify(ExceptionFilter::of<std::range_error>("range_error"));
  const ValuePtr partial = f->apply(make_plain(int64_t{1}));
  const json j = to_json(*partial);

  EXPECT_EQ(j["kind"], "function");
  EXPECT_EQ(j["name"], "add");
  EXPECT_EQ(j["arity"], 1);
  ASSERT_EQ(j["args"].size(), 1u);
  EXPECT_EQ(j["args"][0]["payload"], 1);
  ASSERT_EQ(j["reifies"].size(), 1u);
  EXPECT_EQ(j["reifies"][0], "range_error");
}

TEST_F(JsonDumpTest, DumpDoesNotForce)
{
  int calls = 0;
  const FunctionPtr f = fn([&calls](int64_t a) { return ++calls + a; }, "count");
  const json j = to_json(*f->apply(make_plain(int64_t{1})));
  EXPECT_EQ(j["arity"], 0);
  EXPECT_EQ(calls, 0);
}

TEST_F(JsonDumpTest, Error)
{
  const ValuePtr e = make_error("too small", make_plain(int64_t{1}, std::string("age")));
  const json j = to_json(*e);
  EXPECT_EQ(j["kind"], "error");
  EXPECT_EQ(j["origin"], "age");
  EXPECT_EQ(j["reason"], "too small");
  EXPECT_EQ(j["original"]["kind"], "plain");
}

TEST_F(JsonDumpTest, Payloads)
{
  EXPECT_TRUE(payload_to_json(std::any{}).is_null());
  EXPECT_EQ(payload_to_json(std::any(true)), true);
  EXPECT_EQ(payload_to_json(std::any(2.5)), 2.5);
  EXPECT_EQ(payload_to_json(std::any(json{{"a", 1}})), (json{{"a", 1}}));
  EXPECT_TRUE(payload_to_json(std::any(html::Fragment{})).contains("type"));
}

TEST_F(JsonDumpTest, RenderDict)
{
  const ValuePtr value =
    add()->apply(make_error("too small", make_plain(int64_t{1}, std::string("a"))))->apply(
      make_plain(int64_t{2}, std::string("b")));
  const json j = to_json(RenderDict({{"a", "1"}, {"b", "2"}}, *value));

  EXPECT_EQ(j["empty"], false);
  EXPECT_EQ(j["values"]["a"], "1");
  EXPECT_EQ(j["errors"]["a"][0], "too small");
  EXPECT_FALSE(j["errors"].contains("b"));

  const json empty = to_json(RenderDict::empty());
  EXPECT_EQ(empty["empty"], true);
  EXPECT_TRUE(empty["errors"].empty());
}

}  // namespace formlets
