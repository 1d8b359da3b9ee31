// tests/unit/value/test_value_visitor.cpp - Unit tests for value tree traversal
//
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "formlets/value/callable.hpp"
#include "formlets/value/value_visitor.hpp"

using namespace formlets;

namespace
{

class KindRecorder : public RecursiveValueVisitor<KindRecorder>
{
public:
  bool visit_plain(const PlainValue *)
  {
    kinds.push_back("plain");
    return true;
  }

  bool visit_function(const FunctionValue * value)
  {
    kinds.push_back("function");
    return RecursiveValueVisitor::visit_function(value);
  }

  bool visit_error(const ErrorValue * value)
  {
    kinds.push_back("error");
    return RecursiveValueVisitor::visit_error(value);
  }

  std::vector<std::string> kinds;
};

class StopAtError : public RecursiveValueVisitor<StopAtError>
{
public:
  bool visit_plain(const PlainValue *)
  {
    ++plains;
    return true;
  }

  bool visit_error(const ErrorValue *) { return false; }

  int plains = 0;
};

class KindName : public ValueVisitor<KindName, std::string>
{
public:
  std::string visit_value(const Value *) { return "value"; }
  std::string visit_error(const ErrorValue * value) { return "error:" + value->reason(); }
};

}  // namespace

TEST(ValueVisitor, RecursesIntoArgumentsAndOriginals)
{
  int calls = 0;
  const FunctionPtr f = fn(
    [&calls](int64_t a, int64_t b) {
      ++calls;
      return a + b;
    },
    "add");
  const ValuePtr bad = make_error("bad", make_plain(int64_t{1}));
  const ValuePtr call = f->apply(bad)->apply(make_plain(int64_t{2}));

  KindRecorder recorder;
  EXPECT_TRUE(recorder.visit(call.get()));

  const std::vector<std::string> expected{"function", "error", "plain", "plain"};
  EXPECT_EQ(recorder.kinds, expected);
  EXPECT_EQ(calls, 0);
}

TEST(ValueVisitor, FalseStopsTraversal)
{
  const FunctionPtr f = fn([](int64_t a, int64_t b) { return a + b; }, "add");
  const ValuePtr call =
    f->apply(make_error("bad", make_plain(int64_t{1})))->apply(make_plain(int64_t{2}));

  StopAtError visitor;
  EXPECT_FALSE(visitor.visit(call.get()));
  EXPECT_EQ(visitor.plains, 0);
}

TEST(ValueVisitor, DefaultsToVisitValue)
{
  KindName visitor;
  EXPECT_EQ(visitor.visit(make_plain(int64_t{1}).get()), "value");
  EXPECT_EQ(visitor.visit(make_error("bad", make_plain(int64_t{1})).get()), "error:bad");
  EXPECT_EQ(visitor.visit(nullptr), "");
}
