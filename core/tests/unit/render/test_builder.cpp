// tests/unit/render/test_builder.cpp - Unit tests for builders
//
#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "formlets/basic/errors.hpp"
#include "formlets/render/builder.hpp"
#include "formlets/value/callable.hpp"

using namespace formlets;

namespace
{

class BuilderTest : public ::testing::Test
{
protected:
  static RenderDict submitted_dict()
  {
    const ValuePtr value = make_error("too short", make_plain("ab", std::string("user")));
    return RenderDict({{"user", "ab"}}, *value);
  }

  static FunctionPtr no_attributes()
  {
    return fn([](const RenderDict &) { return html::Attributes{}; }, "no_attributes");
  }
};

/// Delegate target echoing the submitted value of its field.
class EchoSource
{
public:
  [[nodiscard]] html::Fragment get_fragment(
    const RenderDict & dict, const std::optional<std::string> & name) const
  {
    const std::string * value = name ? dict.value(*name) : nullptr;
    return html::Fragment::literal(value ? *value : "-");
  }
};

}  // namespace

TEST_F(BuilderTest, ConstIsVerbatim)
{
  const BuilderPtr b = make_text("<a>");
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "<a>");
}

TEST_F(BuilderTest, CombinedConcatenatesInOrder)
{
  const BuilderPtr b = make_combined(make_text("<a>"), make_text("<b>"));
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "<a><b>");
  EXPECT_EQ(b->build().render(), "<a><b>");
}

TEST_F(BuilderTest, CombinedIsAssociative)
{
  const BuilderPtr a = make_text("1");
  const BuilderPtr b = make_text("2");
  const BuilderPtr c = make_text("3");
  const BuilderPtr left = make_combined(make_combined(a, b), c);
  const BuilderPtr right = make_combined(a, make_combined(b, c));
  EXPECT_EQ(left->build().render(), right->build().render());
  EXPECT_EQ(left->build().render(), "123");
}

TEST_F(BuilderTest, CombinedNeedsBothParts)
{
  EXPECT_THROW((void)make_combined(make_text("a"), nullptr), BuilderContractViolation);
}

TEST_F(BuilderTest, BuildUsesEmptyDict)
{
  const BuilderPtr b = make_tag(
    "p", no_attributes(),
    fn(
      [](const RenderDict & dict) {
        return html::Fragment::literal(dict.is_empty() ? "pristine" : "submitted");
      },
      "state"));

  EXPECT_EQ(b->build().render(), b->build_with(RenderDict::empty()).render());
  EXPECT_EQ(b->build().render(), "<p>pristine</p>");
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "<p>submitted</p>");
}

TEST_F(BuilderTest, TagProducersSeeDict)
{
  const BuilderPtr b = make_tag(
    "input",
    fn(
      [](const RenderDict & dict) {
        html::Attributes attrs{{"name", "user"}};
        if (const std::string * v = dict.value("user")) {
          attrs.push_back({"value", *v});
        }
        if (dict.errors("user") != nullptr) {
          attrs.push_back({"class", "invalid"});
        }
        return attrs;
      },
      "attributes"),
    fn([](const RenderDict &) { return std::optional<html::Fragment>{}; }, "no_content"));

  EXPECT_EQ(b->build().render(), "<input name=\"user\"/>");
  EXPECT_EQ(
    b->build_with(submitted_dict()).render(),
    "<input name=\"user\" value=\"ab\" class=\"invalid\"/>");
}

TEST_F(BuilderTest, TagContentFragment)
{
  const BuilderPtr b = make_tag(
    "label", fn([](const RenderDict &) { return html::Attributes{{"for", "user"}}; }, "attrs"),
    fn([](const RenderDict &) { return html::Fragment::literal("User"); }, "content"));
  EXPECT_EQ(b->build().render(), "<label for=\"user\">User</label>");
}

TEST_F(BuilderTest, TagProducerWithTwoArgumentsIsRejected)
{
  const BuilderPtr b = make_tag(
    "p",
    fn([](const RenderDict &, const RenderDict &) { return html::Attributes{}; }, "two_args"),
    fn([](const RenderDict &) { return html::Fragment::literal(""); }, "content"));
  EXPECT_THROW((void)b->build(), BuilderContractViolation);
}

TEST_F(BuilderTest, TagProducerYieldingPlainIsRejected)
{
  const FunctionPtr attributes = fn([] { return html::Attributes{}; }, "satisfied_already");
  const BuilderPtr b = make_tag("p", attributes, no_attributes());
  EXPECT_THROW((void)b->build(), NotApplicableError);
}

TEST_F(BuilderTest, TagContentOfWrongTypeIsRejected)
{
  const BuilderPtr b =
    make_tag("p", no_attributes(), fn([](const RenderDict &) { return int64_t{1}; }, "number"));
  EXPECT_THROW((void)b->build(), PayloadTypeError);
}

TEST_F(BuilderTest, DelegateReceivesDictAndName)
{
  const BuilderPtr b = make_delegate(std::make_shared<const EchoSource>(), std::string("user"));
  EXPECT_EQ(b->build().render(), "-");
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "ab");
}

TEST_F(BuilderTest, DelegateWithoutName)
{
  const BuilderPtr b = make_delegate(std::make_shared<const EchoSource>());
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "-");
}

TEST_F(BuilderTest, DelegateReturningInvalidFragmentIsRejected)
{
  const BuilderPtr b = make_delegate(
    [](const RenderDict &, const std::optional<std::string> &) { return html::Fragment{}; },
    std::string("broken"));
  EXPECT_THROW((void)b->build(), InvalidFragmentError);
}

TEST_F(BuilderTest, BuildersAreReusable)
{
  const BuilderPtr b = make_combined(
    make_delegate(std::make_shared<const EchoSource>(), std::string("user")), make_text("!"));
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "ab!");
  EXPECT_EQ(b->build().render(), "-!");
  EXPECT_EQ(b->build_with(submitted_dict()).render(), "ab!");
}
