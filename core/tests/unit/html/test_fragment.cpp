// tests/unit/html/test_fragment.cpp - Unit tests for HTML fragments
//
#include <gtest/gtest.h>

#include <string>

#include "formlets/basic/errors.hpp"
#include "formlets/html/fragment.hpp"

using namespace formlets;
using html::Fragment;

TEST(Fragment, LiteralIsVerbatim)
{
  EXPECT_EQ(Fragment::literal("<b>bold</b>").render(), "<b>bold</b>");
  EXPECT_EQ(Fragment::literal("").render(), "");
}

TEST(Fragment, EscapedTextReplacesMarkup)
{
  EXPECT_EQ(
    Fragment::escaped("'<script>' & more").render(), "'&lt;script&gt;' &amp; more");
  EXPECT_EQ(Fragment::escaped("plain").kind(), html::FragmentKind::Literal);
}

TEST(Fragment, TagWithoutContentSelfCloses)
{
  EXPECT_EQ(Fragment::tag("br", {}).render(), "<br/>");
  EXPECT_EQ(
    Fragment::tag("input", {{"type", "text"}, {"name", "user"}}).render(),
    "<input type=\"text\" name=\"user\"/>");
}

TEST(Fragment, TagWithContent)
{
  const Fragment p = Fragment::tag("p", {{"class", "x"}}, Fragment::literal("hi"));
  EXPECT_EQ(p.render(), "<p class=\"x\">hi</p>");
  EXPECT_EQ(Fragment::tag("p", {}, Fragment::literal("")).render(), "<p></p>");
}

TEST(Fragment, AttributeValuesAreQuoted)
{
  const Fragment f = Fragment::tag("input", {{"value", "a \"b\" & <c>"}});
  EXPECT_EQ(f.render(), "<input value=\"a &quot;b&quot; &amp; &lt;c>\"/>");
}

TEST(Fragment, ConcatFlattens)
{
  const Fragment ab = Fragment::literal("a").concat(Fragment::literal("b"));
  const Fragment abc = ab.concat(Fragment::literal("c"));
  EXPECT_EQ(abc.kind(), html::FragmentKind::Sequence);
  EXPECT_EQ(abc.children().size(), 3u);
  EXPECT_EQ(abc.render(), "abc");
}

TEST(Fragment, NestedTags)
{
  const Fragment items = Fragment::tag("li", {}, Fragment::literal("one"))
                           .concat(Fragment::tag("li", {}, Fragment::literal("two")));
  EXPECT_EQ(Fragment::tag("ul", {}, items).render(), "<ul><li>one</li><li>two</li></ul>");
}

TEST(Fragment, DefaultIsInvalid)
{
  const Fragment f;
  EXPECT_FALSE(f.is_valid());
  EXPECT_THROW((void)f.render(), InvalidFragmentError);
}

TEST(Fragment, InvalidPartInvalidatesWhole)
{
  const Fragment f = Fragment::tag("p", {}, Fragment::literal("a").concat(Fragment{}));
  EXPECT_FALSE(f.is_valid());
  EXPECT_THROW((void)f.render(), InvalidFragmentError);
}

TEST(Fragment, EmptyTagNameIsInvalid) { EXPECT_FALSE(Fragment::tag("", {}).is_valid()); }

TEST(Fragment, FindAttribute)
{
  const html::Attributes attrs{{"name", "user"}, {"class", "a"}, {"class", "b"}};
  EXPECT_EQ(html::find_attribute(attrs, "class").value_or(""), "a");
  EXPECT_FALSE(html::find_attribute(attrs, "id").has_value());
}
