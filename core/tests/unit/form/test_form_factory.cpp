// tests/unit/form/test_form_factory.cpp - Unit tests for forms built from a description
//
#include <gtest/gtest.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "formlets/basic/errors.hpp"
#include "formlets/form/form_factory.hpp"
#include "formlets/project/form_config.hpp"

using namespace formlets;
using nlohmann::json;

namespace
{

constexpr const char * k_signup = R"(
form:
  id: signup
  action: /signup
  attributes:
    class: wide
fields:
  - name: user
    label: User name
    type: text
    min_length: 3
  - name: age
    type: integer
    min: 0
    max: 150
)";

class FormFactoryTest : public ::testing::Test
{
protected:
  static FormConfig signup_config()
  {
    auto result = load_form_config_from_string(k_signup);
    EXPECT_TRUE(result.success) << result.error;
    return result.config;
  }

  static bool contains(const std::string & haystack, const std::string & needle)
  {
    return haystack.find(needle) != std::string::npos;
  }
};

}  // namespace

// ============================================================================
// parse_integer
// ============================================================================

TEST(ParseInteger, Decimal)
{
  EXPECT_EQ(parse_integer()->apply(make_plain("42"))->get_as<int64_t>(), 42);
  EXPECT_EQ(parse_integer()->apply(make_plain("-7"))->get_as<int64_t>(), -7);
}

TEST(ParseInteger, ReifiesParseErrors)
{
  EXPECT_EQ(parse_integer()->apply(make_plain(""))->error(), "please enter a number");
  EXPECT_EQ(parse_integer()->apply(make_plain("12x"))->error(), "'12x' is not a number");
  EXPECT_EQ(parse_integer()->apply(make_plain(" 1"))->error(), "' 1' is not a number");
  EXPECT_EQ(
    parse_integer()->apply(make_plain("99999999999999999999"))->error(),
    "'99999999999999999999' is out of range");
}

TEST(ParseInteger, OtherFailuresPropagate)
{
  const ValuePtr call = parse_integer()->apply(make_plain(int64_t{1}));
  EXPECT_THROW((void)call->get(), PayloadTypeError);
}

// ============================================================================
// Field parts
// ============================================================================

TEST(FieldErrorList, RendersErrorsOfField)
{
  const ValuePtr value = make_error("bad", make_plain("x", std::string("user")));
  const RenderDict dict({{"user", "x"}}, *value);
  const FieldErrorList list;

  EXPECT_EQ(
    list.get_fragment(dict, std::string("user")).render(),
    "<ul class=\"errors\"><li>bad</li></ul>");
  EXPECT_EQ(list.get_fragment(dict, std::string("age")).render(), "");
  EXPECT_EQ(list.get_fragment(dict, std::nullopt).render(), "");
}

TEST(FieldErrorList, EscapesReasons)
{
  const ValuePtr value = make_error("'<b>' is not a number", make_plain("<b>", std::string("age")));
  const RenderDict dict({{"age", "<b>"}}, *value);

  EXPECT_EQ(
    FieldErrorList().get_fragment(dict, std::string("age")).render(),
    "<ul class=\"errors\"><li>'&lt;b&gt;' is not a number</li></ul>");
}

TEST(FieldBuilder, PristineField)
{
  FieldConfig field;
  field.name = "age";
  field.label = "Age";
  field.type = FieldType::Integer;

  EXPECT_EQ(
    make_field_builder(field)->build().render(),
    "<div class=\"field\"><label for=\"age\">Age</label>"
    "<input type=\"number\" name=\"age\" id=\"age\"/></div>");
}

TEST(FieldCollector, TextWithoutConstraintsAcceptsAnything)
{
  FieldConfig field;
  field.name = "note";
  const ValuePtr v = make_field_collector(field)->collect({{"note", ""}});
  EXPECT_FALSE(v->is_error());
  EXPECT_EQ(v->get_as<std::string>(), "");
}

TEST(FieldCollector, MinLengthCountsCharacters)
{
  FieldConfig field;
  field.name = "city";
  field.min_length = 4;
  const CollectorPtr collector = make_field_collector(field);

  // four characters, eight bytes
  EXPECT_FALSE(collector->collect({{"city", "\xc3\xa4\xc3\xb6\xc3\xbc\xc3\x9f"}})->is_error());
  // three characters, six bytes
  EXPECT_TRUE(collector->collect({{"city", "\xc3\xa4\xc3\xb6\xc3\xbc"}})->is_error());
}

// ============================================================================
// Whole forms
// ============================================================================

TEST_F(FormFactoryTest, PristineHtml)
{
  Form form = build_form(signup_config());
  const std::string html = form.html();

  EXPECT_TRUE(contains(html, "<form class=\"wide\" method=\"post\" action=\"/signup\">"));
  EXPECT_TRUE(contains(html, "<label for=\"user\">User name</label>"));
  EXPECT_TRUE(contains(html, "<label for=\"age\">age</label>"));
  EXPECT_TRUE(contains(html, "<input type=\"text\" name=\"user\" id=\"user\"/>"));
  EXPECT_TRUE(contains(html, "<input type=\"submit\" value=\"Submit\"/></form>"));
  EXPECT_FALSE(contains(html, "errors"));
}

TEST_F(FormFactoryTest, SuccessfulSubmission)
{
  Form form = build_form(signup_config());
  form.init({{"user", "alice"}, {"age", "30"}});

  ASSERT_TRUE(form.was_successful());
  const json & result = form.result_as<json>();
  EXPECT_EQ(result["user"], "alice");
  EXPECT_EQ(result["age"], 30);

  const std::string html = form.html();
  EXPECT_TRUE(contains(html, "value=\"alice\""));
  EXPECT_FALSE(contains(html, "class=\"invalid\""));
}

TEST_F(FormFactoryTest, FieldErrorsAreRendered)
{
  Form form = build_form(signup_config());
  form.init({{"user", "al"}, {"age", "abc"}});

  ASSERT_TRUE(form.was_submitted());
  EXPECT_FALSE(form.was_successful());
  EXPECT_EQ(form.error(), k_argument_error_reason);

  const RenderDict dict = form.render_dict();
  EXPECT_EQ(dict.errors("user")->front(), "must be at least 3 characters long");
  EXPECT_EQ(dict.errors("age")->front(), "'abc' is not a number");
  EXPECT_EQ(dict.errors("age")->size(), 1u);

  const std::string html = form.html();
  EXPECT_TRUE(contains(
    html, "<input type=\"text\" name=\"user\" id=\"user\" value=\"al\" class=\"invalid\"/>"));
  EXPECT_TRUE(
    contains(html, "<ul class=\"errors\"><li>must be at least 3 characters long</li></ul>"));
  EXPECT_TRUE(contains(html, "<ul class=\"errors\"><li>'abc' is not a number</li></ul>"));
}

TEST_F(FormFactoryTest, IntegerBounds)
{
  Form form = build_form(signup_config());

  form.init({{"user", "alice"}, {"age", "151"}});
  EXPECT_EQ(form.render_dict().errors("age")->front(), "must be at most 150");

  form.init({{"user", "alice"}, {"age", "-1"}});
  EXPECT_EQ(form.render_dict().errors("age")->front(), "must be at least 0");

  form.init({{"user", "alice"}, {"age", "150"}});
  EXPECT_TRUE(form.was_successful());
}

TEST_F(FormFactoryTest, OnlyErroneousFieldIsReported)
{
  Form form = build_form(signup_config());
  form.init({{"user", "alice"}, {"age", "x"}});

  const RenderDict dict = form.render_dict();
  EXPECT_EQ(dict.errors("user"), nullptr);
  ASSERT_NE(dict.errors("age"), nullptr);
}

TEST_F(FormFactoryTest, PartialInputIsNotASubmission)
{
  Form form = build_form(signup_config());
  form.init({{"user", "alice"}});
  EXPECT_FALSE(form.was_submitted());
  EXPECT_FALSE(contains(form.html(), "value=\"alice\""));
}

TEST_F(FormFactoryTest, EmptyConfigIsRejected)
{
  FormConfig config;
  config.form.id = "empty";
  EXPECT_THROW((void)build_form(config), FormStateError);
}
