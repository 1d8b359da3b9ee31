// tests/unit/render/test_render_diagnostics.cpp - Field errors as diagnostics
//
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "formlets/render/render_diagnostics.hpp"
#include "formlets/value/callable.hpp"

using namespace formlets;

TEST(RenderDiagnostics, OneDiagnosticPerReason)
{
  const FunctionPtr add = fn([](int64_t a, int64_t b) { return a + b; }, "add");
  const ValuePtr age = make_plain(int64_t{200}, std::string("age"));
  const ValuePtr value = add->apply(make_error("too big", make_error("odd", age)))
                           ->apply(make_error("too short", make_plain("x", std::string("code"))));
  const RenderDict dict({{"age", "200"}}, *value);

  const DiagnosticBag diags = to_diagnostics(dict);
  ASSERT_EQ(diags.size(), 3u);
  EXPECT_TRUE(diags.has_errors());

  const auto & all = diags.all();
  EXPECT_EQ(all[0].primary_field(), "age");
  EXPECT_EQ(all[0].message, "too big");
  EXPECT_EQ(all[0].code, k_field_error_code);
  EXPECT_EQ(all[0].primary_label()->message, "submitted \"200\"");
  EXPECT_EQ(all[1].message, "odd");

  EXPECT_EQ(all[2].primary_field(), "code");
  EXPECT_EQ(all[2].primary_label()->message, "");
}

TEST(RenderDiagnostics, EmptyDictHasNone) { EXPECT_TRUE(to_diagnostics(RenderDict::empty()).empty()); }
