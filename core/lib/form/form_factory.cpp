// formlets/form/form_factory.cpp - Form construction from a description
//
#include "formlets/form/form_factory.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

#include "formlets/basic/errors.hpp"
#include "formlets/value/callable.hpp"

namespace formlets
{

namespace
{

int64_t parse_int64(const std::string & text)
{
  if (text.empty()) {
    throw ParseError("please enter a number");
  }
  int64_t value = 0;
  const char * begin = text.data();
  const char * end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec == std::errc::result_out_of_range) {
    throw ParseError(fmt::format("'{}' is out of range", text));
  }
  if (ec != std::errc{} || ptr != end) {
    throw ParseError(fmt::format("'{}' is not a number", text));
  }
  return value;
}

// Code points in UTF-8 text; continuation bytes are not counted.
std::size_t utf8_length(const std::string & text)
{
  std::size_t n = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++n;
    }
  }
  return n;
}

FunctionPtr attributes_for(const FieldConfig & field)
{
  const char * input_type = field.type == FieldType::Integer ? "number" : "text";
  return fn(
    [name = field.name, input_type](const RenderDict & dict) {
      html::Attributes attrs{{"type", input_type}, {"name", name}, {"id", name}};
      if (const std::string * submitted = dict.value(name)) {
        attrs.push_back({"value", *submitted});
      }
      if (dict.errors(name) != nullptr) {
        attrs.push_back({"class", "invalid"});
      }
      return attrs;
    },
    "input_attributes");
}

FunctionPtr no_content()
{
  return fn(
    [](const RenderDict &) { return std::optional<html::Fragment>{}; }, "no_content");
}

}  // namespace

FunctionPtr parse_integer()
{
  return fn(parse_int64, "parse_integer")
    ->catch_and_reify(ExceptionFilter::of<ParseError>("ParseError"));
}

html::Fragment FieldErrorList::get_fragment(
  const RenderDict & dict, const std::optional<std::string> & field_name) const
{
  const std::vector<std::string> * errors = field_name ? dict.errors(*field_name) : nullptr;
  if (errors == nullptr || errors->empty()) {
    return html::Fragment::literal("");
  }

  html::Fragment items = html::Fragment::literal("");
  for (const auto & reason : *errors) {
    items = items.concat(html::Fragment::tag("li", {}, html::Fragment::escaped(reason)));
  }
  return html::Fragment::tag("ul", {{"class", "errors"}}, items);
}

BuilderPtr make_field_builder(const FieldConfig & field)
{
  BuilderPtr label = make_const(html::Fragment::tag(
    "label", {{"for", field.name}}, html::Fragment::literal(field.label)));
  BuilderPtr input = make_tag("input", attributes_for(field), no_content());
  BuilderPtr errors =
    make_delegate(std::make_shared<const FieldErrorList>(), std::optional<std::string>(field.name));

  BuilderPtr inner = make_combined(make_combined(label, input), errors);

  // The wrapping div renders the field parts with the same dict.
  return make_tag(
    "div",
    fn([](const RenderDict &) { return html::Attributes{{"class", "field"}}; }, "field_attributes"),
    fn([inner](const RenderDict & dict) { return inner->build_with(dict); }, "field_content"));
}

CollectorPtr make_field_collector(const FieldConfig & field)
{
  CollectorPtr collector = make_input_collector(field.name);

  if (field.type == FieldType::Text) {
    if (field.min_length) {
      const std::size_t n = *field.min_length;
      collector = make_check_collector(
        collector, fn([n](const std::string & s) { return utf8_length(s) >= n; }, "min_length"),
        fmt::format("must be at least {} characters long", n));
    }
    return collector;
  }

  collector = make_map_collector(collector, parse_integer());
  if (field.min) {
    const int64_t min = *field.min;
    collector = make_check_collector(
      collector, fn([min](int64_t v) { return v >= min; }, "min"),
      fmt::format("must be at least {}", min));
  }
  if (field.max) {
    const int64_t max = *field.max;
    collector = make_check_collector(
      collector, fn([max](int64_t v) { return v <= max; }, "max"),
      fmt::format("must be at most {}", max));
  }
  return collector;
}

FunctionPtr make_field_combiner(const FormConfig & config)
{
  std::vector<FieldConfig> fields = config.fields;
  const std::size_t arity = fields.size();
  return make_function(
    arity, "collect_fields", [fields = std::move(fields)](gsl::span<const std::any> args) {
      nlohmann::json result = nlohmann::json::object();
      for (std::size_t i = 0; i < fields.size(); ++i) {
        const FieldConfig & field = fields[i];
        if (field.type == FieldType::Integer) {
          result[field.name] = detail::payload_arg<int64_t>(args, i, "collect_fields");
        } else {
          result[field.name] = detail::payload_arg<std::string>(args, i, "collect_fields");
        }
      }
      return std::any(result);
    });
}

Form build_form(const FormConfig & config)
{
  if (config.fields.empty()) {
    throw FormStateError(fmt::format("form '{}' has no fields", config.form.id));
  }

  CollectorPtr collector = make_const_collector(make_field_combiner(config));
  BuilderPtr builder;
  for (const auto & field : config.fields) {
    collector = make_apply_collector(collector, make_field_collector(field));
    BuilderPtr field_builder = make_field_builder(field);
    builder = builder ? make_combined(builder, field_builder) : field_builder;
  }
  builder = make_combined(
    builder, make_const(html::Fragment::tag("input", {{"type", "submit"}, {"value", "Submit"}})));

  return Form(config.form.id, config.form.action, config.form.attributes, builder, collector);
}

}  // namespace formlets
