// formlets/form/form_factory.hpp - Forms from a form description
//
// Every configured field contributes a builder (label, input, error list)
// and a collector (raw input, integer parsing, checks). The field values are
// combined by one function taking a value per field and yielding a JSON
// object keyed by field name.
//
#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "formlets/form/collector.hpp"
#include "formlets/form/form.hpp"
#include "formlets/html/fragment.hpp"
#include "formlets/project/form_config.hpp"
#include "formlets/render/builder.hpp"
#include "formlets/render/render_dict.hpp"
#include "formlets/value/value.hpp"

namespace formlets
{

/// Raised by parse_integer() for text that is not a decimal integer.
class ParseError : public std::runtime_error
{
public:
  explicit ParseError(const std::string & what) : std::runtime_error(what) {}
};

/// One argument function parsing a decimal int64_t; reifies ParseError.
[[nodiscard]] FunctionPtr parse_integer();

/**
 * Renders the errors recorded for a field as `<ul class="errors">`, or
 * nothing if there are none.
 */
class FieldErrorList
{
public:
  [[nodiscard]] html::Fragment get_fragment(
    const RenderDict & dict, const std::optional<std::string> & field_name) const;
};

[[nodiscard]] BuilderPtr make_field_builder(const FieldConfig & field);

[[nodiscard]] CollectorPtr make_field_collector(const FieldConfig & field);

/// Function of one argument per field returning a nlohmann::json object.
[[nodiscard]] FunctionPtr make_field_combiner(const FormConfig & config);

/**
 * Build the form described by `config`.
 *
 * @throws FormStateError if the description is inconsistent
 */
[[nodiscard]] Form build_form(const FormConfig & config);

}  // namespace formlets
