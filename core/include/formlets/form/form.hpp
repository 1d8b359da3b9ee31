// formlets/form/form.hpp - Submit / evaluate / render cycle of one form
#pragma once

#include <any>
#include <optional>
#include <string>

#include "formlets/form/collector.hpp"
#include "formlets/html/fragment.hpp"
#include "formlets/render/builder.hpp"
#include "formlets/render/render_dict.hpp"

namespace formlets
{

/**
 * A form ties a builder to the collector that reads the same fields.
 *
 * Typical use:
 * @code
 *   Form form("signup", "/signup", {}, builder, collector);
 *   form.init(input);
 *   if (form.was_successful()) {
 *     use(form.result_as<nlohmann::json>());
 *   } else {
 *     respond(form.html());
 *   }
 * @endcode
 */
class Form
{
public:
  /**
   * @param id Must match [a-zA-Z][a-zA-Z0-9_]+
   * @param action Target of the form tag
   * @param attributes Further attributes of the form tag
   * @throws FormStateError on an invalid id or missing builder/collector
   */
  Form(
    std::string id, std::string action, html::Attributes attributes, BuilderPtr builder,
    CollectorPtr collector);

  [[nodiscard]] const std::string & id() const noexcept { return id_; }

  /// Supply submitted input. Drops any previously computed result.
  void init(InputMap input);

  /// True once input was supplied that contains every collected field.
  [[nodiscard]] bool was_submitted();

  /// Submitted and evaluated without errors.
  [[nodiscard]] bool was_successful();

  /// HTML of the form in its current state.
  [[nodiscard]] std::string html();

  /// Render dict for the current state (the empty dict before submission).
  [[nodiscard]] RenderDict render_dict();

  /**
   * Result of a successful submission.
   *
   * @throws FormStateError if the form was not submitted successfully or the
   *         result still needs arguments
   */
  [[nodiscard]] const std::any & result();

  template <typename T>
  [[nodiscard]] const T & result_as()
  {
    (void)result();
    return result_->get_as<T>();
  }

  /// Value tree computed from the input, or null before submission.
  [[nodiscard]] const ValuePtr & result_value();

  /// Reason of the failed evaluation. Throws FormStateError if successful.
  [[nodiscard]] const std::string & error();

private:
  [[nodiscard]] html::Fragment wrap(html::Fragment content) const;

  std::string id_;
  html::Attributes attributes_;
  BuilderPtr builder_;
  CollectorPtr collector_;

  std::optional<InputMap> input_;
  ValuePtr result_;
};

/// Whether `id` can be used as a form id.
[[nodiscard]] bool is_valid_form_id(const std::string & id);

}  // namespace formlets
