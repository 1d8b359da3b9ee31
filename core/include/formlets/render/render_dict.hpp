// formlets/render/render_dict.hpp - Submitted input and per-field errors
//
// A RenderDict is built once per render pass from the submitted input and the
// value computed from it. It echoes the input back and maps every origin to
// the error reasons found below it in the value tree.
//
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "formlets/value/value.hpp"

namespace formlets
{

/// Raw submitted values by field name.
using InputMap = std::map<std::string, std::string, std::less<>>;

/// Error reasons by origin, in the order they were found.
using ErrorMap = std::map<std::string, std::vector<std::string>, std::less<>>;

class RenderDict
{
public:
  /**
   * @param input Submitted input, kept verbatim
   * @param value Value computed from `input`; only inspected structurally
   */
  RenderDict(InputMap input, const Value & value);

  /// The dict of a form that has not been submitted yet.
  [[nodiscard]] static const RenderDict & empty();

  [[nodiscard]] bool is_empty() const noexcept { return empty_; }

  /// Submitted value of a field, or nullptr.
  [[nodiscard]] const std::string * value(std::string_view name) const;

  [[nodiscard]] bool value_exists(std::string_view name) const;

  /// Errors recorded for an origin, or nullptr if there are none.
  [[nodiscard]] const std::vector<std::string> * errors(std::string_view name) const;

  [[nodiscard]] const InputMap & values() const noexcept { return values_; }

  [[nodiscard]] const ErrorMap & all_errors() const noexcept { return errors_; }

  /// Collect the error reasons of a value tree, keyed by origin.
  [[nodiscard]] static ErrorMap compute_from(const Value & value);

private:
  RenderDict(InputMap input, const Value & value, bool empty);

  InputMap values_;
  ErrorMap errors_;
  bool empty_ = false;
};

}  // namespace formlets
