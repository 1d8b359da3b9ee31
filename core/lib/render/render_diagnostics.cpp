// formlets/render/render_diagnostics.cpp
//
#include "formlets/render/render_diagnostics.hpp"

#include <fmt/core.h>

#include <string>

namespace formlets
{

DiagnosticBag to_diagnostics(const RenderDict & dict)
{
  DiagnosticBag diags;
  for (const auto & [origin, reasons] : dict.all_errors()) {
    const std::string * submitted = dict.value(origin);
    for (const auto & reason : reasons) {
      diags
        .report_error(
          origin, reason, submitted ? fmt::format("submitted \"{}\"", *submitted) : "")
        .with_code(k_field_error_code);
    }
  }
  return diags;
}

}  // namespace formlets
