// formlets/render/render_diagnostics.hpp - Field errors as diagnostics
#pragma once

#include "formlets/basic/diagnostic.hpp"
#include "formlets/render/render_dict.hpp"

namespace formlets
{

/// Code of diagnostics reporting a field error.
inline constexpr const char * k_field_error_code = "F001";

/**
 * One error diagnostic per (origin, reason) of the dict, in origin order.
 * The submitted value of the field, when present, is echoed as a note.
 */
[[nodiscard]] DiagnosticBag to_diagnostics(const RenderDict & dict);

}  // namespace formlets
