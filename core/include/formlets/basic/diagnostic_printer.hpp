// formlets/basic/diagnostic_printer.hpp
//
// Prints field diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "formlets/basic/diagnostic.hpp"

namespace formlets
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[F001]: must be at least 3 characters long
 *     --> field 'user'
 *         |
 *         = note: submitted "ab"
 *         = help: enter a longer user name
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, grouped by field.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace formlets
