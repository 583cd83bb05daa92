// api_graph/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their locations in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "api_graph/basic/diagnostic.hpp"

namespace api_graph
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E101]: unsupported export: Widget
 *     --> node_modules/some-lib/index.d.ts
 *      |
 *      = note: reached through "some-lib"
 *      = help: ...
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

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace api_graph
