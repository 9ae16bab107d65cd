// ui_markup/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/basic/source_manager.hpp"

namespace ui_markup
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error: expected `[` after `@`
 *     --> src/view.rs:12:17
 *      |
 *   12 |         div @ flex {}
 *      |             ^ attribute lists are written `@[...]`
 *      |
 *      = help: attributes sit between the element head and its body
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
   * Print a single diagnostic against the source it was reported for.
   */
  void print(const Diagnostic & diag, const SourceManager & source);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace ui_markup
