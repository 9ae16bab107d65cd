// ui_markup/driver/expander.hpp - Markup expansion driver
//
// Entry points for transforming one markup block or every markup macro
// invocation in a host source file. Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/project/markup_config.hpp"

namespace ui_markup
{

// ============================================================================
// Single block
// ============================================================================

struct TransformResult
{
  /// Whether the block parsed and generated (no errors)
  bool success = false;

  /// Parsed tree (only set on success)
  std::optional<Markup> markup;

  /// Generated expression (only set on success)
  std::optional<std::string> code;

  /// Exactly one error on failure
  DiagnosticBag diagnostics;
};

/**
 * Transform one markup block (the text between the macro's delimiters).
 *
 * Source ranges in the result are byte offsets into `text`.
 */
[[nodiscard]] TransformResult transform_markup(std::string_view text, const MarkupConfig & config);

// ============================================================================
// Host source file
// ============================================================================

struct ExpandedInvocation
{
  /// The whole `ui! { ... }` in the host file
  SourceRange range;

  /// The delimited body handed to the parser
  SourceRange body_range;

  std::optional<Markup> markup;
  std::optional<std::string> code;
};

struct ExpandResult
{
  /// Whether every invocation expanded
  bool success = false;

  /// Host text with each successful invocation replaced by its expression.
  /// Failed invocations keep their original text.
  std::string output;

  std::vector<ExpandedInvocation> invocations;

  /// Diagnostics for all invocations, with host-file offsets
  DiagnosticBag diagnostics;
};

/**
 * Expand every `<macro>! { ... }` invocation in a host source file.
 *
 * Invocations are independent: a failing one reports its diagnostic and is
 * left in place while the others are still expanded. Invocations nested in
 * the expression regions of another invocation are not expanded.
 *
 * @param path Host file path (used in messages only)
 * @param text Host file contents
 * @param config Markup configuration (macro name, toolkit names, output style)
 */
[[nodiscard]] ExpandResult expand_source(
  const std::filesystem::path & path, std::string_view text, const MarkupConfig & config);

}  // namespace ui_markup
