// ui_markup/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers run the single-block pipeline for tests and keep the source
// text alive next to the results, so ranges can be sliced back to text.
//
#pragma once

#include <optional>
#include <string>
#include <utility>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/basic/source_manager.hpp"
#include "ui_markup/driver/expander.hpp"
#include "ui_markup/project/markup_config.hpp"
#include "ui_markup/syntax/frontend.hpp"

namespace ui_markup::test_support
{

struct TestParseUnit
{
  SourceManager source;
  DiagnosticBag diags;
  std::optional<Markup> markup;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_source_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return source.get_full_range(r);
  }

  /// Root element (nullptr when parsing failed or the root is a pass-through).
  [[nodiscard]] const Element * root() const noexcept
  {
    return markup ? std::get_if<Element>(&markup->root) : nullptr;
  }

  /// Message of the first diagnostic, or "" when there is none.
  [[nodiscard]] std::string first_message() const
  {
    return diags.empty() ? std::string{} : diags.all().front().message;
  }
};

[[nodiscard]] inline TestParseUnit parse(std::string src, const MarkupConfig & config = {})
{
  TestParseUnit out;
  out.source = SourceManager("<test>", std::move(src));
  out.markup = parse_markup_text(out.source.get_source(), config, out.diags);
  return out;
}

/// Generated code for `src`, or "" on failure.
[[nodiscard]] inline std::string expand(std::string_view src, const MarkupConfig & config = {})
{
  const TransformResult result = transform_markup(src, config);
  return result.code.value_or(std::string{});
}

[[nodiscard]] inline MarkupConfig pretty_config(uint32_t indent_width = 4)
{
  MarkupConfig config;
  config.output.style = OutputStyle::Pretty;
  config.output.indent_width = indent_width;
  return config;
}

}  // namespace ui_markup::test_support
