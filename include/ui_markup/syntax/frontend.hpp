// ui_markup/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/project/markup_config.hpp"
#include "ui_markup/syntax/token.hpp"

namespace ui_markup
{

// Parse pipeline:
// tokens -> delimiter matching -> recursive-descent parser (Markup) -> diagnostics
//
// `tokens` is raw lexer output for exactly one markup block (comments
// allowed), terminated by an Eof token. Source ranges in the result are the
// tokens' own offsets, so a block cut out of a larger file keeps that file's
// positions.
[[nodiscard]] std::optional<Markup> parse_markup(
  const std::vector<syntax::Token> & tokens, const MarkupConfig & config, DiagnosticBag & diags);

// Lex `text` and parse it as one markup block.
[[nodiscard]] std::optional<Markup> parse_markup_text(
  std::string_view text, const MarkupConfig & config, DiagnosticBag & diags);

}  // namespace ui_markup
