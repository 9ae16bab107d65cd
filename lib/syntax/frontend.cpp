// ui_markup/syntax/frontend.cpp - High-level parse pipeline
#include "ui_markup/syntax/frontend.hpp"

#include "ui_markup/syntax/lexer.hpp"
#include "ui_markup/syntax/parser.hpp"
#include "ui_markup/syntax/token_stream.hpp"

namespace ui_markup
{

std::optional<Markup> parse_markup(
  const std::vector<syntax::Token> & tokens, const MarkupConfig & config, DiagnosticBag & diags)
{
  if (auto err = validate_markup_config(config)) {
    diags.report_error({}, "invalid configuration: " + *err)
      .with_category(DiagnosticCategory::Driver);
    return std::nullopt;
  }

  const auto stream = syntax::TokenStream::build(tokens, diags);
  if (!stream) {
    return std::nullopt;
  }

  syntax::Parser parser(*stream, config, diags);
  return parser.parse_markup();
}

std::optional<Markup> parse_markup_text(
  std::string_view text, const MarkupConfig & config, DiagnosticBag & diags)
{
  syntax::Lexer lexer(text);
  return parse_markup(lexer.lex_all(), config, diags);
}

}  // namespace ui_markup
