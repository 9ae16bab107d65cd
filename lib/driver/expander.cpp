// ui_markup/driver/expander.cpp - Markup expansion driver implementation
//
#include "ui_markup/driver/expander.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "ui_markup/codegen/builder_generator.hpp"
#include "ui_markup/syntax/frontend.hpp"
#include "ui_markup/syntax/lexer.hpp"

namespace ui_markup
{

namespace
{

using syntax::Token;
using syntax::TokenKind;

/// Index of the next non-comment token at or after `i`.
size_t next_code_token(const std::vector<Token> & tokens, size_t i)
{
  while (i < tokens.size() && syntax::is_comment(tokens[i].kind)) {
    ++i;
  }
  return i;
}

/// Index of the delimiter closing the one at `open`, or npos.
size_t find_closer(const std::vector<Token> & tokens, size_t open)
{
  int depth = 0;
  for (size_t i = open; i < tokens.size(); ++i) {
    const TokenKind k = tokens[i].kind;
    if (syntax::is_open_delimiter(k)) {
      ++depth;
    } else if (syntax::is_close_delimiter(k)) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

/// Leading whitespace of the line containing `offset`.
std::string_view line_indent(std::string_view text, uint32_t offset)
{
  const size_t nl = text.rfind('\n', offset == 0 ? 0 : offset - 1);
  const size_t line_start = (nl == std::string_view::npos || offset == 0) ? 0 : nl + 1;
  size_t end = line_start;
  while (end < text.size() && (text[end] == ' ' || text[end] == '\t')) {
    ++end;
  }
  return text.substr(line_start, end - line_start);
}

/// Indent every line after the first by `indent`.
std::string reindent(const std::string & code, std::string_view indent)
{
  if (indent.empty()) {
    return code;
  }
  std::string out;
  out.reserve(code.size());
  for (const char c : code) {
    out += c;
    if (c == '\n') {
      out += indent;
    }
  }
  return out;
}

TransformResult transform_tokens(const std::vector<Token> & tokens, const MarkupConfig & config)
{
  TransformResult result;
  auto markup = parse_markup(tokens, config, result.diagnostics);
  if (!markup || result.diagnostics.has_errors()) {
    return result;
  }
  result.code = CodeGenerator::generate(*markup, config);
  result.markup = std::move(markup);
  result.success = true;
  return result;
}

}  // namespace

TransformResult transform_markup(std::string_view text, const MarkupConfig & config)
{
  syntax::Lexer lexer(text);
  return transform_tokens(lexer.lex_all(), config);
}

ExpandResult expand_source(
  const std::filesystem::path & path, std::string_view text, const MarkupConfig & config)
{
  ExpandResult result;
  result.success = true;

  if (auto err = validate_markup_config(config)) {
    result.diagnostics.report_error({}, "invalid configuration: " + *err)
      .with_category(DiagnosticCategory::Driver);
    result.success = false;
    result.output = std::string(text);
    return result;
  }

  syntax::Lexer lexer(text);
  const std::vector<Token> tokens = lexer.lex_all();

  size_t copied_up_to = 0;  // byte offset of text already copied to output

  for (size_t i = next_code_token(tokens, 0); i < tokens.size();
       i = next_code_token(tokens, i + 1)) {
    if (!tokens[i].is_ident(config.macro_name)) {
      continue;
    }
    const size_t bang = next_code_token(tokens, i + 1);
    if (bang >= tokens.size() || tokens[bang].kind != TokenKind::Bang) {
      continue;
    }
    const size_t open = next_code_token(tokens, bang + 1);
    if (open >= tokens.size() || !syntax::is_open_delimiter(tokens[open].kind)) {
      continue;
    }

    const size_t close = find_closer(tokens, open);
    if (close == std::string::npos) {
      result.diagnostics
        .report_error(
          tokens[open].range, "unterminated `" + config.macro_name + "!` invocation",
          "opening delimiter is never closed")
        .with_category(DiagnosticCategory::Driver);
      result.success = false;
      break;
    }

    ExpandedInvocation inv;
    inv.range = SourceRange(tokens[i].range.get_begin(), tokens[close].range.get_end());
    inv.body_range = SourceRange(tokens[open].range.get_end(), tokens[close].range.get_begin());

    std::vector<Token> body(tokens.begin() + static_cast<std::ptrdiff_t>(open + 1),
                            tokens.begin() + static_cast<std::ptrdiff_t>(close));
    const uint32_t eof_at = tokens[close].begin();
    body.push_back(Token{TokenKind::Eof, SourceRange(eof_at, eof_at), {}});

    TransformResult block = transform_tokens(body, config);
    result.diagnostics.merge(std::move(block.diagnostics));

    if (block.success) {
      const uint32_t begin = tokens[i].begin();
      result.output.append(text.substr(copied_up_to, begin - copied_up_to));
      result.output += reindent(*block.code, line_indent(text, begin));
      copied_up_to = tokens[close].end();
      inv.markup = std::move(block.markup);
      inv.code = std::move(block.code);
    } else {
      result.success = false;
    }

    result.invocations.push_back(std::move(inv));
    i = close;
  }

  result.output.append(text.substr(copied_up_to));

  if (result.invocations.empty() && result.success) {
    result.diagnostics.report_warning(
      {}, "no `" + config.macro_name + "!` invocations found in " + path.string());
  }

  return result;
}

}  // namespace ui_markup
