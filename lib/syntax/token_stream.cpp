// ui_markup/syntax/token_stream.cpp - Delimiter matching
#include "ui_markup/syntax/token_stream.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ui_markup::syntax
{

namespace
{

void report_invalid_token(const Token & t, DiagnosticBag & diags)
{
  const std::string_view text = t.text;

  if (text.substr(0, 2) == "/*") {
    diags.report_error(t.range, "unterminated block comment", "comment starts here")
      .with_help("block comments nest; every `/*` needs a matching `*/`");
    return;
  }
  if (text.find('"') != std::string_view::npos) {
    diags.report_error(t.range, "unterminated string literal", "string starts here");
    return;
  }
  if (!text.empty() && (text.front() == '\'' || text.substr(0, 2) == "b'")) {
    diags.report_error(t.range, "invalid character literal");
    return;
  }
  if (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front())) != 0) {
    diags.report_error(t.range, "invalid number literal `" + std::string(text) + "`");
    return;
  }
  diags.report_error(t.range, "unexpected character `" + std::string(text) + "`");
}

}  // namespace

std::optional<TokenStream> TokenStream::build(
  const std::vector<Token> & raw, DiagnosticBag & diags)
{
  TokenStream ts;
  ts.tokens_.reserve(raw.size());

  for (const auto & t : raw) {
    if (is_comment(t.kind)) {
      continue;
    }
    if (t.kind == TokenKind::Unknown) {
      report_invalid_token(t, diags);
      return std::nullopt;
    }
    ts.tokens_.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }

  if (ts.tokens_.empty() || ts.tokens_.back().kind != TokenKind::Eof) {
    const uint32_t at = ts.tokens_.empty() ? 0 : ts.tokens_.back().end();
    ts.tokens_.push_back(Token{TokenKind::Eof, SourceRange(at, at), {}});
  }

  ts.partners_.assign(ts.tokens_.size(), npos);

  std::vector<size_t> open;
  for (size_t i = 0; i < ts.tokens_.size(); ++i) {
    const Token & t = ts.tokens_[i];

    if (is_open_delimiter(t.kind)) {
      open.push_back(i);
      continue;
    }
    if (!is_close_delimiter(t.kind)) {
      continue;
    }

    if (open.empty()) {
      diags
        .report_error(
          t.range, "unexpected closing delimiter `" + std::string(t.text) + "`",
          "no matching opening delimiter")
        .with_help("remove the stray delimiter or add the missing opener");
      return std::nullopt;
    }

    const size_t opener = open.back();
    const TokenKind expected = closer_of(ts.tokens_[opener].kind);
    if (t.kind != expected) {
      diags
        .report_error(
          t.range,
          "mismatched closing delimiter: expected `" + std::string(to_string(expected)) +
            "`, found `" + std::string(t.text) + "`",
          "mismatched closing delimiter")
        .with_secondary_label(ts.tokens_[opener].range, "unclosed delimiter");
      return std::nullopt;
    }

    open.pop_back();
    ts.partners_[opener] = i;
    ts.partners_[i] = opener;
  }

  if (!open.empty()) {
    const Token & unclosed = ts.tokens_[open.back()];
    diags
      .report_error(
        unclosed.range, "unterminated delimiter group `" + std::string(unclosed.text) + "`",
        "unclosed delimiter")
      .with_help(
        "add the missing `" + std::string(to_string(closer_of(unclosed.kind))) + "`");
    return std::nullopt;
  }

  return ts;
}

bool TokenStream::has_gap_before(size_t i) const noexcept
{
  if (i == 0 || i >= tokens_.size()) {
    return false;
  }
  return tokens_[i].begin() > tokens_[i - 1].end();
}

std::string TokenStream::text(size_t begin, size_t end) const
{
  std::string out;
  for (size_t i = begin; i < end && i < tokens_.size(); ++i) {
    if (i > begin && has_gap_before(i)) {
      out += ' ';
    }
    out += tokens_[i].text;
  }
  return out;
}

SourceRange TokenStream::range(size_t begin, size_t end) const
{
  if (begin >= end || begin >= tokens_.size()) {
    const uint32_t at = tokens_[std::min(begin, tokens_.size() - 1)].begin();
    return {at, at};
  }
  const size_t last = std::min(end, tokens_.size()) - 1;
  return {tokens_[begin].range.get_begin(), tokens_[last].range.get_end()};
}

}  // namespace ui_markup::syntax
