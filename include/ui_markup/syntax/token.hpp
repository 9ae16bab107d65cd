// ui_markup/syntax/token.hpp - Host-language tokens
#pragma once

#include <cstdint>
#include <string_view>

#include "ui_markup/basic/source_manager.hpp"

namespace ui_markup::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Comments are emitted so tools can see them; the parser filters them.
  LineComment,   // // ...
  BlockComment,  // /* ... */ (may nest)

  Identifier,  // also keywords and raw identifiers (r#match)
  Lifetime,    // 'a
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // "..", r#".."#, b"..", c".."
  CharLiteral,    // 'x', b'x'

  // Delimiters
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  // Punctuation
  Comma,
  Semicolon,
  Colon,
  ColonColon,
  Dot,
  DotDot,
  DotDotDot,
  DotDotEq,
  At,
  Hash,
  Dollar,
  Question,
  Tilde,
  Bang,

  Arrow,     // ->
  FatArrow,  // =>

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Caret,
  Amp,
  Pipe,
  AndAnd,
  OrOr,
  Shl,
  Shr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PercentEq,
  CaretEq,
  AmpEq,
  PipeEq,
  ShlEq,
  ShrEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source
  std::string_view text;  // full lexeme (quotes and prefixes included)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is_ident(std::string_view name) const noexcept
  {
    return kind == TokenKind::Identifier && text == name;
  }
};

[[nodiscard]] constexpr bool is_comment(TokenKind k) noexcept
{
  return k == TokenKind::LineComment || k == TokenKind::BlockComment;
}

[[nodiscard]] constexpr bool is_open_delimiter(TokenKind k) noexcept
{
  return k == TokenKind::LParen || k == TokenKind::LBrace || k == TokenKind::LBracket;
}

[[nodiscard]] constexpr bool is_close_delimiter(TokenKind k) noexcept
{
  return k == TokenKind::RParen || k == TokenKind::RBrace || k == TokenKind::RBracket;
}

/// Closing delimiter for an opening one (Unknown otherwise).
[[nodiscard]] constexpr TokenKind closer_of(TokenKind open) noexcept
{
  switch (open) {
    case TokenKind::LParen:
      return TokenKind::RParen;
    case TokenKind::LBrace:
      return TokenKind::RBrace;
    case TokenKind::LBracket:
      return TokenKind::RBracket;
    default:
      return TokenKind::Unknown;
  }
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Lifetime:
      return "lifetime";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::CharLiteral:
      return "char";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::DotDotDot:
      return "...";
    case TokenKind::DotDotEq:
      return "..=";
    case TokenKind::At:
      return "@";
    case TokenKind::Hash:
      return "#";
    case TokenKind::Dollar:
      return "$";
    case TokenKind::Question:
      return "?";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Shl:
      return "<<";
    case TokenKind::Shr:
      return ">>";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::CaretEq:
      return "^=";
    case TokenKind::AmpEq:
      return "&=";
    case TokenKind::PipeEq:
      return "|=";
    case TokenKind::ShlEq:
      return "<<=";
    case TokenKind::ShrEq:
      return ">>=";
  }
  return "";
}

}  // namespace ui_markup::syntax
