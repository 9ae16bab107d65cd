// ui_markup/syntax/lexer.cpp - Host-language lexer
#include "ui_markup/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <string>

namespace ui_markup::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c >= 0x80;
}

bool is_digit(unsigned char c) { return std::isdigit(c) != 0; }

bool is_hex_digit(unsigned char c)
{
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

struct Punct
{
  std::string_view text;
  TokenKind kind;
};

// Longest match first.
constexpr std::array<Punct, 24> k_multi_char_puncts = {{
  {"<<=", TokenKind::ShlEq},   {">>=", TokenKind::ShrEq},     {"...", TokenKind::DotDotDot},
  {"..=", TokenKind::DotDotEq}, {"::", TokenKind::ColonColon}, {"..", TokenKind::DotDot},
  {"->", TokenKind::Arrow},    {"=>", TokenKind::FatArrow},   {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},     {"<<", TokenKind::Shl},        {">>", TokenKind::Shr},
  {"==", TokenKind::EqEq},     {"!=", TokenKind::Ne},         {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},       {"+=", TokenKind::PlusEq},     {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},   {"/=", TokenKind::SlashEq},    {"%=", TokenKind::PercentEq},
  {"^=", TokenKind::CaretEq},  {"&=", TokenKind::AmpEq},      {"|=", TokenKind::PipeEq},
}};

TokenKind single_char_kind(char ch)
{
  switch (ch) {
    case '(':
      return TokenKind::LParen;
    case ')':
      return TokenKind::RParen;
    case '{':
      return TokenKind::LBrace;
    case '}':
      return TokenKind::RBrace;
    case '[':
      return TokenKind::LBracket;
    case ']':
      return TokenKind::RBracket;
    case ',':
      return TokenKind::Comma;
    case ';':
      return TokenKind::Semicolon;
    case ':':
      return TokenKind::Colon;
    case '.':
      return TokenKind::Dot;
    case '@':
      return TokenKind::At;
    case '#':
      return TokenKind::Hash;
    case '$':
      return TokenKind::Dollar;
    case '?':
      return TokenKind::Question;
    case '~':
      return TokenKind::Tilde;
    case '!':
      return TokenKind::Bang;
    case '+':
      return TokenKind::Plus;
    case '-':
      return TokenKind::Minus;
    case '*':
      return TokenKind::Star;
    case '/':
      return TokenKind::Slash;
    case '%':
      return TokenKind::Percent;
    case '^':
      return TokenKind::Caret;
    case '&':
      return TokenKind::Amp;
    case '|':
      return TokenKind::Pipe;
    case '=':
      return TokenKind::Eq;
    case '<':
      return TokenKind::Lt;
    case '>':
      return TokenKind::Gt;
    default:
      return TokenKind::Unknown;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  return {kind, SourceRange(start, end), src_.substr(start, end - start)};
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::lex_line_comment()
{
  // Doc comments (/// and //!) are ordinary line comments here.
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  auto end = static_cast<uint32_t>(pos_);
  if (end > start && src_[end - 1] == '\r') {
    end -= 1;
  }
  return {TokenKind::LineComment, SourceRange(start, end), src_.substr(start, end - start)};
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);

  int depth = 1;
  while (!eof() && depth > 0) {
    if (starts_with("/*")) {
      ++depth;
      advance(2);
    } else if (starts_with("*/")) {
      --depth;
      advance(2);
    } else {
      advance(1);
    }
  }

  // Unterminated: the whole tail becomes one Unknown token.
  return make(depth == 0 ? TokenKind::BlockComment : TokenKind::Unknown, start);
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  bool is_float = false;

  const char p1 = peek(1);
  if (peek() == '0' && (p1 == 'x' || p1 == 'o' || p1 == 'b')) {
    advance(2);
    bool any = false;
    while (!eof()) {
      const auto c = static_cast<unsigned char>(peek());
      if (c == '_') {
        advance(1);
        continue;
      }
      const bool ok = (p1 == 'x')   ? is_hex_digit(c)
                      : (p1 == 'o') ? (c >= '0' && c <= '7')
                                    : (c == '0' || c == '1');
      if (!ok) {
        break;
      }
      any = true;
      advance(1);
    }
    if (!any) {
      return make(TokenKind::Unknown, start);
    }
  } else {
    while (!eof() && (is_digit(static_cast<unsigned char>(peek())) || peek() == '_')) {
      advance(1);
    }

    // Fractional part. `1..2` is a range and `1.max(2)` a method call.
    if (peek() == '.' && is_digit(static_cast<unsigned char>(peek(1)))) {
      is_float = true;
      advance(1);
      while (!eof() && (is_digit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        advance(1);
      }
    }

    // Exponent
    if (peek() == 'e' || peek() == 'E') {
      const bool signed_exp = (peek(1) == '+' || peek(1) == '-');
      const char first = signed_exp ? peek(2) : peek(1);
      if (is_digit(static_cast<unsigned char>(first))) {
        is_float = true;
        advance(signed_exp ? 2 : 1);
        while (!eof() && (is_digit(static_cast<unsigned char>(peek())) || peek() == '_')) {
          advance(1);
        }
      }
    }
  }

  // Type suffix: u8, i64, f32, usize, ...
  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    const auto suffix_start = pos_;
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    const std::string_view suffix = src_.substr(suffix_start, pos_ - suffix_start);
    if (suffix == "f32" || suffix == "f64") {
      is_float = true;
    }
  }

  return make(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string(uint32_t start)
{
  // opening quote
  advance(1);

  while (!eof()) {
    const char c = peek();
    if (c == '"') {
      advance(1);
      return make(TokenKind::StringLiteral, start);
    }
    if (c == '\\') {
      // Escapes are not validated; skip the escaped character.
      advance(2);
      continue;
    }
    advance(1);
  }

  return make(TokenKind::Unknown, start);
}

Token Lexer::lex_raw_string(uint32_t start)
{
  // at 'r'
  advance(1);
  size_t hashes = 0;
  while (peek() == '#') {
    ++hashes;
    advance(1);
  }
  if (peek() != '"') {
    return make(TokenKind::Unknown, start);
  }
  advance(1);

  const std::string terminator = "\"" + std::string(hashes, '#');
  while (!eof()) {
    if (starts_with(terminator)) {
      advance(terminator.size());
      return make(TokenKind::StringLiteral, start);
    }
    advance(1);
  }
  return make(TokenKind::Unknown, start);
}

Token Lexer::lex_quote(uint32_t start)
{
  // at '\''
  advance(1);
  const auto c = static_cast<unsigned char>(peek());

  if (c == '\\') {
    while (!eof() && peek() != '\'' && peek() != '\n') {
      advance(peek() == '\\' ? 2 : 1);
    }
    if (peek() == '\'') {
      advance(1);
      return make(TokenKind::CharLiteral, start);
    }
    return make(TokenKind::Unknown, start);
  }

  if (c < 0x80 && peek(1) == '\'' && c != '\'' && c != '\n') {
    advance(2);
    return make(TokenKind::CharLiteral, start);
  }

  if (c >= 0x80) {
    // Multi-byte UTF-8 character literal
    advance(1);
    while ((static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
      advance(1);
    }
    if (peek() == '\'') {
      advance(1);
      return make(TokenKind::CharLiteral, start);
    }
    return make(TokenKind::Unknown, start);
  }

  if (is_ident_start(c)) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return make(TokenKind::Lifetime, start);
  }

  return make(TokenKind::Unknown, start);
}

Token Lexer::lex_punctuation()
{
  const auto start = static_cast<uint32_t>(pos_);

  for (const auto & p : k_multi_char_puncts) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make(p.kind, start);
    }
  }

  const TokenKind kind = single_char_kind(peek());
  advance(1);
  return make(kind, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, SourceRange(at, at), {}};
  }

  if (starts_with("//")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const auto start = static_cast<uint32_t>(pos_);
  const char c = peek();
  const char c1 = peek(1);
  const char c2 = peek(2);

  // Prefixed literals and raw identifiers
  if (c == 'r') {
    if (c1 == '"' || (c1 == '#' && (c2 == '"' || c2 == '#'))) {
      return lex_raw_string(start);
    }
    if (c1 == '#' && is_ident_start(static_cast<unsigned char>(c2))) {
      advance(2);
      while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
      return make(TokenKind::Identifier, start);
    }
  }
  if (c == 'b' || c == 'c') {
    if (c1 == '"') {
      advance(1);
      return lex_string(start);
    }
    if (c1 == 'r' && (c2 == '"' || c2 == '#')) {
      advance(1);
      return lex_raw_string(start);
    }
    if (c == 'b' && c1 == '\'') {
      advance(1);
      return lex_quote(start);
    }
  }

  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier();
  }
  if (is_digit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string(start);
  }
  if (c == '\'') {
    return lex_quote(start);
  }

  return lex_punctuation();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace ui_markup::syntax
