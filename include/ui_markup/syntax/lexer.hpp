// ui_markup/syntax/lexer.hpp - Host-language lexer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "ui_markup/syntax/token.hpp"

namespace ui_markup::syntax
{

/**
 * Splits host source text into tokens.
 *
 * Only token boundaries matter to the markup engine: expression regions are
 * reproduced from the original lexemes, so literals are not decoded. Invalid
 * input (stray characters, unterminated strings or block comments) becomes
 * `TokenKind::Unknown` and is reported by the parser.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ = (pos_ + n < src_.size()) ? pos_ + n : src_.size(); }

  void skip_whitespace();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(uint32_t start);
  [[nodiscard]] Token lex_raw_string(uint32_t start);
  [[nodiscard]] Token lex_quote(uint32_t start);
  [[nodiscard]] Token lex_punctuation();

  [[nodiscard]] Token make(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace ui_markup::syntax
