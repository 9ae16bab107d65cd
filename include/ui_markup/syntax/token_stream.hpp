// ui_markup/syntax/token_stream.hpp - Comment-free tokens with paired delimiters
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/syntax/token.hpp"

namespace ui_markup::syntax
{

/**
 * The token sequence the parser works on.
 *
 * Comments are removed and every `(`, `[` and `{` is paired with its closer,
 * so a delimiter group can be skipped in one step. The last token is always
 * `Eof`.
 */
class TokenStream
{
public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  /**
   * Build a stream from raw lexer output.
   *
   * Reports the first invalid token or delimiter mismatch to `diags` and
   * returns std::nullopt in that case.
   */
  [[nodiscard]] static std::optional<TokenStream> build(
    const std::vector<Token> & raw, DiagnosticBag & diags);

  [[nodiscard]] const Token & operator[](size_t i) const { return tokens_[i]; }
  [[nodiscard]] size_t size() const noexcept { return tokens_.size(); }

  /// Index of the trailing Eof token.
  [[nodiscard]] size_t eof_index() const noexcept { return tokens_.size() - 1; }

  /// Index of the token paired with the delimiter at `i` (npos otherwise).
  [[nodiscard]] size_t partner(size_t i) const noexcept { return partners_[i]; }

  /// True if the source has whitespace or a comment between tokens i-1 and i.
  [[nodiscard]] bool has_gap_before(size_t i) const noexcept;

  /**
   * Text of tokens [begin, end) with every source gap collapsed to one space.
   */
  [[nodiscard]] std::string text(size_t begin, size_t end) const;

  /// Source range covering tokens [begin, end) (empty range at `begin` if none).
  [[nodiscard]] SourceRange range(size_t begin, size_t end) const;

private:
  TokenStream() = default;

  std::vector<Token> tokens_;
  std::vector<size_t> partners_;
};

}  // namespace ui_markup::syntax
