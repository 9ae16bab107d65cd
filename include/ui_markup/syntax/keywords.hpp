#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace ui_markup::syntax
{

// Host keywords that start an expression rather than an element head:
// `if cond { a } else { b }` is a literal child, not an element named `if`.
inline constexpr std::array<std::string_view, 14> k_expression_keywords = {
  "if",  "match", "loop",  "while",  "for",  "unsafe", "async",
  "move", "let",  "return", "break", "const", "static", "box",
};

[[nodiscard]] inline bool is_expression_keyword(std::string_view ident) noexcept
{
  return std::find(k_expression_keywords.begin(), k_expression_keywords.end(), ident) !=
         k_expression_keywords.end();
}

// Host keywords after which a `|` opens closure parameters rather than
// acting as a binary operator.
inline constexpr std::array<std::string_view, 5> k_closure_prefix_keywords = {
  "move", "return", "in", "else", "break",
};

[[nodiscard]] inline bool is_closure_prefix_keyword(std::string_view ident) noexcept
{
  return std::find(k_closure_prefix_keywords.begin(), k_closure_prefix_keywords.end(), ident) !=
         k_closure_prefix_keywords.end();
}

}  // namespace ui_markup::syntax
