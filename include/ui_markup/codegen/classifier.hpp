// ui_markup/codegen/classifier.hpp - Element head -> generation strategy
#pragma once

#include <cstdint>
#include <string_view>

#include "ui_markup/ast/ast.hpp"

namespace ui_markup
{

/**
 * How the base of an element's call chain is produced.
 */
enum class GenerationStrategy : uint8_t {
  NativeConstructor,    // `div()`
  ImplicitConstructor,  // `Header::new()`
  VerbatimExpression,   // the head expression itself
  DeferredWrap,         // `deferred((child).into_any_element())`
};

[[nodiscard]] GenerationStrategy classify(const HeadKind & head) noexcept;

[[nodiscard]] constexpr std::string_view to_string(GenerationStrategy s) noexcept
{
  switch (s) {
    case GenerationStrategy::NativeConstructor:
      return "native-constructor";
    case GenerationStrategy::ImplicitConstructor:
      return "implicit-constructor";
    case GenerationStrategy::VerbatimExpression:
      return "verbatim-expression";
    case GenerationStrategy::DeferredWrap:
      return "deferred-wrap";
  }
  return "";
}

}  // namespace ui_markup
