// ui_markup/codegen/classifier.cpp
#include "ui_markup/codegen/classifier.hpp"

#include <type_traits>
#include <variant>

namespace ui_markup
{

GenerationStrategy classify(const HeadKind & head) noexcept
{
  return std::visit(
    [](const auto & h) -> GenerationStrategy {
      using T = std::decay_t<decltype(h)>;
      if constexpr (std::is_same_v<T, NativeTag>) {
        return GenerationStrategy::NativeConstructor;
      } else if constexpr (std::is_same_v<T, ComponentPath>) {
        return GenerationStrategy::ImplicitConstructor;
      } else if constexpr (std::is_same_v<T, HeadExpr>) {
        return GenerationStrategy::VerbatimExpression;
      } else {
        static_assert(std::is_same_v<T, DeferredHead>);
        return GenerationStrategy::DeferredWrap;
      }
    },
    head);
}

}  // namespace ui_markup
