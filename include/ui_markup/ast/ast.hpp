// ui_markup/ast/ast.hpp - Markup tree definitions
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ui_markup/basic/source_manager.hpp"

namespace ui_markup
{

// ============================================================================
// Utility Types
// ============================================================================

/**
 * Wrapper for recursive types in std::variant.
 * Provides pointer semantics with value-like construction.
 */
template <typename T>
class Box
{
public:
  Box() : ptr_(std::make_unique<T>()) {}
  Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  Box(const Box & other) : ptr_(other.ptr_ ? std::make_unique<T>(*other.ptr_) : nullptr) {}
  Box(Box &&) noexcept = default;

  Box & operator=(const Box & other)
  {
    if (this != &other) {
      ptr_ = other.ptr_ ? std::make_unique<T>(*other.ptr_) : nullptr;
    }
    return *this;
  }
  Box & operator=(Box &&) noexcept = default;

  T & operator*() { return *ptr_; }
  const T & operator*() const { return *ptr_; }
  T * operator->() { return ptr_.get(); }
  const T * operator->() const { return ptr_.get(); }
  T * get() { return ptr_.get(); }
  [[nodiscard]] const T * get() const { return ptr_.get(); }

private:
  std::unique_ptr<T> ptr_;
};

/**
 * An opaque region of host-language code.
 *
 * `text` is the region's tokens joined with a single space wherever the
 * source had whitespace or a comment between them.
 */
struct ExprFragment
{
  std::string text;
  SourceRange range;
};

// ============================================================================
// Element Heads
// ============================================================================

/// Allow-listed toolkit primitive (`div`, `svg`, ...).
struct NativeTag
{
  std::string name;
  SourceRange range;
};

/// Type path constructed through the implicit constructor (`ui::Header`).
struct ComponentPath
{
  std::string path;
  SourceRange range;
};

/// Any other head, used verbatim as the base of the chain.
struct HeadExpr
{
  ExprFragment expr;
};

/// The reserved `deferred` wrapper.
struct DeferredHead
{
  std::string name;
  SourceRange range;
};

using HeadKind = std::variant<NativeTag, ComponentPath, HeadExpr, DeferredHead>;

// ============================================================================
// Attributes
// ============================================================================

/// `name` -> `.name()`
struct FlagAttr
{
  std::string name;
  SourceRange range;
};

/// `name: value` -> `.name(value)`
struct KeyValueAttr
{
  std::string name;
  ExprFragment value;
  SourceRange range;
};

/// `name: (a, b)` -> `.name(a, b)`
struct KeyMultiValueAttr
{
  std::string name;
  std::vector<ExprFragment> values;
  SourceRange range;
};

using Attribute = std::variant<FlagAttr, KeyValueAttr, KeyMultiValueAttr>;

// ============================================================================
// Children
// ============================================================================

struct Element;

/// Plain expression child -> `.child(expr)`
struct LiteralChild
{
  ExprFragment expr;
};

/// `..expr` -> `.children(expr)`
struct SpreadChild
{
  ExprFragment expr;
  SourceRange range;  // includes the `..`
};

/// Nested markup element -> `.child(<element>)`
struct NestedChild
{
  Box<Element> element;
};

/// `.method(...)...` spliced onto the chain verbatim, leading dot included.
struct MethodChainChild
{
  ExprFragment chain;
};

using ChildItem = std::variant<LiteralChild, SpreadChild, NestedChild, MethodChainChild>;

// ============================================================================
// Element / Markup
// ============================================================================

struct Element
{
  HeadKind head;
  std::vector<Attribute> attributes;
  std::vector<ChildItem> children;
  SourceRange range;
};

/**
 * Root of one markup block: an element, or a parenthesized expression that
 * passes through unchanged.
 */
struct Markup
{
  std::variant<Element, ExprFragment> root;
  SourceRange range;
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Kind name of a head, as used in dumps and messages.
constexpr std::string_view head_kind_name(const HeadKind & head)
{
  switch (head.index()) {
    case 0:
      return "native";
    case 1:
      return "component";
    case 2:
      return "expression";
    case 3:
      return "deferred";
    default:
      return "";
  }
}

inline SourceRange get_range(const HeadKind & head)
{
  return std::visit(
    [](const auto & h) -> SourceRange {
      using T = std::decay_t<decltype(h)>;
      if constexpr (std::is_same_v<T, HeadExpr>) {
        return h.expr.range;
      } else {
        return h.range;
      }
    },
    head);
}

inline SourceRange get_range(const Attribute & attr)
{
  return std::visit([](const auto & a) { return a.range; }, attr);
}

inline SourceRange get_range(const ChildItem & child)
{
  return std::visit(
    [](const auto & c) -> SourceRange {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, LiteralChild>) {
        return c.expr.range;
      } else if constexpr (std::is_same_v<T, SpreadChild>) {
        return c.range;
      } else if constexpr (std::is_same_v<T, NestedChild>) {
        return c.element->range;
      } else {
        return c.chain.range;
      }
    },
    child);
}

}  // namespace ui_markup
