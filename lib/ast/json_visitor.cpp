// ui_markup/ast/json_visitor.cpp - JSON serialization implementation
//
#include "ui_markup/ast/json_visitor.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace ui_markup
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_fragment(const ExprFragment & f) { return json{{"text", f.text}, {"range", j_range(f.range)}}; }

// ============================================================================
// Node serialization
// ============================================================================

json j_head(const HeadKind & head)
{
  return std::visit(
    [](const auto & h) -> json {
      using T = std::decay_t<decltype(h)>;
      if constexpr (std::is_same_v<T, NativeTag>) {
        return json{{"type", "NativeTag"}, {"name", h.name}, {"range", j_range(h.range)}};
      } else if constexpr (std::is_same_v<T, ComponentPath>) {
        return json{{"type", "Component"}, {"path", h.path}, {"range", j_range(h.range)}};
      } else if constexpr (std::is_same_v<T, HeadExpr>) {
        return json{{"type", "Expression"}, {"expr", j_fragment(h.expr)}};
      } else {
        return json{{"type", "Deferred"}, {"name", h.name}, {"range", j_range(h.range)}};
      }
    },
    head);
}

json j_attribute(const Attribute & attr)
{
  return std::visit(
    [](const auto & a) -> json {
      using T = std::decay_t<decltype(a)>;
      json j{{"name", a.name}, {"range", j_range(a.range)}};
      if constexpr (std::is_same_v<T, FlagAttr>) {
        j["type"] = "Flag";
      } else if constexpr (std::is_same_v<T, KeyValueAttr>) {
        j["type"] = "KeyValue";
        j["value"] = j_fragment(a.value);
      } else {
        j["type"] = "KeyMultiValue";
        json values = json::array();
        for (const auto & v : a.values) {
          values.push_back(j_fragment(v));
        }
        j["values"] = std::move(values);
      }
      return j;
    },
    attr);
}

json j_child(const ChildItem & child)
{
  return std::visit(
    [](const auto & c) -> json {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, LiteralChild>) {
        return json{{"type", "Literal"}, {"expr", j_fragment(c.expr)}};
      } else if constexpr (std::is_same_v<T, SpreadChild>) {
        return json{{"type", "Spread"}, {"expr", j_fragment(c.expr)}, {"range", j_range(c.range)}};
      } else if constexpr (std::is_same_v<T, NestedChild>) {
        return json{{"type", "Nested"}, {"element", to_json(*c.element)}};
      } else {
        return json{{"type", "MethodChain"}, {"chain", j_fragment(c.chain)}};
      }
    },
    child);
}

}  // namespace

json to_json(const Element & elem)
{
  json attrs = json::array();
  for (const auto & a : elem.attributes) {
    attrs.push_back(j_attribute(a));
  }

  json children = json::array();
  for (const auto & c : elem.children) {
    children.push_back(j_child(c));
  }

  return json{
    {"type", "Element"},
    {"range", j_range(elem.range)},
    {"head", j_head(elem.head)},
    {"attributes", std::move(attrs)},
    {"children", std::move(children)}};
}

json to_json(const Markup & markup)
{
  json root = std::visit(
    [](const auto & r) -> json {
      using T = std::decay_t<decltype(r)>;
      if constexpr (std::is_same_v<T, Element>) {
        return to_json(r);
      } else {
        return json{{"type", "PassThrough"}, {"expr", j_fragment(r)}};
      }
    },
    markup.root);

  return json{{"type", "Markup"}, {"range", j_range(markup.range)}, {"root", std::move(root)}};
}

}  // namespace ui_markup
