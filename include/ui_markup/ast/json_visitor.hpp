// ui_markup/ast/json_visitor.hpp - JSON serialization for markup trees
//
// Produces the structured dump printed by `uimc dump-ast`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "ui_markup/ast/ast.hpp"

namespace ui_markup
{

/**
 * Serialize an element and its whole subtree.
 *
 * Every node carries a "type" tag and a "range" of byte offsets.
 */
[[nodiscard]] nlohmann::json to_json(const Element & elem);

/**
 * Serialize the root of a markup block.
 */
[[nodiscard]] nlohmann::json to_json(const Markup & markup);

}  // namespace ui_markup
