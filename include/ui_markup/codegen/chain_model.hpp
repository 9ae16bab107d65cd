// ui_markup/codegen/chain_model.hpp - Builder call chains (AST -> chain -> text)
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "ui_markup/ast/ast.hpp"

namespace ui_markup::chain
{

// NOTE:
// A chain is the generated expression for one element: a base followed by
// method calls, e.g. `div().flex().child("x")`. Host code inside it is kept
// as opaque text; only the call structure the generator adds is modeled, so
// the printer can lay it out compactly or one link per line.

struct ChainExpr;

/// Call argument: host text, or a generated chain (a nested element).
using Operand = std::variant<std::string, Box<ChainExpr>>;

/// Host expression used unchanged: `Header::with_label("x")`
struct Verbatim
{
  std::string text;
};

/// Free or associated function call: `div()`, `Header::new()`, `deferred(x)`
struct Call
{
  std::string callee;
  std::vector<Operand> args;
};

/// Parenthesized chain: `(div().child("x"))`
struct Grouped
{
  Box<ChainExpr> inner;
};

using ChainBase = std::variant<Verbatim, Call, Grouped>;

/// `.method(args...)`
struct MethodCall
{
  std::string method;
  std::vector<Operand> args;
};

/// Host method-chain text appended as written, leading dot included.
struct Splice
{
  std::string text;
};

using ChainLink = std::variant<MethodCall, Splice>;

struct ChainExpr
{
  ChainBase base;
  std::vector<ChainLink> links;
};

}  // namespace ui_markup::chain
