// ui_markup/codegen/builder_generator.hpp - Generate builder call chains from markup
#pragma once

#include <cstdint>
#include <string>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/codegen/chain_model.hpp"
#include "ui_markup/project/markup_config.hpp"

namespace ui_markup
{

/**
 * Converts a markup tree to the chain model.
 *
 * The fold order is fixed: base expression, then attributes left to right,
 * then children left to right. A `deferred` element bypasses the fold and
 * wraps its single child instead.
 */
class BuilderGenerator
{
public:
  explicit BuilderGenerator(const ToolkitConfig & toolkit) : toolkit_(toolkit) {}

  [[nodiscard]] chain::ChainExpr build(const Element & elem) const;
  [[nodiscard]] chain::ChainExpr build(const Markup & markup) const;

private:
  [[nodiscard]] chain::ChainBase build_base(const HeadKind & head) const;
  [[nodiscard]] chain::ChainExpr build_deferred(const Element & elem) const;

  static void append_attribute(chain::ChainExpr & out, const Attribute & attr);
  void append_child(chain::ChainExpr & out, const ChildItem & child) const;

  const ToolkitConfig & toolkit_;
};

/**
 * Renders the chain model as host source text.
 */
class ChainPrinter
{
public:
  explicit ChainPrinter(OutputConfig options = {}) : options_(options) {}

  [[nodiscard]] std::string print(const chain::ChainExpr & expr) const;

private:
  [[nodiscard]] std::string render(const chain::ChainExpr & expr, uint32_t indent) const;
  [[nodiscard]] std::string render_base(const chain::ChainBase & base, uint32_t indent) const;
  [[nodiscard]] std::string render_args(
    const std::vector<chain::Operand> & args, uint32_t indent) const;

  [[nodiscard]] bool is_pretty() const noexcept { return options_.style == OutputStyle::Pretty; }
  [[nodiscard]] std::string newline(uint32_t indent) const;

  OutputConfig options_;
};

/**
 * High-level generator facade: markup -> chain model -> text.
 */
class CodeGenerator
{
public:
  CodeGenerator() = default;

  [[nodiscard]] static std::string generate(const Markup & markup, const MarkupConfig & config);
};

}  // namespace ui_markup
