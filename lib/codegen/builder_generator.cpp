#include "ui_markup/codegen/builder_generator.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "ui_markup/codegen/classifier.hpp"

namespace ui_markup
{

namespace
{

[[nodiscard]] bool is_multiline_chain(const chain::Operand & arg)
{
  const auto * nested = std::get_if<Box<chain::ChainExpr>>(&arg);
  return nested != nullptr && !(*nested)->links.empty();
}

}  // namespace

// ============================================================================
// BuilderGenerator
// ============================================================================

chain::ChainExpr BuilderGenerator::build(const Markup & markup) const
{
  if (const auto * elem = std::get_if<Element>(&markup.root)) {
    return build(*elem);
  }
  return chain::ChainExpr{chain::Verbatim{std::get<ExprFragment>(markup.root).text}, {}};
}

chain::ChainExpr BuilderGenerator::build(const Element & elem) const
{
  if (classify(elem.head) == GenerationStrategy::DeferredWrap) {
    return build_deferred(elem);
  }

  chain::ChainExpr out{build_base(elem.head), {}};
  for (const auto & attr : elem.attributes) {
    append_attribute(out, attr);
  }
  for (const auto & child : elem.children) {
    append_child(out, child);
  }
  return out;
}

chain::ChainBase BuilderGenerator::build_base(const HeadKind & head) const
{
  switch (classify(head)) {
    case GenerationStrategy::NativeConstructor:
      return chain::Call{std::get<NativeTag>(head).name, {}};
    case GenerationStrategy::ImplicitConstructor:
      return chain::Call{std::get<ComponentPath>(head).path + "::" + toolkit_.constructor, {}};
    case GenerationStrategy::VerbatimExpression:
      return chain::Verbatim{std::get<HeadExpr>(head).expr.text};
    case GenerationStrategy::DeferredWrap:
      break;
  }
  return chain::Verbatim{std::get<DeferredHead>(head).name};
}

// Precondition: exactly one Literal or Nested child (checked by the parser).
chain::ChainExpr BuilderGenerator::build_deferred(const Element & elem) const
{
  chain::Call wrapper{toolkit_.defer, {}};

  if (!elem.children.empty()) {
    chain::ChainExpr inner;
    const ChildItem & child = elem.children.front();
    if (const auto * nested = std::get_if<NestedChild>(&child)) {
      inner = build(*nested->element);
    } else if (const auto * lit = std::get_if<LiteralChild>(&child)) {
      inner = chain::ChainExpr{chain::Verbatim{lit->expr.text}, {}};
    }

    chain::ChainExpr erased{chain::Grouped{Box<chain::ChainExpr>(std::move(inner))}, {}};
    erased.links.emplace_back(chain::MethodCall{toolkit_.erase, {}});
    wrapper.args.emplace_back(Box<chain::ChainExpr>(std::move(erased)));
  }

  return chain::ChainExpr{std::move(wrapper), {}};
}

void BuilderGenerator::append_attribute(chain::ChainExpr & out, const Attribute & attr)
{
  std::visit(
    [&out](const auto & a) {
      using T = std::decay_t<decltype(a)>;
      chain::MethodCall call{a.name, {}};
      if constexpr (std::is_same_v<T, KeyValueAttr>) {
        call.args.emplace_back(a.value.text);
      } else if constexpr (std::is_same_v<T, KeyMultiValueAttr>) {
        for (const auto & v : a.values) {
          call.args.emplace_back(v.text);
        }
      }
      out.links.emplace_back(std::move(call));
    },
    attr);
}

void BuilderGenerator::append_child(chain::ChainExpr & out, const ChildItem & child) const
{
  std::visit(
    [this, &out](const auto & c) {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, LiteralChild>) {
        out.links.emplace_back(chain::MethodCall{toolkit_.attach_one, {c.expr.text}});
      } else if constexpr (std::is_same_v<T, SpreadChild>) {
        out.links.emplace_back(chain::MethodCall{toolkit_.attach_many, {c.expr.text}});
      } else if constexpr (std::is_same_v<T, NestedChild>) {
        chain::MethodCall call{toolkit_.attach_one, {}};
        call.args.emplace_back(Box<chain::ChainExpr>(build(*c.element)));
        out.links.emplace_back(std::move(call));
      } else {
        out.links.emplace_back(chain::Splice{c.chain.text});
      }
    },
    child);
}

// ============================================================================
// ChainPrinter
// ============================================================================

std::string ChainPrinter::print(const chain::ChainExpr & expr) const { return render(expr, 0); }

std::string ChainPrinter::newline(uint32_t indent) const
{
  return "\n" + std::string(indent, ' ');
}

std::string ChainPrinter::render(const chain::ChainExpr & expr, uint32_t indent) const
{
  std::string out = render_base(expr.base, indent);
  const uint32_t link_indent = indent + options_.indent_width;

  for (const auto & link : expr.links) {
    if (is_pretty()) {
      out += newline(link_indent);
    }
    std::visit(
      [&](const auto & l) {
        using T = std::decay_t<decltype(l)>;
        if constexpr (std::is_same_v<T, chain::MethodCall>) {
          out += '.';
          out += l.method;
          out += render_args(l.args, is_pretty() ? link_indent : indent);
        } else {
          out += l.text;
        }
      },
      link);
  }
  return out;
}

std::string ChainPrinter::render_base(const chain::ChainBase & base, uint32_t indent) const
{
  return std::visit(
    [&](const auto & b) -> std::string {
      using T = std::decay_t<decltype(b)>;
      if constexpr (std::is_same_v<T, chain::Verbatim>) {
        return b.text;
      } else if constexpr (std::is_same_v<T, chain::Call>) {
        return b.callee + render_args(b.args, indent);
      } else {
        return "(" + render(*b.inner, indent) + ")";
      }
    },
    base);
}

std::string ChainPrinter::render_args(
  const std::vector<chain::Operand> & args, uint32_t indent) const
{
  bool broken = false;
  if (is_pretty()) {
    for (const auto & a : args) {
      broken = broken || is_multiline_chain(a);
    }
  }

  const uint32_t arg_indent = broken ? indent + options_.indent_width : indent;

  std::string out = "(";
  for (size_t i = 0; i < args.size(); ++i) {
    if (broken) {
      out += newline(arg_indent);
    } else if (i > 0) {
      out += ", ";
    }

    std::visit(
      [&](const auto & a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, std::string>) {
          out += a;
        } else {
          out += render(*a, arg_indent);
        }
      },
      args[i]);

    if (broken && i + 1 < args.size()) {
      out += ',';
    }
  }
  if (broken) {
    out += newline(indent);
  }
  out += ')';
  return out;
}

// ============================================================================
// CodeGenerator
// ============================================================================

std::string CodeGenerator::generate(const Markup & markup, const MarkupConfig & config)
{
  const BuilderGenerator builder(config.toolkit);
  const ChainPrinter printer(config.output);
  return printer.print(builder.build(markup));
}

}  // namespace ui_markup
