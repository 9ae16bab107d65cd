// test_builder_generator.cpp - Markup -> builder call chain (compact output)
//
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "ui_markup/codegen/builder_generator.hpp"
#include "ui_markup/test_support/parse_helpers.hpp"

namespace ui_markup
{

using test_support::expand;

// ============================================================================
// Base expressions
// ============================================================================

TEST(CodegenBuilder, EmptyNativeElement) { EXPECT_EQ(expand("div {}"), "div()"); }

TEST(CodegenBuilder, ComponentUsesImplicitConstructor)
{
  EXPECT_EQ(expand("Header {}"), "Header::new()");
  EXPECT_EQ(expand("widgets::Header {}"), "widgets::Header::new()");
}

TEST(CodegenBuilder, CallSyntaxHeadIsUsedVerbatim)
{
  EXPECT_EQ(expand("Header::with_label(\"x\") {}"), "Header::with_label(\"x\")");
}

TEST(CodegenBuilder, ParenthesizedHeadExpression)
{
  EXPECT_EQ(expand("(self.row(ix)) { \"x\" }"), "(self.row(ix)).child(\"x\")");
}

TEST(CodegenBuilder, OperatorHeadKeepsPrecedence)
{
  EXPECT_EQ(expand("(a + b) @[flex] {}"), "(a + b).flex()");
  EXPECT_EQ(expand("(*boxed) { \"x\" }"), "(*boxed).child(\"x\")");
}

TEST(CodegenBuilder, PassThroughBlock) { EXPECT_EQ(expand("(my_view)"), "(my_view)"); }

// ============================================================================
// Attributes
// ============================================================================

TEST(CodegenBuilder, FlagAttributesBecomeZeroArgumentCalls)
{
  EXPECT_EQ(expand("div @[flex, flex_col] {}"), "div().flex().flex_col()");
}

TEST(CodegenBuilder, KeyValueAttribute)
{
  EXPECT_EQ(expand("div @[w: px(200.0)] {}"), "div().w(px(200.0))");
}

TEST(CodegenBuilder, KeyMultiValueAttribute)
{
  EXPECT_EQ(expand("div @[size: (px(1.0), px(2.0))] {}"), "div().size(px(1.0), px(2.0))");
}

TEST(CodegenBuilder, ParenthesizedSingleValueKeepsParentheses)
{
  EXPECT_EQ(expand("div @[bg: (red)] {}"), "div().bg((red))");
}

// ============================================================================
// Children
// ============================================================================

TEST(CodegenBuilder, LiteralChildrenAttachInOrder)
{
  EXPECT_EQ(expand("div { \"First\", \"Second\" }"), "div().child(\"First\").child(\"Second\")");
}

TEST(CodegenBuilder, SpreadChildAttachesWholeSequence)
{
  EXPECT_EQ(expand("div { ..items }"), "div().children(items)");
  EXPECT_EQ(
    expand("div { ..self.rows.iter().map(|r| r.view()) }"),
    "div().children(self.rows.iter().map(|r| r.view()))");
}

TEST(CodegenBuilder, NestedElementIsGeneratedInPlace)
{
  EXPECT_EQ(expand("div { svg @[size_4] {} }"), "div().child(svg().size_4())");
}

TEST(CodegenBuilder, MethodChainIsSplicedVerbatim)
{
  EXPECT_EQ(expand("div { .map::<Div, _>(|d| d) }"), "div().map::<Div, _>(|d| d)");
  EXPECT_EQ(
    expand("div { .when(cond, |d| d.child(\"x\")) }"), "div().when(cond, |d| d.child(\"x\"))");
}

TEST(CodegenBuilder, AttributesComeBeforeChildren)
{
  EXPECT_EQ(
    expand("div @[flex] { \"a\", .when(c, |d| d), ..xs }"),
    "div().flex().child(\"a\").when(c, |d| d).children(xs)");
}

TEST(CodegenBuilder, ComponentWithAttributesAndChildren)
{
  EXPECT_EQ(
    expand("Card @[rounded] { Header {}, \"body\" }"),
    "Card::new().rounded().child(Header::new()).child(\"body\")");
}

// ============================================================================
// Deferred
// ============================================================================

TEST(CodegenBuilder, DeferredWrapsErasedChild)
{
  EXPECT_EQ(
    expand("deferred { div { \"x\" } }"), "deferred((div().child(\"x\")).into_any_element())");
}

TEST(CodegenBuilder, DeferredWrapsLiteralChild)
{
  EXPECT_EQ(expand("deferred { menu }"), "deferred((menu).into_any_element())");
}

TEST(CodegenBuilder, NestedDeferred)
{
  EXPECT_EQ(
    expand("anchored { deferred { Menu {} } }"),
    "anchored().child(deferred((Menu::new()).into_any_element()))");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(CodegenBuilder, ToolkitNamesComeFromConfiguration)
{
  MarkupConfig config;
  config.toolkit.native_tags = {"column"};
  config.toolkit.deferred_tag = "later";
  config.toolkit.constructor = "build";
  config.toolkit.attach_one = "push";
  config.toolkit.attach_many = "extend";
  config.toolkit.erase = "boxed";
  config.toolkit.defer = "lazy";

  EXPECT_EQ(
    expand("column { Label {}, ..rest, later { x } }", config),
    "column().push(Label::build()).extend(rest).push(lazy((x).boxed()))");
}

TEST(CodegenBuilder, FailedParseGeneratesNothing)
{
  const auto result = transform_markup("div @[] {}", MarkupConfig{});
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.code.has_value());
  EXPECT_FALSE(result.markup.has_value());
  EXPECT_EQ(result.diagnostics.size(), 1U);
}

TEST(CodegenBuilder, BuildProducesChainModel)
{
  auto unit = test_support::parse("div @[flex] { \"a\", ..xs, .m() }");
  ASSERT_NE(unit.root(), nullptr);

  const MarkupConfig config;
  const BuilderGenerator builder(config.toolkit);
  const chain::ChainExpr expr = builder.build(*unit.root());

  const auto * base = std::get_if<chain::Call>(&expr.base);
  ASSERT_NE(base, nullptr);
  EXPECT_EQ(base->callee, "div");
  EXPECT_TRUE(base->args.empty());

  ASSERT_EQ(expr.links.size(), 4U);
  EXPECT_EQ(std::get<chain::MethodCall>(expr.links[0]).method, "flex");
  EXPECT_EQ(std::get<chain::MethodCall>(expr.links[1]).method, "child");
  EXPECT_EQ(std::get<chain::MethodCall>(expr.links[2]).method, "children");
  EXPECT_EQ(std::get<chain::Splice>(expr.links[3]).text, ".m()");
}

TEST(CodegenBuilder, RepeatedBuildIsIdentical)
{
  const std::string src = "div @[a, b: x, c: (y, z)] { \"p\", ..q, .r(), s {} }";
  const auto first = transform_markup(src, MarkupConfig{});
  const auto second = transform_markup(src, MarkupConfig{});
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(*first.code, *second.code);
}

namespace
{

/// Each link as `method(arg, ...)`, or the spliced text.
std::vector<std::string> link_sequence(const std::string & src)
{
  auto unit = test_support::parse(src);
  std::vector<std::string> out;
  if (unit.root() == nullptr) {
    return out;
  }
  const MarkupConfig config;
  const BuilderGenerator builder(config.toolkit);
  const ChainPrinter printer;
  const chain::ChainExpr expr = builder.build(*unit.root());
  for (const auto & link : expr.links) {
    if (const auto * call = std::get_if<chain::MethodCall>(&link)) {
      std::string text = call->method + "(";
      for (size_t i = 0; i < call->args.size(); ++i) {
        if (i > 0) {
          text += ", ";
        }
        if (const auto * s = std::get_if<std::string>(&call->args[i])) {
          text += *s;
        } else {
          text += printer.print(*std::get<Box<chain::ChainExpr>>(call->args[i]));
        }
      }
      out.push_back(text + ")");
    } else {
      out.push_back(std::get<chain::Splice>(link).text);
    }
  }
  return out;
}

}  // namespace

TEST(CodegenBuilder, LinkOrderFollowsSourceOrder)
{
  const auto original = link_sequence("div @[a, b: x, c: (y, z)] { \"p\", ..q, .r(), s {} }");
  const std::vector<std::string> expected = {
    "a()", "b(x)", "c(y, z)", "child(\"p\")", "children(q)", ".r()", "child(s)"};
  EXPECT_EQ(original, expected);

  const auto permuted = link_sequence("div @[c: (y, z), a, b: x] { s {}, .r(), ..q, \"p\" }");
  const std::vector<std::string> expected_permuted = {
    "c(y, z)", "a()", "b(x)", "child(s)", ".r()", "children(q)", "child(\"p\")"};
  EXPECT_EQ(permuted, expected_permuted);
}

}  // namespace ui_markup
