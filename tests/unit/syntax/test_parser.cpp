// test_parser.cpp - Markup grammar, boundary scanning and error reporting
//
#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/test_support/parse_helpers.hpp"

namespace ui_markup
{

using test_support::parse;

namespace
{

template <typename T>
const T & child_as(const Element & elem, size_t i)
{
  return std::get<T>(elem.children.at(i));
}

template <typename T>
const T & attr_as(const Element & elem, size_t i)
{
  return std::get<T>(elem.attributes.at(i));
}

}  // namespace

// ============================================================================
// Heads
// ============================================================================

TEST(SyntaxParser, NativeTagWithEmptyBody)
{
  auto unit = parse("div {}");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  EXPECT_TRUE(unit.diags.empty());

  const Element & root = *unit.root();
  ASSERT_TRUE(std::holds_alternative<NativeTag>(root.head));
  EXPECT_EQ(std::get<NativeTag>(root.head).name, "div");
  EXPECT_TRUE(root.attributes.empty());
  EXPECT_TRUE(root.children.empty());
  EXPECT_EQ(unit.slice(root.range), "div {}");
}

TEST(SyntaxParser, UppercaseIdentifierIsComponent)
{
  auto unit = parse("Header {}");
  ASSERT_NE(unit.root(), nullptr);
  ASSERT_TRUE(std::holds_alternative<ComponentPath>(unit.root()->head));
  EXPECT_EQ(std::get<ComponentPath>(unit.root()->head).path, "Header");
}

TEST(SyntaxParser, ComponentPathIsJoinedWithoutSpaces)
{
  auto unit = parse("widgets :: Header {}");
  ASSERT_NE(unit.root(), nullptr);
  ASSERT_TRUE(std::holds_alternative<ComponentPath>(unit.root()->head));
  EXPECT_EQ(std::get<ComponentPath>(unit.root()->head).path, "widgets::Header");
}

TEST(SyntaxParser, CallSyntaxMakesExpressionHead)
{
  auto unit = parse("Header::with_label(\"x\") {}");
  ASSERT_NE(unit.root(), nullptr);
  ASSERT_TRUE(std::holds_alternative<HeadExpr>(unit.root()->head));
  EXPECT_EQ(std::get<HeadExpr>(unit.root()->head).expr.text, "Header::with_label(\"x\")");
}

TEST(SyntaxParser, LowercasePathIsExpressionHead)
{
  auto unit = parse("ui::div {}");
  ASSERT_NE(unit.root(), nullptr);
  ASSERT_TRUE(std::holds_alternative<HeadExpr>(unit.root()->head));
  EXPECT_EQ(std::get<HeadExpr>(unit.root()->head).expr.text, "ui::div");
}

TEST(SyntaxParser, ParenthesizedHeadKeepsGrouping)
{
  auto unit = parse("(self.render_row(ix)) { \"x\" }");
  ASSERT_NE(unit.root(), nullptr);
  ASSERT_TRUE(std::holds_alternative<HeadExpr>(unit.root()->head));
  EXPECT_EQ(std::get<HeadExpr>(unit.root()->head).expr.text, "(self.render_row(ix))");
}

TEST(SyntaxParser, OperatorHeadKeepsGrouping)
{
  auto unit = parse("(a + b) @[flex] {}");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_TRUE(std::holds_alternative<HeadExpr>(unit.root()->head));
  EXPECT_EQ(std::get<HeadExpr>(unit.root()->head).expr.text, "(a + b)");
}

TEST(SyntaxParser, UnknownLowercaseHeadIsExpressionByDefault)
{
  auto unit = parse("my_widget {}");
  ASSERT_NE(unit.root(), nullptr);
  EXPECT_EQ(head_kind_name(unit.root()->head), "expression");
}

TEST(SyntaxParser, StrictNativeTagsRejectUnknownLowercaseHead)
{
  MarkupConfig config;
  config.syntax.strict_native_tags = true;
  auto unit = parse("my_widget {}", config);
  EXPECT_FALSE(unit.markup.has_value());
  EXPECT_EQ(unit.first_message(), "unknown element `my_widget`");
}

TEST(SyntaxParser, DeferredHead)
{
  auto unit = parse("deferred { div {} }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  EXPECT_EQ(head_kind_name(unit.root()->head), "deferred");
  ASSERT_EQ(unit.root()->children.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<NestedChild>(unit.root()->children[0]));
}

TEST(SyntaxParser, ConfiguredNamesDriveClassification)
{
  MarkupConfig config;
  config.toolkit.native_tags = {"view"};
  config.syntax.component_pattern = "^Ui";

  auto unit = parse("view { UiButton {}, Header {} }", config);
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  EXPECT_EQ(head_kind_name(unit.root()->head), "native");

  const auto & button = *child_as<NestedChild>(*unit.root(), 0).element;
  EXPECT_EQ(head_kind_name(button.head), "component");
  const auto & header = *child_as<NestedChild>(*unit.root(), 1).element;
  EXPECT_EQ(head_kind_name(header.head), "expression");
}

// ============================================================================
// Attributes
// ============================================================================

TEST(SyntaxParser, AttributeShapes)
{
  auto unit = parse("div @[flex, w: px(200.0), size: (px(1.0), px(2.0)), bg: (red)] {}");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  const Element & root = *unit.root();
  ASSERT_EQ(root.attributes.size(), 4U);

  EXPECT_EQ(attr_as<FlagAttr>(root, 0).name, "flex");

  const auto & w = attr_as<KeyValueAttr>(root, 1);
  EXPECT_EQ(w.name, "w");
  EXPECT_EQ(w.value.text, "px(200.0)");

  const auto & size = attr_as<KeyMultiValueAttr>(root, 2);
  EXPECT_EQ(size.name, "size");
  ASSERT_EQ(size.values.size(), 2U);
  EXPECT_EQ(size.values[0].text, "px(1.0)");
  EXPECT_EQ(size.values[1].text, "px(2.0)");

  // A single parenthesized value keeps its parentheses.
  const auto & bg = attr_as<KeyValueAttr>(root, 3);
  EXPECT_EQ(bg.value.text, "(red)");
}

TEST(SyntaxParser, AttributeValueWithClosureAndTurbofish)
{
  auto unit = parse("div @[on_click: cx.listener(|this, ev, cx| this.go::<A, B>(ev))] {}");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->attributes.size(), 1U);
  EXPECT_EQ(
    attr_as<KeyValueAttr>(*unit.root(), 0).value.text,
    "cx.listener(|this, ev, cx| this.go::<A, B>(ev))");
}

TEST(SyntaxParser, AttributeTrailingCommaIsAllowed)
{
  auto unit = parse("div @[flex, gap_2,] {}");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  EXPECT_EQ(unit.root()->attributes.size(), 2U);
}

// ============================================================================
// Children
// ============================================================================

TEST(SyntaxParser, ChildKinds)
{
  auto unit = parse(R"(div {
    "Title",
    ..items,
    .when(active, |d| d.child("x")),
    Header {},
    self.label.clone(),
  })");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  const Element & root = *unit.root();
  ASSERT_EQ(root.children.size(), 5U);

  EXPECT_EQ(child_as<LiteralChild>(root, 0).expr.text, "\"Title\"");
  EXPECT_EQ(child_as<SpreadChild>(root, 1).expr.text, "items");
  EXPECT_EQ(unit.slice(child_as<SpreadChild>(root, 1).range), "..items");
  EXPECT_EQ(child_as<MethodChainChild>(root, 2).chain.text, ".when(active, |d| d.child(\"x\"))");
  EXPECT_EQ(head_kind_name(child_as<NestedChild>(root, 3).element->head), "component");
  EXPECT_EQ(child_as<LiteralChild>(root, 4).expr.text, "self.label.clone()");
}

TEST(SyntaxParser, MethodChainWithTurbofishAndMultipleCalls)
{
  auto unit = parse("div { .map::<Div, _>(|d| d).flex() }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 1U);
  EXPECT_EQ(child_as<MethodChainChild>(*unit.root(), 0).chain.text, ".map::<Div, _>(|d| d).flex()");
}

TEST(SyntaxParser, ClosureParametersDoNotSplitChildren)
{
  auto unit = parse("div { |a, b| a + b }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 1U);
  EXPECT_EQ(child_as<LiteralChild>(*unit.root(), 0).expr.text, "|a, b| a + b");
}

TEST(SyntaxParser, BitwiseOrIsNotAClosure)
{
  auto unit = parse("div { a | b, c }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 2U);
  EXPECT_EQ(child_as<LiteralChild>(*unit.root(), 0).expr.text, "a | b");
}

TEST(SyntaxParser, TurbofishGenericsDoNotSplitChildren)
{
  auto unit = parse("div { items.iter().collect::<HashMap<K, V>>(), \"x\" }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 2U);
  EXPECT_EQ(
    child_as<LiteralChild>(*unit.root(), 0).expr.text, "items.iter().collect::<HashMap<K, V>>()");
}

TEST(SyntaxParser, KeywordLedChildIsLiteral)
{
  auto unit = parse("div { if open { a } else { b } }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 1U);
  EXPECT_EQ(child_as<LiteralChild>(*unit.root(), 0).expr.text, "if open { a } else { b }");
}

TEST(SyntaxParser, CommentsInsideMarkupAreIgnored)
{
  auto unit = parse("div { /* first */ \"a\", // second\n \"b\" }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  ASSERT_EQ(unit.root()->children.size(), 2U);
  EXPECT_EQ(child_as<LiteralChild>(*unit.root(), 1).expr.text, "\"b\"");
}

TEST(SyntaxParser, NestedElementsKeepSourceRanges)
{
  auto unit = parse("div { span @[bold] { \"x\" } }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  const auto & span = *child_as<NestedChild>(*unit.root(), 0).element;
  EXPECT_EQ(unit.slice(span.range), "span @[bold] { \"x\" }");

  const auto fr = unit.full_range(span.range);
  EXPECT_EQ(fr.start_line, 1U);
  EXPECT_EQ(fr.start_column, 7U);
}

// ============================================================================
// Pass-through
// ============================================================================

TEST(SyntaxParser, ParenthesizedBlockIsPassThrough)
{
  auto unit = parse("(self.cached_view.clone())");
  ASSERT_TRUE(unit.markup.has_value()) << unit.first_message();
  ASSERT_TRUE(std::holds_alternative<ExprFragment>(unit.markup->root));
  EXPECT_EQ(std::get<ExprFragment>(unit.markup->root).text, "(self.cached_view.clone())");
}

TEST(SyntaxParser, TuplePassThroughKeepsParentheses)
{
  auto unit = parse("(a, b)");
  ASSERT_TRUE(unit.markup.has_value()) << unit.first_message();
  EXPECT_EQ(std::get<ExprFragment>(unit.markup->root).text, "(a, b)");
}

// ============================================================================
// Errors
// ============================================================================

struct ErrorCase
{
  const char * source;
  const char * message;
};

class SyntaxParserErrors : public ::testing::TestWithParam<ErrorCase>
{
};

TEST_P(SyntaxParserErrors, ReportsExactlyOneError)
{
  const ErrorCase & c = GetParam();
  auto unit = parse(c.source);
  EXPECT_FALSE(unit.markup.has_value()) << c.source;
  ASSERT_EQ(unit.diags.size(), 1U) << c.source;
  EXPECT_EQ(unit.first_message(), c.message) << c.source;
  EXPECT_EQ(unit.diags.all()[0].severity, Severity::Error);
}

INSTANTIATE_TEST_SUITE_P(
  Grammar, SyntaxParserErrors,
  ::testing::Values(
    ErrorCase{"", "empty markup block"},
    ErrorCase{"  // only a comment", "empty markup block"},
    ErrorCase{"div", "expected `{` after element head"},
    ErrorCase{"()", "empty parenthesized expression"},
    ErrorCase{"() {}", "empty parenthesized element head"},
    ErrorCase{"div @ flex {}", "expected `[` after `@`"},
    ErrorCase{"div @[] {}", "empty attribute list"},
    ErrorCase{"div @[a] @[b] {}", "duplicate attribute list"},
    ErrorCase{"div @[a]", "expected `{` after attribute list"},
    ErrorCase{"div {} @[a]", "attribute list after element body"},
    ErrorCase{"div @[a,,b] {}", "empty attribute"},
    ErrorCase{"div @[\"x\"] {}", "expected attribute name"},
    ErrorCase{"div @[w px] {}", "expected `:` or `,` after attribute `w`"},
    ErrorCase{"div @[w:] {}", "missing value for attribute `w`"},
    ErrorCase{"div @[w: ()] {}", "empty argument list for attribute `w`"},
    ErrorCase{"div @[w: (a,,b)] {}", "empty argument"},
    ErrorCase{"div { a,, b }", "empty child"},
    ErrorCase{"div { .. }", "malformed spread"},
    ErrorCase{"div { ...items }", "malformed spread"},
    ErrorCase{"div { ..=items }", "malformed spread"},
    ErrorCase{"div { .5 }", "malformed method chain"},
    ErrorCase{"div { @[flex], \"x\" }", "stray attribute list"},
    ErrorCase{"div { @flex }", "stray attribute list"},
    ErrorCase{"div {}, span {}", "a markup block has exactly one root element"},
    ErrorCase{"div {} extra", "unexpected tokens after element body"},
    ErrorCase{"div { span {} extra }", "unexpected tokens after element body"},
    ErrorCase{"div { span @[a] }", "expected `{` after attribute list"},
    ErrorCase{"div { a(b] }", "mismatched closing delimiter: expected `)`, found `]`"},
    ErrorCase{"div { \"open }", "unterminated string literal"}));

TEST(SyntaxParser, DuplicateAttributeListPointsAtBothLists)
{
  auto unit = parse("div @[a] @[b] {}");
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.all()[0];
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(unit.slice(d.labels[0].range), "@");
  EXPECT_EQ(d.labels[0].range.get_begin().get_offset(), 9U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(unit.slice(d.labels[1].range), "@[a]");
  ASSERT_TRUE(d.help_message.has_value());
}

TEST(SyntaxParser, ErrorsCarrySyntaxCategory)
{
  auto unit = parse("div @[] {}");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].category, DiagnosticCategory::Syntax);
}

// ============================================================================
// Deferred shape
// ============================================================================

TEST(SyntaxParser, DeferredRejectsAttributes)
{
  auto unit = parse("deferred @[flex] { div {} }");
  EXPECT_FALSE(unit.markup.has_value());
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.all()[0];
  EXPECT_EQ(d.message, "`deferred` does not accept attributes");
  EXPECT_EQ(d.category, DiagnosticCategory::Structural);
  EXPECT_EQ(unit.slice(d.primary_range()), "@[flex]");
}

TEST(SyntaxParser, DeferredRequiresAChild)
{
  auto unit = parse("deferred {}");
  EXPECT_FALSE(unit.markup.has_value());
  EXPECT_EQ(unit.first_message(), "`deferred` must have exactly one child, found none");
}

TEST(SyntaxParser, DeferredRejectsSeveralChildren)
{
  auto unit = parse("deferred { div {}, span {} }");
  EXPECT_FALSE(unit.markup.has_value());
  ASSERT_EQ(unit.diags.size(), 1U);
  const auto & d = unit.diags.all()[0];
  EXPECT_EQ(d.message, "`deferred` must have exactly one child, found 2");
  EXPECT_EQ(unit.slice(d.primary_range()), "span {}");
  EXPECT_EQ(d.category, DiagnosticCategory::Structural);
}

TEST(SyntaxParser, DeferredRejectsSpreadChild)
{
  auto unit = parse("deferred { ..items }");
  EXPECT_FALSE(unit.markup.has_value());
  EXPECT_EQ(unit.first_message(), "`deferred` accepts a single element or expression");
}

TEST(SyntaxParser, DeferredAcceptsLiteralChild)
{
  auto unit = parse("deferred { self.menu.clone() }");
  ASSERT_NE(unit.root(), nullptr) << unit.first_message();
  EXPECT_TRUE(std::holds_alternative<LiteralChild>(unit.root()->children[0]));
}

}  // namespace ui_markup
