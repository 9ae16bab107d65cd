// test_expander.cpp - Expanding markup invocations in host source files
//
#include <gtest/gtest.h>

#include <string>

#include "ui_markup/basic/source_manager.hpp"
#include "ui_markup/driver/expander.hpp"
#include "ui_markup/test_support/parse_helpers.hpp"

namespace ui_markup
{

namespace
{

ExpandResult expand_text(const std::string & text, const MarkupConfig & config = {})
{
  return expand_source("view.rs", text, config);
}

}  // namespace

TEST(DriverExpander, ReplacesSingleInvocation)
{
  const auto result = expand_text("let v = ui! { div @[flex] { \"x\" } };\n");
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.output, "let v = div().flex().child(\"x\");\n");

  ASSERT_EQ(result.invocations.size(), 1U);
  const auto & inv = result.invocations[0];
  EXPECT_EQ(inv.range.get_begin().get_offset(), 8U);
  ASSERT_TRUE(inv.code.has_value());
  EXPECT_EQ(*inv.code, "div().flex().child(\"x\")");
}

TEST(DriverExpander, AcceptsAnyDelimiter)
{
  const auto result = expand_text("a(ui!(div {})); b(ui![Header {}]);");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, "a(div()); b(Header::new());");
}

TEST(DriverExpander, PassThroughKeepsPrecedence)
{
  const auto result = expand_text("let x = ui!{ (a + b) } * 2;");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, "let x = (a + b) * 2;");
}

TEST(DriverExpander, LeavesOtherMacrosAndCommentsAlone)
{
  const std::string text =
    "// ui! { not code }\n"
    "println!(\"ui! {{ }}\");\n"
    "let x = ui! { svg {} };\n";
  const auto result = expand_text(text);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
    result.output,
    "// ui! { not code }\n"
    "println!(\"ui! {{ }}\");\n"
    "let x = svg();\n");
  EXPECT_EQ(result.invocations.size(), 1U);
}

TEST(DriverExpander, InvocationsAreIndependent)
{
  const std::string text =
    "fn a() { ui! { div {} } }\n"
    "fn b() { ui! { div @[] {} } }\n"
    "fn c() { ui! { Header {} } }\n";
  const auto result = expand_text(text);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.invocations.size(), 3U);
  EXPECT_TRUE(result.invocations[0].code.has_value());
  EXPECT_FALSE(result.invocations[1].code.has_value());
  EXPECT_TRUE(result.invocations[2].code.has_value());

  // The failing invocation keeps its text; the others are still expanded.
  EXPECT_EQ(
    result.output,
    "fn a() { div() }\n"
    "fn b() { ui! { div @[] {} } }\n"
    "fn c() { Header::new() }\n");

  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].message, "empty attribute list");
}

TEST(DriverExpander, DiagnosticsUseHostPositions)
{
  const std::string text =
    "fn render() {\n"
    "    ui! {\n"
    "        div { ..., }\n"
    "    }\n"
    "}\n";
  const auto result = expand_text(text);
  ASSERT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);

  const auto & d = result.diagnostics.all()[0];
  EXPECT_EQ(d.message, "malformed spread");

  const SourceManager source("view.rs", text);
  const auto lc = source.get_line_column(d.primary_range().get_begin());
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 15U);
}

TEST(DriverExpander, PrettyOutputFollowsInvocationIndent)
{
  const std::string text =
    "fn render() -> Div {\n"
    "    ui! { div @[flex] { \"x\" } }\n"
    "}\n";
  const auto result = expand_text(text, test_support::pretty_config());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
    result.output,
    "fn render() -> Div {\n"
    "    div()\n"
    "        .flex()\n"
    "        .child(\"x\")\n"
    "}\n");
}

TEST(DriverExpander, ConfiguredMacroName)
{
  MarkupConfig config;
  config.macro_name = "html";
  const auto result = expand_text("ui! { div {} }; html! { div {} };", config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, "ui! { div {} }; div();");
}

TEST(DriverExpander, UnterminatedInvocation)
{
  const auto result = expand_text("let v = ui! { div {};\n");
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].message, "unterminated `ui!` invocation");
  EXPECT_EQ(result.diagnostics.all()[0].category, DiagnosticCategory::Driver);
  EXPECT_EQ(result.output, "let v = ui! { div {};\n");
}

TEST(DriverExpander, NoInvocationsIsAWarning)
{
  const auto result = expand_text("fn main() {}\n");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.invocations.empty());
  EXPECT_EQ(result.output, "fn main() {}\n");
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].severity, Severity::Warning);
  EXPECT_EQ(result.diagnostics.all()[0].message, "no `ui!` invocations found in view.rs");
}

TEST(DriverExpander, InvalidConfigurationStopsEarly)
{
  MarkupConfig config;
  config.toolkit.native_tags.push_back("deferred");
  const auto result = expand_text("ui! { div {} }", config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "ui! { div {} }");
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].category, DiagnosticCategory::Driver);
}

TEST(DriverExpander, TransformMarkupWithInvalidConfiguration)
{
  MarkupConfig config;
  config.syntax.component_pattern = "(";
  const auto result = transform_markup("div {}", config);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].category, DiagnosticCategory::Driver);
}

}  // namespace ui_markup
