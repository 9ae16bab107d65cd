// test_json_visitor.cpp - Unit tests for markup JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/ast/json_visitor.hpp"
#include "ui_markup/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace ui_markup
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto unit = test_support::parse(source);
    EXPECT_TRUE(unit.markup.has_value()) << unit.first_message();
    return unit.markup ? to_json(*unit.markup) : json();
  }
};

TEST_F(JsonVisitorTest, EmptyElement)
{
  auto j = parse_and_serialize("div {}");
  EXPECT_EQ(j["type"], "Markup");
  EXPECT_EQ(j["range"]["start"], 0);
  EXPECT_EQ(j["range"]["end"], 6);

  auto root = j["root"];
  EXPECT_EQ(root["type"], "Element");
  EXPECT_EQ(root["head"]["type"], "NativeTag");
  EXPECT_EQ(root["head"]["name"], "div");
  EXPECT_TRUE(root["attributes"].is_array());
  EXPECT_EQ(root["attributes"].size(), 0);
  EXPECT_EQ(root["children"].size(), 0);
}

TEST_F(JsonVisitorTest, Attributes)
{
  auto j = parse_and_serialize("div @[flex, w: px(1.0), size: (a, b)] {}");
  auto attrs = j["root"]["attributes"];
  ASSERT_EQ(attrs.size(), 3);

  EXPECT_EQ(attrs[0]["type"], "Flag");
  EXPECT_EQ(attrs[0]["name"], "flex");

  EXPECT_EQ(attrs[1]["type"], "KeyValue");
  EXPECT_EQ(attrs[1]["value"]["text"], "px(1.0)");

  EXPECT_EQ(attrs[2]["type"], "KeyMultiValue");
  ASSERT_EQ(attrs[2]["values"].size(), 2);
  EXPECT_EQ(attrs[2]["values"][1]["text"], "b");
}

TEST_F(JsonVisitorTest, Children)
{
  auto j = parse_and_serialize("div { \"x\", ..items, .when(c, |d| d), Header {} }");
  auto children = j["root"]["children"];
  ASSERT_EQ(children.size(), 4);

  EXPECT_EQ(children[0]["type"], "Literal");
  EXPECT_EQ(children[0]["expr"]["text"], "\"x\"");
  EXPECT_EQ(children[1]["type"], "Spread");
  EXPECT_EQ(children[1]["expr"]["text"], "items");
  EXPECT_EQ(children[2]["type"], "MethodChain");
  EXPECT_EQ(children[3]["type"], "Nested");
  EXPECT_EQ(children[3]["element"]["head"]["type"], "Component");
  EXPECT_EQ(children[3]["element"]["head"]["path"], "Header");
}

TEST_F(JsonVisitorTest, HeadKinds)
{
  EXPECT_EQ(parse_and_serialize("make() {}")["root"]["head"]["type"], "Expression");
  EXPECT_EQ(parse_and_serialize("make() {}")["root"]["head"]["expr"]["text"], "make()");
  EXPECT_EQ(parse_and_serialize("deferred { a }")["root"]["head"]["type"], "Deferred");
}

TEST_F(JsonVisitorTest, PassThrough)
{
  auto j = parse_and_serialize("(view)");
  EXPECT_EQ(j["root"]["type"], "PassThrough");
  EXPECT_EQ(j["root"]["expr"]["text"], "(view)");
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  auto j = parse_and_serialize("div { span {} }");
  auto span = j["root"]["children"][0]["element"];
  EXPECT_EQ(span["range"]["start"], 6);
  EXPECT_EQ(span["range"]["end"], 13);
}

}  // namespace ui_markup
