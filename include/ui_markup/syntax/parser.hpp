// ui_markup/syntax/parser.hpp - Recursive-descent markup parser
#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "ui_markup/ast/ast.hpp"
#include "ui_markup/basic/diagnostic.hpp"
#include "ui_markup/project/markup_config.hpp"
#include "ui_markup/syntax/token_stream.hpp"

namespace ui_markup::syntax
{

/**
 * Parses one markup block into a `Markup` tree.
 *
 * Every rule works on a half-open token range [begin, end). Expression
 * regions are never parsed: the boundary scanner only finds where they end
 * (the next depth-0 comma), stepping over delimiter groups, turbofish
 * arguments and closure parameter lists.
 *
 * Parsing is fail-fast: the first error is reported and nothing is returned.
 *
 * The configuration must have passed `validate_markup_config`.
 */
class Parser
{
public:
  Parser(const TokenStream & tokens, const MarkupConfig & config, DiagnosticBag & diags);

  [[nodiscard]] std::optional<Markup> parse_markup();

private:
  // Scanners
  [[nodiscard]] size_t item_end(size_t begin, size_t end) const;
  [[nodiscard]] size_t skip_generic_args(size_t lt, size_t end) const;
  [[nodiscard]] size_t skip_closure_params(size_t pipe, size_t end) const;
  [[nodiscard]] bool is_expression_start(size_t i, size_t begin) const;
  [[nodiscard]] size_t find_body_marker(size_t begin, size_t end) const;
  [[nodiscard]] bool has_depth0_comma(size_t begin, size_t end) const;
  [[nodiscard]] bool looks_like_element(size_t begin, size_t end) const;

  // Rules
  [[nodiscard]] std::optional<Element> parse_element(size_t begin, size_t end, bool top_level);
  [[nodiscard]] std::optional<HeadKind> parse_head(size_t begin, size_t end);
  [[nodiscard]] bool parse_attributes(size_t begin, size_t end, std::vector<Attribute> & out);
  [[nodiscard]] std::optional<Attribute> parse_attribute(size_t begin, size_t end);
  [[nodiscard]] bool parse_children(size_t begin, size_t end, std::vector<ChildItem> & out);
  [[nodiscard]] std::optional<ChildItem> parse_child(size_t begin, size_t end);
  [[nodiscard]] bool check_deferred(const Element & elem, SourceRange attr_range);

  [[nodiscard]] bool is_component_name(std::string_view segment) const;
  [[nodiscard]] ExprFragment fragment(size_t begin, size_t end) const;

  DiagnosticBuilder error_at(SourceRange range, std::string msg, std::string label = "");

  const TokenStream & ts_;
  const MarkupConfig & config_;
  DiagnosticBag & diags_;
  std::regex component_rule_;
};

}  // namespace ui_markup::syntax
