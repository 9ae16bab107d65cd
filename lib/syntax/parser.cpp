#include "ui_markup/syntax/parser.hpp"

#include <cctype>
#include <string>
#include <utility>

#include "ui_markup/syntax/keywords.hpp"

namespace ui_markup::syntax
{
namespace
{

constexpr const char * k_attr_placement_help =
  "attributes are written `@[...]` and sit between the element head and its body: "
  "`div @[flex] { ... }`";

constexpr const char * k_body_required_help =
  "the `{ }` body is what makes this a UI element rather than a plain expression; "
  "write `{}` for an element without children, or wrap a plain expression in "
  "parentheses: `(expr)`";

[[nodiscard]] std::string_view strip_raw_prefix(std::string_view ident) noexcept
{
  return (ident.substr(0, 2) == "r#") ? ident.substr(2) : ident;
}

[[nodiscard]] bool ends_operand(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::Lifetime:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::CharLiteral:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::Question:
      return true;
    default:
      return false;
  }
}

}  // namespace

Parser::Parser(const TokenStream & tokens, const MarkupConfig & config, DiagnosticBag & diags)
: ts_(tokens),
  config_(config),
  diags_(diags),
  component_rule_(config.syntax.component_pattern, std::regex::ECMAScript)
{
}

DiagnosticBuilder Parser::error_at(SourceRange range, std::string msg, std::string label)
{
  return diags_.report_error(range, std::move(msg), std::move(label));
}

ExprFragment Parser::fragment(size_t begin, size_t end) const
{
  return ExprFragment{ts_.text(begin, end), ts_.range(begin, end)};
}

bool Parser::is_component_name(std::string_view segment) const
{
  const std::string s(strip_raw_prefix(segment));
  return std::regex_search(s, component_rule_);
}

// ============================================================================
// Boundary scanner
// ============================================================================

size_t Parser::item_end(size_t begin, size_t end) const
{
  for (size_t i = begin; i < end; ++i) {
    const TokenKind k = ts_[i].kind;

    if (k == TokenKind::Comma) {
      return i;
    }
    if (is_open_delimiter(k)) {
      i = ts_.partner(i);
      continue;
    }
    // Turbofish: `::<A, B>`
    if (
      k == TokenKind::ColonColon && i + 1 < end &&
      (ts_[i + 1].kind == TokenKind::Lt || ts_[i + 1].kind == TokenKind::Shl)) {
      i = skip_generic_args(i + 1, end) - 1;
      continue;
    }
    // Closure parameters: `|a, b|`
    if (k == TokenKind::Pipe && is_expression_start(i, begin)) {
      i = skip_closure_params(i, end) - 1;
      continue;
    }
  }
  return end;
}

size_t Parser::skip_generic_args(size_t lt, size_t end) const
{
  int depth = 0;
  for (size_t i = lt; i < end; ++i) {
    switch (ts_[i].kind) {
      case TokenKind::Lt:
        depth += 1;
        break;
      case TokenKind::Shl:
        depth += 2;
        break;
      case TokenKind::Gt:
        depth -= 1;
        break;
      case TokenKind::Shr:
        depth -= 2;
        break;
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace:
        i = ts_.partner(i);
        break;
      default:
        break;
    }
    if (depth <= 0) {
      return i + 1;
    }
  }
  return end;
}

size_t Parser::skip_closure_params(size_t pipe, size_t end) const
{
  for (size_t i = pipe + 1; i < end; ++i) {
    const TokenKind k = ts_[i].kind;
    if (k == TokenKind::Pipe) {
      return i + 1;
    }
    if (is_open_delimiter(k)) {
      i = ts_.partner(i);
    }
  }
  // No closing `|`: not a parameter list after all.
  return pipe + 1;
}

bool Parser::is_expression_start(size_t i, size_t begin) const
{
  if (i == begin) {
    return true;
  }
  const Token & prev = ts_[i - 1];
  if (prev.kind == TokenKind::Identifier) {
    return is_closure_prefix_keyword(prev.text) || is_expression_keyword(prev.text);
  }
  return !ends_operand(prev.kind);
}

size_t Parser::find_body_marker(size_t begin, size_t end) const
{
  for (size_t i = begin; i < end; ++i) {
    const TokenKind k = ts_[i].kind;
    if (k == TokenKind::At || k == TokenKind::LBrace) {
      return i;
    }
    if (is_open_delimiter(k)) {
      i = ts_.partner(i);
    }
  }
  return end;
}

bool Parser::has_depth0_comma(size_t begin, size_t end) const
{
  return item_end(begin, end) != end;
}

bool Parser::looks_like_element(size_t begin, size_t end) const
{
  if (begin >= end) {
    return false;
  }
  const Token & first = ts_[begin];
  if (first.kind == TokenKind::Identifier && is_expression_keyword(first.text)) {
    return false;
  }
  if (
    first.kind == TokenKind::Pipe || first.kind == TokenKind::OrOr ||
    first.kind == TokenKind::Lifetime) {
    return false;
  }
  const size_t marker = find_body_marker(begin, end);
  return marker != end && marker > begin;
}

// ============================================================================
// Rules
// ============================================================================

std::optional<Markup> Parser::parse_markup()
{
  const size_t end = ts_.eof_index();

  if (end == 0) {
    error_at(ts_.range(0, 0), "empty markup block", "expected an element here")
      .with_help("write an element such as `div {}`, or a parenthesized expression `(expr)`");
    return std::nullopt;
  }

  // Pass-through: `(expr)`
  if (ts_[0].kind == TokenKind::LParen && ts_.partner(0) == end - 1) {
    if (end == 2) {
      error_at(ts_.range(0, end), "empty parenthesized expression", "nothing inside `()`")
        .with_help("put an expression inside the parentheses, or write an element `div {}`");
      return std::nullopt;
    }
    return Markup{fragment(0, end), ts_.range(0, end)};
  }

  if (find_body_marker(0, end) == end) {
    error_at(ts_.range(0, end), "expected `{` after element head", "element body missing")
      .with_help(k_body_required_help);
    return std::nullopt;
  }

  auto elem = parse_element(0, end, /*top_level=*/true);
  if (!elem) {
    return std::nullopt;
  }
  const SourceRange range = elem->range;
  return Markup{std::move(*elem), range};
}

std::optional<Element> Parser::parse_element(size_t begin, size_t end, bool top_level)
{
  const size_t marker = find_body_marker(begin, end);
  if (marker == end) {
    error_at(ts_.range(begin, end), "expected `{` after element head", "element body missing")
      .with_help(k_body_required_help);
    return std::nullopt;
  }
  if (marker == begin) {
    error_at(ts_[marker].range, "expected an element head", "nothing before this")
      .with_help("start an element with a tag, a component or an expression: `div { ... }`");
    return std::nullopt;
  }

  auto head = parse_head(begin, marker);
  if (!head) {
    return std::nullopt;
  }

  Element elem;
  elem.head = std::move(*head);

  size_t pos = marker;
  SourceRange attr_range;

  if (ts_[pos].kind == TokenKind::At) {
    if (pos + 1 >= end || ts_[pos + 1].kind != TokenKind::LBracket) {
      error_at(ts_[pos].range, "expected `[` after `@`", "attribute list must be `@[...]`")
        .with_help(k_attr_placement_help);
      return std::nullopt;
    }
    const size_t close = ts_.partner(pos + 1);
    attr_range = ts_.range(pos, close + 1);
    if (close == pos + 2) {
      error_at(attr_range, "empty attribute list", "`@[]` has no attributes")
        .with_help("remove the `@[]`, or list attributes such as `@[flex, w: px(10.0)]`");
      return std::nullopt;
    }
    if (!parse_attributes(pos + 2, close, elem.attributes)) {
      return std::nullopt;
    }
    pos = close + 1;

    if (pos >= end || ts_[pos].kind != TokenKind::LBrace) {
      if (pos < end && ts_[pos].kind == TokenKind::At) {
        error_at(ts_[pos].range, "duplicate attribute list", "second attribute list")
          .with_secondary_label(attr_range, "first attribute list")
          .with_help("merge the attributes into one `@[...]` between the head and the body");
        return std::nullopt;
      }
      const SourceRange where = (pos < end) ? ts_[pos].range
                                            : SourceRange(attr_range.get_end(), attr_range.get_end());
      error_at(where, "expected `{` after attribute list", "element body missing")
        .with_help(k_body_required_help);
      return std::nullopt;
    }
  }

  const size_t body_close = ts_.partner(pos);
  if (!parse_children(pos + 1, body_close, elem.children)) {
    return std::nullopt;
  }

  const size_t after = body_close + 1;
  if (after < end) {
    const Token & t = ts_[after];
    if (t.kind == TokenKind::At) {
      error_at(t.range, "attribute list after element body", "attributes cannot follow the body")
        .with_help(k_attr_placement_help);
    } else if (top_level && t.kind == TokenKind::Comma) {
      error_at(t.range, "a markup block has exactly one root element", "unexpected `,`")
        .with_help("wrap sibling elements in a container: `div { a {}, b {} }`");
    } else {
      error_at(
        ts_.range(after, end), "unexpected tokens after element body",
        top_level ? "expected the end of the markup block" : "expected `,` or the end of the group")
        .with_help("separate sibling children with commas");
    }
    return std::nullopt;
  }

  elem.range = ts_.range(begin, body_close + 1);

  if (std::holds_alternative<DeferredHead>(elem.head) && !check_deferred(elem, attr_range)) {
    return std::nullopt;
  }
  return elem;
}

std::optional<HeadKind> Parser::parse_head(size_t begin, size_t end)
{
  const Token & first = ts_[begin];

  if (end - begin == 1 && first.kind == TokenKind::Identifier) {
    const std::string name(first.text);
    if (name == config_.toolkit.deferred_tag) {
      return HeadKind{DeferredHead{name, first.range}};
    }
    if (config_.toolkit.is_native_tag(name)) {
      return HeadKind{NativeTag{name, first.range}};
    }
    if (is_component_name(name)) {
      return HeadKind{ComponentPath{name, first.range}};
    }
    if (
      config_.syntax.strict_native_tags &&
      std::islower(static_cast<unsigned char>(strip_raw_prefix(name).front())) != 0) {
      std::string allowed;
      for (const auto & tag : config_.toolkit.native_tags) {
        allowed += allowed.empty() ? "" : ", ";
        allowed += tag;
      }
      error_at(first.range, "unknown element `" + name + "`", "not a native element")
        .with_help(
          "native elements are: " + allowed + ", " + config_.toolkit.deferred_tag +
          "; components start with an uppercase letter; wrap any other expression in "
          "parentheses: `(" +
          name + ")`");
      return std::nullopt;
    }
    return HeadKind{HeadExpr{fragment(begin, end)}};
  }

  // Identifier path: `a::b::Header`, `::ui::Header`
  {
    size_t i = begin;
    if (ts_[i].kind == TokenKind::ColonColon) {
      ++i;
    }
    bool is_path = i < end;
    std::string_view last;
    for (bool want_ident = true; is_path && i < end; ++i, want_ident = !want_ident) {
      const TokenKind k = ts_[i].kind;
      if (want_ident) {
        is_path = (k == TokenKind::Identifier);
        last = ts_[i].text;
      } else {
        is_path = (k == TokenKind::ColonColon) && i + 1 < end;
      }
    }
    if (is_path && is_component_name(last)) {
      std::string path;
      for (size_t j = begin; j < end; ++j) {
        path += ts_[j].text;
      }
      return HeadKind{ComponentPath{std::move(path), ts_.range(begin, end)}};
    }
  }

  // The grouping of `(expr)` is kept: attribute and child calls bind to the whole expression.
  if (
    first.kind == TokenKind::LParen && ts_.partner(begin) == end - 1 && end - begin == 2) {
    error_at(ts_.range(begin, end), "empty parenthesized element head", "nothing inside `()`")
      .with_help("put the expression that builds the element inside the parentheses");
    return std::nullopt;
  }

  return HeadKind{HeadExpr{fragment(begin, end)}};
}

bool Parser::parse_attributes(size_t begin, size_t end, std::vector<Attribute> & out)
{
  size_t i = begin;
  while (i < end) {
    const size_t j = item_end(i, end);
    if (i == j) {
      error_at(ts_[j].range, "empty attribute", "expected an attribute before `,`")
        .with_help("remove the extra comma");
      return false;
    }
    auto attr = parse_attribute(i, j);
    if (!attr) {
      return false;
    }
    out.push_back(std::move(*attr));
    i = j + 1;
  }
  return true;
}

std::optional<Attribute> Parser::parse_attribute(size_t begin, size_t end)
{
  const Token & name_tok = ts_[begin];
  if (name_tok.kind != TokenKind::Identifier) {
    error_at(name_tok.range, "expected attribute name", "found `" + std::string(name_tok.text) + "`")
      .with_help("attributes are `name` or `name: value`");
    return std::nullopt;
  }
  const std::string name(name_tok.text);

  if (end == begin + 1) {
    return Attribute{FlagAttr{name, name_tok.range}};
  }

  const Token & sep = ts_[begin + 1];
  if (sep.kind != TokenKind::Colon) {
    error_at(sep.range, "expected `:` or `,` after attribute `" + name + "`")
      .with_help(
        "write a flag as `" + name + "`, and a method with arguments as `" + name +
        ": value` or `" + name + ": (a, b)`");
    return std::nullopt;
  }

  const size_t v = begin + 2;
  if (v == end) {
    error_at(sep.range, "missing value for attribute `" + name + "`", "expected a value after `:`")
      .with_help("use a flag `" + name + "` to call `." + name + "()` without arguments");
    return std::nullopt;
  }

  const SourceRange range = ts_.range(begin, end);

  if (ts_[v].kind == TokenKind::LParen && ts_.partner(v) == end - 1) {
    const size_t inner_begin = v + 1;
    const size_t inner_end = end - 1;
    if (inner_begin == inner_end) {
      error_at(ts_.range(v, end), "empty argument list for attribute `" + name + "`", "`()`")
        .with_help("use a flag `" + name + "` to call `." + name + "()` without arguments");
      return std::nullopt;
    }
    if (has_depth0_comma(inner_begin, inner_end)) {
      KeyMultiValueAttr multi{name, {}, range};
      size_t i = inner_begin;
      while (i < inner_end) {
        const size_t j = item_end(i, inner_end);
        if (i == j) {
          error_at(ts_[j].range, "empty argument", "expected an expression before `,`")
            .with_help("remove the extra comma");
          return std::nullopt;
        }
        multi.values.push_back(fragment(i, j));
        i = j + 1;
      }
      return Attribute{std::move(multi)};
    }
  }

  return Attribute{KeyValueAttr{name, fragment(v, end), range}};
}

bool Parser::parse_children(size_t begin, size_t end, std::vector<ChildItem> & out)
{
  size_t i = begin;
  while (i < end) {
    const size_t j = item_end(i, end);
    if (i == j) {
      error_at(ts_[j].range, "empty child", "expected a child before `,`")
        .with_help("remove the extra comma");
      return false;
    }
    auto child = parse_child(i, j);
    if (!child) {
      return false;
    }
    out.push_back(std::move(*child));
    i = j + 1;
  }
  return true;
}

std::optional<ChildItem> Parser::parse_child(size_t begin, size_t end)
{
  const Token & first = ts_[begin];

  switch (first.kind) {
    case TokenKind::DotDot:
      if (end == begin + 1) {
        error_at(first.range, "malformed spread", "expected an expression after `..`")
          .with_help("spread a collection of children with `..items`");
        return std::nullopt;
      }
      return ChildItem{SpreadChild{fragment(begin + 1, end), ts_.range(begin, end)}};

    case TokenKind::DotDotDot:
    case TokenKind::DotDotEq:
      error_at(first.range, "malformed spread", "`" + std::string(first.text) + "` is not a spread")
        .with_help("spread a collection of children with `..items`");
      return std::nullopt;

    case TokenKind::At:
      error_at(first.range, "stray attribute list", "attributes need an element head")
        .with_help(k_attr_placement_help);
      return std::nullopt;

    case TokenKind::Dot:
      if (end == begin + 1 || ts_[begin + 1].kind != TokenKind::Identifier) {
        error_at(first.range, "malformed method chain", "expected a method name after `.`")
          .with_help("method chains are written `.method(args)`, e.g. `.when(cond, |d| d)`");
        return std::nullopt;
      }
      return ChildItem{MethodChainChild{fragment(begin, end)}};

    default:
      break;
  }

  if (looks_like_element(begin, end)) {
    auto elem = parse_element(begin, end, /*top_level=*/false);
    if (!elem) {
      return std::nullopt;
    }
    return ChildItem{NestedChild{Box<Element>(std::move(*elem))}};
  }

  return ChildItem{LiteralChild{fragment(begin, end)}};
}

bool Parser::check_deferred(const Element & elem, SourceRange attr_range)
{
  const auto & head = std::get<DeferredHead>(elem.head);

  if (!elem.attributes.empty()) {
    error_at(attr_range, "`" + head.name + "` does not accept attributes")
      .with_category(DiagnosticCategory::Structural)
      .with_secondary_label(head.range, "deferred element")
      .with_help("put the attributes on the wrapped child instead");
    return false;
  }

  if (elem.children.empty()) {
    error_at(elem.range, "`" + head.name + "` must have exactly one child, found none")
      .with_category(DiagnosticCategory::Structural)
      .with_help("wrap a single element: `" + head.name + " { div { ... } }`");
    return false;
  }

  if (elem.children.size() > 1) {
    error_at(
      get_range(elem.children[1]),
      "`" + head.name + "` must have exactly one child, found " +
        std::to_string(elem.children.size()),
      "extra child")
      .with_category(DiagnosticCategory::Structural)
      .with_secondary_label(head.range, "deferred element")
      .with_help("wrap the children in a container: `" + head.name + " { div { a, b } }`");
    return false;
  }

  const ChildItem & only = elem.children.front();
  if (std::holds_alternative<SpreadChild>(only) || std::holds_alternative<MethodChainChild>(only)) {
    error_at(get_range(only), "`" + head.name + "` accepts a single element or expression")
      .with_category(DiagnosticCategory::Structural)
      .with_help("spreads and method chains need an enclosing element to attach to");
    return false;
  }

  return true;
}

}  // namespace ui_markup::syntax
