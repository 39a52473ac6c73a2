// codemap/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "codemap/syntax/ts_ll.hpp"

namespace codemap::ts_ll
{

Span Node::span() const noexcept
{
  if (is_null()) {
    return {};
  }
  const TSPoint start = ts_node_start_point(node_);
  const TSPoint end = ts_node_end_point(node_);
  return Span{
    .start_line = start.row + 1,
    .start_column = start.column + 1,
    .end_line = end.row + 1,
    .end_column = end.column + 1,
    .start_byte = start_byte(),
    .end_byte = end_byte(),
  };
}

Parser::Parser(const TSLanguage * language) : parser_(ts_parser_new())
{
  ready_ = parser_ != nullptr && language != nullptr &&
           ts_parser_set_language(parser_.get(), language);
}

Tree Parser::parse(std::string_view text) const
{
  if (!ready_) {
    return Tree();
  }
  return Tree(ts_parser_parse_string(
    parser_.get(), nullptr, text.data(), static_cast<uint32_t>(text.size())));
}

}  // namespace codemap::ts_ll
