// codemap/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
//
// Node is a value type over TSNode; Parser and Tree own their tree-sitter
// handles. Grammar-specific knowledge lives in the adapters, not here.
//
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <memory>
#include <string_view>

#include "codemap/basic/source_file.hpp"

namespace codemap::ts_ll
{

//------------------------------------------------------------------------------
// Node
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }

  /// ERROR node produced by error recovery.
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  /// Token inserted by error recovery (zero width).
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }
  /// True when this node or any descendant is an ERROR or MISSING node.
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }

  /// Grammar node type, e.g. "function_definition".
  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * type = is_null() ? nullptr : ts_node_type(node_);
    return type != nullptr ? std::string_view(type) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }
  [[nodiscard]] SourceRange range() const noexcept { return {start_byte(), end_byte()}; }

  /// 1-based line of the first byte.
  [[nodiscard]] uint32_t start_line() const noexcept { return ts_node_start_point(node_).row + 1; }
  [[nodiscard]] uint32_t end_line() const noexcept { return ts_node_end_point(node_).row + 1; }

  /// Line/column span built from the parser's points (1-based).
  [[nodiscard]] Span span() const noexcept;

  [[nodiscard]] std::string_view text(const SourceFile & source) const noexcept
  {
    return source.get_slice(range());
  }

  // Children (all, or named only)
  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  /// Field under which child `i` hangs; empty for unnamed positions.
  [[nodiscard]] std::string_view field_name_for_child(uint32_t i) const noexcept
  {
    const char * field = ts_node_field_name_for_child(node_, i);
    return field != nullptr ? std::string_view(field) : std::string_view();
  }

  // Navigation
  [[nodiscard]] Node parent() const noexcept { return Node(ts_node_parent(node_)); }
  [[nodiscard]] Node next_named_sibling() const noexcept
  {
    return Node(ts_node_next_named_sibling(node_));
  }
  [[nodiscard]] Node prev_named_sibling() const noexcept
  {
    return Node(ts_node_prev_named_sibling(node_));
  }

  bool operator==(const Node & other) const noexcept { return ts_node_eq(node_, other.node_); }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Tree / Parser
//------------------------------------------------------------------------------
struct TreeDeleter
{
  void operator()(TSTree * tree) const noexcept { ts_tree_delete(tree); }
};

struct ParserDeleter
{
  void operator()(TSParser * parser) const noexcept { ts_parser_delete(parser); }
};

/// Owning handle for a parsed syntax tree; empty when parsing failed.
class Tree
{
public:
  Tree() = default;
  explicit Tree(TSTree * tree) : tree_(tree) {}

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_.get())) : Node();
  }

private:
  std::unique_ptr<TSTree, TreeDeleter> tree_;
};

/// A parser bound to one grammar.
class Parser
{
public:
  explicit Parser(const TSLanguage * language);

  /// False when the grammar's ABI version is not supported by the linked runtime.
  [[nodiscard]] bool is_ready() const noexcept { return ready_; }

  /// Parse UTF-8 text; returns an empty tree when the parser is not ready.
  [[nodiscard]] Tree parse(std::string_view text) const;

private:
  std::unique_ptr<TSParser, ParserDeleter> parser_;
  bool ready_ = false;
};

}  // namespace codemap::ts_ll
