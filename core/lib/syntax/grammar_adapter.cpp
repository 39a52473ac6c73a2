// codemap/syntax/grammar_adapter.cpp - Adapter base and shared helpers
#include "codemap/syntax/grammar_adapter.hpp"

#include <cctype>

namespace codemap
{

std::string_view to_string(MarkerRole role) noexcept
{
  switch (role) {
    case MarkerRole::ClassMethod:
      return "class_method";
    case MarkerRole::StaticMethod:
      return "static_method";
  }
  return "unknown";
}

// ============================================================================
// MarkerTable
// ============================================================================

void MarkerTable::add(std::string name, MarkerRole role)
{
  entries_.emplace_back(normalize(name), role);
}

std::optional<MarkerRole> MarkerTable::lookup(std::string_view normalized_name) const
{
  for (const auto & [name, role] : entries_) {
    if (name == normalized_name) {
      return role;
    }
  }

  const auto dot = normalized_name.rfind('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view last = normalized_name.substr(dot + 1);
  for (const auto & [name, role] : entries_) {
    if (name == last) {
      return role;
    }
  }
  return std::nullopt;
}

std::optional<std::string> MarkerTable::find_conflict() const
{
  for (size_t i = 0; i < entries_.size(); ++i) {
    for (size_t j = i + 1; j < entries_.size(); ++j) {
      if (entries_[i].first == entries_[j].first && entries_[i].second != entries_[j].second) {
        return entries_[i].first;
      }
    }
  }
  return std::nullopt;
}

std::string MarkerTable::normalize(std::string_view decorator_text)
{
  std::string out;
  out.reserve(decorator_text.size());
  for (const char c : decorator_text) {
    if (c == '(') {
      break;
    }
    if (c == '@' && out.empty()) {
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

// ============================================================================
// String literals
// ============================================================================

std::string strip_quotes(std::string_view literal)
{
  // Python prefixes (r, b, u, f and combinations) precede the opening quote
  size_t prefix = 0;
  while (prefix < literal.size() && prefix < 3 &&
         std::isalpha(static_cast<unsigned char>(literal[prefix])) != 0) {
    ++prefix;
  }
  if (prefix < literal.size() &&
      (literal[prefix] == '"' || literal[prefix] == '\'' || literal[prefix] == '`')) {
    literal.remove_prefix(prefix);
  }

  if (literal.size() >= 6) {
    const std::string_view head = literal.substr(0, 3);
    if ((head == "\"\"\"" || head == "'''") && literal.substr(literal.size() - 3) == head) {
      return std::string(literal.substr(3, literal.size() - 6));
    }
  }

  if (literal.size() >= 2) {
    const char q = literal.front();
    if ((q == '"' || q == '\'' || q == '`') && literal.back() == q) {
      return std::string(literal.substr(1, literal.size() - 2));
    }
  }
  return std::string(literal);
}

// ============================================================================
// GrammarAdapter
// ============================================================================

namespace
{

bool has_descendant_of_kind(ts_ll::Node node, const KindSet & kinds)
{
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node child = node.named_child(i);
    if (kinds.contains(child.kind()) || has_descendant_of_kind(child, kinds)) {
      return true;
    }
  }
  return false;
}

bool is_blank(std::string_view text)
{
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

GrammarAdapter::GrammarAdapter(LanguageId id, const TSLanguage * language, GrammarCapabilities caps)
: id_(id), language_(language), caps_(std::move(caps))
{
}

ParseResult GrammarAdapter::parse(std::string_view source) const
{
  const ts_ll::Parser parser(language_);
  if (!parser.is_ready()) {
    return ParseResult::failure(
      "grammar for '" + std::string(to_string(id_)) +
      "' could not be loaded (incompatible tree-sitter ABI)");
  }

  ts_ll::Tree tree = parser.parse(source);
  if (tree.is_null()) {
    return ParseResult::failure("parser produced no syntax tree");
  }

  const ts_ll::Node root = tree.root_node();
  if (is_blank(source)) {
    return ParseResult::success(std::move(tree));
  }

  bool all_errors = root.is_error();
  const uint32_t n = root.named_child_count();
  if (!all_errors && n > 0) {
    all_errors = true;
    for (uint32_t i = 0; i < n; ++i) {
      const ts_ll::Node child = root.named_child(i);
      if (!child.is_error() && !caps_.comment_kinds.contains(child.kind())) {
        all_errors = false;
        break;
      }
    }
  }
  if (all_errors && root.has_error()) {
    return ParseResult::failure("no part of the file could be parsed", std::move(tree));
  }

  return ParseResult::success(std::move(tree));
}

std::string GrammarAdapter::declaration_name(ts_ll::Node decl, const SourceFile & source) const
{
  const ts_ll::Node name = decl.child_by_field(caps_.name_field);
  if (name.is_null() || name.is_missing() || name.is_error() || name.start_byte() == name.end_byte()) {
    return {};
  }
  return std::string(name.text(source));
}

std::vector<std::string> GrammarAdapter::base_classes(
  ts_ll::Node cls, const SourceFile & source) const
{
  std::vector<std::string> out;
  const uint32_t n = cls.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node child = cls.named_child(i);
    if (caps_.heritage_kinds.contains(child.kind())) {
      collect_bases(child, source, out);
    }
  }
  return out;
}

void GrammarAdapter::collect_bases(
  ts_ll::Node clause, const SourceFile & source, std::vector<std::string> & out) const
{
  const uint32_t n = clause.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node child = clause.named_child(i);
    const std::string_view kind = child.kind();
    if (child.is_error() || child.is_missing() || caps_.comment_kinds.contains(kind) ||
        caps_.heritage_skip_kinds.contains(kind)) {
      continue;
    }
    if (caps_.heritage_kinds.contains(kind)) {
      collect_bases(child, source, out);
    } else {
      out.emplace_back(child.text(source));
    }
  }
}

bool GrammarAdapter::is_import_statement(ts_ll::Node node) const
{
  return caps_.import_kinds.contains(node.kind());
}

bool GrammarAdapter::is_guard_branch(ts_ll::Node node, const SourceFile & /*source*/) const
{
  return caps_.guard_kinds.contains(node.kind());
}

RelativePath GrammarAdapter::classify_module_path(std::string_view module) const
{
  return caps_.module_layout.dotted_relative ? classify_dotted(module)
                                             : classify_path_style(module);
}

std::optional<std::string> GrammarAdapter::string_value(
  ts_ll::Node node, const SourceFile & source) const
{
  if (!caps_.string_kinds.contains(node.kind())) {
    return std::nullopt;
  }
  if (has_descendant_of_kind(node, caps_.interpolation_kinds)) {
    return std::nullopt;
  }
  return strip_quotes(node.text(source));
}

RelativePath GrammarAdapter::classify_path_style(std::string_view module)
{
  RelativePath result;
  if (module == "." || module == ".." || module.substr(0, 2) == "./" ||
      module.substr(0, 3) == "../") {
    result.relative = true;
  }
  if (!result.relative) {
    return result;
  }

  size_t pos = 0;
  while (pos <= module.size()) {
    const size_t next = module.find('/', pos);
    const std::string_view segment =
      module.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
    if (segment == "..") {
      ++result.depth;
    }
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }
  return result;
}

RelativePath GrammarAdapter::classify_dotted(std::string_view module)
{
  RelativePath result;
  while (result.depth < module.size() && module[result.depth] == '.') {
    ++result.depth;
  }
  result.relative = result.depth > 0;
  return result;
}

ts_ll::Node GrammarAdapter::first_named_child_of_kind(
  ts_ll::Node node, std::initializer_list<std::string_view> kinds)
{
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node child = node.named_child(i);
    for (const auto k : kinds) {
      if (child.kind() == k) {
        return child;
      }
    }
  }
  return {};
}

}  // namespace codemap
