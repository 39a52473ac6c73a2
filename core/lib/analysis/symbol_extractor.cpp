// codemap/analysis/symbol_extractor.cpp - Declaration classification
#include "codemap/analysis/symbol_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "codemap/basic/logging.hpp"

namespace codemap
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

std::string_view strip_comment_markers(std::string_view line)
{
  line = trim(line);
  for (const std::string_view open : {"/**", "/*!", "/*", "///", "//!", "//", "#"}) {
    if (starts_with(line, open)) {
      line.remove_prefix(open.size());
      break;
    }
  }
  if (line.size() >= 2 && line.substr(line.size() - 2) == "*/") {
    line.remove_suffix(2);
  }
  line = trim(line);
  // javadoc continuation lines
  if (!line.empty() && line.front() == '*') {
    line.remove_prefix(1);
  }
  return trim(line);
}

std::string join_cleaned_lines(std::string_view raw, bool strip_markers)
{
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos <= raw.size()) {
    const size_t nl = raw.find('\n', pos);
    const std::string_view line =
      raw.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    lines.push_back(strip_markers ? strip_comment_markers(line) : trim(line));
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }

  while (!lines.empty() && lines.front().empty()) {
    lines.erase(lines.begin());
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out.append(lines[i]);
  }
  return out;
}

std::string synthetic_name(std::string_view prefix, const Span & span)
{
  return std::string(prefix) + "@" + std::to_string(span.start_line) + ":" +
         std::to_string(span.start_column);
}

}  // namespace

std::string clean_comment_text(std::string_view raw) { return join_cleaned_lines(raw, true); }

SymbolExtractor::SymbolExtractor(
  const GrammarAdapter & adapter, const SourceFile & source, DiagnosticBag & diags)
: adapter_(adapter), caps_(adapter.capabilities()), source_(source), diags_(diags)
{
}

std::vector<SymbolRecord> SymbolExtractor::extract(ts_ll::Node root)
{
  if (root.is_null()) {
    throw std::invalid_argument("SymbolExtractor::extract: null syntax tree");
  }

  records_.clear();
  frames_.clear();
  visit(root);
  return std::move(records_);
}

// ============================================================================
// Traversal
// ============================================================================

void SymbolExtractor::visit(ts_ll::Node node)
{
  const Role role = role_of(node);
  if (role == Role::None) {
    visit_children(node);
    return;
  }

  // Forward declarations and elaborated type names (`struct S;`) are not definitions.
  if (role == Role::Class && node.child_by_field(caps_.body_field).is_null() && !node.has_error()) {
    return;
  }

  auto record = build_record(node, role);
  if (!record) {
    return;
  }

  const SymbolId id{static_cast<uint32_t>(records_.size())};
  const SymbolKind kind = record->kind;
  records_.push_back(std::move(*record));

  frames_.push_back(Frame{id, kind});
  visit_children(node);
  frames_.pop_back();
}

void SymbolExtractor::visit_children(ts_ll::Node node)
{
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    visit(node.named_child(i));
  }
}

SymbolExtractor::Role SymbolExtractor::role_of(ts_ll::Node node) const
{
  // Keyword tokens share their kind with the node they introduce ("class", "lambda").
  if (!node.is_named() || node.is_error() || node.is_missing()) {
    return Role::None;
  }
  const std::string_view kind = node.kind();
  if (caps_.function_kinds.contains(kind)) {
    return Role::Function;
  }
  if (caps_.class_kinds.contains(kind)) {
    return Role::Class;
  }
  if (caps_.lambda_kinds.contains(kind)) {
    return Role::Lambda;
  }
  return Role::None;
}

// ============================================================================
// Record construction
// ============================================================================

std::optional<SymbolRecord> SymbolExtractor::build_record(ts_ll::Node node, Role role)
{
  SymbolRecord r;
  r.span = node.span();

  if (role == Role::Lambda) {
    r.name = synthetic_name("<lambda>", r.span);
    r.kind = SymbolKind::Lambda;
    if (const Frame * f = innermost_named()) {
      r.enclosing_scope = f->id;
    }
  } else {
    const ts_ll::Node name_node = node.child_by_field(caps_.name_field);
    r.name = adapter_.declaration_name(node, source_);
    if (r.name.empty()) {
      const bool anonymous_allowed = role == Role::Class &&
                                     caps_.anonymous_class_kinds.contains(node.kind()) &&
                                     name_node.is_null();
      if (!anonymous_allowed) {
        report_anomaly(node, "declaration name could not be recovered");
        return std::nullopt;
      }
      r.name = synthetic_name("<class>", r.span);
    }
    if (const Frame * f = innermost()) {
      r.enclosing_scope = f->id;
    }
  }

  const ts_ll::Node body = node.child_by_field(caps_.body_field);
  if ((body.is_null() && node.has_error()) || (!body.is_null() && body.is_missing())) {
    report_anomaly(node, "declaration body could not be recovered");
    return std::nullopt;
  }

  r.decorators = collect_decorators(node);

  switch (role) {
    case Role::Class:
      r.kind = SymbolKind::Class;
      r.bases = adapter_.base_classes(node, source_);
      if (!r.decorators.empty()) {
        r.modifiers.set(Modifier::Decorated);
      }
      break;
    case Role::Function:
      r.kind = classify_function(node, r.name, r.decorators, r.modifiers);
      break;
    case Role::Lambda:
    case Role::None:
      break;
  }

  if (role != Role::Class) {
    if (!caps_.async_token.empty() && has_token_child(node, caps_.async_token)) {
      r.modifiers.set(Modifier::Async);
    } else if (body_contains(node, caps_.await_kinds)) {
      r.modifiers.set(Modifier::Async);
    }

    if (caps_.generator_kinds.contains(node.kind()) ||
        (!caps_.generator_token.empty() && has_token_child(node, caps_.generator_token)) ||
        body_contains(node, caps_.suspension_kinds)) {
      r.modifiers.set(Modifier::Generator);
    }
  }

  if (role != Role::Lambda) {
    r.doc_comment = doc_comment(node);
  }
  return r;
}

SymbolKind SymbolExtractor::classify_function(
  ts_ll::Node node, const std::string & name, const std::vector<std::string> & decorators,
  ModifierSet & modifiers) const
{
  const Frame * scope = innermost();
  const bool in_class = scope != nullptr && scope->kind == SymbolKind::Class;

  std::optional<MarkerRole> marker;
  bool decorated = false;
  for (const auto & d : decorators) {
    const auto role =
      in_class ? caps_.markers.lookup(MarkerTable::normalize(d)) : std::optional<MarkerRole>();
    if (role) {
      if (!marker) {
        marker = role;
      }
    } else {
      decorated = true;
    }
  }
  if (decorated) {
    modifiers.set(Modifier::Decorated);
  }

  if (!in_class) {
    return SymbolKind::Function;
  }
  if (marker == MarkerRole::ClassMethod) {
    modifiers.set(Modifier::ClassBound);
    return SymbolKind::ClassMethod;
  }
  if (marker == MarkerRole::StaticMethod || has_static_keyword(node)) {
    modifiers.set(Modifier::Static);
    return SymbolKind::StaticMethod;
  }
  if (is_constructor(node, name)) {
    return SymbolKind::Constructor;
  }
  return SymbolKind::Method;
}

bool SymbolExtractor::is_constructor(ts_ll::Node node, const std::string & name) const
{
  if (caps_.constructor_kinds.contains(node.kind())) {
    return true;
  }
  if (std::find(caps_.constructor_names.begin(), caps_.constructor_names.end(), name) !=
      caps_.constructor_names.end()) {
    return true;
  }
  if (caps_.constructor_matches_class_name) {
    const Frame * scope = innermost();
    return scope != nullptr && records_[scope->id.value].name == name;
  }
  return false;
}

// ============================================================================
// Node queries
// ============================================================================

std::vector<std::string> SymbolExtractor::collect_decorators(ts_ll::Node node) const
{
  std::vector<ts_ll::Node> found;
  const auto add_decorators_of = [&](ts_ll::Node container) {
    const uint32_t n = container.named_child_count();
    for (uint32_t i = 0; i < n; ++i) {
      const ts_ll::Node c = container.named_child(i);
      if (caps_.decorator_kinds.contains(c.kind())) {
        found.push_back(c);
      }
    }
  };

  add_decorators_of(node);
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = node.named_child(i);
    if (caps_.modifier_container_kinds.contains(c.kind())) {
      add_decorators_of(c);
    }
  }

  ts_ll::Node anchor = node;
  for (ts_ll::Node p = node.parent(); !p.is_null() && caps_.wrapper_kinds.contains(p.kind());
       p = p.parent()) {
    add_decorators_of(p);
    anchor = p;
  }

  // Decorators written as siblings right before a class member
  for (ts_ll::Node prev = anchor.prev_named_sibling();
       !prev.is_null() && caps_.decorator_kinds.contains(prev.kind());
       prev = prev.prev_named_sibling()) {
    found.push_back(prev);
  }

  std::sort(found.begin(), found.end(), [](const ts_ll::Node & a, const ts_ll::Node & b) {
    return a.start_byte() < b.start_byte();
  });
  found.erase(
    std::unique(
      found.begin(), found.end(),
      [](const ts_ll::Node & a, const ts_ll::Node & b) { return a.start_byte() == b.start_byte(); }),
    found.end());

  std::vector<std::string> texts;
  texts.reserve(found.size());
  for (const auto & d : found) {
    texts.emplace_back(d.text(source_));
  }
  return texts;
}

bool SymbolExtractor::has_token_child(ts_ll::Node node, std::string_view token) const
{
  const uint32_t n = node.child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = node.child(i);
    if (!c.is_named() && c.kind() == token) {
      return true;
    }
  }
  return false;
}

bool SymbolExtractor::has_static_keyword(ts_ll::Node node) const
{
  if (caps_.static_token.empty()) {
    return false;
  }
  if (has_token_child(node, caps_.static_token)) {
    return true;
  }
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = node.named_child(i);
    if (caps_.modifier_container_kinds.contains(c.kind()) &&
        (has_token_child(c, caps_.static_token) || c.text(source_) == caps_.static_token)) {
      return true;
    }
  }
  return false;
}

bool SymbolExtractor::body_contains(ts_ll::Node node, const KindSet & kinds) const
{
  if (kinds.empty()) {
    return false;
  }
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = node.named_child(i);
    const std::string_view kind = c.kind();
    if (kinds.contains(kind)) {
      return true;
    }
    // Suspension points of nested functions belong to them.
    if (caps_.function_kinds.contains(kind) || caps_.lambda_kinds.contains(kind) ||
        caps_.class_kinds.contains(kind)) {
      continue;
    }
    if (body_contains(c, kinds)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> SymbolExtractor::doc_comment(ts_ll::Node node) const
{
  if (caps_.docstring_in_body) {
    if (auto doc = body_docstring(node)) {
      return doc;
    }
  }
  return leading_comment(node);
}

std::optional<std::string> SymbolExtractor::body_docstring(ts_ll::Node node) const
{
  const ts_ll::Node body = node.child_by_field(caps_.body_field);
  if (body.is_null()) {
    return std::nullopt;
  }

  ts_ll::Node first;
  const uint32_t n = body.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = body.named_child(i);
    if (!caps_.comment_kinds.contains(c.kind())) {
      first = c;
      break;
    }
  }
  if (first.is_null() || first.kind() != "expression_statement" || first.named_child_count() == 0) {
    return std::nullopt;
  }
  const ts_ll::Node literal = first.named_child(0);
  if (!caps_.string_kinds.contains(literal.kind())) {
    return std::nullopt;
  }

  std::string doc = join_cleaned_lines(strip_quotes(literal.text(source_)), false);
  if (doc.empty()) {
    return std::nullopt;
  }
  return doc;
}

std::optional<std::string> SymbolExtractor::leading_comment(ts_ll::Node node) const
{
  ts_ll::Node anchor = node;
  while (!anchor.parent().is_null() && caps_.wrapper_kinds.contains(anchor.parent().kind())) {
    anchor = anchor.parent();
  }

  uint32_t top_line = anchor.start_line();
  ts_ll::Node prev = anchor.prev_named_sibling();
  while (!prev.is_null() && caps_.decorator_kinds.contains(prev.kind())) {
    top_line = prev.start_line();
    prev = prev.prev_named_sibling();
  }

  std::vector<ts_ll::Node> block;
  while (!prev.is_null() && caps_.comment_kinds.contains(prev.kind()) &&
         prev.end_line() + 1 >= top_line) {
    // A comment trailing code on the same line documents that code.
    const ts_ll::Node before = prev.prev_sibling();
    if (!before.is_null() && before.end_line() == prev.start_line() &&
        !caps_.comment_kinds.contains(before.kind())) {
      break;
    }
    block.push_back(prev);
    top_line = prev.start_line();
    prev = prev.prev_named_sibling();
  }
  if (block.empty()) {
    return std::nullopt;
  }

  std::string raw;
  for (auto it = block.rbegin(); it != block.rend(); ++it) {
    if (!raw.empty()) {
      raw.push_back('\n');
    }
    raw.append(it->text(source_));
  }

  std::string doc = clean_comment_text(raw);
  if (doc.empty()) {
    return std::nullopt;
  }
  return doc;
}

// ============================================================================
// Scope stack
// ============================================================================

const SymbolExtractor::Frame * SymbolExtractor::innermost() const noexcept
{
  return frames_.empty() ? nullptr : &frames_.back();
}

const SymbolExtractor::Frame * SymbolExtractor::innermost_named() const noexcept
{
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->kind != SymbolKind::Lambda) {
      return &*it;
    }
  }
  return nullptr;
}

void SymbolExtractor::report_anomaly(ts_ll::Node node, std::string message)
{
  const Span span = node.span();
  logging::logger()->debug(
    "{}:{}:{}: skipping {} ({})", source_.path().string(), span.start_line, span.start_column,
    node.kind(), message);
  diags_
    .report_warning(
      DiagnosticKind::DeclarationAnomaly, span, std::move(message), "declaration skipped")
    .with_help("fix the syntax error to include this declaration in the map");
}

}  // namespace codemap
