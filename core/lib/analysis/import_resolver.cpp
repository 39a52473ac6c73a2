// codemap/analysis/import_resolver.cpp - Import/include normalization
#include "codemap/analysis/import_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include "codemap/basic/logging.hpp"

namespace codemap
{

// ============================================================================
// ScopeIndex
// ============================================================================

std::optional<SymbolId> ScopeIndex::innermost(SourceRange range) const noexcept
{
  std::optional<SymbolId> best;
  uint32_t best_size = std::numeric_limits<uint32_t>::max();
  for (size_t i = 0; i < symbols_.size(); ++i) {
    const SourceRange r = symbols_[i].span.to_source_range();
    if (!r.is_valid() || !r.contains(range)) {
      continue;
    }
    // Nested declarations come later in document order; prefer them on ties.
    if (r.size() <= best_size) {
      best_size = r.size();
      best = SymbolId{static_cast<uint32_t>(i)};
    }
  }
  return best;
}

// ============================================================================
// Classification
// ============================================================================

ImportKind classify_import(const ImportShape & shape, bool guarded) noexcept
{
  if (!shape.literal) {
    return ImportKind::Dynamic;
  }
  if (guarded) {
    return ImportKind::Conditional;
  }
  if (shape.wildcard) {
    return ImportKind::Wildcard;
  }
  if (shape.relative) {
    return ImportKind::Relative;
  }
  if (shape.targets.size() > 1) {
    return ImportKind::SelectiveMultiple;
  }
  const bool aliased = std::any_of(shape.targets.begin(), shape.targets.end(), [](const auto & t) {
    return !t.local_alias.empty();
  });
  return aliased ? ImportKind::Aliased : ImportKind::Direct;
}

// ============================================================================
// ImportResolver
// ============================================================================

ImportResolver::ImportResolver(
  const GrammarAdapter & adapter, const SourceFile & source,
  gsl::span<const SymbolRecord> symbols, DiagnosticBag & diags, ResolverOptions options)
: adapter_(adapter),
  caps_(adapter.capabilities()),
  source_(source),
  scopes_(symbols),
  diags_(diags),
  options_(options)
{
}

std::vector<ImportRecord> ImportResolver::resolve(ts_ll::Node root)
{
  if (root.is_null()) {
    throw std::invalid_argument("ImportResolver::resolve: null root node");
  }
  records_.clear();
  visit(root, false);
  return std::move(records_);
}

void ImportResolver::visit(ts_ll::Node node, bool guarded)
{
  if (!node.is_named() || node.is_missing()) {
    return;
  }
  const std::string_view kind = node.kind();

  // A function body starts a fresh guard context.
  bool inner_guarded = guarded;
  if (caps_.function_kinds.contains(kind) || caps_.lambda_kinds.contains(kind)) {
    inner_guarded = false;
  } else if (adapter_.is_guard_branch(node, source_)) {
    inner_guarded = true;
  }

  if (caps_.import_kinds.contains(kind)) {
    if (auto shape = adapter_.decode_import(node, source_)) {
      emit(node, std::move(*shape), guarded);
      return;
    }
    if (node.has_error() && adapter_.is_import_statement(node)) {
      diags_
        .report_warning(
          DiagnosticKind::MalformedImport, node.span(), "malformed import statement",
          "import skipped")
        .with_help("the statement could not be decoded; fix the syntax error to record it");
      logging::logger()->debug(
        "{}:{}: skipped malformed import", source_.path().string(), node.start_line());
      return;
    }
  } else if (caps_.call_kinds.contains(kind)) {
    if (auto shape = decode_call(node)) {
      emit(node, std::move(*shape), guarded);
    }
  }

  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    visit(node.named_child(i), inner_guarded);
  }
}

std::optional<ImportShape> ImportResolver::decode_call(ts_ll::Node call) const
{
  const ts_ll::Node callee = call.child_by_field("function");
  if (callee.is_null()) {
    return std::nullopt;
  }
  std::string callee_name(callee.text(source_));
  callee_name.erase(
    std::remove_if(
      callee_name.begin(), callee_name.end(),
      [](unsigned char c) { return std::isspace(c) != 0; }),
    callee_name.end());
  if (!caps_.import_call_functions.contains(callee_name)) {
    return std::nullopt;
  }

  const ts_ll::Node args = call.child_by_field("arguments");
  if (args.is_null()) {
    return std::nullopt;
  }
  ts_ll::Node first_arg;
  const uint32_t n = args.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node arg = args.named_child(i);
    if (!caps_.comment_kinds.contains(arg.kind())) {
      first_arg = arg;
      break;
    }
  }
  if (first_arg.is_null()) {
    return std::nullopt;
  }

  ImportShape shape;
  if (auto value = literal_value(first_arg)) {
    shape.module = std::move(*value);
    const RelativePath rel = adapter_.classify_module_path(shape.module);
    shape.relative = rel.relative;
    shape.relative_depth = rel.depth;
    shape.targets = bound_targets(call);
  } else {
    shape.literal = false;
  }
  return shape;
}

std::optional<std::string> ImportResolver::literal_value(ts_ll::Node node) const
{
  const std::string_view kind = node.kind();
  if (kind == "parenthesized_expression" && node.named_child_count() == 1) {
    return literal_value(node.named_child(0));
  }
  if (caps_.string_kinds.contains(kind)) {
    return adapter_.string_value(node, source_);
  }
  if (!options_.fold_constant_imports || !caps_.concat_kinds.contains(kind)) {
    return std::nullopt;
  }

  const ts_ll::Node left = node.child_by_field("left");
  const ts_ll::Node right = node.child_by_field("right");
  if (!left.is_null() && !right.is_null()) {
    const ts_ll::Node op = node.child_by_field("operator");
    if (!op.is_null() && op.text(source_) != "+") {
      return std::nullopt;
    }
    auto lhs = literal_value(left);
    auto rhs = literal_value(right);
    if (!lhs || !rhs) {
      return std::nullopt;
    }
    return *lhs + *rhs;
  }

  // implicit concatenation: "a" "b"
  std::string out;
  const uint32_t n = node.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    auto part = literal_value(node.named_child(i));
    if (!part) {
      return std::nullopt;
    }
    out += *part;
  }
  return out;
}

std::vector<ImportTarget> ImportResolver::bound_targets(ts_ll::Node call) const
{
  std::vector<ImportTarget> targets;

  // `await import("m")` and `(require("m"))` bind through their wrapper.
  ts_ll::Node expr = call;
  ts_ll::Node parent = call.parent();
  while (!parent.is_null() &&
         (parent.kind() == "await_expression" || parent.kind() == "await" ||
          parent.kind() == "parenthesized_expression")) {
    expr = parent;
    parent = parent.parent();
  }
  if (parent.is_null() || !caps_.binding_kinds.contains(parent.kind())) {
    return targets;
  }

  ts_ll::Node value = parent.child_by_field("value");
  if (value.is_null()) {
    value = parent.child_by_field("right");
  }
  if (value != expr) {
    return targets;
  }

  ts_ll::Node binding = parent.child_by_field("name");
  if (binding.is_null()) {
    binding = parent.child_by_field("left");
  }
  if (binding.is_null()) {
    return targets;
  }

  if (binding.kind() == "identifier") {
    targets.push_back(ImportTarget{std::string(binding.text(source_)), "", false, ""});
    return targets;
  }

  // const {a, b: c} = require("m")
  if (binding.kind() == "object_pattern") {
    const uint32_t n = binding.named_child_count();
    for (uint32_t i = 0; i < n; ++i) {
      const ts_ll::Node prop = binding.named_child(i);
      const std::string_view pk = prop.kind();
      if (pk == "shorthand_property_identifier_pattern" || pk == "shorthand_property_identifier") {
        targets.push_back(ImportTarget{std::string(prop.text(source_)), "", false, ""});
      } else if (pk == "pair_pattern") {
        const ts_ll::Node key = prop.child_by_field("key");
        const ts_ll::Node val = prop.child_by_field("value");
        if (!key.is_null() && !val.is_null() && val.kind() == "identifier") {
          targets.push_back(
            ImportTarget{
              strip_quotes(key.text(source_)), std::string(val.text(source_)), false, ""});
        }
      }
    }
  }
  return targets;
}

void ImportResolver::emit(ts_ll::Node node, ImportShape shape, bool guarded)
{
  ImportRecord record;
  record.raw_statement = std::string(node.text(source_));
  record.span = node.span();
  record.guarded = guarded;
  record.scope = scopes_.innermost(node.range());
  record.kind = classify_import(shape, guarded);
  record.relative_depth = shape.relative_depth;

  if (!shape.literal) {
    record.resolved_module = std::nullopt;
  } else {
    record.resolved_module = shape.module;
    if (shape.wildcard) {
      record.targets = {ImportTarget{"*", "", true, ""}};
    } else {
      record.targets = std::move(shape.targets);
      if (record.targets.empty()) {
        record.targets.push_back(ImportTarget{shape.module, "", false, ""});
      }
    }
  }

  logging::logger()->trace(
    "{}:{}: {} import of '{}'", source_.path().string(), record.span.start_line,
    to_string(record.kind), record.resolved_module.value_or(std::string(k_unresolved_module)));
  records_.push_back(std::move(record));
}

}  // namespace codemap
