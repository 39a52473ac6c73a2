// codemap/model/model.cpp - Record helpers and enum names
#include <algorithm>
#include <array>
#include <iterator>

#include "codemap/model/file_map.hpp"
#include "codemap/model/import.hpp"
#include "codemap/model/symbol.hpp"

namespace codemap
{

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Function:
      return "Function";
    case SymbolKind::Method:
      return "Method";
    case SymbolKind::ClassMethod:
      return "ClassMethod";
    case SymbolKind::StaticMethod:
      return "StaticMethod";
    case SymbolKind::Lambda:
      return "Lambda";
    case SymbolKind::Class:
      return "Class";
    case SymbolKind::Constructor:
      return "Constructor";
  }
  return "Unknown";
}

std::string_view to_string(Modifier modifier) noexcept
{
  switch (modifier) {
    case Modifier::Async:
      return "Async";
    case Modifier::Generator:
      return "Generator";
    case Modifier::Decorated:
      return "Decorated";
    case Modifier::Static:
      return "Static";
    case Modifier::ClassBound:
      return "ClassBound";
  }
  return "Unknown";
}

std::vector<Modifier> ModifierSet::list() const
{
  static constexpr std::array<Modifier, 5> k_all = {
    Modifier::Async, Modifier::Generator, Modifier::Decorated, Modifier::Static,
    Modifier::ClassBound};

  std::vector<Modifier> out;
  std::copy_if(k_all.begin(), k_all.end(), std::back_inserter(out), [this](Modifier m) {
    return has(m);
  });
  return out;
}

std::string_view to_string(ImportKind kind) noexcept
{
  switch (kind) {
    case ImportKind::Direct:
      return "Direct";
    case ImportKind::Aliased:
      return "Aliased";
    case ImportKind::Relative:
      return "Relative";
    case ImportKind::Wildcard:
      return "Wildcard";
    case ImportKind::Conditional:
      return "Conditional";
    case ImportKind::Dynamic:
      return "Dynamic";
    case ImportKind::SelectiveMultiple:
      return "SelectiveMultiple";
  }
  return "Unknown";
}

std::vector<std::string> ImportRecord::module_references() const
{
  std::vector<std::string> refs;
  if (!resolved_module) {
    return refs;
  }

  for (const auto & target : targets) {
    if (!target.module.empty() &&
        std::find(refs.begin(), refs.end(), target.module) == refs.end()) {
      refs.push_back(target.module);
    }
  }
  if (refs.empty()) {
    refs.push_back(*resolved_module);
  }
  return refs;
}

std::vector<SymbolId> FileMap::children_of(SymbolId id) const
{
  std::vector<SymbolId> out;
  for (uint32_t i = 0; i < symbols.size(); ++i) {
    if (symbols[i].enclosing_scope == id) {
      out.push_back(SymbolId{i});
    }
  }
  return out;
}

}  // namespace codemap
