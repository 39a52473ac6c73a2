// codemap/syntax/adapter_registry.cpp - Language -> GrammarAdapter lookup
#include "codemap/syntax/adapter_registry.hpp"

#include "codemap/basic/logging.hpp"

namespace codemap
{

RegistrationResult AdapterRegistry::add(std::unique_ptr<GrammarAdapter> adapter)
{
  if (!adapter) {
    return RegistrationResult::fail("adapter is null");
  }
  if (find(adapter->id()) != nullptr) {
    return RegistrationResult::fail(
      "an adapter for '" + std::string(to_string(adapter->id())) + "' is already registered");
  }
  if (adapter->ts_language() == nullptr) {
    return RegistrationResult::fail(
      "adapter for '" + std::string(to_string(adapter->id())) + "' has no grammar");
  }
  if (const auto conflict = adapter->capabilities().markers.find_conflict()) {
    return RegistrationResult::fail(
      "marker '" + *conflict + "' of '" + std::string(to_string(adapter->id())) +
      "' maps to both class_method and static_method");
  }

  logging::logger()->debug("registered grammar adapter '{}'", to_string(adapter->id()));
  adapters_.push_back(std::move(adapter));
  return RegistrationResult::ok();
}

RegistrationResult AdapterRegistry::add_marker(
  LanguageId language, const std::string & name, MarkerRole role)
{
  GrammarAdapter * adapter = find_mutable(language);
  if (adapter == nullptr) {
    return RegistrationResult::fail(
      "no adapter registered for '" + std::string(to_string(language)) + "'");
  }

  MarkerTable & markers = adapter->capabilities().markers;
  const std::string normalized = MarkerTable::normalize(name);
  if (normalized.empty()) {
    return RegistrationResult::fail("marker name is empty");
  }
  for (const auto & [existing, existing_role] : markers.entries()) {
    if (existing == normalized && existing_role != role) {
      return RegistrationResult::fail(
        "marker '" + normalized + "' of '" + std::string(to_string(language)) +
        "' is already mapped to " + std::string(to_string(existing_role)));
    }
  }

  markers.add(normalized, role);
  return RegistrationResult::ok();
}

const GrammarAdapter * AdapterRegistry::find(LanguageId language) const noexcept
{
  for (const auto & a : adapters_) {
    if (a->id() == language) {
      return a.get();
    }
  }
  return nullptr;
}

GrammarAdapter * AdapterRegistry::find_mutable(LanguageId language) noexcept
{
  for (auto & a : adapters_) {
    if (a->id() == language) {
      return a.get();
    }
  }
  return nullptr;
}

std::vector<LanguageId> AdapterRegistry::languages() const
{
  std::vector<LanguageId> out;
  out.reserve(adapters_.size());
  for (const auto & a : adapters_) {
    out.push_back(a->id());
  }
  return out;
}

AdapterRegistry AdapterRegistry::with_builtin_languages()
{
  AdapterRegistry registry;
  for (auto * make : {
         &make_python_adapter, &make_javascript_adapter, &make_typescript_adapter,
         &make_tsx_adapter, &make_java_adapter, &make_cpp_adapter}) {
    const auto result = registry.add(make());
    if (!result.success) {
      logging::logger()->error("built-in adapter rejected: {}", result.error);
    }
  }
  return registry;
}

}  // namespace codemap
