// codemap/syntax/adapter_registry.hpp - Language -> GrammarAdapter lookup
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codemap/syntax/grammar_adapter.hpp"
#include "codemap/syntax/language.hpp"

namespace codemap
{

/**
 * Result of registering an adapter or a marker.
 */
struct RegistrationResult
{
  bool success = false;
  std::string error;

  static RegistrationResult ok()
  {
    RegistrationResult r;
    r.success = true;
    return r;
  }

  static RegistrationResult fail(std::string msg)
  {
    RegistrationResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Owns the grammar adapters of a run, one per language.
 *
 * Populate before analysis starts; lookups are read-only afterwards and
 * may happen from any thread.
 */
class AdapterRegistry
{
public:
  AdapterRegistry() = default;

  AdapterRegistry(const AdapterRegistry &) = delete;
  AdapterRegistry & operator=(const AdapterRegistry &) = delete;
  AdapterRegistry(AdapterRegistry &&) = default;
  AdapterRegistry & operator=(AdapterRegistry &&) = default;

  /**
   * Register an adapter.
   *
   * Rejected when the adapter is null, its language is already registered,
   * or its marker table maps one name to two roles.
   */
  RegistrationResult add(std::unique_ptr<GrammarAdapter> adapter);

  /**
   * Add a marker decorator to a registered language.
   *
   * Rejected when the name already maps to a different role.
   */
  RegistrationResult add_marker(LanguageId language, const std::string & name, MarkerRole role);

  [[nodiscard]] const GrammarAdapter * find(LanguageId language) const noexcept;

  [[nodiscard]] std::vector<LanguageId> languages() const;

  [[nodiscard]] size_t size() const noexcept { return adapters_.size(); }

  /// Registry with the Python, JavaScript, TypeScript, TSX, Java and C++ adapters.
  [[nodiscard]] static AdapterRegistry with_builtin_languages();

private:
  [[nodiscard]] GrammarAdapter * find_mutable(LanguageId language) noexcept;

  std::vector<std::unique_ptr<GrammarAdapter>> adapters_;
};

}  // namespace codemap
