// codemap/graph/module_locator.hpp - Module reference to file lookup
//
// The graph builder asks a ModuleLocator where a module reference lives.
// FilesystemModuleLocator is the default implementation: registered
// packages, search paths and the per-language module layout.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "codemap/syntax/adapter_registry.hpp"
#include "codemap/syntax/language.hpp"

namespace codemap
{

// ============================================================================
// Requests and results
// ============================================================================

/**
 * Registry of package names to their filesystem paths.
 *
 * A reference whose first segment is a registered name (`pkg.sub`,
 * `pkg/sub.h`) is looked up under the registered directory.
 */
using PackageRegistry = std::unordered_map<std::string, std::filesystem::path>;

struct LocateRequest
{
  std::filesystem::path from_file;
  LanguageId language = LanguageId::Unknown;
  std::string module;           ///< as written in the import
  uint32_t relative_depth = 0;  ///< parent hops already counted by the resolver
};

struct LocateResult
{
  /// Resolved file (only valid if found() is true)
  std::filesystem::path path;

  /// Why the lookup failed
  std::string reason;

  [[nodiscard]] bool found() const noexcept { return !path.empty(); }

  static LocateResult found_at(std::filesystem::path p)
  {
    LocateResult r;
    r.path = std::move(p);
    return r;
  }

  static LocateResult not_found(std::string why)
  {
    LocateResult r;
    r.reason = std::move(why);
    return r;
  }
};

// ============================================================================
// ModuleLocator
// ============================================================================

/**
 * Module lookup contract.
 *
 * `locate` may complete asynchronously; the future either holds a result or
 * an exception, which the graph builder records as a failed lookup.
 */
class ModuleLocator
{
public:
  virtual ~ModuleLocator() = default;

  [[nodiscard]] virtual std::future<LocateResult> locate(const LocateRequest & request) const = 0;
};

// ============================================================================
// FilesystemModuleLocator
// ============================================================================

class FilesystemModuleLocator final : public ModuleLocator
{
public:
  explicit FilesystemModuleLocator(const AdapterRegistry & registry) : registry_(registry) {}

  /**
   * Register a package path.
   *
   * @param name Package name (first segment of a module reference)
   * @param path Filesystem path to the package root directory
   */
  void register_package(std::string_view name, const std::filesystem::path & path)
  {
    packages_[std::string(name)] = path;
  }

  void register_packages(const PackageRegistry & registry)
  {
    for (const auto & [name, path] : registry) {
      packages_[name] = path;
    }
  }

  /// Directory tried for every non-relative reference, in registration order.
  void add_search_path(const std::filesystem::path & dir) { search_paths_.push_back(dir); }

  [[nodiscard]] std::future<LocateResult> locate(const LocateRequest & request) const override;

  /// Synchronous lookup used by `locate`.
  [[nodiscard]] LocateResult locate_now(const LocateRequest & request) const;

  /**
   * Candidate files for a request, in lookup order.
   *
   * Each candidate is the module path itself, then the path with each layout
   * extension appended, then each layout index file inside it.
   */
  [[nodiscard]] std::vector<std::filesystem::path> candidates(const LocateRequest & request) const;

private:
  const AdapterRegistry & registry_;
  PackageRegistry packages_;
  std::vector<std::filesystem::path> search_paths_;
};

}  // namespace codemap
