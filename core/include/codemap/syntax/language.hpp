// codemap/syntax/language.hpp - Supported source languages
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace codemap
{

enum class LanguageId : uint8_t {
  Unknown,
  Python,
  JavaScript,
  TypeScript,
  Tsx,
  Java,
  Cpp,  ///< C and C++ sources and headers
};

[[nodiscard]] std::string_view to_string(LanguageId id) noexcept;

/// Accepts canonical names ("python", "cpp", ...) and common short forms ("py", "c++", "ts").
[[nodiscard]] std::optional<LanguageId> language_from_name(std::string_view name) noexcept;

/// Language for a file based on its extension; Unknown when unrecognized.
[[nodiscard]] LanguageId language_for_path(const std::filesystem::path & path);

}  // namespace codemap
