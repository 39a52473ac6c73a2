// codemap/syntax/language.cpp - Supported source languages
#include "codemap/syntax/language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace codemap
{

namespace
{

constexpr std::array<std::pair<std::string_view, LanguageId>, 19> k_extensions = {{
  {".py", LanguageId::Python},
  {".pyi", LanguageId::Python},
  {".js", LanguageId::JavaScript},
  {".mjs", LanguageId::JavaScript},
  {".cjs", LanguageId::JavaScript},
  {".jsx", LanguageId::JavaScript},
  {".ts", LanguageId::TypeScript},
  {".mts", LanguageId::TypeScript},
  {".cts", LanguageId::TypeScript},
  {".tsx", LanguageId::Tsx},
  {".java", LanguageId::Java},
  {".c", LanguageId::Cpp},
  {".h", LanguageId::Cpp},
  {".cc", LanguageId::Cpp},
  {".cpp", LanguageId::Cpp},
  {".cxx", LanguageId::Cpp},
  {".hh", LanguageId::Cpp},
  {".hpp", LanguageId::Cpp},
  {".hxx", LanguageId::Cpp},
}};

}  // namespace

std::string_view to_string(LanguageId id) noexcept
{
  switch (id) {
    case LanguageId::Python:
      return "python";
    case LanguageId::JavaScript:
      return "javascript";
    case LanguageId::TypeScript:
      return "typescript";
    case LanguageId::Tsx:
      return "tsx";
    case LanguageId::Java:
      return "java";
    case LanguageId::Cpp:
      return "cpp";
    case LanguageId::Unknown:
      break;
  }
  return "unknown";
}

std::optional<LanguageId> language_from_name(std::string_view name) noexcept
{
  if (name == "python" || name == "py") {
    return LanguageId::Python;
  }
  if (name == "javascript" || name == "js") {
    return LanguageId::JavaScript;
  }
  if (name == "typescript" || name == "ts") {
    return LanguageId::TypeScript;
  }
  if (name == "tsx") {
    return LanguageId::Tsx;
  }
  if (name == "java") {
    return LanguageId::Java;
  }
  if (name == "cpp" || name == "c++" || name == "c") {
    return LanguageId::Cpp;
  }
  return std::nullopt;
}

LanguageId language_for_path(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  const auto it = std::find_if(k_extensions.begin(), k_extensions.end(), [&](const auto & entry) {
    return entry.first == ext;
  });
  return it != k_extensions.end() ? it->second : LanguageId::Unknown;
}

}  // namespace codemap
