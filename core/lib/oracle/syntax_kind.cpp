// api_graph/oracle/syntax_kind.cpp - Syntax kind and symbol flag parsing
//
#include "api_graph/oracle/syntax_kind.hpp"

#include <array>
#include <utility>

namespace api_graph
{

std::optional<SyntaxKind> syntax_kind_from_string(std::string_view name) noexcept
{
#define SYNTAX_KIND(Kind, DeclarationBearing) \
  if (name == #Kind) return SyntaxKind::Kind;
#include "api_graph/oracle/syntax_kinds.def"
  return std::nullopt;
}

std::optional<SymbolFlags> symbol_flag_from_string(std::string_view name) noexcept
{
  static constexpr std::array<std::pair<std::string_view, SymbolFlags>, 5> k_flags = {{
    {"alias", SymbolFlags::Alias},
    {"type_parameter", SymbolFlags::TypeParameter},
    {"type_literal", SymbolFlags::TypeLiteral},
    {"transient", SymbolFlags::Transient},
    {"export_star", SymbolFlags::ExportStar},
  }};

  for (const auto & [flag_name, flag] : k_flags) {
    if (flag_name == name) {
      return flag;
    }
  }
  return std::nullopt;
}

}  // namespace api_graph
