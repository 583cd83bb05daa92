// api_graph/oracle/syntax_kind.hpp - Syntax kinds and symbol flags
//
// The vocabulary shared between the oracle and the analyzer.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace api_graph
{

// ============================================================================
// SyntaxKind
// ============================================================================

/**
 * Kind of a syntax node as classified by the front end.
 * Generated from syntax_kinds.def.
 */
enum class SyntaxKind : uint8_t {
#define SYNTAX_KIND(Kind, DeclarationBearing) Kind,
#include "api_graph/oracle/syntax_kinds.def"
};

/**
 * Default classification of declaration-bearing kinds.
 *
 * Oracles may override the classification, but every implementation in this
 * repository defers to this table.
 */
[[nodiscard]] constexpr bool is_declaration_kind(SyntaxKind kind) noexcept
{
  switch (kind) {
#define SYNTAX_KIND(Kind, DeclarationBearing) \
  case SyntaxKind::Kind:                      \
    return DeclarationBearing;
#include "api_graph/oracle/syntax_kinds.def"
  }
  return false;
}

[[nodiscard]] constexpr std::string_view to_string(SyntaxKind kind) noexcept
{
  switch (kind) {
#define SYNTAX_KIND(Kind, DeclarationBearing) \
  case SyntaxKind::Kind:                      \
    return #Kind;
#include "api_graph/oracle/syntax_kinds.def"
  }
  return "Other";
}

/// Parse a kind name as written by to_string()
[[nodiscard]] std::optional<SyntaxKind> syntax_kind_from_string(std::string_view name) noexcept;

// ============================================================================
// SymbolFlags
// ============================================================================

/**
 * Classification bits of a symbol.
 */
enum class SymbolFlags : uint32_t {
  None = 0,
  Alias = 1U << 0,          ///< import, re-export or rename of another symbol
  TypeParameter = 1U << 1,  ///< generic parameter
  TypeLiteral = 1U << 2,    ///< anonymous structural type
  Transient = 1U << 3,      ///< synthesized by the checker
  ExportStar = 1U << 4,     ///< aggregate of all `export * from` declarations of a module
};

[[nodiscard]] constexpr SymbolFlags operator|(SymbolFlags a, SymbolFlags b) noexcept
{
  return static_cast<SymbolFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr SymbolFlags operator&(SymbolFlags a, SymbolFlags b) noexcept
{
  return static_cast<SymbolFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

/// Check whether any bit of `mask` is set in `flags`
[[nodiscard]] constexpr bool has_any(SymbolFlags flags, SymbolFlags mask) noexcept
{
  return (flags & mask) != SymbolFlags::None;
}

/// Parse a single flag name ("alias", "type_parameter", ...)
[[nodiscard]] std::optional<SymbolFlags> symbol_flag_from_string(std::string_view name) noexcept;

}  // namespace api_graph
