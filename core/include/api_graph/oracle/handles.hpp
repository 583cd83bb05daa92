// api_graph/oracle/handles.hpp - Opaque handles into the type resolution oracle
//
// The analyzer never owns program entities. It refers to symbols, syntax
// nodes and modules through these compact value handles, which the oracle
// hands out and interprets.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace api_graph
{

// ============================================================================
// Handle<Tag>
// ============================================================================

/**
 * A strongly typed index into oracle-owned storage.
 *
 * Handles are cheap to copy, hashable and comparable. Each tag produces a
 * distinct type so that a NodeId can never be passed where a SymbolId is
 * expected.
 */
template <typename Tag>
struct Handle
{
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  uint32_t value = k_invalid_value;

  constexpr Handle() noexcept = default;
  constexpr explicit Handle(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr Handle invalid() noexcept { return Handle{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid_value; }

  [[nodiscard]] constexpr bool operator==(Handle other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(Handle other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(Handle other) const noexcept
  {
    return value < other.value;
  }
};

struct SymbolTag;
struct NodeTag;
struct ModuleTag;

/// Identity of a declared name (after merging co-declarations)
using SymbolId = Handle<SymbolTag>;

/// A syntax node of the analyzed program
using NodeId = Handle<NodeTag>;

/// A source module (one source file)
using ModuleId = Handle<ModuleTag>;

}  // namespace api_graph

namespace std
{

template <typename Tag>
struct hash<api_graph::Handle<Tag>>
{
  size_t operator()(api_graph::Handle<Tag> h) const noexcept { return hash<uint32_t>{}(h.value); }
};

}  // namespace std
