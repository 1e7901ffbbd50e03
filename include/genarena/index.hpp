#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace genarena {

// Handle to one occupancy of one arena slot.
//
// Index carries no value type, so handles from arenas of different element
// types share one representation and can be stored side by side. The flip
// side is that an Index from one arena resolves against any other arena;
// nothing detects that mix-up.
struct Index {
  uint32_t slot = 0;
  uint32_t generation = 0;

  // Generation 0 is never issued, so a null handle never resolves.
  static constexpr auto Null() -> Index {
    return {};
  }
  [[nodiscard]] constexpr auto IsNull() const -> bool {
    return generation == 0;
  }

  // Packs the handle as (slot << 32) | generation.
  [[nodiscard]] constexpr auto ToRaw() const -> uint64_t {
    return (static_cast<uint64_t>(slot) << 32) | generation;
  }
  static constexpr auto FromRaw(uint64_t raw) -> Index {
    return {
        .slot = static_cast<uint32_t>(raw >> 32),
        .generation = static_cast<uint32_t>(raw & UINT32_MAX)};
  }

  auto operator==(const Index&) const -> bool = default;
  auto operator<=>(const Index&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, Index index) -> H {
    return H::combine(std::move(h), index.slot, index.generation);
  }
};

// "Index(<slot>:<generation>)"
auto ToString(Index index) -> std::string;

}  // namespace genarena

template <>
struct std::hash<genarena::Index> {
  auto operator()(genarena::Index index) const noexcept -> size_t {
    return std::hash<uint64_t>{}(index.ToRaw());
  }
};

template <>
struct fmt::formatter<genarena::Index> {
  constexpr auto parse(fmt::format_parse_context& ctx)
      -> fmt::format_parse_context::iterator {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const genarena::Index& index, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "Index({}:{})", index.slot, index.generation);
  }
};
