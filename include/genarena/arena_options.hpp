#pragma once

#include <cstddef>
#include <cstdint>

namespace genarena {

struct ArenaOptions {
  // Slots reserved up front. Reserving does not create slots.
  size_t initial_capacity = 0;

  // Last generation a slot may be occupied under. Removing an occupant at
  // this generation retires the slot for good instead of wrapping the
  // counter. Values below 1 are treated as 1.
  uint32_t max_generation = UINT32_MAX;

  auto operator==(const ArenaOptions&) const -> bool = default;
};

}  // namespace genarena
