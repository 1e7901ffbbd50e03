#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "genarena/arena_options.hpp"
#include "genarena/common/internal_error.hpp"
#include "genarena/index.hpp"

namespace genarena {

namespace detail {

// Terminates the free list.
inline constexpr uint32_t kEndOfFreeList = UINT32_MAX;
// Stored in next_free of a slot whose generations are used up. Such a slot
// is never linked into the free list again.
inline constexpr uint32_t kRetiredSlot = UINT32_MAX - 1;
// Slot numbers from here on would collide with the sentinels above.
inline constexpr size_t kMaxSlots = kRetiredSlot;

inline constexpr uint32_t kFirstGeneration = 1;

template <typename T>
struct OccupiedSlot {
  T value;
  uint32_t generation;
};

// generation is the one the next occupant receives (for a retired slot, the
// last one it was occupied under). next_free is only meaningful here.
struct FreeSlot {
  uint32_t generation;
  uint32_t next_free;
};

template <typename T>
using Slot = std::variant<OccupiedSlot<T>, FreeSlot>;

}  // namespace detail

// Generational arena: O(1) insert, lookup and removal through untyped
// Index handles. A removed slot is reused by a later insert under a higher
// generation, so handles to the old occupant keep failing lookups instead
// of aliasing the new one.
//
// Free slots form a singly linked list threaded through the slot vector;
// the most recently vacated slot is reused first.
//
// Not thread-safe. Iterators are invalidated by any insert, removal or
// clear; using one after such a mutation is undefined behavior.
template <typename T>
class Arena final {
 public:
  template <typename V>
  struct BasicEntry {
    Index index;
    V& value;
  };
  using Entry = BasicEntry<T>;
  using ConstEntry = BasicEntry<const T>;

  // Walks occupied slots in slot order. Dereferencing yields an entry by
  // value that refers into the arena.
  template <typename V>
  class BasicIterator {
   public:
    using SlotVector = std::conditional_t<
        std::is_const_v<V>, const std::vector<detail::Slot<T>>,
        std::vector<detail::Slot<T>>>;

    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::input_iterator_tag;
    using value_type = BasicEntry<V>;
    using difference_type = std::ptrdiff_t;
    using reference = BasicEntry<V>;

    BasicIterator() = default;
    BasicIterator(SlotVector* slots, size_t pos) : slots_(slots), pos_(pos) {
      SkipFree();
    }

    auto operator*() const -> reference {
      auto& occupied = std::get<detail::OccupiedSlot<T>>((*slots_)[pos_]);
      return {
          .index =
              {.slot = static_cast<uint32_t>(pos_),
               .generation = occupied.generation},
          .value = occupied.value};
    }

    auto operator++() -> BasicIterator& {
      ++pos_;
      SkipFree();
      return *this;
    }
    auto operator++(int) -> BasicIterator {
      auto copy = *this;
      ++*this;
      return copy;
    }

    auto operator==(const BasicIterator& other) const -> bool {
      return slots_ == other.slots_ && pos_ == other.pos_;
    }

   private:
    void SkipFree() {
      while (pos_ < slots_->size() &&
             !std::holds_alternative<detail::OccupiedSlot<T>>(
                 (*slots_)[pos_])) {
        ++pos_;
      }
    }

    SlotVector* slots_ = nullptr;
    size_t pos_ = 0;
  };
  using Iterator = BasicIterator<T>;
  using ConstIterator = BasicIterator<const T>;

  Arena() = default;
  explicit Arena(ArenaOptions options) : options_(Normalize(options)) {
    Reserve(options_.initial_capacity);
  }
  ~Arena() = default;

  static auto WithCapacity(size_t capacity) -> Arena {
    return Arena(ArenaOptions{.initial_capacity = capacity});
  }

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&& other) noexcept
      : slots_(std::move(other.slots_)),
        free_head_(std::exchange(other.free_head_, detail::kEndOfFreeList)),
        size_(std::exchange(other.size_, 0)),
        retired_(std::exchange(other.retired_, 0)),
        options_(other.options_) {
    other.slots_.clear();
  }
  auto operator=(Arena&& other) noexcept -> Arena& {
    if (this != &other) {
      slots_ = std::move(other.slots_);
      other.slots_.clear();
      free_head_ = std::exchange(other.free_head_, detail::kEndOfFreeList);
      size_ = std::exchange(other.size_, 0);
      retired_ = std::exchange(other.retired_, 0);
      options_ = other.options_;
    }
    return *this;
  }

  auto Insert(T value) -> Index {
    return Emplace(std::move(value));
  }

  // Constructs the value before touching any slot. If moving it into a
  // reused slot throws, the slot is put back on the free list unchanged.
  template <typename... Args>
  auto Emplace(Args&&... args) -> Index {
    T value(std::forward<Args>(args)...);

    if (free_head_ != detail::kEndOfFreeList) {
      uint32_t slot = free_head_;
      auto vacant = std::get<detail::FreeSlot>(slots_[slot]);
      try {
        slots_[slot].template emplace<0>(detail::OccupiedSlot<T>{
            .value = std::move(value), .generation = vacant.generation});
      } catch (...) {
        slots_[slot].template emplace<1>(vacant);
        throw;
      }
      free_head_ = vacant.next_free;
      ++size_;
      return {.slot = slot, .generation = vacant.generation};
    }

    if (slots_.size() >= detail::kMaxSlots) {
      throw std::length_error("genarena::Arena: slot limit reached");
    }
    auto slot = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back(
        std::in_place_index<0>,
        detail::OccupiedSlot<T>{
            .value = std::move(value),
            .generation = detail::kFirstGeneration});
    ++size_;
    return {.slot = slot, .generation = detail::kFirstGeneration};
  }

  // nullptr if the index is out of range, names a free slot, or belongs to
  // an earlier occupant.
  [[nodiscard]] auto Get(Index index) const -> const T* {
    const auto* occupied = FindOccupied(*this, index);
    return occupied != nullptr ? &occupied->value : nullptr;
  }
  [[nodiscard]] auto GetMut(Index index) -> T* {
    auto* occupied = FindOccupied(*this, index);
    return occupied != nullptr ? &occupied->value : nullptr;
  }

  // Checked access for handles the caller knows to be live. Throws
  // InternalError otherwise.
  [[nodiscard]] auto At(Index index) const -> const T& {
    const auto* value = Get(index);
    if (value == nullptr) {
      ThrowStale(index);
    }
    return *value;
  }
  [[nodiscard]] auto At(Index index) -> T& {
    auto* value = GetMut(index);
    if (value == nullptr) {
      ThrowStale(index);
    }
    return *value;
  }

  [[nodiscard]] auto Contains(Index index) const -> bool {
    return FindOccupied(*this, index) != nullptr;
  }

  // Moves the value out and frees its slot. Returns nullopt, without any
  // state change, for an index Get would reject.
  auto Remove(Index index) -> std::optional<T> {
    auto* occupied = FindOccupied(*this, index);
    if (occupied == nullptr) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(occupied->value));
    Vacate(index.slot, occupied->generation);
    --size_;
    return value;
  }

  // Removes every value. Generations advance exactly as with Remove, so
  // no index issued before the call resolves afterwards.
  void Clear() {
    spdlog::trace("arena: clearing {} live entries", size_);
    free_head_ = detail::kEndOfFreeList;
    // Walk backwards so the rebuilt free list hands out low slots first.
    for (size_t i = slots_.size(); i-- > 0;) {
      auto slot = static_cast<uint32_t>(i);
      if (auto* occupied = std::get_if<detail::OccupiedSlot<T>>(&slots_[i])) {
        Vacate(slot, occupied->generation);
        continue;
      }
      auto& vacant = std::get<detail::FreeSlot>(slots_[i]);
      if (vacant.next_free != detail::kRetiredSlot) {
        vacant.next_free = free_head_;
        free_head_ = slot;
      }
    }
    size_ = 0;
  }

  void Reserve(size_t capacity) {
    slots_.reserve(std::min(capacity, detail::kMaxSlots));
  }

  [[nodiscard]] auto Size() const -> size_t {
    return size_;
  }
  [[nodiscard]] auto IsEmpty() const -> bool {
    return size_ == 0;
  }

  // Slots created so far, live, free and retired alike.
  [[nodiscard]] auto SlotCount() const -> size_t {
    return slots_.size();
  }
  [[nodiscard]] auto RetiredCount() const -> size_t {
    return retired_;
  }
  [[nodiscard]] auto Options() const -> const ArenaOptions& {
    return options_;
  }

  auto begin() -> Iterator {
    return Iterator(&slots_, 0);
  }
  auto end() -> Iterator {
    return Iterator(&slots_, slots_.size());
  }
  auto begin() const -> ConstIterator {
    return ConstIterator(&slots_, 0);
  }
  auto end() const -> ConstIterator {
    return ConstIterator(&slots_, slots_.size());
  }

 private:
  static auto Normalize(ArenaOptions options) -> ArenaOptions {
    options.max_generation = std::max(options.max_generation, 1U);
    return options;
  }

  template <typename Self>
  static auto FindOccupied(Self& self, Index index) -> std::conditional_t<
      std::is_const_v<Self>, const detail::OccupiedSlot<T>*,
      detail::OccupiedSlot<T>*> {
    if (index.slot >= self.slots_.size()) {
      return nullptr;
    }
    auto* occupied =
        std::get_if<detail::OccupiedSlot<T>>(&self.slots_[index.slot]);
    if (occupied == nullptr || occupied->generation != index.generation) {
      return nullptr;
    }
    return occupied;
  }

  // Turns an occupied slot free. The slot goes back on the free list under
  // the next generation, or is retired once max_generation is reached.
  void Vacate(uint32_t slot, uint32_t generation) {
    if (generation >= options_.max_generation) {
      slots_[slot].template emplace<1>(detail::FreeSlot{
          .generation = generation, .next_free = detail::kRetiredSlot});
      ++retired_;
      spdlog::debug(
          "arena: retired slot {} at generation {}", slot, generation);
      return;
    }
    slots_[slot].template emplace<1>(detail::FreeSlot{
        .generation = generation + 1, .next_free = free_head_});
    free_head_ = slot;
  }

  [[noreturn]] static void ThrowStale(Index index) {
    common::ThrowInternalError(
        "Arena::At", fmt::format("{} does not name a live entry", index));
  }

  std::vector<detail::Slot<T>> slots_;
  uint32_t free_head_ = detail::kEndOfFreeList;
  size_t size_ = 0;
  size_t retired_ = 0;
  ArenaOptions options_;
};

}  // namespace genarena
