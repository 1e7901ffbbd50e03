#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "genarena/arena.hpp"
#include "genarena/arena_options.hpp"
#include "genarena/index.hpp"

namespace genarena {
namespace {

class ArenaGenerationTest : public ::testing::Test {
 protected:
  // Insert then remove `cycles` times, returning the handles handed out.
  static auto Cycle(Arena<int>& arena, int cycles) -> std::vector<Index> {
    std::vector<Index> handed_out;
    for (int i = 0; i < cycles; ++i) {
      auto index = arena.Insert(i);
      handed_out.push_back(index);
      EXPECT_TRUE(arena.Remove(index).has_value());
    }
    return handed_out;
  }
};

TEST_F(ArenaGenerationTest, DefaultOptions) {
  Arena<int> arena;
  EXPECT_EQ(arena.Options().max_generation, UINT32_MAX);
  EXPECT_EQ(arena.Options().initial_capacity, 0);
}

TEST_F(ArenaGenerationTest, ZeroMaxGenerationIsClampedToOne) {
  Arena<int> arena(ArenaOptions{.max_generation = 0});
  EXPECT_EQ(arena.Options().max_generation, 1);
}

TEST_F(ArenaGenerationTest, SingleSlotGenerationsStrictlyIncrease) {
  Arena<int> arena;
  auto handed_out = Cycle(arena, 1000);

  for (size_t i = 0; i < handed_out.size(); ++i) {
    EXPECT_EQ(handed_out[i].slot, 0);
    EXPECT_EQ(handed_out[i].generation, i + 1);
  }
  EXPECT_EQ(arena.SlotCount(), 1);
  EXPECT_EQ(arena.RetiredCount(), 0);
}

TEST_F(ArenaGenerationTest, NoEarlierHandleResolvesAfterReuse) {
  Arena<int> arena;
  auto handed_out = Cycle(arena, 50);
  auto live = arena.Insert(-1);

  for (const auto& index : handed_out) {
    EXPECT_EQ(index.slot, live.slot);
    EXPECT_EQ(arena.Get(index), nullptr);
  }
  EXPECT_EQ(*arena.Get(live), -1);
}

// =============================================================================
// Retirement
// =============================================================================

TEST_F(ArenaGenerationTest, SlotRetiresAtMaxGeneration) {
  Arena<int> arena(ArenaOptions{.max_generation = 3});
  auto handed_out = Cycle(arena, 3);

  ASSERT_EQ(handed_out.size(), 3);
  EXPECT_EQ(handed_out[0], (Index{.slot = 0, .generation = 1}));
  EXPECT_EQ(handed_out[1], (Index{.slot = 0, .generation = 2}));
  EXPECT_EQ(handed_out[2], (Index{.slot = 0, .generation = 3}));
  EXPECT_EQ(arena.RetiredCount(), 1);
  EXPECT_TRUE(arena.IsEmpty());

  // The exhausted slot is skipped; a fresh one is appended.
  auto next = arena.Insert(99);
  EXPECT_EQ(next, (Index{.slot = 1, .generation = 1}));
  EXPECT_EQ(arena.SlotCount(), 2);
  for (const auto& index : handed_out) {
    EXPECT_FALSE(arena.Contains(index));
  }
}

TEST_F(ArenaGenerationTest, RetiredSlotIsNeverReused) {
  Arena<int> arena(ArenaOptions{.max_generation = 1});
  auto retired = arena.Insert(0);
  arena.Remove(retired);
  EXPECT_EQ(arena.RetiredCount(), 1);

  for (int i = 0; i < 10; ++i) {
    auto index = arena.Insert(i);
    EXPECT_NE(index.slot, retired.slot);
    arena.Remove(index);
  }
  EXPECT_EQ(arena.RetiredCount(), 11);
  EXPECT_EQ(arena.SlotCount(), 11);
}

TEST_F(ArenaGenerationTest, ClearRetiresExhaustedSlots) {
  Arena<int> arena(ArenaOptions{.max_generation = 2});
  auto a = arena.Insert(1);
  arena.Remove(a);
  arena.Insert(2);  // slot 0, generation 2
  arena.Insert(3);  // slot 1, generation 1

  arena.Clear();
  EXPECT_EQ(arena.RetiredCount(), 1);

  EXPECT_EQ(arena.Insert(4), (Index{.slot = 1, .generation = 2}));
  EXPECT_EQ(arena.Insert(5), (Index{.slot = 2, .generation = 1}));
}

TEST_F(ArenaGenerationTest, ClearKeepsRetiredSlotsOffFreeList) {
  Arena<int> arena(ArenaOptions{.max_generation = 1});
  arena.Remove(arena.Insert(0));
  arena.Insert(1);
  arena.Clear();
  EXPECT_EQ(arena.RetiredCount(), 2);

  arena.Clear();
  EXPECT_EQ(arena.RetiredCount(), 2);
  EXPECT_EQ(arena.Insert(2), (Index{.slot = 2, .generation = 1}));
}

TEST_F(ArenaGenerationTest, RetirementLeavesOtherSlotsUntouched) {
  Arena<int> arena(ArenaOptions{.max_generation = 2});
  auto stable = arena.Insert(7);
  Cycle(arena, 2);  // slot 1 at generations 1 and 2, then retired

  EXPECT_EQ(arena.RetiredCount(), 1);
  EXPECT_EQ(*arena.Get(stable), 7);
  EXPECT_EQ(arena.Size(), 1);
}

}  // namespace
}  // namespace genarena
