#include "orby/cursor.hpp"
#include "orby/lane.hpp"
#include <gtest/gtest.h>

using namespace orby;

// ============================================================================
// Lane
// ============================================================================

TEST(Lane, ZeroInitialized) {
  Lane lane(8);
  EXPECT_EQ(lane.capacity(), 8u);
  for (const auto &c : lane.cells())
    EXPECT_TRUE(c.is_zero());
  EXPECT_EQ(lane.bytes().size(), 8u * CELL_BYTES);
}

TEST(Lane, ShiftLeftMovesSuffixAndZeroesTail) {
  Lane lane(6);
  for (size_t i = 0; i < 5; ++i)
    lane[i] = Cell(i + 1);

  lane.shift_left(1, 5); // [1,2,3,4,5,0] -> [1,3,4,5,0,0]
  EXPECT_EQ(lane[0], Cell(1));
  EXPECT_EQ(lane[1], Cell(3));
  EXPECT_EQ(lane[2], Cell(4));
  EXPECT_EQ(lane[3], Cell(5));
  EXPECT_TRUE(lane[4].is_zero());
  EXPECT_TRUE(lane[5].is_zero());
}

TEST(Lane, ShiftLeftOfLastOccupiedSlotOnlyZeroesIt) {
  Lane lane(4);
  lane[0] = Cell(1);
  lane[1] = Cell(2);
  lane.shift_left(1, 2);
  EXPECT_EQ(lane[0], Cell(1));
  EXPECT_TRUE(lane[1].is_zero());
}

TEST(Lane, ZeroRange) {
  Lane lane(4);
  for (size_t i = 0; i < 4; ++i)
    lane[i] = Cell(9);
  lane.zero_range(1, 3);
  EXPECT_EQ(lane[0], Cell(9));
  EXPECT_TRUE(lane[1].is_zero());
  EXPECT_TRUE(lane[2].is_zero());
  EXPECT_EQ(lane[3], Cell(9));
  lane.clear();
  EXPECT_TRUE(lane[0].is_zero());
}

// ============================================================================
// Cursor
// ============================================================================

TEST(Cursor, RingWrapsModuloCapacity) {
  Cursor cur(3, AddressingMode::Ring);
  for (int i = 0; i < 7; ++i) {
    ASSERT_TRUE(cur.next_slot().has_value());
    cur.advance();
  }
  EXPECT_EQ(cur.position(), 7u % 3u);
  EXPECT_EQ(cur.length(), 3u);
  EXPECT_FALSE(cur.full());
}

TEST(Cursor, BoundedStopsAtCapacity) {
  Cursor cur(2, AddressingMode::Bounded);
  cur.advance();
  cur.advance();
  EXPECT_TRUE(cur.full());
  EXPECT_FALSE(cur.next_slot().has_value());
  EXPECT_EQ(cur.position(), 2u);
  EXPECT_EQ(cur.length(), 2u);
}

TEST(Cursor, CompactionPointsCursorAtNewLength) {
  Cursor cur(4, AddressingMode::Ring);
  for (int i = 0; i < 5; ++i)
    cur.advance();
  ASSERT_EQ(cur.length(), 4u);
  cur.shrink_after_compaction();
  EXPECT_EQ(cur.length(), 3u);
  EXPECT_EQ(cur.position(), 3u);
}

TEST(Cursor, RestoreValidatesModeInvariant) {
  Cursor bounded(10, AddressingMode::Bounded);
  EXPECT_TRUE(bounded.restore(4, 4));
  EXPECT_FALSE(bounded.restore(3, 4));
  EXPECT_FALSE(bounded.restore(11, 11));
  EXPECT_EQ(bounded.position(), 4u);

  Cursor ring(10, AddressingMode::Ring);
  EXPECT_TRUE(ring.restore(3, 10));
  EXPECT_TRUE(ring.restore(5, 5));
  EXPECT_FALSE(ring.restore(3, 5));
  EXPECT_FALSE(ring.restore(10, 10));
  EXPECT_EQ(ring.position(), 5u);
  EXPECT_EQ(ring.length(), 5u);
}
