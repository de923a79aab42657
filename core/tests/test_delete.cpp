#include "orby/orby.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace orby;

namespace {

std::unique_ptr<Orby> make_engine(size_t capacity, size_t dimension,
                                  AddressingMode mode, DeletionPolicy policy) {
  auto cfg = EngineConfigBuilder("delete_test")
                 .capacity(capacity)
                 .dimension(dimension)
                 .addressing(mode)
                 .deletion(policy)
                 .worker_threads(4)
                 .log_level(spdlog::level::off)
                 .build();
  return std::move(Orby::create(cfg.value()).value());
}

Row row2(uint64_t a, uint64_t b) { return Row{Cell(a), Cell(b)}; }

void fill(Orby &engine, uint64_t count) {
  std::vector<Row> rows;
  for (uint64_t k = 1; k <= count; ++k)
    rows.push_back(row2(k, k * 100));
  ASSERT_TRUE(engine.insert_batch(rows).has_value());
}

} // namespace

// ============================================================================
// Compacting
// ============================================================================

TEST(Delete, CompactingShiftsSuffixLeft) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Compacting);
  fill(*engine, 5);

  ASSERT_TRUE(engine->remove(1).has_value());
  EXPECT_EQ(engine->len(), 4u);
  EXPECT_EQ(engine->cursor(), 4u);
  EXPECT_EQ(engine->live_count(), 4u);

  const std::vector<Row> expected = {row2(1, 100), row2(3, 300),
                                     row2(4, 400), row2(5, 500)};
  for (size_t i = 0; i < expected.size(); ++i)
    EXPECT_EQ(engine->get(i).value(), expected[i]);

  // The next insert lands right after the packed region.
  ASSERT_TRUE(engine->insert(row2(6, 600)).has_value());
  EXPECT_EQ(engine->get(4).value(), row2(6, 600));
}

TEST(Delete, CompactingLastRow) {
  auto engine = make_engine(4, 2, AddressingMode::Bounded,
                            DeletionPolicy::Compacting);
  fill(*engine, 4);
  ASSERT_TRUE(engine->remove(3).has_value());
  EXPECT_EQ(engine->len(), 3u);
  // A full bounded store has room again.
  EXPECT_TRUE(engine->insert(row2(9, 9)).has_value());
  EXPECT_EQ(engine->get(3).value(), row2(9, 9));
}

TEST(Delete, CompactingAfterRingWrap) {
  auto engine = make_engine(4, 2, AddressingMode::Ring,
                            DeletionPolicy::Compacting);
  fill(*engine, 6); // lanes: [5,6,3,4], cursor 2
  ASSERT_TRUE(engine->remove(0).has_value());
  EXPECT_EQ(engine->len(), 3u);
  EXPECT_EQ(engine->cursor(), 3u);
  EXPECT_EQ(engine->get(0).value(), row2(6, 600));
  EXPECT_EQ(engine->get(1).value(), row2(3, 300));
  EXPECT_EQ(engine->get(2).value(), row2(4, 400));
}

TEST(Delete, CompactingLargeShiftAcrossLanes) {
  const size_t n = 150'000;
  auto engine = make_engine(n, 3, AddressingMode::Bounded,
                            DeletionPolicy::Compacting);
  std::vector<Row> rows;
  rows.reserve(n);
  for (uint64_t k = 1; k <= n; ++k)
    rows.push_back(Row{Cell(k), Cell(k + 1), Cell(k + 2)});
  ASSERT_TRUE(engine->insert_batch(rows).has_value());

  ASSERT_TRUE(engine->remove(10).has_value());
  EXPECT_EQ(engine->len(), n - 1);
  EXPECT_EQ(engine->get(10).value(), (Row{Cell(12), Cell(13), Cell(14)}));
  EXPECT_EQ(engine->get(n - 2).value(),
            (Row{Cell(n), Cell(n + 1), Cell(n + 2)}));
  EXPECT_EQ(engine->count_active(), n - 1);
}

// ============================================================================
// Tombstoning
// ============================================================================

TEST(Delete, TombstoningZeroesOnlyTarget) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Tombstoning);
  fill(*engine, 4);
  const size_t cursor_before = engine->cursor();

  ASSERT_TRUE(engine->remove(2).has_value());
  EXPECT_EQ(engine->len(), 4u);
  EXPECT_EQ(engine->cursor(), cursor_before);
  EXPECT_EQ(engine->live_count(), 3u);
  EXPECT_EQ(engine->get(2).value(), row2(0, 0));
  EXPECT_EQ(engine->get(1).value(), row2(2, 200));
  EXPECT_EQ(engine->get(3).value(), row2(4, 400));

  // Second delete of the same slot changes nothing.
  ASSERT_TRUE(engine->remove(2).has_value());
  EXPECT_EQ(engine->live_count(), 3u);
}

TEST(Delete, IndexOutOfRange) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Tombstoning);
  fill(*engine, 2);
  auto r = engine->remove(2);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::IndexOutOfRange);
  EXPECT_EQ(engine->live_count(), 2u);
}

// ============================================================================
// Id-based mutations
// ============================================================================

TEST(Delete, UpdateByIdRewritesEveryMatch) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Tombstoning);
  std::vector<Row> rows = {row2(7, 1), row2(8, 2), row2(7, 3)};
  ASSERT_TRUE(engine->insert_batch(rows).has_value());

  auto n = engine->update_by_id(0, Cell(7), row2(7, 99));
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 2u);
  EXPECT_EQ(engine->get(0).value(), row2(7, 99));
  EXPECT_EQ(engine->get(1).value(), row2(8, 2));
  EXPECT_EQ(engine->get(2).value(), row2(7, 99));
  EXPECT_EQ(engine->len(), 3u);

  auto none = engine->update_by_id(0, Cell(5), row2(5, 5));
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(*none, 0u);
}

TEST(Delete, IdOperationsRejectZeroId) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Tombstoning);
  auto u = engine->update_by_id(0, Cell{}, row2(1, 1));
  ASSERT_FALSE(u.has_value());
  EXPECT_EQ(u.error().kind, ErrorKind::ReservedRow);
  auto p = engine->purge_by_id(0, Cell{});
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().kind, ErrorKind::ReservedRow);
  auto bad_lane = engine->purge_by_id(5, Cell(1));
  ASSERT_FALSE(bad_lane.has_value());
  EXPECT_EQ(bad_lane.error().kind, ErrorKind::IndexOutOfRange);
}

TEST(Delete, UpsertUpdatesOrInserts) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Tombstoning);
  auto first = engine->upsert(0, Cell(42), row2(42, 1));
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(*first);
  EXPECT_EQ(engine->len(), 1u);

  auto second = engine->upsert(0, Cell(42), row2(42, 2));
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(*second);
  EXPECT_EQ(engine->len(), 1u);
  EXPECT_EQ(engine->get(0).value(), row2(42, 2));
}

TEST(Delete, PurgeByIdTombstonesEvenWhenCompacting) {
  auto engine = make_engine(8, 2, AddressingMode::Ring,
                            DeletionPolicy::Compacting);
  std::vector<Row> rows = {row2(1, 7), row2(2, 8), row2(3, 7)};
  ASSERT_TRUE(engine->insert_batch(rows).has_value());

  auto n = engine->purge_by_id(1, Cell(7));
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 2u);
  EXPECT_EQ(engine->len(), 3u);
  EXPECT_EQ(engine->live_count(), 1u);
  EXPECT_EQ(engine->get(0).value(), row2(0, 0));
  EXPECT_EQ(engine->get(1).value(), row2(2, 8));
}

TEST(Delete, TruncateReplacesContents) {
  auto engine = make_engine(4, 2, AddressingMode::Bounded,
                            DeletionPolicy::Tombstoning);
  fill(*engine, 4);

  std::vector<Row> fresh = {row2(9, 9), row2(8, 8)};
  auto n = engine->truncate(fresh);
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 2u);
  EXPECT_EQ(engine->len(), 2u);
  EXPECT_EQ(engine->cursor(), 2u);
  EXPECT_EQ(engine->live_count(), 2u);
  EXPECT_EQ(engine->get(0).value(), row2(9, 9));
  EXPECT_EQ(engine->count_active(), 2u);
}

TEST(Delete, TruncateValidatesBeforeClearing) {
  auto engine = make_engine(2, 2, AddressingMode::Bounded,
                            DeletionPolicy::Tombstoning);
  fill(*engine, 2);

  std::vector<Row> too_many = {row2(1, 1), row2(2, 2), row2(3, 3)};
  auto r = engine->truncate(too_many);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, ErrorKind::CapacityExceeded);

  std::vector<Row> bad_shape = {Row{Cell(1)}};
  auto s = engine->truncate(bad_shape);
  ASSERT_FALSE(s.has_value());
  EXPECT_EQ(s.error().kind, ErrorKind::ShapeMismatch);

  EXPECT_EQ(engine->len(), 2u);
  EXPECT_EQ(engine->get(1).value(), row2(2, 200));
}
