#include "orby/orby_c_api.h"
#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class CApiTest : public ::testing::Test {
protected:
  orby_engine_t *engine = nullptr;
  fs::path vault_dir;

  void SetUp() override {
    vault_dir = fs::temp_directory_path() / "orby_c_api_test";
    fs::remove_all(vault_dir);
  }

  void TearDown() override {
    if (engine)
      orby_destroy(engine);
    std::error_code ec;
    fs::remove_all(vault_dir, ec);
  }

  static orby_options_t options(size_t capacity, uint32_t dimension) {
    orby_options_t opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.capacity = capacity;
    opts.dimension = dimension;
    opts.worker_threads = 2;
    return opts;
  }

  /// Row k is (k, 100 + k % 3).
  static std::vector<orby_cell_t> rows(uint64_t first, uint64_t count) {
    std::vector<orby_cell_t> cells;
    for (uint64_t k = first; k < first + count; ++k) {
      cells.push_back({k, 0});
      cells.push_back({100 + k % 3, 0});
    }
    return cells;
  }
};

TEST_F(CApiTest, Version) {
  const char *v = orby_version();
  ASSERT_NE(v, nullptr);
  EXPECT_GT(std::strlen(v), 0u);
}

TEST_F(CApiTest, NullPointers) {
  orby_options_t opts = options(8, 2);
  EXPECT_EQ(orby_create(nullptr, &engine), ORBY_ERR_NULL_PTR);
  EXPECT_EQ(orby_create(&opts, nullptr), ORBY_ERR_NULL_PTR);
  EXPECT_EQ(orby_insert_batch(nullptr, nullptr, 0, nullptr), ORBY_ERR_NULL_PTR);
  EXPECT_EQ(orby_remove(nullptr, 0), ORBY_ERR_NULL_PTR);
  EXPECT_EQ(orby_sleep(nullptr), ORBY_ERR_NULL_PTR);
  size_t n = 0;
  EXPECT_EQ(orby_len(nullptr, &n), ORBY_ERR_NULL_PTR);
  EXPECT_EQ(orby_destroy(nullptr), ORBY_OK);
}

TEST_F(CApiTest, InvalidOptions) {
  orby_options_t opts = options(0, 2);
  EXPECT_EQ(orby_create(&opts, &engine), ORBY_ERR_INVALID_CONFIG);
  EXPECT_EQ(engine, nullptr);

  opts = options(8, 0);
  EXPECT_EQ(orby_create(&opts, &engine), ORBY_ERR_INVALID_CONFIG);

  opts = options(8, 2);
  opts.addressing = 7;
  EXPECT_EQ(orby_create(&opts, &engine), ORBY_ERR_INVALID_CONFIG);
  EXPECT_EQ(engine, nullptr);
}

TEST_F(CApiTest, InsertGetFindRemove) {
  orby_options_t opts = options(64, 2);
  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);

  auto cells = rows(1, 10);
  size_t inserted = 0;
  ASSERT_EQ(orby_insert_batch(engine, cells.data(), 10, &inserted), ORBY_OK);
  EXPECT_EQ(inserted, 10u);

  size_t len = 0;
  ASSERT_EQ(orby_len(engine, &len), ORBY_OK);
  EXPECT_EQ(len, 10u);

  orby_cell_t row[2];
  ASSERT_EQ(orby_get_row(engine, 4, row, 2), ORBY_OK);
  EXPECT_EQ(row[0].lo, 5u);
  EXPECT_EQ(row[1].lo, 102u);
  EXPECT_EQ(orby_get_row(engine, 4, row, 1), ORBY_ERR_BUFFER_TOO_SMALL);
  EXPECT_EQ(orby_get_row(engine, 10, row, 2), ORBY_ERR_INDEX_OUT_OF_RANGE);

  // k % 3 == 1 for k = 1, 4, 7, 10.
  size_t indices[8];
  orby_cell_t out[16];
  size_t count = 0;
  ASSERT_EQ(orby_find_by(engine, 1, {101, 0}, 0, indices, out, 8, &count),
            ORBY_OK);
  ASSERT_EQ(count, 4u);
  EXPECT_EQ(indices[0], 0u);
  EXPECT_EQ(indices[3], 9u);
  EXPECT_EQ(out[3 * 2].lo, 10u);

  ASSERT_EQ(orby_remove(engine, 0), ORBY_OK);
  size_t live = 0;
  ASSERT_EQ(orby_live_count(engine, &live), ORBY_OK);
  EXPECT_EQ(live, 9u);
  ASSERT_EQ(orby_find_by(engine, 1, {101, 0}, 0, indices, nullptr, 8, &count),
            ORBY_OK);
  EXPECT_EQ(count, 3u);
  EXPECT_EQ(indices[0], 3u);
}

TEST_F(CApiTest, FindByReportsSmallBuffer) {
  orby_options_t opts = options(64, 2);
  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);
  auto cells = rows(1, 30);
  ASSERT_EQ(orby_insert_batch(engine, cells.data(), 30, nullptr), ORBY_OK);

  size_t indices[3];
  size_t count = 0;
  EXPECT_EQ(orby_find_by(engine, 1, {100, 0}, 0, indices, nullptr, 3, &count),
            ORBY_ERR_BUFFER_TOO_SMALL);
  EXPECT_EQ(count, 3u);
  EXPECT_EQ(indices[0], 2u);

  // A limit that fits is not an overflow.
  EXPECT_EQ(orby_find_by(engine, 1, {100, 0}, 3, indices, nullptr, 3, &count),
            ORBY_OK);
  EXPECT_EQ(count, 3u);

  EXPECT_EQ(orby_find_by(engine, 5, {100, 0}, 0, indices, nullptr, 3, &count),
            ORBY_ERR_INDEX_OUT_OF_RANGE);
}

TEST_F(CApiTest, BoundedOverflowReportsPartialBatch) {
  orby_options_t opts = options(4, 2);
  opts.addressing = ORBY_ADDRESSING_BOUNDED;
  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);

  auto cells = rows(1, 6);
  size_t inserted = 0;
  EXPECT_EQ(orby_insert_batch(engine, cells.data(), 6, &inserted),
            ORBY_ERR_CAPACITY_EXCEEDED);
  EXPECT_EQ(inserted, 4u);
}

TEST_F(CApiTest, SleepAndReload) {
  const std::string path = vault_dir.string();
  orby_options_t opts = options(16, 2);
  opts.vault_path = path.c_str();
  opts.autoload = 1;
  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);

  auto cells = rows(1, 5);
  ASSERT_EQ(orby_insert_batch(engine, cells.data(), 5, nullptr), ORBY_OK);
  ASSERT_EQ(orby_sleep(engine), ORBY_OK);
  ASSERT_EQ(orby_destroy(engine), ORBY_OK);
  engine = nullptr;

  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);
  size_t len = 0;
  ASSERT_EQ(orby_len(engine, &len), ORBY_OK);
  EXPECT_EQ(len, 5u);
  orby_cell_t row[2];
  ASSERT_EQ(orby_get_row(engine, 2, row, 2), ORBY_OK);
  EXPECT_EQ(row[0].lo, 3u);

  // Same vault, different shape.
  orby_engine_t *other = nullptr;
  orby_options_t wrong = opts;
  wrong.capacity = 32;
  EXPECT_EQ(orby_create(&wrong, &other), ORBY_ERR_CONFIG_MISMATCH);
  EXPECT_EQ(other, nullptr);
}

TEST_F(CApiTest, SleepWithoutVault) {
  orby_options_t opts = options(8, 1);
  ASSERT_EQ(orby_create(&opts, &engine), ORBY_OK);
  EXPECT_EQ(orby_sleep(engine), ORBY_ERR_INVALID_CONFIG);
}
