/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "data_loading/index_selector.hpp"
#include "data_loading/path_table.hpp"
#include "utils/errors.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace data_loading;

// ==================== PathTable Tests ====================

TEST(PathTableTest, StoresFixedWidthRecords) {
  PathTable table(3, 8);
  table.set(0, "a/1.jpg");
  table.set(1, "b.png");
  table.set(2, "");

  EXPECT_EQ(table.get(0), "a/1.jpg");
  EXPECT_EQ(table.get(1), "b.png");
  EXPECT_TRUE(table.get(2).empty());
  EXPECT_EQ(table.path(1), "b.png");
  EXPECT_EQ(table.memory_bytes(), 24u);
}

TEST(PathTableTest, OverwriteClearsPreviousTail) {
  PathTable table(1, 10);
  table.set(0, "long/path");
  table.set(0, "short");
  EXPECT_EQ(table.get(0), "short");
}

TEST(PathTableTest, RejectsPathsWithoutRoomForTerminator) {
  PathTable table(1, 4);
  EXPECT_THROW(table.set(0, "abcd"), std::length_error);
  EXPECT_NO_THROW(table.set(0, "abc"));
}

TEST(PathTableTest, RejectsOutOfRangeIndices) {
  PathTable table(2, 4);
  EXPECT_THROW(table.set(2, "a"), utils::IndexRangeError);
  EXPECT_THROW(table.get(5), utils::IndexRangeError);
}

// ==================== IndexSelector Tests ====================

TEST(IndexSelectorTest, ExpandsEachForm) {
  EXPECT_THAT(resolve_indices(size_t(4), 5), ::testing::ElementsAre(4));
  EXPECT_THAT(resolve_indices(IndexRange{1, 3}, 5), ::testing::ElementsAre(1, 2, 3));
  EXPECT_THAT(resolve_indices(std::vector<size_t>{3, 1, 3}, 5), ::testing::ElementsAre(3, 1, 3));
}

TEST(IndexSelectorTest, RejectsInvalidSelections) {
  EXPECT_THROW(resolve_indices(IndexRange{3, 1}, 5), utils::IndexRangeError);
  EXPECT_THROW(resolve_indices(IndexRange{0, 5}, 5), utils::IndexRangeError);
  EXPECT_THROW(resolve_indices(std::vector<size_t>{}, 5), utils::IndexRangeError);
  EXPECT_THROW(resolve_indices(std::vector<size_t>{0, 7}, 5), utils::IndexRangeError);
  EXPECT_THROW(resolve_indices(size_t(0), 0), utils::IndexRangeError);
}
