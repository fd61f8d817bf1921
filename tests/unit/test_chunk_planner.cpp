#include <gtest/gtest.h>
#include "chunkup/storage/chunk_planner.hpp"
#include <numeric>
#include <stdexcept>

using namespace chunkup::storage;

TEST(ChunkPlannerTest, PlansCeilingOfFileOverChunk) {
    EXPECT_EQ(ChunkPlanner::plan(500, 1024), 1u);
    EXPECT_EQ(ChunkPlanner::plan(1024, 1024), 1u);
    EXPECT_EQ(ChunkPlanner::plan(1025, 1024), 2u);
    EXPECT_EQ(ChunkPlanner::plan(3 * 1024, 1024), 3u);
    EXPECT_EQ(ChunkPlanner::plan(12 * 1024 * 1024, ChunkPlanner::DEFAULT_CHUNK_SIZE), 3u);
}

TEST(ChunkPlannerTest, RejectsZeroSizes) {
    EXPECT_THROW(ChunkPlanner::plan(0, 1024), std::invalid_argument);
    EXPECT_THROW(ChunkPlanner::plan(1024, 0), std::invalid_argument);
}

TEST(ChunkPlannerTest, RejectsPlansBeyondIndexRange) {
    EXPECT_THROW(ChunkPlanner::plan(1ULL << 40, 1), std::invalid_argument);
}

TEST(ChunkPlannerTest, LastRangeIsShort) {
    auto first = ChunkPlanner::range(0, 2500, 1024);
    auto last = ChunkPlanner::range(2, 2500, 1024);

    EXPECT_EQ(first, (ChunkRange{0, 1024}));
    EXPECT_EQ(last, (ChunkRange{2048, 2500}));
    EXPECT_EQ(last.size(), 452u);
}

TEST(ChunkPlannerTest, RangeOutOfBoundsThrows) {
    EXPECT_THROW(ChunkPlanner::range(3, 2500, 1024), std::out_of_range);
}

TEST(ChunkPlannerTest, RangesCoverFileWithoutGaps) {
    for (std::uint64_t file_size : {1ULL, 999ULL, 1024ULL, 4096ULL, 10000ULL}) {
        auto ranges = ChunkPlanner::ranges(file_size, 1024);
        ASSERT_EQ(ranges.size(), ChunkPlanner::plan(file_size, 1024));

        std::uint64_t expected_start = 0;
        std::uint64_t total = 0;
        for (const auto& range : ranges) {
            EXPECT_EQ(range.start, expected_start);
            EXPECT_GT(range.size(), 0u);
            EXPECT_LE(range.size(), 1024u);
            expected_start = range.end;
            total += range.size();
        }
        EXPECT_EQ(total, file_size);
    }
}
