/**
 * @file test_chunk_plan.cpp
 * @brief Unit tests for chunk range planning
 */

#include <gtest/gtest.h>

#include <kcenon/background_transfer/parallel/chunk_plan.h>

namespace kcenon::background_transfer::test {

class ChunkPlanTest : public ::testing::Test {
protected:
    static auto make_parent() -> task {
        task t;
        t.task_id = "p1";
        t.kind = task_kind::parallel_download;
        t.url = "https://a.example.com/big.iso";
        t.headers = {{"Authorization", "Bearer x"}};
        t.directory = "downloads";
        t.filename = "big.iso";
        t.priority = 3;
        t.group = "isos";
        t.retries = 2;
        t.retries_remaining = 0;
        return t;
    }

    // Ranges must tile [0, total) without gaps or overlap
    static void expect_tiles(const std::vector<byte_range>& ranges, uint64_t total) {
        ASSERT_FALSE(ranges.empty());
        uint64_t next = 0;
        for (const auto& r : ranges) {
            EXPECT_EQ(r.start, next);
            ASSERT_TRUE(r.end.has_value());
            EXPECT_GE(*r.end, r.start);
            next = *r.end + 1;
        }
        EXPECT_EQ(next, total);
    }
};

// =============================================================================
// Chunk Count
// =============================================================================

TEST_F(ChunkPlanTest, ConfigValidation) {
    EXPECT_TRUE(chunk_plan_config{}.validate().has_value());
    EXPECT_FALSE(chunk_plan_config{0}.validate().has_value());
    EXPECT_FALSE(chunk_plan_config{chunk_plan_config::max_chunks + 1}.validate().has_value());
}

TEST_F(ChunkPlanTest, ChunkCountPerSourceUrl) {
    auto parent = make_parent();
    EXPECT_EQ(planned_chunk_count(parent, chunk_plan_config{}),
              static_cast<std::size_t>(chunk_plan_config::default_chunks_per_url));

    parent.chunk_count = 3;
    parent.mirror_urls = {"https://b.example.com/big.iso"};
    EXPECT_EQ(planned_chunk_count(parent, chunk_plan_config{}), 6u);

    parent.chunk_count = 50;
    EXPECT_EQ(planned_chunk_count(parent, chunk_plan_config{}),
              static_cast<std::size_t>(chunk_plan_config::max_chunks));
}

TEST_F(ChunkPlanTest, SourceUrlsPrimaryFirst) {
    auto parent = make_parent();
    parent.mirror_urls = {"https://b.example.com/x", "https://c.example.com/x"};

    auto urls = source_urls(parent);
    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0], parent.url);
    EXPECT_EQ(urls[2], "https://c.example.com/x");
}

// =============================================================================
// Range Planning
// =============================================================================

TEST_F(ChunkPlanTest, EvenSplit) {
    auto ranges = plan_ranges(200, true, 2);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].header_value(), "bytes=0-99");
    EXPECT_EQ(ranges[1].header_value(), "bytes=100-199");
}

TEST_F(ChunkPlanTest, UnevenSplitLastChunkShorter) {
    auto ranges = plan_ranges(10, true, 4);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0].size(), 3u);
    EXPECT_EQ(ranges[3].size(), 1u);
    expect_tiles(ranges, 10);
}

TEST_F(ChunkPlanTest, FewerBytesThanChunks) {
    auto ranges = plan_ranges(3, true, 8);
    EXPECT_EQ(ranges.size(), 3u);
    expect_tiles(ranges, 3);
}

TEST_F(ChunkPlanTest, LargeContentTiles) {
    constexpr uint64_t total = 4'294'967'311ull;
    auto ranges = plan_ranges(total, true, 7);
    EXPECT_EQ(ranges.size(), 7u);
    expect_tiles(ranges, total);
}

TEST_F(ChunkPlanTest, SingleChunkWithKnownLength) {
    auto ranges = plan_ranges(500, true, 1);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].start, 0u);
    EXPECT_EQ(ranges[0].end, 499u);
}

TEST_F(ChunkPlanTest, FallsBackToOneOpenRange) {
    for (auto ranges : {plan_ranges(std::nullopt, true, 4), plan_ranges(0, true, 4),
                        plan_ranges(1000, false, 4)}) {
        ASSERT_EQ(ranges.size(), 1u);
        EXPECT_EQ(ranges[0].start, 0u);
        EXPECT_FALSE(ranges[0].end.has_value());
        EXPECT_FALSE(ranges[0].size().has_value());
    }
}

TEST_F(ChunkPlanTest, OpenRangeHeader) {
    byte_range range{50, std::nullopt};
    EXPECT_EQ(range.header_value(), "bytes=50-");
}

// =============================================================================
// Chunk Tasks
// =============================================================================

TEST_F(ChunkPlanTest, ChunkIdsAreDeterministic) {
    EXPECT_EQ(chunk_task_id("p1", 0), "p1.chunk0");
    EXPECT_EQ(chunk_task_id("p1", 12), "p1.chunk12");
}

TEST_F(ChunkPlanTest, ChunkInheritsFromParent) {
    auto parent = make_parent();
    auto chunk = make_chunk_task(parent, "p1.chunk1", "https://b.example.com/big.iso",
                                 byte_range{100, 199});

    EXPECT_EQ(chunk.task_id, "p1.chunk1");
    EXPECT_EQ(chunk.parent_task_id, "p1");
    EXPECT_TRUE(chunk.is_chunk());
    EXPECT_EQ(chunk.kind, task_kind::download);
    EXPECT_EQ(chunk.url, "https://b.example.com/big.iso");
    EXPECT_EQ(chunk.group, "isos");
    EXPECT_EQ(chunk.priority, 3);
    EXPECT_EQ(chunk.retries, 2);
    EXPECT_EQ(chunk.retries_remaining, 2);
    EXPECT_EQ(chunk.directory, "downloads");
    EXPECT_EQ(chunk.byte_range_start, 100u);
    EXPECT_EQ(chunk.byte_range_end, 199u);
    EXPECT_EQ(chunk.headers.at("Authorization"), "Bearer x");
    EXPECT_EQ(chunk.headers.at("Range"), "bytes=100-199");
    EXPECT_TRUE(validate_task(chunk).has_value());
}

TEST_F(ChunkPlanTest, OpenFallbackChunkIsPlainGet) {
    auto chunk = make_chunk_task(make_parent(), "p1.chunk0", "https://a.example.com/big.iso",
                                 byte_range{0, std::nullopt});
    EXPECT_EQ(chunk.headers.count("Range"), 0u);
    EXPECT_FALSE(chunk.byte_range_end.has_value());
}

}  // namespace kcenon::background_transfer::test
