#include "support/temp_files.h"
#include "upload/chunk_splitter.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using upload::ByteRange;

namespace {
constexpr std::uint64_t kMiB = 1024 * 1024;

// Ranges must start at 0, touch each other and end at total_size.
void expect_tiling(const upload::ChunkRanges& ranges, std::uint64_t total_size) {
    std::uint64_t next = 0;
    for (const auto& range : ranges) {
        EXPECT_EQ(range.start, next);
        EXPECT_GT(range.size(), 0u);
        EXPECT_LE(range.size(), ranges.chunk_size());
        next = range.end;
    }
    EXPECT_EQ(next, total_size);
}
} // namespace

TEST(ChunkSplitterTest, TwelveMiBInFiveMiBChunks) {
    auto ranges = upload::split(12 * kMiB, 5 * kMiB);

    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], (ByteRange{0, 5 * kMiB}));
    EXPECT_EQ(ranges[1], (ByteRange{5 * kMiB, 10 * kMiB}));
    EXPECT_EQ(ranges[2], (ByteRange{10 * kMiB, 12 * kMiB}));
    EXPECT_EQ(ranges[2].size(), 2 * kMiB);
}

TEST(ChunkSplitterTest, CountIsCeiling) {
    EXPECT_EQ(upload::chunk_count(0, 10), 0u);
    EXPECT_EQ(upload::chunk_count(1, 10), 1u);
    EXPECT_EQ(upload::chunk_count(10, 10), 1u);
    EXPECT_EQ(upload::chunk_count(11, 10), 2u);
    EXPECT_EQ(upload::chunk_count(3 * kMiB, 5 * kMiB), 1u);
}

TEST(ChunkSplitterTest, RangesTileTheFile) {
    for (std::uint64_t total : {1ull, 7ull, 100ull, 1000ull, 1024ull, 4097ull}) {
        for (std::uint64_t chunk : {1ull, 3ull, 64ull, 1024ull}) {
            auto ranges = upload::split(total, chunk);
            EXPECT_EQ(ranges.size(), upload::chunk_count(total, chunk));
            expect_tiling(ranges, total);
        }
    }
}

TEST(ChunkSplitterTest, IterationIsRestartable) {
    auto ranges = upload::split(10, 4);
    std::vector<ByteRange> first(ranges.begin(), ranges.end());
    std::vector<ByteRange> second(ranges.begin(), ranges.end());
    auto copy = ranges;
    std::vector<ByteRange> third(copy.begin(), copy.end());

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, third);
    EXPECT_EQ(first.size(), 3u);
}

TEST(ChunkSplitterTest, EmptyFileHasNoRanges) {
    auto ranges = upload::split(0, 5);
    EXPECT_TRUE(ranges.empty());
    EXPECT_EQ(ranges.begin(), ranges.end());
}

TEST(ChunkSplitterTest, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(upload::split(10, 0), std::invalid_argument);
}

TEST(ChunkSplitterTest, IndexPastEndThrows) {
    auto ranges = upload::split(10, 5);
    EXPECT_THROW(ranges[2], std::out_of_range);
}

TEST(ChunkSplitterTest, ReadChunksReassembleFile) {
    test_utils::TempDir dir;
    const std::uint64_t size = 10'000;
    auto path = dir.write_file("data.bin", size);

    std::vector<std::byte> reassembled;
    for (const auto& range : upload::split(size, 3'000)) {
        auto bytes = upload::read_chunk(path, range);
        ASSERT_TRUE(bytes.has_value());
        ASSERT_EQ(bytes->size(), range.size());
        reassembled.insert(reassembled.end(), bytes->begin(), bytes->end());
    }

    ASSERT_EQ(reassembled.size(), size);
    for (std::uint64_t i = 0; i < size; ++i) {
        ASSERT_EQ(static_cast<char>(reassembled[i]), test_utils::TempDir::pattern_byte(i))
            << "at offset " << i;
    }
}

TEST(ChunkSplitterTest, ReadPastEndFails) {
    test_utils::TempDir dir;
    auto path = dir.write_file("short.bin", 100);

    EXPECT_FALSE(upload::read_chunk(path, ByteRange{50, 150}).has_value());
    EXPECT_FALSE(upload::read_chunk(dir.path() / "missing.bin", ByteRange{0, 1}).has_value());
}
