#include "rangedl/chunk_info.hpp"
#include "rangedl/download_status.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <vector>

namespace rangedl {
namespace {

void expectPartition(const std::vector<ChunkInfo>& chunks, std::uint64_t total) {
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(chunks.front().start, 0u);
    EXPECT_EQ(chunks.back().end, total - 1);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_LE(chunks[i].start, chunks[i].end);
        EXPECT_EQ(chunks[i].downloaded, 0u);
        EXPECT_FALSE(chunks[i].completed);
        if (i + 1 < chunks.size()) {
            EXPECT_EQ(chunks[i].end + 1, chunks[i + 1].start);
        }
    }
}

TEST(ChunkPlanTest, SplitsIntoEqualRanges) {
    const auto chunks = planChunks(1'000'000, true, 4);
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].end, 249'999u);
    EXPECT_EQ(chunks[1].start, 250'000u);
    EXPECT_EQ(chunks[1].end, 499'999u);
    EXPECT_EQ(chunks[2].start, 500'000u);
    EXPECT_EQ(chunks[2].end, 749'999u);
    EXPECT_EQ(chunks[3].start, 750'000u);
    EXPECT_EQ(chunks[3].end, 999'999u);
}

TEST(ChunkPlanTest, RemainderGoesToLastChunk) {
    const auto chunks = planChunks(1003, true, 4);
    ASSERT_EQ(chunks.size(), 4u);
    expectPartition(chunks, 1003);
    EXPECT_EQ(chunks[0].length(), 250u);
    EXPECT_EQ(chunks[3].length(), 253u);
}

TEST(ChunkPlanTest, PartitionHoldsForManySizes) {
    for (std::uint64_t total : {2ull, 7ull, 64ull, 999ull, 4096ull, 1'234'567ull}) {
        for (int connections : {2, 3, 8, 32}) {
            if (total < static_cast<std::uint64_t>(connections)) {
                continue;
            }
            SCOPED_TRACE(testing::Message() << "total=" << total << " connections=" << connections);
            const auto chunks = planChunks(total, true, connections);
            EXPECT_EQ(chunks.size(), static_cast<std::size_t>(connections));
            expectPartition(chunks, total);
        }
    }
}

TEST(ChunkPlanTest, NoRangeSupportUsesOneChunk) {
    const auto chunks = planChunks(5000, false, 8);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].end, 4999u);
}

TEST(ChunkPlanTest, SingleConnectionUsesOneChunk) {
    const auto chunks = planChunks(5000, true, 1);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].end, 4999u);
}

TEST(ChunkPlanTest, UnknownSizeUsesOneChunk) {
    const auto chunks = planChunks(0, true, 8);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].end, 0u);
}

TEST(ChunkPlanTest, FewerBytesThanConnectionsUsesOneChunk) {
    const auto chunks = planChunks(3, true, 8);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].end, 2u);
}

TEST(ChunkPlanTest, SumsAndCompletion) {
    auto chunks = planChunks(100, true, 2);
    chunks[0].downloaded = 50;
    chunks[0].completed = true;
    chunks[1].downloaded = 20;
    EXPECT_EQ(sumDownloaded(chunks), 70u);
    EXPECT_FALSE(allCompleted(chunks));
    chunks[1].completed = true;
    EXPECT_TRUE(allCompleted(chunks));
}

TEST(ChunkPlanTest, ZeroLengthChunk) {
    ChunkInfo chunk;
    chunk.start = 10;
    chunk.end = 9;
    EXPECT_EQ(chunk.length(), 0u);
}

TEST(DownloadStatusTest, NamesRoundTrip) {
    for (auto status : {DownloadStatus::Queued, DownloadStatus::Downloading, DownloadStatus::Paused,
                        DownloadStatus::Stopped, DownloadStatus::Error, DownloadStatus::Merging,
                        DownloadStatus::Completed}) {
        EXPECT_EQ(statusFromString(toString(status)), status);
    }
    EXPECT_EQ(toString(DownloadStatus::Downloading), "Downloading");
    EXPECT_FALSE(statusFromString("downloading").has_value());
    EXPECT_FALSE(statusFromString("").has_value());
}

TEST(DownloadStatusTest, FinishedStates) {
    EXPECT_TRUE(isFinished(DownloadStatus::Completed));
    EXPECT_TRUE(isFinished(DownloadStatus::Error));
    EXPECT_TRUE(isFinished(DownloadStatus::Stopped));
    EXPECT_FALSE(isFinished(DownloadStatus::Queued));
    EXPECT_FALSE(isFinished(DownloadStatus::Downloading));
    EXPECT_FALSE(isFinished(DownloadStatus::Paused));
    EXPECT_FALSE(isFinished(DownloadStatus::Merging));
}

} // namespace
} // namespace rangedl
