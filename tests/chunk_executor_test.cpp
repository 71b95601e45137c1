#include "common/chunk_executor.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace xorblur;

TEST(ChunkExecutorTest, RejectsZeroThreshold) {
    EXPECT_THROW(ParallelChunkExecutor(0), std::invalid_argument);
}

TEST(ChunkExecutorTest, PlanOfEmptyInputIsEmpty) {
    ParallelChunkExecutor executor(1024);
    EXPECT_TRUE(executor.plan(0).empty());
}

TEST(ChunkExecutorTest, SmallInputIsOneLeaf) {
    ParallelChunkExecutor executor(1024);
    auto chunks = executor.plan(1024);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].begin, 0u);
    EXPECT_EQ(chunks[0].end, 1024u);
}

TEST(ChunkExecutorTest, PlanCoversRangeWithDisjointLeaves) {
    const size_t threshold = 4096;
    ParallelChunkExecutor executor(threshold);

    for (size_t size : {4097u, 10000u, 65536u, 1048576u + 3u}) {
        auto chunks = executor.plan(size);
        ASSERT_FALSE(chunks.empty());

        size_t expectedBegin = 0;
        for (const auto& chunk : chunks) {
            EXPECT_EQ(chunk.begin, expectedBegin);
            EXPECT_GT(chunk.size(), 0u);
            EXPECT_LE(chunk.size(), threshold);
            expectedBegin = chunk.end;
        }
        EXPECT_EQ(expectedBegin, size);
    }
}

TEST(ChunkExecutorTest, RunVisitsEveryIndexExactly) {
    ParallelChunkExecutor executor(1000, 4);
    const size_t size = 123457;
    std::vector<std::atomic<int>> hits(size);
    for (auto& h : hits) {
        h.store(0);
    }

    executor.run(size, [&hits](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            hits[i].fetch_add(1);
        }
    });

    for (size_t i = 0; i < size; ++i) {
        ASSERT_EQ(hits[i].load(), 1) << "index " << i;
    }
}

TEST(ChunkExecutorTest, RunSkipsEmptyAndKeepsSmallInputWhole) {
    ParallelChunkExecutor executor(16);
    int calls = 0;
    executor.run(0, [&calls](size_t, size_t) { ++calls; });
    EXPECT_EQ(calls, 0);

    executor.run(16, [&calls](size_t begin, size_t end) {
        ++calls;
        EXPECT_EQ(begin, 0u);
        EXPECT_EQ(end, 16u);
    });
    EXPECT_EQ(calls, 1);
}

TEST(ChunkExecutorTest, ThreadCountSetting) {
    ParallelChunkExecutor executor(64);
    EXPECT_EQ(executor.getNumThreads(), 0);
    executor.setNumThreads(3);
    EXPECT_EQ(executor.getNumThreads(), 3);
    EXPECT_GE(ParallelChunkExecutor::maxThreads(), 1);
}
