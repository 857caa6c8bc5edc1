/**
Copyright 2025 CatalogLinker Team
Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at
    http://www.apache.org/licenses/LICENSE-2.0
Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
 */


#include "../../../src/util/executor/ParallelExecutor.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

class ParallelExecutorTest : public ::testing::Test {
 protected:
    std::unique_ptr<ParallelExecutor> executor;

    void SetUp() override { executor = std::make_unique<ParallelExecutor>(4); }
};

// Test 1: Small inputs stay on the calling thread
TEST_F(ParallelExecutorTest, SmallDatasetThreshold) {
    EXPECT_FALSE(executor->shouldUseParallelProcessing(ParallelExecutor::PARALLEL_THRESHOLD));
    EXPECT_TRUE(executor->shouldUseParallelProcessing(ParallelExecutor::PARALLEL_THRESHOLD + 1));
}

// Test 2: A single worker never goes parallel
TEST_F(ParallelExecutorTest, SingleWorkerIsSequential) {
    ParallelExecutor single(1);
    EXPECT_EQ(single.getWorkerCount(), 1);
    EXPECT_FALSE(single.shouldUseParallelProcessing(100000));
}

// Test 3: Worker count is clamped
TEST_F(ParallelExecutorTest, WorkerCountClamped) {
    EXPECT_EQ(executor->getWorkerCount(), 4);
    ParallelExecutor many(500);
    EXPECT_EQ(many.getWorkerCount(), 32);
    ParallelExecutor automatic(0);
    EXPECT_GE(automatic.getWorkerCount(), 1);
}

// Test 4: Chunks cover every index exactly once
TEST_F(ParallelExecutorTest, ChunkCoverageComplete) {
    std::vector<WorkChunk> chunks = executor->createWorkChunks(1003, 250);
    ASSERT_EQ(chunks.size(), 5);
    size_t expectedStart = 0;
    for (const auto &chunk : chunks) {
        EXPECT_EQ(chunk.startIndex, expectedStart);
        expectedStart = chunk.endIndex;
    }
    EXPECT_EQ(expectedStart, 1003);
    EXPECT_EQ(chunks.back().size(), 3);
    EXPECT_TRUE(executor->createWorkChunks(10, 0).empty());
}

// Test 5: map keeps input order regardless of completion order
TEST_F(ParallelExecutorTest, MapPreservesOrder) {
    const size_t n = 20000;
    std::vector<size_t> results = executor->map<size_t>(n, [](size_t index) { return index * 2; });
    ASSERT_EQ(results.size(), n);
    for (size_t i = 0; i < n; i++) {
        ASSERT_EQ(results[i], i * 2);
    }
}

// Test 6: Sequential and parallel runs agree
TEST_F(ParallelExecutorTest, MapMatchesSequential) {
    ParallelExecutor single(1);
    auto square = [](size_t index) { return static_cast<long>(index % 97) * static_cast<long>(index % 13); };
    EXPECT_EQ(executor->map<long>(5000, square), single.map<long>(5000, square));
}

// Test 7: Exceptions reach the caller after every chunk finished
TEST_F(ParallelExecutorTest, MapPropagatesExceptions) {
    std::atomic<size_t> processed{0};
    EXPECT_THROW(executor->map<int>(5000,
                                    [&processed](size_t index) {
                                        processed++;
                                        if (index == 4321) throw std::runtime_error("bad item");
                                        return 1;
                                    }),
                 std::runtime_error);
    EXPECT_GT(processed.load(), 0);
}

// Test 8: Empty input
TEST_F(ParallelExecutorTest, EmptyDataset) {
    EXPECT_TRUE(executor->map<int>(0, [](size_t) { return 1; }).empty());
}

// Test 9: Move-only results are collected across chunks in item order
TEST_F(ParallelExecutorTest, MapCollectsMoveOnlyResults) {
    const size_t n = 3001;
    std::vector<std::unique_ptr<size_t>> results =
        executor->map<std::unique_ptr<size_t>>(n, [](size_t index) { return std::make_unique<size_t>(index + 1); });
    ASSERT_EQ(results.size(), n);
    for (size_t i = 0; i < n; i++) {
        ASSERT_NE(results[i], nullptr);
        ASSERT_EQ(*results[i], i + 1);
    }
}
