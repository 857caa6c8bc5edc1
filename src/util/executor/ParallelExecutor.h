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


#ifndef CATALOGLINKER_PARALLEL_EXECUTOR_H
#define CATALOGLINKER_PARALLEL_EXECUTOR_H

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * Half-open range [startIndex, endIndex) of items handled by one task
 */
struct WorkChunk {
    size_t startIndex;
    size_t endIndex;

    WorkChunk(size_t start, size_t end) : startIndex(start), endIndex(end) {}

    size_t size() const { return endIndex - startIndex; }
};

/**
 * Fixed size thread pool. The worker count defaults to the number of hardware threads.
 */
class DynamicThreadPool {
 private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queueMutex;
    std::condition_variable condition;
    std::atomic<bool> stop{false};
    int workerCount;

 public:
    explicit DynamicThreadPool(int requestedWorkers = 0);
    ~DynamicThreadPool();

    template <class F, class... Args>
    auto enqueue(F &&f, Args &&...args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    int getWorkerCount() const { return workerCount; }

 private:
    void workerFunction();
};

/**
 * Runs per-item work over a thread pool. Results always come back in item order, whatever order
 * the chunks complete in.
 */
class ParallelExecutor {
 private:
    std::unique_ptr<DynamicThreadPool> threadPool;
    int workerCount;

    size_t calculateOptimalChunkSize(size_t totalItems, int workers) const;

 public:
    static constexpr size_t PARALLEL_THRESHOLD = 1000;

    explicit ParallelExecutor(int requestedWorkers = 0);
    ~ParallelExecutor() = default;

    /**
     * Applies processor(index) to every index in [0, totalItems). Exceptions thrown by the
     * processor propagate to the caller.
     */
    template <typename ResultType, typename Processor>
    std::vector<ResultType> map(size_t totalItems, Processor processor);

    template <typename ResultType, typename TaskFunc>
    std::vector<ResultType> executeChunkedTasks(const std::vector<WorkChunk> &chunks, TaskFunc taskFunction);

    bool shouldUseParallelProcessing(size_t dataSize) const;

    int getWorkerCount() const { return workerCount; }

    std::vector<WorkChunk> createWorkChunks(size_t totalItems, size_t chunkSize) const;

 private:
    // Concatenates chunk results in chunk order, moving the elements out
    template <typename T>
    std::vector<T> mergeResults(std::vector<std::vector<T>> &chunkResults) const;
};

template <class F, class... Args>
auto DynamicThreadPool::enqueue(F &&f, Args &&...args) -> std::future<typename std::invoke_result_t<F, Args...>> {
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> res = task->get_future();
    {
        std::scoped_lock lock(queueMutex);
        if (stop) throw std::runtime_error("enqueue on stopped ThreadPool");
        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}

template <typename ResultType, typename TaskFunc>
std::vector<ResultType> ParallelExecutor::executeChunkedTasks(const std::vector<WorkChunk> &chunks,
                                                              TaskFunc taskFunction) {
    std::vector<std::future<ResultType>> futures;
    futures.reserve(chunks.size());

    for (const auto &chunk : chunks) {
        futures.push_back(threadPool->enqueue([chunk, &taskFunction]() -> ResultType { return taskFunction(chunk); }));
    }

    // Every future is drained before rethrowing so no task outlives taskFunction
    std::vector<ResultType> results;
    results.reserve(chunks.size());
    std::exception_ptr failure;
    for (auto &future : futures) {
        try {
            results.push_back(future.get());
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);
    return results;
}

template <typename ResultType, typename Processor>
std::vector<ResultType> ParallelExecutor::map(size_t totalItems, Processor processor) {
    auto runChunk = [&processor](const WorkChunk &chunk) {
        std::vector<ResultType> chunkResults;
        chunkResults.reserve(chunk.size());
        for (size_t i = chunk.startIndex; i < chunk.endIndex; i++) {
            chunkResults.push_back(processor(i));
        }
        return chunkResults;
    };

    if (!shouldUseParallelProcessing(totalItems)) {
        return runChunk(WorkChunk(0, totalItems));
    }

    size_t chunkSize = calculateOptimalChunkSize(totalItems, workerCount);
    std::vector<WorkChunk> chunks = createWorkChunks(totalItems, chunkSize);
    std::vector<std::vector<ResultType>> chunkResults =
        executeChunkedTasks<std::vector<ResultType>>(chunks, runChunk);
    return mergeResults(chunkResults);
}

template <typename T>
std::vector<T> ParallelExecutor::mergeResults(std::vector<std::vector<T>> &chunkResults) const {
    size_t totalSize = 0;
    for (const auto &chunk : chunkResults) {
        totalSize += chunk.size();
    }

    std::vector<T> finalResult;
    finalResult.reserve(totalSize);
    for (auto &chunk : chunkResults) {
        std::move(chunk.begin(), chunk.end(), std::back_inserter(finalResult));
    }
    return finalResult;
}

#endif  // CATALOGLINKER_PARALLEL_EXECUTOR_H
