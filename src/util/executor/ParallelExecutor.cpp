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


#include "ParallelExecutor.h"

#include "../logger/Logger.h"

Logger executor_logger;

DynamicThreadPool::DynamicThreadPool(int requestedWorkers) : stop(false) {
    workerCount = requestedWorkers > 0 ? requestedWorkers : static_cast<int>(std::thread::hardware_concurrency());

    // Safety limits: minimum 1, maximum 32
    workerCount = std::max(1, std::min(32, workerCount));

    for (int i = 0; i < workerCount; ++i) {
        workers.emplace_back([this] { workerFunction(); });
    }
}

DynamicThreadPool::~DynamicThreadPool() {
    {
        std::scoped_lock lock(queueMutex);
        stop = true;
    }
    condition.notify_all();
    for (std::thread &worker : workers) {
        worker.join();
    }
}

void DynamicThreadPool::workerFunction() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queueMutex);
            condition.wait(lock, [this] { return stop || !tasks.empty(); });
            if (stop && tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

ParallelExecutor::ParallelExecutor(int requestedWorkers) {
    threadPool = std::make_unique<DynamicThreadPool>(requestedWorkers);
    workerCount = threadPool->getWorkerCount();
    executor_logger.debug("Parallel executor started with " + std::to_string(workerCount) + " workers");
}

size_t ParallelExecutor::calculateOptimalChunkSize(size_t totalItems, int workers) const {
    // Target: 3 chunks per worker for load balancing
    size_t chunksPerWorker = 3;
    size_t minChunkSize = 256;
    size_t maxChunkSize = 100000;

    size_t targetChunks = static_cast<size_t>(workers) * chunksPerWorker;
    size_t chunkSize = totalItems / targetChunks;

    return std::max(minChunkSize, std::min(maxChunkSize, chunkSize));
}

bool ParallelExecutor::shouldUseParallelProcessing(size_t dataSize) const {
    return dataSize > PARALLEL_THRESHOLD && workerCount > 1;
}

std::vector<WorkChunk> ParallelExecutor::createWorkChunks(size_t totalItems, size_t chunkSize) const {
    std::vector<WorkChunk> chunks;
    if (chunkSize == 0) return chunks;

    for (size_t start = 0; start < totalItems; start += chunkSize) {
        chunks.emplace_back(start, std::min(start + chunkSize, totalItems));
    }
    return chunks;
}
