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


#ifndef CATALOGLINKER_BLOCKER_H
#define CATALOGLINKER_BLOCKER_H

#include <memory>
#include <vector>

#include "../util/LinkerConfig.h"
#include "BlockingStrategy.h"

/**
 * Runs every registered strategy and unions their candidates. The result is sorted by
 * (source id, target id) and holds each pair once.
 */
class Blocker {
 public:
    Blocker() = default;
    Blocker(Blocker &&) = default;
    Blocker &operator=(Blocker &&) = default;

    static Blocker fromConfig(const LinkerConfig &config);

    static std::unique_ptr<BlockingStrategy> createStrategy(const std::string &name, const LinkerConfig &config);

    void addStrategy(std::unique_ptr<BlockingStrategy> strategy);

    size_t getStrategyCount() const { return strategies.size(); }

    /**
     * Throws BlockingError when a strategy fails. Missing attributes never fail a strategy.
     */
    std::vector<CandidatePair> block(const EntityCollection &source, const EntityCollection &target,
                                     ParallelExecutor &executor) const;

 private:
    std::vector<std::unique_ptr<BlockingStrategy>> strategies;
};

#endif  // CATALOGLINKER_BLOCKER_H
