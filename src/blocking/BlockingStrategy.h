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


#ifndef CATALOGLINKER_BLOCKINGSTRATEGY_H
#define CATALOGLINKER_BLOCKINGSTRATEGY_H

#include <functional>
#include <string>
#include <vector>

#include "../entity/EntityCollection.h"
#include "../util/executor/ParallelExecutor.h"
#include "BlockingIndex.h"

/**
 * Produces candidate pairs for a source and a target collection. A strategy never fails because
 * an entity lacks an attribute; such entities simply yield no candidates.
 */
class BlockingStrategy {
 public:
    explicit BlockingStrategy(std::string name) : name(std::move(name)) {}
    virtual ~BlockingStrategy() = default;

    const std::string &getName() const { return name; }

    virtual std::vector<CandidatePair> block(const EntityCollection &source, const EntityCollection &target,
                                             ParallelExecutor &executor) const = 0;

 protected:
    std::string name;
};

/**
 * Indexes the target collection by key and pairs every source entity with the targets sharing
 * one of its keys.
 */
class ExactKeyBlocking : public BlockingStrategy {
 public:
    ExactKeyBlocking(std::string name, BlockingIndex::KeyFunction keyFunction)
        : BlockingStrategy(std::move(name)), keyFunction(std::move(keyFunction)) {}

    std::vector<CandidatePair> block(const EntityCollection &source, const EntityCollection &target,
                                     ParallelExecutor &executor) const override;

    // First word of every normalized value of a string attribute
    static BlockingIndex::KeyFunction firstTokenKey(const std::string &attribute);

    // Every normalized value of an attribute of any kind
    static BlockingIndex::KeyFunction exactValueKey(const std::string &attribute);

    // Every normalized URL of a link attribute
    static BlockingIndex::KeyFunction normalizedUrlKey(const std::string &attribute);

 private:
    BlockingIndex::KeyFunction keyFunction;
};

/**
 * Delegates candidate lookup to a caller supplied function, e.g. a query against an external
 * full text index. The function returns target ids; ids missing from the target collection are
 * ignored. It is called concurrently from the worker pool.
 */
class FunctionBlocking : public BlockingStrategy {
 public:
    using CandidateFunction = std::function<std::vector<std::string>(const Entity &source)>;

    FunctionBlocking(std::string name, CandidateFunction candidateFunction)
        : BlockingStrategy(std::move(name)), candidateFunction(std::move(candidateFunction)) {}

    std::vector<CandidatePair> block(const EntityCollection &source, const EntityCollection &target,
                                     ParallelExecutor &executor) const override;

 private:
    CandidateFunction candidateFunction;
};

/**
 * In-memory full text search over name tokens. Each source entity is paired with the targets
 * sharing the most name tokens, at most limit of them.
 */
class FullTextBlocking : public BlockingStrategy {
 public:
    FullTextBlocking(std::string name, std::string attribute, size_t limit)
        : BlockingStrategy(std::move(name)), attribute(std::move(attribute)), limit(limit) {}

    std::vector<CandidatePair> block(const EntityCollection &source, const EntityCollection &target,
                                     ParallelExecutor &executor) const override;

 private:
    std::string attribute;
    size_t limit;
};

#endif  // CATALOGLINKER_BLOCKINGSTRATEGY_H
