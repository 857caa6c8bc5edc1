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


#ifndef CATALOGLINKER_BLOCKINGINDEX_H
#define CATALOGLINKER_BLOCKINGINDEX_H

#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "../entity/EntityCollection.h"

/**
 * Partitions of one collection by blocking key. Partitions hold positions in the collection
 * arena, so they are only meaningful against that collection.
 */
class BlockingIndex {
 public:
    using KeyFunction = std::function<std::set<std::string>(const Entity &)>;

    BlockingIndex(const EntityCollection &collection, const KeyFunction &keyFunction);

    // Arena positions sharing the key. Empty when no entity produced it.
    const std::vector<size_t> &lookup(const std::string &key) const;

    size_t getPartitionCount() const { return partitions.size(); }

    // Entities that produced no key and therefore sit in no partition
    size_t getUnkeyedCount() const { return unkeyedCount; }

 private:
    std::unordered_map<std::string, std::vector<size_t>> partitions;
    size_t unkeyedCount = 0;
};

#endif  // CATALOGLINKER_BLOCKINGINDEX_H
