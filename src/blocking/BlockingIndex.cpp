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


#include "BlockingIndex.h"

BlockingIndex::BlockingIndex(const EntityCollection &collection, const KeyFunction &keyFunction) {
    for (size_t i = 0; i < collection.size(); i++) {
        std::set<std::string> keys = keyFunction(collection.at(i));
        if (keys.empty()) {
            unkeyedCount++;
            continue;
        }
        for (const auto &key : keys) {
            partitions[key].push_back(i);
        }
    }
}

const std::vector<size_t> &BlockingIndex::lookup(const std::string &key) const {
    static const std::vector<size_t> empty;
    auto it = partitions.find(key);
    return it == partitions.end() ? empty : it->second;
}
