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


#include "FeatureSchema.h"

#include <cstdint>
#include <cstdio>

FeatureSchema::FeatureSchema(std::vector<std::string> featureIds) : featureIds(std::move(featureIds)) {
    std::string joined;
    for (const auto &id : this->featureIds) {
        joined += id;
        joined += '\n';
    }
    hash = fnv1aHex(joined);
}

int FeatureSchema::indexOf(const std::string &featureId) const {
    for (size_t i = 0; i < featureIds.size(); i++) {
        if (featureIds[i] == featureId) return static_cast<int>(i);
    }
    return -1;
}

std::string FeatureSchema::fnv1aHex(const std::string &data) {
    uint64_t value = 14695981039346656037ULL;
    for (unsigned char c : data) {
        value ^= c;
        value *= 1099511628211ULL;
    }
    char buffer[17];
    snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(value));
    return std::string(buffer);
}
