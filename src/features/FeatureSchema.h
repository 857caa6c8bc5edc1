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


#ifndef CATALOGLINKER_FEATURESCHEMA_H
#define CATALOGLINKER_FEATURESCHEMA_H

#include <string>
#include <vector>

#include "../entity/Entity.h"

/**
 * Ordered feature ids of a comparison vector. Two schemas are compatible only when their hashes
 * are equal, which requires the same ids in the same order.
 */
class FeatureSchema {
 public:
    FeatureSchema() = default;
    explicit FeatureSchema(std::vector<std::string> featureIds);

    const std::vector<std::string> &getFeatureIds() const { return featureIds; }

    size_t size() const { return featureIds.size(); }

    // 64 bit FNV-1a over the ids, as 16 hex digits
    const std::string &getHash() const { return hash; }

    // Position of the feature, -1 when the schema does not contain it
    int indexOf(const std::string &featureId) const;

    bool operator==(const FeatureSchema &other) const { return hash == other.hash; }
    bool operator!=(const FeatureSchema &other) const { return hash != other.hash; }

    static std::string fnv1aHex(const std::string &data);

 private:
    std::vector<std::string> featureIds;
    std::string hash = fnv1aHex("");
};

struct FeatureVector {
    CandidatePair pair;
    std::vector<double> values;
};

struct FeatureMatrix {
    FeatureSchema schema;
    std::vector<FeatureVector> vectors;
};

#endif  // CATALOGLINKER_FEATURESCHEMA_H
