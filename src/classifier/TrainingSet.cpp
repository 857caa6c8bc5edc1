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


#include "TrainingSet.h"

#include <algorithm>

void TrainingSet::add(FeatureVector vector, bool match) {
    vectors.push_back(std::move(vector));
    labels.push_back(match ? 1 : 0);
}

size_t TrainingSet::countPositives() const { return std::count(labels.begin(), labels.end(), 1); }

std::string TrainingSet::getIdentity() const {
    std::vector<std::string> entries;
    entries.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); i++) {
        entries.push_back(vectors[i].pair.sourceId + "\t" + vectors[i].pair.targetId + "\t" +
                          std::to_string(labels[i]));
    }
    std::sort(entries.begin(), entries.end());

    std::string joined = schema.getHash();
    for (const auto &entry : entries) {
        joined += "\n" + entry;
    }
    return "ts-" + FeatureSchema::fnv1aHex(joined);
}

arma::mat TrainingSet::featureMatrix() const {
    arma::mat features(vectors.size(), schema.size());
    for (size_t r = 0; r < vectors.size(); r++) {
        for (size_t c = 0; c < schema.size(); c++) {
            features(r, c) = vectors[r].values.at(c);
        }
    }
    return features;
}

arma::vec TrainingSet::labelVector() const {
    arma::vec values(labels.size());
    for (size_t i = 0; i < labels.size(); i++) {
        values(i) = labels[i];
    }
    return values;
}

TrainingSet TrainingSet::subset(const std::vector<size_t> &indices) const {
    TrainingSet result(schema);
    for (size_t index : indices) {
        result.add(vectors.at(index), labels.at(index) == 1);
    }
    return result;
}
