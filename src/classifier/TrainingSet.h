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


#ifndef CATALOGLINKER_TRAININGSET_H
#define CATALOGLINKER_TRAININGSET_H

#include <armadillo>
#include <string>
#include <vector>

#include "../features/FeatureSchema.h"

/**
 * Labeled comparison vectors sharing one feature schema
 */
class TrainingSet {
 public:
    explicit TrainingSet(FeatureSchema schema) : schema(std::move(schema)) {}

    void add(FeatureVector vector, bool match);

    const FeatureSchema &getSchema() const { return schema; }

    const std::vector<FeatureVector> &getVectors() const { return vectors; }

    const std::vector<int> &getLabels() const { return labels; }

    size_t size() const { return vectors.size(); }

    size_t countPositives() const;

    size_t countNegatives() const { return size() - countPositives(); }

    // Stable identifier derived from the pairs, their labels and the schema
    std::string getIdentity() const;

    // One row per vector. Every vector must have the schema's width.
    arma::mat featureMatrix() const;

    // 1.0 for matches, 0.0 otherwise
    arma::vec labelVector() const;

    TrainingSet subset(const std::vector<size_t> &indices) const;

 private:
    FeatureSchema schema;
    std::vector<FeatureVector> vectors;
    std::vector<int> labels;
};

#endif  // CATALOGLINKER_TRAININGSET_H
