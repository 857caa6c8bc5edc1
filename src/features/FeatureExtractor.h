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


#ifndef CATALOGLINKER_FEATUREEXTRACTOR_H
#define CATALOGLINKER_FEATUREEXTRACTOR_H

#include <memory>
#include <string>
#include <vector>

#include "../entity/EntityCollection.h"
#include "../util/LinkerConfig.h"
#include "../util/LinkerErrors.h"
#include "../util/executor/ParallelExecutor.h"
#include "Feature.h"
#include "FeatureSchema.h"

class FeatureExtractor {
 public:
    FeatureExtractor() = default;
    FeatureExtractor(FeatureExtractor &&) = default;
    FeatureExtractor &operator=(FeatureExtractor &&) = default;

    static FeatureExtractor fromConfig(const LinkerConfig &config);

    // Builds the feature registered under the given id. Throws std::invalid_argument if unknown.
    static std::unique_ptr<Feature> createFeature(const std::string &featureId, const LinkerConfig &config);

    /**
     * Appends a feature column. Throws std::invalid_argument if the id is already used.
     */
    void addFeature(std::unique_ptr<Feature> feature);

    const FeatureSchema &getSchema() const { return schema; }

    FeatureVector extract(const CandidatePair &pair, const Entity &source, const Entity &target) const;

    /**
     * Extracts every pair, in pair order. Pairs naming an unknown entity, and pairs whose
     * comparison throws, are reported in errors instead of the matrix.
     */
    FeatureMatrix extractAll(const std::vector<CandidatePair> &pairs, const EntityCollection &source,
                             const EntityCollection &target, ParallelExecutor &executor,
                             std::vector<PairError> &errors) const;

 private:
    std::vector<std::unique_ptr<Feature>> features;
    FeatureSchema schema;
};

#endif  // CATALOGLINKER_FEATUREEXTRACTOR_H
