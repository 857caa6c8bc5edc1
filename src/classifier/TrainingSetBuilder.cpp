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


#include "TrainingSetBuilder.h"

#include <set>

#include "../util/logger/Logger.h"

using namespace std;

Logger training_logger;

TrainingSet TrainingSetBuilder::build(const EntityCollection &source, const EntityCollection &target,
                                      const ConfirmedLinks &links) const {
    set<string> linkedSources;
    set<CandidatePair> pairs;
    size_t unresolved = 0;
    for (const auto &link : links) {
        if (source.find(link.first) == nullptr || target.find(link.second) == nullptr) {
            unresolved++;
            training_logger.debug("Confirmed link " + link.first + " -> " + link.second +
                                  " names an entity that was not loaded");
            continue;
        }
        linkedSources.insert(link.first);
        pairs.insert(CandidatePair{link.first, link.second});
    }
    if (unresolved > 0) {
        training_logger.warn(to_string(unresolved) + " of " + to_string(links.size()) +
                             " confirmed links could not be joined and were skipped");
    }

    EntityCollection linked = source.subset(linkedSources);
    for (const auto &candidate : blocker.block(linked, target, executor)) {
        pairs.insert(candidate);
    }

    vector<CandidatePair> ordered(pairs.begin(), pairs.end());
    vector<PairError> errors;
    FeatureMatrix matrix = extractor.extractAll(ordered, source, target, executor, errors);
    if (!errors.empty()) {
        throw TrainingError("feature extraction failed for " + to_string(errors.size()) + " pairs, first " +
                            errors.front().toString());
    }

    TrainingSet trainingSet(matrix.schema);
    for (auto &row : matrix.vectors) {
        bool match = links.at(row.pair.sourceId) == row.pair.targetId;
        trainingSet.add(std::move(row), match);
    }
    training_logger.info("Training set: " + to_string(trainingSet.countPositives()) + " matches, " +
                         to_string(trainingSet.countNegatives()) + " non-matches");
    return trainingSet;
}
