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


#ifndef CATALOGLINKER_TRAININGSETBUILDER_H
#define CATALOGLINKER_TRAININGSETBUILDER_H

#include <map>
#include <string>

#include "../blocking/Blocker.h"
#include "../features/FeatureExtractor.h"
#include "TrainingSet.h"

// Confirmed historical links, source id to target id
typedef std::map<std::string, std::string> ConfirmedLinks;

/**
 * Joins confirmed links against the two collections. Confirmed pairs are the matches; every
 * other blocked candidate of a linked source is a non-match.
 */
class TrainingSetBuilder {
 public:
    TrainingSetBuilder(const Blocker &blocker, const FeatureExtractor &extractor, ParallelExecutor &executor)
        : blocker(blocker), extractor(extractor), executor(executor) {}

    // Throws TrainingError when a pair cannot be extracted
    TrainingSet build(const EntityCollection &source, const EntityCollection &target,
                      const ConfirmedLinks &links) const;

 private:
    const Blocker &blocker;
    const FeatureExtractor &extractor;
    ParallelExecutor &executor;
};

#endif  // CATALOGLINKER_TRAININGSETBUILDER_H
