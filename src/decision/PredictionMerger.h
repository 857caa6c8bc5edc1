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

#ifndef CATALOGLINKER_PREDICTIONMERGER_H
#define CATALOGLINKER_PREDICTIONMERGER_H

#include <string>
#include <vector>

/**
 * Combines the scores several models gave the same pair into one score on the same scale.
 * Probabilities and margins are never mixed; the threshold is the one the merged score is
 * later decided against (0 for margins).
 */
class PredictionMerger {
 public:
    // Throws std::invalid_argument for a strategy other than majority_vote, union or intersection
    PredictionMerger(std::string strategy, double threshold);

    const std::string &getStrategy() const { return strategy; }

    /**
     * majority_vote: the highest score when at least half of the scores reach the threshold,
     * the lowest otherwise. union: the highest score. intersection: the lowest score.
     * Throws std::invalid_argument when there is nothing to merge.
     */
    double merge(const std::vector<double> &scores) const;

 private:
    std::string strategy;
    double threshold;
};

#endif  // CATALOGLINKER_PREDICTIONMERGER_H
