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


#ifndef CATALOGLINKER_DECISIONLAYER_H
#define CATALOGLINKER_DECISIONLAYER_H

#include <string>
#include <vector>

#include "../util/LinkerConfig.h"
#include "LinkDecision.h"

struct ResolvedDecisions {
    std::vector<LinkDecision> decisions;
    std::vector<PairConflictWarning> warnings;
};

class DecisionLayer {
 public:
    // Throws std::invalid_argument unless 0 <= margin <= threshold <= 1
    explicit DecisionLayer(double threshold, double undecidedMargin = 0.0);

    static DecisionLayer fromConfig(const LinkerConfig &config);

    double getThreshold() const { return threshold; }
    double getUndecidedMargin() const { return undecidedMargin; }

    /**
     * Calibrated score: match at or above the threshold, undecided in
     * [threshold - margin, threshold), non-match below. The score becomes the confidence.
     */
    LinkDecision decide(const CandidatePair &pair, double score, const std::string &strategyId) const;

    // Uncalibrated output: the label is taken as is and no confidence is attached
    LinkDecision decideLabel(const CandidatePair &pair, bool match, const std::string &strategyId) const;

    /**
     * Keeps one match per source entity, the one with the highest confidence, ties going to
     * the smallest target id. Every other match of that source is relabelled superseded and
     * reported as a warning. Output is sorted by pair.
     */
    ResolvedDecisions resolveConflicts(std::vector<LinkDecision> decisions) const;

 private:
    double threshold;
    double undecidedMargin;
};

#endif  // CATALOGLINKER_DECISIONLAYER_H
