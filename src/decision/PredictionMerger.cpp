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

#include "PredictionMerger.h"

#include <algorithm>
#include <stdexcept>

#include "../util/Conts.h"

using namespace std;

PredictionMerger::PredictionMerger(string strategy, double threshold)
    : strategy(std::move(strategy)), threshold(threshold) {
    if (find(Conts::MERGE::ALL.begin(), Conts::MERGE::ALL.end(), this->strategy) == Conts::MERGE::ALL.end()) {
        throw invalid_argument("Unknown merge strategy: " + this->strategy);
    }
}

double PredictionMerger::merge(const vector<double> &scores) const {
    if (scores.empty()) {
        throw invalid_argument("No scores to merge");
    }
    auto bounds = minmax_element(scores.begin(), scores.end());
    if (strategy == Conts::MERGE::UNION) {
        return *bounds.second;
    }
    if (strategy == Conts::MERGE::INTERSECTION) {
        return *bounds.first;
    }
    size_t votes = count_if(scores.begin(), scores.end(), [this](double score) { return score >= threshold; });
    return 2 * votes >= scores.size() ? *bounds.second : *bounds.first;
}
