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


#include "DecisionLayer.h"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "../util/logger/Logger.h"

using namespace std;

Logger decision_logger;

DecisionLayer::DecisionLayer(double threshold, double undecidedMargin)
    : threshold(threshold), undecidedMargin(undecidedMargin) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw invalid_argument("Decision threshold must lie in [0, 1], got " + to_string(threshold));
    }
    if (!(undecidedMargin >= 0.0 && undecidedMargin <= threshold)) {
        throw invalid_argument("Undecided margin must lie in [0, threshold], got " + to_string(undecidedMargin));
    }
}

DecisionLayer DecisionLayer::fromConfig(const LinkerConfig &config) {
    return DecisionLayer(config.decisionThreshold, config.undecidedMargin);
}

LinkDecision DecisionLayer::decide(const CandidatePair &pair, double score, const string &strategyId) const {
    LinkDecision decision;
    decision.pair = pair;
    decision.strategyId = strategyId;
    decision.confidence = score;
    if (score >= threshold) {
        decision.label = LinkLabel::MATCH;
    } else if (undecidedMargin > 0.0 && score >= threshold - undecidedMargin) {
        decision.label = LinkLabel::UNDECIDED;
    } else {
        decision.label = LinkLabel::NON_MATCH;
    }
    return decision;
}

LinkDecision DecisionLayer::decideLabel(const CandidatePair &pair, bool match, const string &strategyId) const {
    LinkDecision decision;
    decision.pair = pair;
    decision.strategyId = strategyId;
    decision.label = match ? LinkLabel::MATCH : LinkLabel::NON_MATCH;
    return decision;
}

// True when a should be retained over b
static bool outranks(const LinkDecision &a, const LinkDecision &b) {
    double left = a.confidence.value_or(-1.0);
    double right = b.confidence.value_or(-1.0);
    if (left != right) return left > right;
    return a.pair.targetId < b.pair.targetId;
}

ResolvedDecisions DecisionLayer::resolveConflicts(vector<LinkDecision> decisions) const {
    sort(decisions.begin(), decisions.end(),
         [](const LinkDecision &a, const LinkDecision &b) { return a.pair < b.pair; });

    map<string, size_t> retained;
    for (size_t i = 0; i < decisions.size(); i++) {
        if (decisions[i].label != LinkLabel::MATCH) continue;
        auto current = retained.find(decisions[i].pair.sourceId);
        if (current == retained.end()) {
            retained[decisions[i].pair.sourceId] = i;
        } else if (outranks(decisions[i], decisions[current->second])) {
            current->second = i;
        }
    }

    ResolvedDecisions result;
    for (size_t i = 0; i < decisions.size(); i++) {
        if (decisions[i].label != LinkLabel::MATCH) continue;
        const LinkDecision &winner = decisions[retained.at(decisions[i].pair.sourceId)];
        if (i == retained.at(decisions[i].pair.sourceId)) continue;
        PairConflictWarning warning{decisions[i].pair.sourceId, winner.pair.targetId, decisions[i].pair.targetId,
                                    winner.confidence, decisions[i].confidence};
        decision_logger.info(warning.toString());
        result.warnings.push_back(warning);
        decisions[i].label = LinkLabel::SUPERSEDED;
    }
    result.decisions = std::move(decisions);
    return result;
}
