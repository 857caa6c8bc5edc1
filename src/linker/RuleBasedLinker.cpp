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


#include "RuleBasedLinker.h"

#include <stdexcept>

#include "../util/Conts.h"
#include "../util/LinkerErrors.h"

RuleBasedLinker::RuleBasedLinker(std::string strategyId, std::vector<std::string> requiredFeatures,
                                 double minimumValue)
    : strategyId(std::move(strategyId)), requiredFeatures(std::move(requiredFeatures)), minimumValue(minimumValue) {
    if (this->requiredFeatures.empty()) {
        throw std::invalid_argument("A linking rule needs at least one feature");
    }
}

RuleBasedLinker RuleBasedLinker::fromPreset(const std::string &preset) {
    const std::string strategyId = "rule:" + preset;
    if (preset == Conts::RULE_PRESET::PERFECT_NAME) {
        return RuleBasedLinker(strategyId, {Conts::FEATURE::NAME_EXACT, Conts::FEATURE::BIRTH_DATE});
    } else if (preset == Conts::RULE_PRESET::LINKS) {
        return RuleBasedLinker(strategyId, {Conts::FEATURE::URL_EXACT});
    } else if (preset == Conts::RULE_PRESET::NAME_AND_LINK) {
        return RuleBasedLinker(strategyId, {Conts::FEATURE::NAME_EXACT, Conts::FEATURE::URL_EXACT});
    }
    throw std::invalid_argument("Unknown rule preset: " + preset);
}

bool RuleBasedLinker::accepts(const FeatureVector &vector, const FeatureSchema &schema) const {
    if (vector.values.size() != schema.size()) {
        throw SchemaMismatch("Feature vector " + vector.pair.toString() + " does not fit the schema", schema.size(),
                             vector.values.size());
    }
    for (const auto &feature : requiredFeatures) {
        int index = schema.indexOf(feature);
        if (index < 0) {
            throw SchemaMismatch("Rule " + strategyId + " needs feature " + feature + " which the schema lacks",
                                 requiredFeatures.size(), schema.size());
        }
        if (vector.values[index] < minimumValue) {
            return false;
        }
    }
    return true;
}

LinkDecision RuleBasedLinker::link(const FeatureVector &vector, const FeatureSchema &schema) const {
    LinkDecision decision;
    decision.pair = vector.pair;
    decision.strategyId = strategyId;
    if (accepts(vector, schema)) {
        decision.label = LinkLabel::MATCH;
        decision.confidence = 1.0;
    } else {
        decision.label = LinkLabel::NON_MATCH;
    }
    return decision;
}
