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


#ifndef CATALOGLINKER_RULEBASEDLINKER_H
#define CATALOGLINKER_RULEBASEDLINKER_H

#include <string>
#include <vector>

#include "../decision/LinkDecision.h"
#include "../features/FeatureSchema.h"

/**
 * Zero training baseline. A pair matches when every required feature reaches the minimum value;
 * matches get confidence 1.0, everything else is a non-match without a score.
 */
class RuleBasedLinker {
 public:
    RuleBasedLinker(std::string strategyId, std::vector<std::string> requiredFeatures, double minimumValue = 1.0);

    /**
     * perfect_name: exact name and birth date, links: exact link, name_and_link: both.
     * Throws std::invalid_argument for any other name.
     */
    static RuleBasedLinker fromPreset(const std::string &preset);

    const std::string &getStrategyId() const { return strategyId; }

    const std::vector<std::string> &getRequiredFeatures() const { return requiredFeatures; }

    /**
     * Throws SchemaMismatch when the schema lacks a required feature or the vector does not have
     * the schema's width.
     */
    LinkDecision link(const FeatureVector &vector, const FeatureSchema &schema) const;

    bool accepts(const FeatureVector &vector, const FeatureSchema &schema) const;

 private:
    std::string strategyId;
    std::vector<std::string> requiredFeatures;
    double minimumValue;
};

#endif  // CATALOGLINKER_RULEBASEDLINKER_H
