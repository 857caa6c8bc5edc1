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


#include "../../../src/linker/RuleBasedLinker.h"

#include <stdexcept>

#include "../../../src/util/Conts.h"
#include "../../../src/util/LinkerErrors.h"
#include "gtest/gtest.h"

class RuleBasedLinkerTest : public ::testing::Test {
 protected:
    FeatureSchema schema{{Conts::FEATURE::NAME_EXACT, Conts::FEATURE::NAME_SIMILARITY, Conts::FEATURE::BIRTH_DATE,
                          Conts::FEATURE::URL_EXACT}};

    FeatureVector vector(const std::string &source, const std::string &target, std::vector<double> values) {
        FeatureVector result;
        result.pair = CandidatePair(source, target);
        result.values = std::move(values);
        return result;
    }
};

TEST_F(RuleBasedLinkerTest, TestPerfectNameAcceptsWithFullConfidence) {
    RuleBasedLinker linker = RuleBasedLinker::fromPreset(Conts::RULE_PRESET::PERFECT_NAME);
    ASSERT_EQ(linker.getStrategyId(), "rule:perfect_name");

    LinkDecision decision = linker.link(vector("Q1", "T1", {1.0, 1.0, 1.0, 0.0}), schema);
    ASSERT_EQ(decision.label, LinkLabel::MATCH);
    ASSERT_TRUE(decision.confidence.has_value());
    ASSERT_DOUBLE_EQ(*decision.confidence, 1.0);
    ASSERT_EQ(decision.strategyId, "rule:perfect_name");
    ASSERT_EQ(decision.pair, CandidatePair("Q1", "T1"));
}

TEST_F(RuleBasedLinkerTest, TestPartialEvidenceIsNonMatchWithoutConfidence) {
    RuleBasedLinker linker = RuleBasedLinker::fromPreset(Conts::RULE_PRESET::PERFECT_NAME);
    // Birth dates only agree on the year out of two known components
    LinkDecision decision = linker.link(vector("Q1", "T2", {1.0, 1.0, 0.5, 1.0}), schema);
    ASSERT_EQ(decision.label, LinkLabel::NON_MATCH);
    ASSERT_FALSE(decision.confidence.has_value());
}

TEST_F(RuleBasedLinkerTest, TestPresets) {
    RuleBasedLinker links = RuleBasedLinker::fromPreset(Conts::RULE_PRESET::LINKS);
    ASSERT_TRUE(links.accepts(vector("Q2", "T2", {0.0, 0.3, 0.0, 1.0}), schema));
    // Same id space only
    ASSERT_FALSE(links.accepts(vector("Q2", "T3", {0.0, 0.3, 0.0, 0.5}), schema));

    RuleBasedLinker both = RuleBasedLinker::fromPreset(Conts::RULE_PRESET::NAME_AND_LINK);
    ASSERT_EQ(both.getRequiredFeatures().size(), 2);
    ASSERT_FALSE(both.accepts(vector("Q2", "T2", {0.0, 0.3, 0.0, 1.0}), schema));
    ASSERT_TRUE(both.accepts(vector("Q2", "T2", {1.0, 1.0, 0.0, 1.0}), schema));

    ASSERT_THROW(RuleBasedLinker::fromPreset("soundex"), std::invalid_argument);
    ASSERT_THROW(RuleBasedLinker("rule:none", {}), std::invalid_argument);
}

TEST_F(RuleBasedLinkerTest, TestCustomMinimumValue) {
    RuleBasedLinker linker("rule:similar", {Conts::FEATURE::NAME_SIMILARITY}, 0.8);
    ASSERT_TRUE(linker.accepts(vector("Q1", "T1", {0.0, 0.85, 0.0, 0.0}), schema));
    ASSERT_FALSE(linker.accepts(vector("Q1", "T1", {0.0, 0.75, 0.0, 0.0}), schema));
}

TEST_F(RuleBasedLinkerTest, TestSchemaMismatch) {
    RuleBasedLinker linker = RuleBasedLinker::fromPreset(Conts::RULE_PRESET::PERFECT_NAME);

    // Test 1: vector narrower than the schema
    ASSERT_THROW(linker.link(vector("Q1", "T1", {1.0, 1.0}), schema), SchemaMismatch);

    // Test 2: schema without the rule's features
    FeatureSchema linksOnly({Conts::FEATURE::URL_EXACT});
    ASSERT_THROW(linker.link(vector("Q1", "T1", {1.0}), linksOnly), SchemaMismatch);
}
