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


#include "../../../src/engine/ResolutionEngine.h"

#include <algorithm>

#include "../../../src/io/JsonLinesEntitySource.h"
#include "../../../src/normalizer/Normalizer.h"
#include "../../../src/util/Conts.h"
#include "../../../src/util/LinkerErrors.h"
#include "gtest/gtest.h"

static const std::vector<std::string> GIVEN_NAMES = {"Alpha", "Bravo", "Charlie", "Delta", "Echo", "Foxtrot"};

static Entity person(const std::string &id, Collection collection, const std::string &name, int birthYear) {
    std::map<std::string, AttributeValue> attributes;
    attributes[Conts::ATTRIBUTE::NAME] = StringList{{name}};
    attributes[Conts::ATTRIBUTE::BIRTH_DATE] = DateList{{*Normalizer::parseDate(std::to_string(birthYear))}};
    return Entity(id, collection, attributes);
}

class ResolutionEngineTest : public ::testing::Test {
 protected:
    // Every source shares the first name token with every target, so blocking yields all pairs
    EntityCollection source{Collection::SOURCE};
    EntityCollection target{Collection::TARGET};
    ConfirmedLinks links;

    void SetUp() override {
        for (size_t i = 0; i < GIVEN_NAMES.size(); i++) {
            std::string suffix = std::to_string(i + 1);
            source.add(person("Q" + suffix, Collection::SOURCE, "John " + GIVEN_NAMES[i], 1900 + i));
            target.add(person("T" + suffix, Collection::TARGET, "john " + GIVEN_NAMES[i], 1900 + i));
            links["Q" + suffix] = "T" + suffix;
        }
    }

    static LinkerConfig testConfig() {
        LinkerConfig config;
        config.workers = 2;
        config.blockingStrategies = {Conts::BLOCKING::NAME_TOKEN};
        return config;
    }
};

TEST_F(ResolutionEngineTest, TestRuleOnlyResolutionOnCatalogFiles) {
    LinkerConfig config = testConfig();
    config.blockingStrategies = {Conts::BLOCKING::NAME_TOKEN, Conts::BLOCKING::URL};
    ResolutionEngine engine(config);

    JsonLinesEntitySource sourceFile(TEST_RESOURCE_DIR "source.jsonl", Collection::SOURCE);
    JsonLinesEntitySource targetFile(TEST_RESOURCE_DIR "target.jsonl", Collection::TARGET);
    EntityCollection catalogSource = sourceFile.load();
    EntityCollection catalogTarget = targetFile.load();

    ResolutionResult result = engine.resolve(catalogSource, catalogTarget, nullptr);
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.decisions.size(), 3);

    const LinkDecision &hartshorne = result.decisions[0];
    ASSERT_EQ(hartshorne.pair, CandidatePair("Q1", "T1"));
    ASSERT_EQ(hartshorne.label, LinkLabel::MATCH);
    ASSERT_DOUBLE_EQ(hartshorne.confidence.value_or(0.0), 1.0);
    ASSERT_EQ(hartshorne.strategyId, "rule:name_exact+birth_date");

    // Name agrees but the source has no birth date
    ASSERT_EQ(result.decisions[2].pair, CandidatePair("Q4", "T3"));
    ASSERT_EQ(result.decisions[2].label, LinkLabel::NON_MATCH);
    ASSERT_FALSE(result.decisions[2].confidence.has_value());
    ASSERT_EQ(result.count(LinkLabel::MATCH), 1);
}

TEST_F(ResolutionEngineTest, TestBaselinePresets) {
    LinkerConfig config = testConfig();
    config.blockingStrategies = {Conts::BLOCKING::NAME_TOKEN, Conts::BLOCKING::URL};
    ResolutionEngine engine(config);
    EntityCollection catalogSource = JsonLinesEntitySource(TEST_RESOURCE_DIR "source.jsonl", Collection::SOURCE).load();
    EntityCollection catalogTarget = JsonLinesEntitySource(TEST_RESOURCE_DIR "target.jsonl", Collection::TARGET).load();

    ResolutionResult links = engine.baseline(catalogSource, catalogTarget, Conts::RULE_PRESET::LINKS);
    ASSERT_EQ(links.count(LinkLabel::MATCH), 1);
    for (const auto &decision : links.decisions) {
        ASSERT_EQ(decision.strategyId, "rule:links");
        if (decision.label == LinkLabel::MATCH) ASSERT_EQ(decision.pair, CandidatePair("Q2", "T2"));
    }

    ResolutionResult both = engine.baseline(catalogSource, catalogTarget, Conts::RULE_PRESET::NAME_AND_LINK);
    ASSERT_EQ(both.count(LinkLabel::MATCH), 0);

    ASSERT_THROW(engine.baseline(catalogSource, catalogTarget, "soundex"), std::invalid_argument);
}

TEST_F(ResolutionEngineTest, TestTrainAndResolve) {
    ResolutionEngine engine(testConfig());
    std::shared_ptr<const Model> model = engine.train(source, target, links);
    ASSERT_EQ(model->getAlgorithm(), Conts::CLASSIFIER::NAIVE_BAYES);
    ASSERT_EQ(model->getSchema(), engine.getSchema());

    ResolutionResult result = engine.resolve(source, target, model.get());
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.decisions.size(), GIVEN_NAMES.size() * GIVEN_NAMES.size());
    ASSERT_EQ(result.count(LinkLabel::MATCH), GIVEN_NAMES.size());
    for (const auto &decision : result.decisions) {
        bool confirmed = links.at(decision.pair.sourceId) == decision.pair.targetId;
        if (confirmed) {
            // Exact name and birth year take the rule fast path
            ASSERT_EQ(decision.label, LinkLabel::MATCH);
            ASSERT_EQ(decision.strategyId, "rule:name_exact+birth_date");
        } else {
            ASSERT_EQ(decision.label, LinkLabel::NON_MATCH);
            ASSERT_EQ(decision.strategyId, "classifier:naive_bayes");
            ASSERT_TRUE(decision.confidence.has_value());
            ASSERT_LT(*decision.confidence, 0.5);
        }
    }
}

TEST_F(ResolutionEngineTest, TestClassifierDecidesWithoutFastPath) {
    LinkerConfig config = testConfig();
    config.ruleFastPath = false;
    ResolutionEngine engine(config);
    std::shared_ptr<const Model> model = engine.train(source, target, links);

    ResolutionResult result = engine.resolve(source, target, model.get());
    ASSERT_EQ(result.count(LinkLabel::MATCH), GIVEN_NAMES.size());
    for (const auto &decision : result.decisions) {
        ASSERT_EQ(decision.strategyId, "classifier:naive_bayes");
        if (decision.label == LinkLabel::MATCH) {
            ASSERT_EQ(links.at(decision.pair.sourceId), decision.pair.targetId);
            ASSERT_GE(*decision.confidence, 0.5);
        }
    }
}

TEST_F(ResolutionEngineTest, TestResultsDoNotDependOnWorkerCount) {
    LinkerConfig single = testConfig();
    single.workers = 1;
    LinkerConfig many = testConfig();
    many.workers = 4;
    ResolutionEngine first(single);
    ResolutionEngine second(many);
    std::shared_ptr<const Model> model = first.train(source, target, links);

    ResolutionResult a = first.resolve(source, target, model.get());
    ResolutionResult b = second.resolve(source, target, model.get());
    ASSERT_EQ(a.decisions.size(), b.decisions.size());
    for (size_t i = 0; i < a.decisions.size(); i++) {
        ASSERT_EQ(a.decisions[i].pair, b.decisions[i].pair);
        ASSERT_EQ(a.decisions[i].label, b.decisions[i].label);
        ASSERT_EQ(a.decisions[i].confidence, b.decisions[i].confidence);
    }
}

TEST_F(ResolutionEngineTest, TestModelForAnotherSchemaIsRejected) {
    ResolutionEngine engine(testConfig());
    std::shared_ptr<const Model> model = engine.train(source, target, links);

    LinkerConfig narrower = testConfig();
    narrower.features = {Conts::FEATURE::NAME_EXACT, Conts::FEATURE::BIRTH_DATE};
    ResolutionEngine other(narrower);
    ASSERT_THROW(other.resolve(source, target, model.get()), SchemaMismatch);
}

TEST_F(ResolutionEngineTest, TestMergedModelsCombineScores) {
    LinkerConfig config = testConfig();
    config.ruleFastPath = false;
    config.classifierParameters.epochs = 50;
    ResolutionEngine naiveBayesEngine(config);
    config.classifier = Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON;
    ResolutionEngine perceptronEngine(config);
    std::shared_ptr<const Model> naiveBayes = naiveBayesEngine.train(source, target, links);
    std::shared_ptr<const Model> perceptron = perceptronEngine.train(source, target, links);

    ResolutionResult first = naiveBayesEngine.resolve(source, target, naiveBayes.get());
    ResolutionResult second = naiveBayesEngine.resolve(source, target, perceptron.get());

    config.classifier = Conts::CLASSIFIER::NAIVE_BAYES;
    config.mergeStrategy = Conts::MERGE::UNION;
    ResolutionResult unionResult = ResolutionEngine(config).resolve(source, target, {naiveBayes, perceptron});
    config.mergeStrategy = Conts::MERGE::INTERSECTION;
    ResolutionResult intersection = ResolutionEngine(config).resolve(source, target, {naiveBayes, perceptron});

    ASSERT_EQ(unionResult.decisions.size(), first.decisions.size());
    ASSERT_EQ(intersection.decisions.size(), first.decisions.size());
    for (size_t i = 0; i < first.decisions.size(); i++) {
        ASSERT_EQ(unionResult.decisions[i].pair, first.decisions[i].pair);
        double a = *first.decisions[i].confidence;
        double b = *second.decisions[i].confidence;
        ASSERT_DOUBLE_EQ(*unionResult.decisions[i].confidence, std::max(a, b));
        ASSERT_DOUBLE_EQ(*intersection.decisions[i].confidence, std::min(a, b));
        ASSERT_EQ(unionResult.decisions[i].strategyId, "merge:union:naive_bayes+single_layer_perceptron");
    }
}

TEST_F(ResolutionEngineTest, TestMergingOneModelTwiceChangesNothing) {
    LinkerConfig config = testConfig();
    config.ruleFastPath = false;
    ResolutionEngine engine(config);
    std::shared_ptr<const Model> model = engine.train(source, target, links);

    ResolutionResult single = engine.resolve(source, target, model.get());
    ResolutionResult merged = engine.resolve(source, target, {model, model});
    ASSERT_EQ(merged.decisions.size(), single.decisions.size());
    ASSERT_EQ(merged.count(LinkLabel::MATCH), single.count(LinkLabel::MATCH));
    for (size_t i = 0; i < single.decisions.size(); i++) {
        ASSERT_EQ(merged.decisions[i].label, single.decisions[i].label);
        ASSERT_EQ(merged.decisions[i].confidence, single.decisions[i].confidence);
        ASSERT_EQ(merged.decisions[i].strategyId, "merge:majority_vote:naive_bayes+naive_bayes");
    }

    // No model at all falls back to the rule
    ResolutionResult ruleOnly = engine.resolve(source, target, std::vector<std::shared_ptr<const Model>>());
    for (const auto &decision : ruleOnly.decisions) {
        ASSERT_EQ(decision.strategyId, "rule:name_exact+birth_date");
    }
}

TEST_F(ResolutionEngineTest, TestMergingRejectsMixedCalibration) {
    LinkerConfig config = testConfig();
    ResolutionEngine naiveBayesEngine(config);
    config.classifier = Conts::CLASSIFIER::LINEAR_SVM;
    ResolutionEngine marginEngine(config);
    std::shared_ptr<const Model> probabilities = naiveBayesEngine.train(source, target, links);
    std::shared_ptr<const Model> margins = marginEngine.train(source, target, links);

    ASSERT_THROW(naiveBayesEngine.resolve(source, target, {probabilities, margins}), std::invalid_argument);
    ASSERT_THROW(naiveBayesEngine.resolve(source, target, {probabilities, nullptr}), std::invalid_argument);
}

TEST_F(ResolutionEngineTest, TestVotingEnsembleTrainsAndLinks) {
    LinkerConfig config = testConfig();
    config.classifier = Conts::CLASSIFIER::VOTING;
    config.classifierParameters.votingMembers = {"nb", "slp"};
    config.classifierParameters.epochs = 50;
    ResolutionEngine engine(config);
    std::shared_ptr<const Model> model = engine.train(source, target, links);
    ASSERT_EQ(model->getAlgorithm(), Conts::CLASSIFIER::VOTING);
    ASSERT_TRUE(model->isCalibrated());

    ResolutionResult result = engine.resolve(source, target, model.get());
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.count(LinkLabel::MATCH), GIVEN_NAMES.size());
    size_t scored = 0;
    for (const auto &decision : result.decisions) {
        if (decision.strategyId == "classifier:voting") scored++;
    }
    ASSERT_EQ(scored, GIVEN_NAMES.size() * GIVEN_NAMES.size() - GIVEN_NAMES.size());
}

TEST_F(ResolutionEngineTest, TestTrainingNeedsNonMatches) {
    LinkerConfig config = testConfig();
    config.blockingStrategies = {Conts::BLOCKING::URL};
    ResolutionEngine engine(config);
    // Without any blocked candidates only the confirmed pairs remain
    ASSERT_THROW(engine.train(source, target, links), TrainingError);
}

TEST_F(ResolutionEngineTest, TestEvaluate) {
    LinkerConfig config = testConfig();
    config.folds = 3;
    ResolutionEngine engine(config);
    EvaluationResult result = engine.evaluate(source, target, links);
    ASSERT_EQ(result.perFold.size(), 3);
    ASSERT_EQ(result.foldAssignments.size(), GIVEN_NAMES.size() * GIVEN_NAMES.size());
    ASSERT_DOUBLE_EQ(result.pooled.recall, 1.0);
}

TEST_F(ResolutionEngineTest, TestInvalidConfiguration) {
    LinkerConfig config = testConfig();
    config.classifier = "random_forest";
    ASSERT_THROW(ResolutionEngine engine(config), std::invalid_argument);

    LinkerConfig softOverMargins = testConfig();
    softOverMargins.classifier = Conts::CLASSIFIER::VOTING;
    softOverMargins.classifierParameters.votingMembers = {"nb", "lsvm"};
    ASSERT_THROW(ResolutionEngine engine(softOverMargins), std::invalid_argument);

    LinkerConfig badThreshold = testConfig();
    badThreshold.decisionThreshold = 2.0;
    ASSERT_THROW(ResolutionEngine engine(badThreshold), std::invalid_argument);
}
