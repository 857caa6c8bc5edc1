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


#include "../../../src/classifier/Classifier.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "../../../src/classifier/ClassifierFactory.h"
#include "../../../src/classifier/NaiveBayesClassifier.h"
#include "../../../src/classifier/VotingClassifier.h"
#include "../../../src/util/Conts.h"
#include "gtest/gtest.h"

static const std::vector<std::string> FEATURES = {"name_exact", "name_similarity", "birth_date"};

// Matches sit near (0.9, 0.9, 1), non-matches near the origin
static TrainingSet separableSet(size_t perClass) {
    TrainingSet trainingSet((FeatureSchema(FEATURES)));
    for (size_t i = 0; i < perClass; i++) {
        FeatureVector positive{CandidatePair("Q" + std::to_string(i), "T" + std::to_string(i)),
                               {0.8 + 0.01 * (i % 10), 0.9 + 0.005 * (i % 10), 1.0 - 0.01 * (i % 5)}};
        trainingSet.add(positive, true);
        FeatureVector negative{CandidatePair("Q" + std::to_string(i), "N" + std::to_string(i)),
                               {0.02 * (i % 10), 0.05 * (i % 3), 0.01 * (i % 7)}};
        trainingSet.add(negative, false);
    }
    return trainingSet;
}

static ClassifierParameters testParameters() {
    ClassifierParameters parameters;
    parameters.hiddenLayers = {16, 8};
    parameters.epochs = 300;
    parameters.learningRate = 0.05;
    parameters.batchSize = 16;
    return parameters;
}

static FeatureMatrix clearCaseMatrix() {
    FeatureMatrix matrix;
    matrix.schema = FeatureSchema(FEATURES);
    matrix.vectors.push_back({CandidatePair("P1", "T1"), {1.0, 1.0, 1.0}});
    matrix.vectors.push_back({CandidatePair("P2", "T2"), {0.0, 0.0, 0.0}});
    return matrix;
}

class ClassifierTest : public ::testing::Test {
 protected:
    ParallelExecutor executor{2};
};

TEST_F(ClassifierTest, TestEveryAlgorithmSeparatesClearCases) {
    TrainingSet trainingSet = separableSet(20);
    for (const auto &algorithm : ClassifierFactory::getAlgorithms()) {
        SCOPED_TRACE(algorithm);
        std::unique_ptr<Classifier> classifier = ClassifierFactory::create(algorithm, testParameters());
        std::shared_ptr<const Model> model = classifier->fit(trainingSet);

        ASSERT_EQ(model->getAlgorithm(), algorithm);
        ASSERT_EQ(model->getSchema(), trainingSet.getSchema());
        ASSERT_EQ(model->getTrainingSetId(), trainingSet.getIdentity());
        ASSERT_EQ(model->isCalibrated(), classifier->isCalibrated());
        ASSERT_FALSE(model->getTrainedAt().empty());

        ScoreBatch batch = Classifier::predict(*model, clearCaseMatrix(), executor);
        ASSERT_TRUE(batch.errors.empty());
        ASSERT_EQ(batch.scores.size(), 2);
        ASSERT_EQ(batch.scores[0].pair, CandidatePair("P1", "T1"));
        ASSERT_GT(batch.scores[0].value, batch.scores[1].value);
        ASSERT_TRUE(model->predictLabel({1.0, 1.0, 1.0}));
        ASSERT_FALSE(model->predictLabel({0.0, 0.0, 0.0}));
        if (model->isCalibrated()) {
            ASSERT_GE(batch.scores[1].value, 0.0);
            ASSERT_LE(batch.scores[0].value, 1.0);
        }
    }
}

TEST_F(ClassifierTest, TestFitIsDeterministicForASeed) {
    TrainingSet trainingSet = separableSet(15);
    for (const auto &algorithm : ClassifierFactory::getAlgorithms()) {
        SCOPED_TRACE(algorithm);
        auto first = ClassifierFactory::create(algorithm, testParameters())->fit(trainingSet);
        auto second = ClassifierFactory::create(algorithm, testParameters())->fit(trainingSet);
        ASSERT_EQ(first->getParameters().dump(), second->getParameters().dump());
    }
}

TEST_F(ClassifierTest, TestSingleClassIsRejected) {
    TrainingSet onlyMatches((FeatureSchema(FEATURES)));
    onlyMatches.add({CandidatePair("Q1", "T1"), {1.0, 1.0, 1.0}}, true);
    onlyMatches.add({CandidatePair("Q2", "T2"), {1.0, 0.9, 1.0}}, true);

    for (const auto &algorithm : ClassifierFactory::getAlgorithms()) {
        SCOPED_TRACE(algorithm);
        auto classifier = ClassifierFactory::create(algorithm, testParameters());
        ASSERT_THROW(classifier->fit(onlyMatches), TrainingError);
    }
}

TEST_F(ClassifierTest, TestMalformedTrainingSets) {
    auto classifier = ClassifierFactory::create(Conts::CLASSIFIER::NAIVE_BAYES, testParameters());

    // Test 1: empty set
    TrainingSet empty((FeatureSchema(FEATURES)));
    ASSERT_THROW(classifier->fit(empty), TrainingError);

    // Test 2: vector of the wrong width
    TrainingSet narrow = separableSet(3);
    narrow.add({CandidatePair("Q9", "T9"), {1.0, 1.0}}, true);
    ASSERT_THROW(classifier->fit(narrow), TrainingError);

    // Test 3: non-finite value
    TrainingSet notFinite = separableSet(3);
    notFinite.add({CandidatePair("Q9", "T9"), {1.0, std::numeric_limits<double>::quiet_NaN(), 1.0}}, true);
    ASSERT_THROW(classifier->fit(notFinite), TrainingError);
}

TEST_F(ClassifierTest, TestNaiveBayesWithoutBinarizeNeedsBinaryInput) {
    NaiveBayesClassifier classifier(std::nullopt, 1.0);
    ASSERT_THROW(classifier.fit(separableSet(5)), TrainingError);

    TrainingSet binary((FeatureSchema(FEATURES)));
    binary.add({CandidatePair("Q1", "T1"), {1.0, 1.0, 1.0}}, true);
    binary.add({CandidatePair("Q2", "T2"), {1.0, 0.0, 1.0}}, true);
    binary.add({CandidatePair("Q1", "T2"), {0.0, 0.0, 0.0}}, false);
    binary.add({CandidatePair("Q2", "T1"), {0.0, 1.0, 0.0}}, false);
    std::shared_ptr<const Model> model = classifier.fit(binary);
    ASSERT_GT(model->score({1.0, 1.0, 1.0}), 0.5);
    ASSERT_LT(model->score({0.0, 0.0, 0.0}), 0.5);
}

TEST_F(ClassifierTest, TestPredictGuardsTheSchema) {
    auto model = ClassifierFactory::create("nb", testParameters())->fit(separableSet(5));

    FeatureMatrix reordered = clearCaseMatrix();
    reordered.schema = FeatureSchema({"name_similarity", "name_exact", "birth_date"});
    ASSERT_THROW(Classifier::predict(*model, reordered, executor), SchemaMismatch);
    ASSERT_THROW(model->score({1.0, 1.0}), SchemaMismatch);
}

TEST_F(ClassifierTest, TestBadVectorIsReportedPerPair) {
    auto model = ClassifierFactory::create("nb", testParameters())->fit(separableSet(5));

    FeatureMatrix matrix = clearCaseMatrix();
    FeatureVector narrow{CandidatePair("P9", "T9"), {1.0, 1.0}};
    matrix.vectors.insert(matrix.vectors.begin() + 1, narrow);
    ScoreBatch batch = Classifier::predict(*model, matrix, executor);

    ASSERT_EQ(batch.scores.size(), 2);
    ASSERT_EQ(batch.errors.size(), 1);
    ASSERT_EQ(batch.errors[0].sourceId, "P9");
    ASSERT_EQ(batch.errors[0].stage, "score");
    ASSERT_EQ(batch.scores[1].pair, CandidatePair("P2", "T2"));
}

TEST_F(ClassifierTest, TestFactoryNames) {
    ASSERT_EQ(ClassifierFactory::canonicalName("nb"), Conts::CLASSIFIER::NAIVE_BAYES);
    ASSERT_EQ(ClassifierFactory::canonicalName("lsvm"), Conts::CLASSIFIER::LINEAR_SVM);
    ASSERT_EQ(ClassifierFactory::canonicalName("svm"), Conts::CLASSIFIER::SVM);
    ASSERT_EQ(ClassifierFactory::canonicalName("slp"), Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON);
    ASSERT_EQ(ClassifierFactory::canonicalName("multi_layer_perceptron"), Conts::CLASSIFIER::MULTI_LAYER_PERCEPTRON);
    ASSERT_THROW(ClassifierFactory::canonicalName("random_forest"), std::invalid_argument);

    ClassifierParameters noHidden = testParameters();
    noHidden.hiddenLayers.clear();
    ASSERT_THROW(ClassifierFactory::create("mlp", noHidden), std::invalid_argument);
    ASSERT_NO_THROW(ClassifierFactory::create("slp", noHidden));
}

TEST_F(ClassifierTest, TestSoftVotingAveragesMemberProbabilities) {
    TrainingSet trainingSet = separableSet(15);
    ClassifierParameters parameters = testParameters();
    parameters.votingMembers = {"nb", "slp"};
    parameters.votingMode = Conts::VOTING_MODE::SOFT;

    auto ensemble = ClassifierFactory::create(Conts::CLASSIFIER::VOTING, parameters)->fit(trainingSet);
    auto naiveBayes = ClassifierFactory::create("nb", parameters)->fit(trainingSet);
    auto perceptron = ClassifierFactory::create("slp", parameters)->fit(trainingSet);
    ASSERT_TRUE(ensemble->isCalibrated());
    ASSERT_EQ(ensemble->getAlgorithm(), Conts::CLASSIFIER::VOTING);

    std::vector<std::vector<double>> rows = {{1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}, {0.5, 0.4, 0.0}};
    for (const auto &row : rows) {
        double mean = (naiveBayes->score(row) + perceptron->score(row)) / 2.0;
        ASSERT_NEAR(ensemble->score(row), mean, 1e-12);
    }

    nlohmann::json parameterJson = ensemble->getParameters();
    ASSERT_EQ(parameterJson["voting"], "soft");
    ASSERT_EQ(parameterJson["members"].size(), 2);
    ASSERT_EQ(parameterJson["members"][0]["algorithm"], Conts::CLASSIFIER::NAIVE_BAYES);
}

TEST_F(ClassifierTest, TestHardVotingCountsMemberLabels) {
    TrainingSet trainingSet = separableSet(15);
    ClassifierParameters parameters = testParameters();
    parameters.votingMembers = {"nb", "lsvm", "slp"};
    parameters.votingMode = Conts::VOTING_MODE::HARD;

    std::unique_ptr<Classifier> classifier = ClassifierFactory::create("voting", parameters);
    ASSERT_FALSE(classifier->isCalibrated());
    std::shared_ptr<const Model> model = classifier->fit(trainingSet);
    ASSERT_FALSE(model->isCalibrated());

    // Every member agrees on the clear cases
    ASSERT_DOUBLE_EQ(model->score({1.0, 1.0, 1.0}), 1.0);
    ASSERT_DOUBLE_EQ(model->score({0.0, 0.0, 0.0}), -1.0);
    ASSERT_TRUE(model->predictLabel({1.0, 1.0, 1.0}));
    ASSERT_FALSE(model->predictLabel({0.0, 0.0, 0.0}));
}

TEST_F(ClassifierTest, TestHardVotingTieIsAMatch) {
    TrainingSet trainingSet = separableSet(10);
    auto matching = ClassifierFactory::create("nb", testParameters())->fit(trainingSet);
    auto kernel = NaiveBayesKernel::fromJson(matching->getParameters());

    // A margin kernel that always says non-match, paired with one that says match
    class Negative : public ClassifierKernel {
     public:
        double decisionValue(const arma::rowvec &) const override { return -1.0; }
        nlohmann::json toJson() const override { return nlohmann::json::object(); }
    };
    std::vector<VotingKernel::Member> members = {
        {Conts::CLASSIFIER::NAIVE_BAYES, true, kernel},
        {Conts::CLASSIFIER::LINEAR_SVM, false, std::make_shared<Negative>()}};
    VotingKernel voting(Conts::VOTING_MODE::HARD, members);
    arma::rowvec clearMatch = {1.0, 1.0, 1.0};
    ASSERT_DOUBLE_EQ(voting.decisionValue(clearMatch), 0.0);
}

TEST_F(ClassifierTest, TestVotingRejectsInvalidMembers) {
    ClassifierParameters parameters = testParameters();

    // Soft voting cannot average margins
    parameters.votingMembers = {"nb", "lsvm"};
    parameters.votingMode = Conts::VOTING_MODE::SOFT;
    ASSERT_THROW(ClassifierFactory::create("voting", parameters), std::invalid_argument);

    parameters.votingMembers = {"nb", "voting"};
    parameters.votingMode = Conts::VOTING_MODE::HARD;
    ASSERT_THROW(ClassifierFactory::create("voting", parameters), std::invalid_argument);

    parameters.votingMembers = {"nb", "random_forest"};
    ASSERT_THROW(ClassifierFactory::create("voting", parameters), std::invalid_argument);

    ASSERT_THROW(VotingClassifier(Conts::VOTING_MODE::HARD, {}), std::invalid_argument);
    parameters.votingMembers = {"nb"};
    parameters.votingMode = "weighted";
    ASSERT_THROW(ClassifierFactory::create("voting", parameters), std::invalid_argument);
}

TEST_F(ClassifierTest, TestVotingMemberFailureIsATrainingError) {
    ClassifierParameters parameters = testParameters();
    parameters.votingMembers = {"slp", "nb"};
    parameters.binarize.reset();
    // Naive Bayes without binarization refuses continuous features
    auto classifier = ClassifierFactory::create("voting", parameters);
    ASSERT_THROW(classifier->fit(separableSet(5)), TrainingError);
}
