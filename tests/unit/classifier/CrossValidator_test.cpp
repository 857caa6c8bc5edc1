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


#include "../../../src/classifier/CrossValidator.h"

#include <stdexcept>

#include "../../../src/classifier/ClassifierFactory.h"
#include "../../../src/util/Conts.h"
#include "gtest/gtest.h"

static TrainingSet labeledSet(size_t positives, size_t negatives) {
    TrainingSet trainingSet(FeatureSchema({"name_exact", "birth_date"}));
    for (size_t i = 0; i < positives; i++) {
        trainingSet.add({CandidatePair("Q" + std::to_string(i), "T" + std::to_string(i)),
                         {1.0, 0.9 + 0.01 * (i % 10)}},
                        true);
    }
    for (size_t i = 0; i < negatives; i++) {
        trainingSet.add({CandidatePair("Q" + std::to_string(i), "N" + std::to_string(i)),
                         {0.0, 0.03 * (i % 4)}},
                        false);
    }
    return trainingSet;
}

class CrossValidatorTest : public ::testing::Test {
 protected:
    ParallelExecutor executor{2};
    std::unique_ptr<Classifier> classifier = ClassifierFactory::create(Conts::CLASSIFIER::NAIVE_BAYES, {});
};

TEST_F(CrossValidatorTest, TestFoldsAreStratified) {
    TrainingSet trainingSet = labeledSet(20, 30);
    CrossValidator validator(5, 1269);
    std::vector<int> folds = validator.assignFolds(trainingSet.getLabels());

    ASSERT_EQ(folds.size(), trainingSet.size());
    std::vector<int> positivesPerFold(5, 0);
    std::vector<int> negativesPerFold(5, 0);
    for (size_t i = 0; i < folds.size(); i++) {
        ASSERT_GE(folds[i], 0);
        ASSERT_LT(folds[i], 5);
        (trainingSet.getLabels()[i] == 1 ? positivesPerFold : negativesPerFold)[folds[i]]++;
    }
    for (int fold = 0; fold < 5; fold++) {
        ASSERT_EQ(positivesPerFold[fold], 4);
        ASSERT_EQ(negativesPerFold[fold], 6);
    }
}

TEST_F(CrossValidatorTest, TestSameSeedSameFolds) {
    TrainingSet trainingSet = labeledSet(20, 30);
    ASSERT_EQ(CrossValidator(5, 7).assignFolds(trainingSet.getLabels()),
              CrossValidator(5, 7).assignFolds(trainingSet.getLabels()));
    ASSERT_NE(CrossValidator(5, 7).assignFolds(trainingSet.getLabels()),
              CrossValidator(5, 8).assignFolds(trainingSet.getLabels()));
}

TEST_F(CrossValidatorTest, TestEvaluationIsReproducible) {
    TrainingSet trainingSet = labeledSet(20, 30);
    CrossValidator validator(5, 1269);
    EvaluationResult first = validator.evaluate(*classifier, trainingSet, executor);
    EvaluationResult second = validator.evaluate(*classifier, trainingSet, executor);

    ASSERT_EQ(first.algorithm, Conts::CLASSIFIER::NAIVE_BAYES);
    ASSERT_EQ(first.perFold.size(), 5);
    ASSERT_EQ(first.foldAssignments, second.foldAssignments);
    ASSERT_DOUBLE_EQ(first.mean.fScore, second.mean.fScore);
    ASSERT_DOUBLE_EQ(first.pooled.precision, second.pooled.precision);
    ASSERT_FALSE(first.toString().empty());

    size_t evaluated = 0;
    for (const auto &counts : first.perFold) {
        evaluated += counts.truePositives + counts.falsePositives + counts.falseNegatives + counts.trueNegatives;
    }
    ASSERT_EQ(evaluated, trainingSet.size());
}

TEST_F(CrossValidatorTest, TestSeparableDataScoresPerfectly) {
    EvaluationResult result = CrossValidator(4, 3).evaluate(*classifier, labeledSet(12, 12), executor);
    ASSERT_DOUBLE_EQ(result.mean.precision, 1.0);
    ASSERT_DOUBLE_EQ(result.mean.recall, 1.0);
    ASSERT_DOUBLE_EQ(result.pooled.fScore, 1.0);
    ASSERT_DOUBLE_EQ(result.standardDeviation.fScore, 0.0);
}

TEST_F(CrossValidatorTest, TestTooFewExamplesPerClass) {
    CrossValidator validator(5, 1269);
    TrainingSet trainingSet = labeledSet(4, 30);
    ASSERT_THROW(validator.assignFolds(trainingSet.getLabels()), TrainingError);
    ASSERT_THROW(validator.evaluate(*classifier, trainingSet, executor), TrainingError);
    ASSERT_THROW(CrossValidator(1, 1269), std::invalid_argument);
}

TEST_F(CrossValidatorTest, TestConfusionCountsWithEmptyDenominators) {
    ConfusionCounts counts;
    counts.trueNegatives = 10;
    ASSERT_DOUBLE_EQ(counts.precision(), 0.0);
    ASSERT_DOUBLE_EQ(counts.recall(), 0.0);
    ASSERT_DOUBLE_EQ(counts.fScore(), 0.0);

    counts.truePositives = 3;
    counts.falsePositives = 1;
    counts.falseNegatives = 3;
    ASSERT_DOUBLE_EQ(counts.precision(), 0.75);
    ASSERT_DOUBLE_EQ(counts.recall(), 0.5);
    ASSERT_DOUBLE_EQ(counts.fScore(), 0.6);
}
