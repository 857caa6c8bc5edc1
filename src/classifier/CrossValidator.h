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


#ifndef CATALOGLINKER_CROSSVALIDATOR_H
#define CATALOGLINKER_CROSSVALIDATOR_H

#include <string>
#include <vector>

#include "../util/executor/ParallelExecutor.h"
#include "Classifier.h"
#include "TrainingSet.h"

struct ConfusionCounts {
    size_t truePositives = 0;
    size_t falsePositives = 0;
    size_t falseNegatives = 0;
    size_t trueNegatives = 0;

    double precision() const;
    double recall() const;
    double fScore() const;
};

struct MetricSummary {
    double precision = 0.0;
    double recall = 0.0;
    double fScore = 0.0;
};

struct EvaluationResult {
    std::string algorithm;
    int folds = 0;
    unsigned int seed = 0;
    // Fold of every training example, in training set order
    std::vector<int> foldAssignments;
    std::vector<ConfusionCounts> perFold;
    MetricSummary mean;
    // Population standard deviation across folds
    MetricSummary standardDeviation;
    // Metrics over the predictions of all folds taken together
    MetricSummary pooled;

    std::string toString() const;
};

/**
 * Stratified k-fold cross-validation. Each class is shuffled with its own pass of the seeded
 * generator and dealt round robin over the folds, so every fold keeps the class ratio and the
 * same seed always yields the same folds.
 */
class CrossValidator {
 public:
    CrossValidator(int folds, unsigned int seed, double threshold = 0.5);

    // Throws TrainingError when a class has fewer examples than there are folds
    std::vector<int> assignFolds(const std::vector<int> &labels) const;

    EvaluationResult evaluate(const Classifier &classifier, const TrainingSet &trainingSet,
                              ParallelExecutor &executor) const;

 private:
    int folds;
    unsigned int seed;
    double threshold;
};

#endif  // CATALOGLINKER_CROSSVALIDATOR_H
