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


#include "CrossValidator.h"

#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;

Logger validation_logger;

double ConfusionCounts::precision() const {
    size_t predicted = truePositives + falsePositives;
    return predicted == 0 ? 0.0 : static_cast<double>(truePositives) / predicted;
}

double ConfusionCounts::recall() const {
    size_t actual = truePositives + falseNegatives;
    return actual == 0 ? 0.0 : static_cast<double>(truePositives) / actual;
}

double ConfusionCounts::fScore() const {
    double p = precision();
    double r = recall();
    return p + r == 0.0 ? 0.0 : 2.0 * p * r / (p + r);
}

string EvaluationResult::toString() const {
    ostringstream out;
    out << algorithm << " " << folds << "-fold (seed " << seed << "): precision " << mean.precision << " +/- "
        << standardDeviation.precision << ", recall " << mean.recall << " +/- " << standardDeviation.recall
        << ", f-score " << mean.fScore << " +/- " << standardDeviation.fScore << "; pooled precision "
        << pooled.precision << ", recall " << pooled.recall << ", f-score " << pooled.fScore;
    return out.str();
}

CrossValidator::CrossValidator(int folds, unsigned int seed, double threshold)
    : folds(folds), seed(seed), threshold(threshold) {
    if (folds < 2) {
        throw invalid_argument("Cross-validation needs at least 2 folds, got " + to_string(folds));
    }
}

vector<int> CrossValidator::assignFolds(const vector<int> &labels) const {
    vector<size_t> positives, negatives;
    for (size_t i = 0; i < labels.size(); i++) {
        (labels[i] == 1 ? positives : negatives).push_back(i);
    }
    if (positives.size() < static_cast<size_t>(folds) || negatives.size() < static_cast<size_t>(folds)) {
        throw TrainingError("stratified " + to_string(folds) + "-fold cross-validation needs at least " +
                            to_string(folds) + " examples per class, got " + to_string(positives.size()) +
                            " matches and " + to_string(negatives.size()) + " non-matches");
    }

    vector<int> assignment(labels.size(), -1);
    mt19937 generator(seed);
    for (const vector<size_t> *members : {&positives, &negatives}) {
        vector<size_t> order = Utils::shuffledIndices(members->size(), generator);
        for (size_t k = 0; k < order.size(); k++) {
            assignment[(*members)[order[k]]] = static_cast<int>(k % folds);
        }
    }
    return assignment;
}

static MetricSummary summarize(const ConfusionCounts &counts) {
    return MetricSummary{counts.precision(), counts.recall(), counts.fScore()};
}

EvaluationResult CrossValidator::evaluate(const Classifier &classifier, const TrainingSet &trainingSet,
                                          ParallelExecutor &executor) const {
    EvaluationResult result;
    result.algorithm = classifier.getName();
    result.folds = folds;
    result.seed = seed;
    result.foldAssignments = assignFolds(trainingSet.getLabels());

    const vector<int> &labels = trainingSet.getLabels();
    ConfusionCounts pooled;
    for (int fold = 0; fold < folds; fold++) {
        vector<size_t> trainIndices, testIndices;
        for (size_t i = 0; i < labels.size(); i++) {
            (result.foldAssignments[i] == fold ? testIndices : trainIndices).push_back(i);
        }
        shared_ptr<const Model> model = classifier.fit(trainingSet.subset(trainIndices));

        TrainingSet testSet = trainingSet.subset(testIndices);
        ScoreBatch batch = Classifier::predict(*model, FeatureMatrix{testSet.getSchema(), testSet.getVectors()},
                                               executor);
        if (!batch.errors.empty()) {
            throw TrainingError("fold " + to_string(fold) + " could not score " + batch.errors.front().toString());
        }

        ConfusionCounts counts;
        for (size_t k = 0; k < batch.scores.size(); k++) {
            bool predicted = batch.calibrated ? batch.scores[k].value >= threshold : batch.scores[k].value >= 0.0;
            bool actual = testSet.getLabels()[k] == 1;
            if (predicted && actual) {
                counts.truePositives++;
            } else if (predicted) {
                counts.falsePositives++;
            } else if (actual) {
                counts.falseNegatives++;
            } else {
                counts.trueNegatives++;
            }
        }
        validation_logger.debug(result.algorithm + " fold " + to_string(fold) + ": precision " +
                                to_string(counts.precision()) + ", recall " + to_string(counts.recall()));
        pooled.truePositives += counts.truePositives;
        pooled.falsePositives += counts.falsePositives;
        pooled.falseNegatives += counts.falseNegatives;
        pooled.trueNegatives += counts.trueNegatives;
        result.perFold.push_back(counts);
    }

    for (const auto &counts : result.perFold) {
        result.mean.precision += counts.precision() / folds;
        result.mean.recall += counts.recall() / folds;
        result.mean.fScore += counts.fScore() / folds;
    }
    for (const auto &counts : result.perFold) {
        result.standardDeviation.precision += pow(counts.precision() - result.mean.precision, 2) / folds;
        result.standardDeviation.recall += pow(counts.recall() - result.mean.recall, 2) / folds;
        result.standardDeviation.fScore += pow(counts.fScore() - result.mean.fScore, 2) / folds;
    }
    result.standardDeviation.precision = sqrt(result.standardDeviation.precision);
    result.standardDeviation.recall = sqrt(result.standardDeviation.recall);
    result.standardDeviation.fScore = sqrt(result.standardDeviation.fScore);
    result.pooled = summarize(pooled);

    validation_logger.info("Evaluation " + result.toString());
    return result;
}
