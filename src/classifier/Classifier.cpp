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


#include "Classifier.h"

#include <cmath>
#include <optional>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

Logger classifier_logger;

std::shared_ptr<const Model> Classifier::fit(const TrainingSet &trainingSet) const {
    const FeatureSchema &schema = trainingSet.getSchema();
    if (trainingSet.size() == 0) {
        throw TrainingError("empty training set");
    }
    if (schema.size() == 0) {
        throw TrainingError("feature schema has no features");
    }
    for (const auto &vector : trainingSet.getVectors()) {
        if (vector.values.size() != schema.size()) {
            throw TrainingError("vector " + vector.pair.toString() + " has " + std::to_string(vector.values.size()) +
                                " features, schema " + schema.getHash() + " has " + std::to_string(schema.size()));
        }
        for (double value : vector.values) {
            if (!std::isfinite(value)) {
                throw TrainingError("vector " + vector.pair.toString() + " holds a non-finite value");
            }
        }
    }
    size_t positives = trainingSet.countPositives();
    size_t negatives = trainingSet.countNegatives();
    if (positives == 0 || negatives == 0) {
        throw TrainingError("both classes are required, got " + std::to_string(positives) + " matches and " +
                            std::to_string(negatives) + " non-matches");
    }

    classifier_logger.info("Training " + getName() + " on " + std::to_string(trainingSet.size()) + " pairs (" +
                           std::to_string(positives) + " matches) with schema " + schema.getHash());
    std::shared_ptr<const ClassifierKernel> kernel;
    try {
        kernel = train(trainingSet.featureMatrix(), trainingSet.labelVector());
    } catch (const TrainingError &) {
        throw;
    } catch (const std::exception &e) {
        throw TrainingError(getName() + ": " + e.what());
    }
    if (!kernel) {
        throw TrainingError(getName() + " produced no model");
    }
    return std::make_shared<const Model>(getName(), schema, isCalibrated(), Utils::getCurrentTimestamp(),
                                         trainingSet.getIdentity(), kernel);
}

ScoreBatch Classifier::predict(const Model &model, const FeatureMatrix &matrix, ParallelExecutor &executor) {
    if (matrix.schema != model.getSchema()) {
        throw SchemaMismatch("Batch schema " + matrix.schema.getHash() + " differs from model schema " +
                                 model.getSchema().getHash(),
                             model.getSchema().size(), matrix.schema.size());
    }

    struct Outcome {
        std::optional<PairScore> score;
        std::optional<PairError> error;
    };
    const std::vector<FeatureVector> &vectors = matrix.vectors;
    std::vector<Outcome> outcomes = executor.map<Outcome>(vectors.size(), [&](size_t index) {
        const FeatureVector &vector = vectors[index];
        Outcome outcome;
        try {
            outcome.score = PairScore{vector.pair, model.score(vector.values)};
        } catch (const std::exception &e) {
            outcome.error = PairError{vector.pair.sourceId, vector.pair.targetId, "score", e.what()};
        }
        return outcome;
    });

    ScoreBatch batch;
    batch.calibrated = model.isCalibrated();
    batch.scores.reserve(outcomes.size());
    for (auto &outcome : outcomes) {
        if (outcome.score) {
            batch.scores.push_back(*outcome.score);
        } else if (outcome.error) {
            classifier_logger.warn("Scoring failed " + outcome.error->toString());
            batch.errors.push_back(*outcome.error);
        }
    }
    return batch;
}
