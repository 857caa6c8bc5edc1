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


#ifndef CATALOGLINKER_CLASSIFIER_H
#define CATALOGLINKER_CLASSIFIER_H

#include <armadillo>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../util/LinkerErrors.h"
#include "../util/executor/ParallelExecutor.h"
#include "Model.h"
#include "TrainingSet.h"

struct PairScore {
    CandidatePair pair;
    double value;
};

struct ScoreBatch {
    bool calibrated = false;
    std::vector<PairScore> scores;
    std::vector<PairError> errors;
};

/**
 * An untrained model family. fit() turns a training set into an immutable Model; the family
 * object itself keeps only hyper-parameters.
 */
class Classifier {
 public:
    virtual ~Classifier() = default;

    virtual std::string getName() const = 0;

    // True when scores are match probabilities rather than margins
    virtual bool isCalibrated() const = 0;

    // Calibration of a kernel restored from these parameters. Only ensembles depend on them.
    virtual bool isCalibratedFor(const nlohmann::json &parameters) const { return isCalibrated(); }

    /**
     * Throws TrainingError for an empty set, a single class, vectors of the wrong width or
     * non-finite values, and when the algorithm itself fails. No model is returned then.
     */
    std::shared_ptr<const Model> fit(const TrainingSet &trainingSet) const;

    // Rebuilds a kernel from persisted parameters
    virtual std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const = 0;

    /**
     * Scores a batch in vector order. A batch built for another schema throws SchemaMismatch;
     * a single bad vector is reported in ScoreBatch::errors and the rest is still scored.
     */
    static ScoreBatch predict(const Model &model, const FeatureMatrix &matrix, ParallelExecutor &executor);

 protected:
    virtual std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const = 0;

    // Trains its members on the already validated matrix
    friend class VotingClassifier;
};

#endif  // CATALOGLINKER_CLASSIFIER_H
