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


#ifndef CATALOGLINKER_MODEL_H
#define CATALOGLINKER_MODEL_H

#include <armadillo>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../features/FeatureSchema.h"

/**
 * Trained parameters of one algorithm. Kernels are immutable, so one instance can be scored from
 * many threads at once.
 */
class ClassifierKernel {
 public:
    virtual ~ClassifierKernel() = default;

    // Probability of a match for calibrated kernels, a signed margin otherwise
    virtual double decisionValue(const arma::rowvec &features) const = 0;

    virtual nlohmann::json toJson() const = 0;
};

class Model {
 public:
    Model(std::string algorithm, FeatureSchema schema, bool calibrated, std::string trainedAt,
          std::string trainingSetId, std::shared_ptr<const ClassifierKernel> kernel);

    const std::string &getAlgorithm() const { return algorithm; }

    const FeatureSchema &getSchema() const { return schema; }

    bool isCalibrated() const { return calibrated; }

    const std::string &getTrainedAt() const { return trainedAt; }

    const std::string &getTrainingSetId() const { return trainingSetId; }

    nlohmann::json getParameters() const { return kernel->toJson(); }

    /**
     * Match probability, or margin for uncalibrated models. Throws SchemaMismatch when the vector
     * does not have exactly the schema's width and std::invalid_argument for non-finite values.
     */
    double score(const std::vector<double> &values) const;

    // score() >= 0.5 for calibrated models, margin >= 0 otherwise
    bool predictLabel(const std::vector<double> &values) const;

 private:
    std::string algorithm;
    FeatureSchema schema;
    bool calibrated;
    std::string trainedAt;
    std::string trainingSetId;
    std::shared_ptr<const ClassifierKernel> kernel;
};

#endif  // CATALOGLINKER_MODEL_H
