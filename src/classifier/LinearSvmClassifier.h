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


#ifndef CATALOGLINKER_LINEARSVMCLASSIFIER_H
#define CATALOGLINKER_LINEARSVMCLASSIFIER_H

#include "Classifier.h"

class LinearSvmKernel : public ClassifierKernel {
 public:
    LinearSvmKernel(arma::vec weights, double bias);

    // w.x + b, positive on the match side
    double decisionValue(const arma::rowvec &features) const override;
    nlohmann::json toJson() const override;

    static std::shared_ptr<const LinearSvmKernel> fromJson(const nlohmann::json &parameters);

 private:
    arma::vec weights;
    double bias;
};

/**
 * Hinge loss SVM trained with Pegasos stochastic sub-gradient steps. The bias is learnt as
 * the weight of a constant input. Output is an uncalibrated margin.
 */
class LinearSvmClassifier : public Classifier {
 public:
    LinearSvmClassifier(double c, int epochs, unsigned int seed);

    std::string getName() const override;
    bool isCalibrated() const override { return false; }
    std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const override;

 protected:
    std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const override;

 private:
    double c;
    int epochs;
    unsigned int seed;
};

#endif  // CATALOGLINKER_LINEARSVMCLASSIFIER_H
