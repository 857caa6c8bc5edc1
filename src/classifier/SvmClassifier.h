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


#ifndef CATALOGLINKER_SVMCLASSIFIER_H
#define CATALOGLINKER_SVMCLASSIFIER_H

#include "Classifier.h"

struct PlattParameters {
    double a;
    double b;

    // 1 / (1 + exp(a * margin + b))
    double probability(double margin) const;
};

/**
 * Fits a sigmoid mapping margins to match probabilities by Newton iterations with
 * backtracking, using the smoothed targets (n+ + 1) / (n+ + 2) and 1 / (n- + 2).
 */
PlattParameters fitPlattScaling(const arma::vec &margins, const arma::vec &labels);

class SvmKernel : public ClassifierKernel {
 public:
    SvmKernel(double gamma, double bias, arma::mat supportVectors, arma::vec coefficients, PlattParameters platt,
              arma::uword featureCount);

    double margin(const arma::rowvec &features) const;
    // Platt calibrated probability of a match
    double decisionValue(const arma::rowvec &features) const override;
    nlohmann::json toJson() const override;

    arma::uword getSupportVectorCount() const { return supportVectors.n_rows; }

    static std::shared_ptr<const SvmKernel> fromJson(const nlohmann::json &parameters);

 private:
    double gamma;
    double bias;
    arma::mat supportVectors;
    arma::vec coefficients;
    PlattParameters platt;
    arma::uword featureCount;
};

/**
 * RBF kernel SVM trained with simplified SMO. The kernel matrix is cached for training sets
 * up to KERNEL_CACHE_LIMIT rows and recomputed row by row above that.
 */
class SvmClassifier : public Classifier {
 public:
    static constexpr arma::uword KERNEL_CACHE_LIMIT = 5000;
    static constexpr int MAX_SWEEPS = 1000;

    SvmClassifier(double c, double gamma, double tolerance, int maxPasses, unsigned int seed);

    std::string getName() const override;
    bool isCalibrated() const override { return true; }
    std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const override;

 protected:
    std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const override;

 private:
    double c;
    double gamma;
    double tolerance;
    int maxPasses;
    unsigned int seed;
};

#endif  // CATALOGLINKER_SVMCLASSIFIER_H
