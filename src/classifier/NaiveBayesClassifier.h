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


#ifndef CATALOGLINKER_NAIVEBAYESCLASSIFIER_H
#define CATALOGLINKER_NAIVEBAYESCLASSIFIER_H

#include <optional>

#include "Classifier.h"

/**
 * Bernoulli naive Bayes. Row 0 of the probability matrix holds P(feature on | non-match),
 * row 1 P(feature on | match).
 */
class NaiveBayesKernel : public ClassifierKernel {
 public:
    NaiveBayesKernel(std::optional<double> binarize, arma::vec classLogPrior, arma::mat featureProbability);

    double decisionValue(const arma::rowvec &features) const override;
    nlohmann::json toJson() const override;

    static std::shared_ptr<const NaiveBayesKernel> fromJson(const nlohmann::json &parameters);

 private:
    std::optional<double> binarize;
    arma::vec classLogPrior;
    arma::mat logProbability;
    arma::mat logComplement;
};

class NaiveBayesClassifier : public Classifier {
 public:
    NaiveBayesClassifier(std::optional<double> binarize, double alpha);

    std::string getName() const override;
    bool isCalibrated() const override { return true; }
    std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const override;

 protected:
    std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const override;

 private:
    std::optional<double> binarize;
    double alpha;
};

#endif  // CATALOGLINKER_NAIVEBAYESCLASSIFIER_H
