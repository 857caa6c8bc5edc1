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


#include "NaiveBayesClassifier.h"

#include <cmath>

#include "../util/Conts.h"
#include "ArmaJson.h"

using namespace std;

static arma::mat binarizeRows(const arma::mat &features, const optional<double> &binarize) {
    double threshold = binarize.value_or(0.0);
    arma::mat result(features.n_rows, features.n_cols);
    for (arma::uword i = 0; i < features.n_rows; i++) {
        for (arma::uword j = 0; j < features.n_cols; j++) {
            result.at(i, j) = features.at(i, j) > threshold ? 1.0 : 0.0;
        }
    }
    return result;
}

NaiveBayesKernel::NaiveBayesKernel(optional<double> binarize, arma::vec classLogPrior, arma::mat featureProbability)
    : binarize(binarize), classLogPrior(std::move(classLogPrior)) {
    if (this->classLogPrior.n_elem != 2 || featureProbability.n_rows != 2) {
        throw invalid_argument("naive Bayes parameters must cover exactly two classes");
    }
    if (featureProbability.min() <= 0.0 || featureProbability.max() >= 1.0) {
        throw invalid_argument("naive Bayes feature probabilities must lie strictly between 0 and 1");
    }
    logProbability = arma::log(featureProbability);
    logComplement = arma::log(1.0 - featureProbability);
}

double NaiveBayesKernel::decisionValue(const arma::rowvec &features) const {
    if (features.n_elem != logProbability.n_cols) {
        throw invalid_argument("expected " + to_string(logProbability.n_cols) + " features, got " +
                               to_string(features.n_elem));
    }
    double threshold = binarize.value_or(0.0);
    double jointLog[2];
    for (arma::uword c = 0; c < 2; c++) {
        double sum = classLogPrior(c);
        for (arma::uword j = 0; j < features.n_elem; j++) {
            sum += features(j) > threshold ? logProbability.at(c, j) : logComplement.at(c, j);
        }
        jointLog[c] = sum;
    }
    // P(match | x) = 1 / (1 + exp(jll0 - jll1))
    double difference = jointLog[0] - jointLog[1];
    if (difference > 0) {
        double e = exp(-difference);
        return e / (1.0 + e);
    }
    return 1.0 / (1.0 + exp(difference));
}

nlohmann::json NaiveBayesKernel::toJson() const {
    json parameters;
    parameters["binarize"] = binarize ? json(*binarize) : json(nullptr);
    parameters["class_log_prior"] = vecToJson(classLogPrior);
    parameters["feature_probability"] = matToJson(arma::exp(logProbability));
    return parameters;
}

shared_ptr<const NaiveBayesKernel> NaiveBayesKernel::fromJson(const nlohmann::json &parameters) {
    if (!parameters.is_object() || !parameters.contains("class_log_prior") ||
        !parameters.contains("feature_probability")) {
        throw invalid_argument("naive Bayes parameters are incomplete");
    }
    optional<double> binarize;
    if (parameters.contains("binarize") && !parameters["binarize"].is_null()) {
        if (!parameters["binarize"].is_number()) {
            throw invalid_argument("naive Bayes binarize must be a number or null");
        }
        binarize = parameters["binarize"].get<double>();
    }
    return make_shared<const NaiveBayesKernel>(binarize, vecFromJson(parameters["class_log_prior"]),
                                               matFromJson(parameters["feature_probability"]));
}

NaiveBayesClassifier::NaiveBayesClassifier(optional<double> binarize, double alpha)
    : binarize(binarize), alpha(alpha) {
    if (!(alpha > 0.0)) {
        throw invalid_argument("naive Bayes smoothing must be positive");
    }
}

string NaiveBayesClassifier::getName() const { return Conts::CLASSIFIER::NAIVE_BAYES; }

shared_ptr<const ClassifierKernel> NaiveBayesClassifier::restoreKernel(const nlohmann::json &parameters) const {
    return NaiveBayesKernel::fromJson(parameters);
}

shared_ptr<const ClassifierKernel> NaiveBayesClassifier::train(const arma::mat &features,
                                                               const arma::vec &labels) const {
    if (!binarize) {
        for (double value : features) {
            if (value != 0.0 && value != 1.0) {
                throw TrainingError("naive Bayes without binarization needs 0/1 features, found " +
                                    to_string(value));
            }
        }
    }
    arma::mat binary = binarizeRows(features, binarize);

    arma::vec classCount(2, arma::fill::zeros);
    arma::mat featureCount(2, binary.n_cols, arma::fill::zeros);
    for (arma::uword i = 0; i < binary.n_rows; i++) {
        arma::uword c = labels(i) > 0.5 ? 1 : 0;
        classCount(c) += 1.0;
        featureCount.row(c) += binary.row(i);
    }

    arma::vec classLogPrior = arma::log(classCount / static_cast<double>(binary.n_rows));
    arma::mat probability(2, binary.n_cols);
    for (arma::uword c = 0; c < 2; c++) {
        probability.row(c) = (featureCount.row(c) + alpha) / (classCount(c) + 2.0 * alpha);
    }
    return make_shared<const NaiveBayesKernel>(binarize, classLogPrior, probability);
}
