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


#include "LinearSvmClassifier.h"

#include <cmath>
#include <random>

#include "../util/Conts.h"
#include "../util/Utils.h"
#include "ArmaJson.h"

using namespace std;

LinearSvmKernel::LinearSvmKernel(arma::vec weights, double bias) : weights(std::move(weights)), bias(bias) {
    if (this->weights.n_elem == 0) {
        throw invalid_argument("linear SVM needs at least one weight");
    }
}

double LinearSvmKernel::decisionValue(const arma::rowvec &features) const {
    if (features.n_elem != weights.n_elem) {
        throw invalid_argument("expected " + to_string(weights.n_elem) + " features, got " +
                               to_string(features.n_elem));
    }
    return arma::dot(features, weights) + bias;
}

nlohmann::json LinearSvmKernel::toJson() const {
    json parameters;
    parameters["weights"] = vecToJson(weights);
    parameters["bias"] = bias;
    return parameters;
}

shared_ptr<const LinearSvmKernel> LinearSvmKernel::fromJson(const nlohmann::json &parameters) {
    if (!parameters.is_object() || !parameters.contains("weights") || !parameters.contains("bias") ||
        !parameters["bias"].is_number()) {
        throw invalid_argument("linear SVM parameters are incomplete");
    }
    return make_shared<const LinearSvmKernel>(vecFromJson(parameters["weights"]), parameters["bias"].get<double>());
}

LinearSvmClassifier::LinearSvmClassifier(double c, int epochs, unsigned int seed) : c(c), epochs(epochs), seed(seed) {
    if (!(c > 0.0)) {
        throw invalid_argument("linear SVM regularization C must be positive");
    }
    if (epochs <= 0) {
        throw invalid_argument("linear SVM needs at least one epoch");
    }
}

string LinearSvmClassifier::getName() const { return Conts::CLASSIFIER::LINEAR_SVM; }

shared_ptr<const ClassifierKernel> LinearSvmClassifier::restoreKernel(const nlohmann::json &parameters) const {
    return LinearSvmKernel::fromJson(parameters);
}

shared_ptr<const ClassifierKernel> LinearSvmClassifier::train(const arma::mat &features,
                                                              const arma::vec &labels) const {
    const arma::uword n = features.n_rows;
    const arma::uword d = features.n_cols;
    // Last column is the constant bias input
    arma::mat augmented = arma::join_rows(features, arma::ones<arma::vec>(n));
    arma::vec signs(n);
    for (arma::uword i = 0; i < n; i++) {
        signs(i) = labels(i) > 0.5 ? 1.0 : -1.0;
    }

    const double lambda = 1.0 / (c * static_cast<double>(n));
    const double radius = 1.0 / sqrt(lambda);
    arma::rowvec w(d + 1, arma::fill::zeros);
    mt19937 generator(seed);
    size_t step = 0;
    for (int epoch = 0; epoch < epochs; epoch++) {
        vector<size_t> order = Utils::shuffledIndices(n, generator);
        for (size_t index : order) {
            step++;
            double eta = 1.0 / (lambda * static_cast<double>(step));
            double margin = signs(index) * arma::dot(w, augmented.row(index));
            w *= (1.0 - eta * lambda);
            if (margin < 1.0) {
                w += (eta * signs(index)) * augmented.row(index);
            }
            double norm = arma::norm(w, 2);
            if (norm > radius) {
                w *= radius / norm;
            }
        }
    }
    if (!w.is_finite()) {
        throw TrainingError("linear SVM weights diverged");
    }
    arma::vec weights = w.cols(0, d - 1).t();
    return make_shared<const LinearSvmKernel>(weights, w(d));
}
