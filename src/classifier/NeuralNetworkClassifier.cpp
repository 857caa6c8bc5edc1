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


#include "NeuralNetworkClassifier.h"

#include <cmath>
#include <random>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"
#include "ArmaJson.h"

using namespace std;

Logger network_logger;

static const double ADAM_BETA1 = 0.9;
static const double ADAM_BETA2 = 0.999;
static const double ADAM_EPSILON = 1e-8;

static double sigmoid(double z) {
    if (z >= 0) {
        return 1.0 / (1.0 + exp(-z));
    }
    double e = exp(z);
    return e / (1.0 + e);
}

// Box-Muller over raw generator output so a seed yields the same weights with any standard library
static double standardNormal(mt19937 &generator) {
    const double scale = 1.0 / 4294967296.0;
    double u1 = (static_cast<double>(generator()) + 1.0) * scale;
    double u2 = static_cast<double>(generator()) * scale;
    return sqrt(-2.0 * log(u1)) * cos(2.0 * arma::datum::pi * u2);
}

// Pre-activations of every layer for a batch, one row per example
static vector<arma::mat> forward(const vector<DenseLayer> &layers, const arma::mat &input) {
    vector<arma::mat> preActivations;
    preActivations.reserve(layers.size());
    arma::mat activation = input;
    for (size_t l = 0; l < layers.size(); l++) {
        arma::mat z = activation * layers[l].weights.t();
        z.each_row() += layers[l].bias.t();
        preActivations.push_back(z);
        if (l + 1 < layers.size()) {
            activation = z;
            activation.transform([](double v) { return v > 0.0 ? v : 0.0; });
        }
    }
    return preActivations;
}

NeuralNetworkKernel::NeuralNetworkKernel(vector<DenseLayer> layers) : layers(std::move(layers)) {
    if (this->layers.empty()) {
        throw invalid_argument("a network needs at least its output layer");
    }
    for (size_t l = 0; l < this->layers.size(); l++) {
        const DenseLayer &layer = this->layers[l];
        if (layer.weights.n_rows != layer.bias.n_elem) {
            throw invalid_argument("layer " + to_string(l) + " has mismatched weights and bias");
        }
        if (l > 0 && layer.weights.n_cols != this->layers[l - 1].weights.n_rows) {
            throw invalid_argument("layer " + to_string(l) + " does not accept the previous layer's output");
        }
    }
    if (this->layers.back().weights.n_rows != 1) {
        throw invalid_argument("the output layer must have a single unit");
    }
}

double NeuralNetworkKernel::decisionValue(const arma::rowvec &features) const {
    if (features.n_elem != layers.front().weights.n_cols) {
        throw invalid_argument("expected " + to_string(layers.front().weights.n_cols) + " features, got " +
                               to_string(features.n_elem));
    }
    arma::vec activation = features.t();
    for (size_t l = 0; l < layers.size(); l++) {
        arma::vec z = layers[l].weights * activation + layers[l].bias;
        if (l + 1 < layers.size()) {
            z.transform([](double v) { return v > 0.0 ? v : 0.0; });
        }
        activation = z;
    }
    return sigmoid(activation(0));
}

nlohmann::json NeuralNetworkKernel::toJson() const {
    json serializedLayers = json::array();
    for (const auto &layer : layers) {
        json entry;
        entry["weights"] = matToJson(layer.weights);
        entry["bias"] = vecToJson(layer.bias);
        serializedLayers.push_back(entry);
    }
    json parameters;
    parameters["layers"] = serializedLayers;
    return parameters;
}

shared_ptr<const NeuralNetworkKernel> NeuralNetworkKernel::fromJson(const nlohmann::json &parameters) {
    if (!parameters.is_object() || !parameters.contains("layers") || !parameters["layers"].is_array()) {
        throw invalid_argument("network parameters have no layers");
    }
    vector<DenseLayer> layers;
    for (const auto &entry : parameters["layers"]) {
        if (!entry.is_object() || !entry.contains("weights") || !entry.contains("bias")) {
            throw invalid_argument("network layer is incomplete");
        }
        layers.push_back(DenseLayer{matFromJson(entry["weights"]), vecFromJson(entry["bias"])});
    }
    return make_shared<const NeuralNetworkKernel>(std::move(layers));
}

NeuralNetworkClassifier::NeuralNetworkClassifier(string name, vector<int> hiddenLayers, int epochs,
                                                 double learningRate, int batchSize, unsigned int seed)
    : name(std::move(name)),
      hiddenLayers(std::move(hiddenLayers)),
      epochs(epochs),
      learningRate(learningRate),
      batchSize(batchSize),
      seed(seed) {
    if (epochs <= 0 || batchSize <= 0 || !(learningRate > 0.0)) {
        throw invalid_argument("epochs, batch size and learning rate must be positive");
    }
    for (int units : this->hiddenLayers) {
        if (units <= 0) {
            throw invalid_argument("hidden layers need at least one unit");
        }
    }
}

shared_ptr<const ClassifierKernel> NeuralNetworkClassifier::restoreKernel(const nlohmann::json &parameters) const {
    return NeuralNetworkKernel::fromJson(parameters);
}

shared_ptr<const ClassifierKernel> NeuralNetworkClassifier::train(const arma::mat &features,
                                                                  const arma::vec &labels) const {
    const arma::uword n = features.n_rows;
    mt19937 generator(seed);

    vector<arma::uword> sizes;
    sizes.push_back(features.n_cols);
    for (int units : hiddenLayers) {
        sizes.push_back(static_cast<arma::uword>(units));
    }
    sizes.push_back(1);

    // He initialisation, zero bias
    vector<DenseLayer> layers;
    for (size_t l = 1; l < sizes.size(); l++) {
        DenseLayer layer{arma::mat(sizes[l], sizes[l - 1]), arma::vec(sizes[l], arma::fill::zeros)};
        double scale = sqrt(2.0 / static_cast<double>(sizes[l - 1]));
        for (arma::uword r = 0; r < layer.weights.n_rows; r++) {
            for (arma::uword c = 0; c < layer.weights.n_cols; c++) {
                layer.weights(r, c) = standardNormal(generator) * scale;
            }
        }
        layers.push_back(layer);
    }

    vector<DenseLayer> firstMoment, secondMoment;
    for (const auto &layer : layers) {
        DenseLayer zero{arma::mat(arma::size(layer.weights), arma::fill::zeros),
                        arma::vec(layer.bias.n_elem, arma::fill::zeros)};
        firstMoment.push_back(zero);
        secondMoment.push_back(zero);
    }

    size_t step = 0;
    const arma::uword batch = static_cast<arma::uword>(batchSize);
    for (int epoch = 0; epoch < epochs; epoch++) {
        vector<size_t> order = Utils::shuffledIndices(n, generator);
        double epochLoss = 0.0;
        for (arma::uword start = 0; start < n; start += batch) {
            arma::uword end = min(n, start + batch);
            arma::uvec rows(end - start);
            for (arma::uword k = start; k < end; k++) {
                rows(k - start) = order[k];
            }
            arma::mat input = features.rows(rows);
            arma::vec target = labels.elem(rows);
            const double m = static_cast<double>(rows.n_elem);

            vector<arma::mat> z = forward(layers, input);
            arma::vec probability = z.back().col(0);
            probability.transform([](double v) { return sigmoid(v); });
            for (arma::uword k = 0; k < probability.n_elem; k++) {
                double p = min(max(probability(k), 1e-12), 1.0 - 1e-12);
                epochLoss -= target(k) * log(p) + (1.0 - target(k)) * log(1.0 - p);
            }

            arma::mat delta = (probability - target) / m;
            step++;
            for (size_t l = layers.size(); l-- > 0;) {
                arma::mat previous;
                if (l == 0) {
                    previous = input;
                } else {
                    previous = z[l - 1];
                    previous.transform([](double v) { return v > 0.0 ? v : 0.0; });
                }
                arma::mat weightGradient = delta.t() * previous;
                arma::vec biasGradient = arma::sum(delta, 0).t();

                arma::mat nextDelta;
                if (l > 0) {
                    nextDelta = delta * layers[l].weights;
                    nextDelta %= arma::conv_to<arma::mat>::from(z[l - 1] > 0.0);
                }

                double correction1 = 1.0 - pow(ADAM_BETA1, static_cast<double>(step));
                double correction2 = 1.0 - pow(ADAM_BETA2, static_cast<double>(step));
                firstMoment[l].weights = ADAM_BETA1 * firstMoment[l].weights + (1.0 - ADAM_BETA1) * weightGradient;
                secondMoment[l].weights =
                    ADAM_BETA2 * secondMoment[l].weights + (1.0 - ADAM_BETA2) * arma::square(weightGradient);
                firstMoment[l].bias = ADAM_BETA1 * firstMoment[l].bias + (1.0 - ADAM_BETA1) * biasGradient;
                secondMoment[l].bias =
                    ADAM_BETA2 * secondMoment[l].bias + (1.0 - ADAM_BETA2) * arma::square(biasGradient);
                layers[l].weights -= learningRate * (firstMoment[l].weights / correction1) /
                                     (arma::sqrt(secondMoment[l].weights / correction2) + ADAM_EPSILON);
                layers[l].bias -= learningRate * (firstMoment[l].bias / correction1) /
                                  (arma::sqrt(secondMoment[l].bias / correction2) + ADAM_EPSILON);

                delta = nextDelta;
            }
        }
        if (!isfinite(epochLoss)) {
            throw TrainingError(name + " loss diverged at epoch " + to_string(epoch));
        }
        if (epoch % 50 == 0 || epoch + 1 == epochs) {
            network_logger.debug(name + " epoch " + to_string(epoch) + " loss " + to_string(epochLoss / n));
        }
    }
    return make_shared<const NeuralNetworkKernel>(std::move(layers));
}
