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


#ifndef CATALOGLINKER_NEURALNETWORKCLASSIFIER_H
#define CATALOGLINKER_NEURALNETWORKCLASSIFIER_H

#include <vector>

#include "Classifier.h"

struct DenseLayer {
    arma::mat weights;  // outputs x inputs
    arma::vec bias;
};

class NeuralNetworkKernel : public ClassifierKernel {
 public:
    explicit NeuralNetworkKernel(std::vector<DenseLayer> layers);

    // Sigmoid of the output unit
    double decisionValue(const arma::rowvec &features) const override;
    nlohmann::json toJson() const override;

    const std::vector<DenseLayer> &getLayers() const { return layers; }

    static std::shared_ptr<const NeuralNetworkKernel> fromJson(const nlohmann::json &parameters);

 private:
    std::vector<DenseLayer> layers;
};

/**
 * Feed-forward network with ReLU hidden layers and one sigmoid output, trained on binary
 * cross-entropy with Adam over shuffled mini-batches. With no hidden layers this is the
 * single layer perceptron.
 */
class NeuralNetworkClassifier : public Classifier {
 public:
    NeuralNetworkClassifier(std::string name, std::vector<int> hiddenLayers, int epochs, double learningRate,
                            int batchSize, unsigned int seed);

    std::string getName() const override { return name; }
    bool isCalibrated() const override { return true; }
    std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const override;

 protected:
    std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const override;

 private:
    std::string name;
    std::vector<int> hiddenLayers;
    int epochs;
    double learningRate;
    int batchSize;
    unsigned int seed;
};

#endif  // CATALOGLINKER_NEURALNETWORKCLASSIFIER_H
