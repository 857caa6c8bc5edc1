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


#include "ClassifierFactory.h"

#include <map>
#include <stdexcept>

#include "../util/Conts.h"
#include "LinearSvmClassifier.h"
#include "NaiveBayesClassifier.h"
#include "NeuralNetworkClassifier.h"
#include "SvmClassifier.h"
#include "VotingClassifier.h"

using namespace std;

static const map<string, string> &aliases() {
    static const map<string, string> table = {
        {"nb", Conts::CLASSIFIER::NAIVE_BAYES},
        {"lsvm", Conts::CLASSIFIER::LINEAR_SVM},
        {"svm", Conts::CLASSIFIER::SVM},
        {"slp", Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON},
        {"mlp", Conts::CLASSIFIER::MULTI_LAYER_PERCEPTRON},
    };
    return table;
}

vector<string> ClassifierFactory::getAlgorithms() {
    return {Conts::CLASSIFIER::NAIVE_BAYES, Conts::CLASSIFIER::LINEAR_SVM, Conts::CLASSIFIER::SVM,
            Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON, Conts::CLASSIFIER::MULTI_LAYER_PERCEPTRON,
            Conts::CLASSIFIER::VOTING};
}

string ClassifierFactory::canonicalName(const string &name) {
    auto alias = aliases().find(name);
    if (alias != aliases().end()) {
        return alias->second;
    }
    for (const auto &algorithm : getAlgorithms()) {
        if (algorithm == name) return algorithm;
    }
    throw invalid_argument("Unknown classifier: " + name);
}

unique_ptr<Classifier> ClassifierFactory::create(const string &name, const ClassifierParameters &parameters) {
    string algorithm = canonicalName(name);
    if (algorithm == Conts::CLASSIFIER::NAIVE_BAYES) {
        return make_unique<NaiveBayesClassifier>(parameters.binarize, parameters.alpha);
    }
    if (algorithm == Conts::CLASSIFIER::LINEAR_SVM) {
        return make_unique<LinearSvmClassifier>(parameters.svmC, parameters.linearSvmEpochs, parameters.seed);
    }
    if (algorithm == Conts::CLASSIFIER::SVM) {
        return make_unique<SvmClassifier>(parameters.svmC, parameters.svmGamma, parameters.svmTolerance,
                                          parameters.svmMaxPasses, parameters.seed);
    }
    if (algorithm == Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON) {
        return make_unique<NeuralNetworkClassifier>(algorithm, vector<int>(), parameters.epochs,
                                                    parameters.learningRate, parameters.batchSize, parameters.seed);
    }
    if (algorithm == Conts::CLASSIFIER::VOTING) {
        vector<unique_ptr<Classifier>> members;
        for (const auto &member : parameters.votingMembers) {
            if (canonicalName(member) == Conts::CLASSIFIER::VOTING) {
                throw invalid_argument("A voting ensemble cannot contain another voting ensemble");
            }
            members.push_back(create(member, parameters));
        }
        return make_unique<VotingClassifier>(parameters.votingMode, std::move(members));
    }
    if (parameters.hiddenLayers.empty()) {
        throw invalid_argument("A multi layer perceptron needs at least one hidden layer");
    }
    return make_unique<NeuralNetworkClassifier>(algorithm, parameters.hiddenLayers, parameters.epochs,
                                                parameters.learningRate, parameters.batchSize, parameters.seed);
}
