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


#include "LinkerConfig.h"

#include <algorithm>
#include <stdexcept>

#include "Conts.h"
#include "Utils.h"

using namespace std;

static const string *findProperty(const map<string, string> &properties, const string &key) {
    auto it = properties.find(key);
    if (it == properties.end()) return nullptr;
    return &it->second;
}

static double parseDouble(const string &key, const string &value) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error &) {
        throw std::invalid_argument("Property " + key + " is not a number: '" + value + "'");
    }
}

static int parseInt(const string &key, const string &value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error &) {
        throw std::invalid_argument("Property " + key + " is not an integer: '" + value + "'");
    }
}

static void readString(const map<string, string> &properties, const string &key, string &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) out = *value;
}

static void readInt(const map<string, string> &properties, const string &key, int &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) out = parseInt(key, *value);
}

static void readUnsigned(const map<string, string> &properties, const string &key, unsigned int &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) {
        int parsed = parseInt(key, *value);
        if (parsed < 0) throw std::invalid_argument("Property " + key + " must not be negative");
        out = static_cast<unsigned int>(parsed);
    }
}

static void readDouble(const map<string, string> &properties, const string &key, double &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) out = parseDouble(key, *value);
}

// A present but empty value clears the option
static void readOptionalDouble(const map<string, string> &properties, const string &key, optional<double> &out) {
    const string *value = findProperty(properties, key);
    if (!value) return;
    if (value->empty()) {
        out.reset();
    } else {
        out = parseDouble(key, *value);
    }
}

static void readBool(const map<string, string> &properties, const string &key, bool &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) out = Utils::parseBoolean(*value);
}

static void readList(const map<string, string> &properties, const string &key, vector<string> &out) {
    const string *value = findProperty(properties, key);
    if (value && !value->empty()) out = Utils::splitAndTrim(*value, ',');
}

LinkerConfig LinkerConfig::fromProperties(const map<string, string> &properties) {
    LinkerConfig config;
    readString(properties, Conts::PROPERTY::LOG_LEVEL, config.logLevel);
    readInt(properties, Conts::PROPERTY::WORKERS, config.workers);

    vector<string> required;
    readList(properties, Conts::PROPERTY::ENTITY_REQUIRED, required);
    config.requiredAttributes.insert(required.begin(), required.end());

    readList(properties, Conts::PROPERTY::BLOCKING_STRATEGIES, config.blockingStrategies);
    readString(properties, Conts::PROPERTY::BLOCKING_ATTRIBUTE, config.blockingAttribute);
    readInt(properties, Conts::PROPERTY::BLOCKING_FULLTEXT_LIMIT, config.fullTextLimit);

    readList(properties, Conts::PROPERTY::FEATURES, config.features);
    readString(properties, Conts::PROPERTY::STRING_METRIC, config.stringMetric);
    readOptionalDouble(properties, Conts::PROPERTY::STRING_THRESHOLD, config.stringThreshold);
    readBool(properties, Conts::PROPERTY::LINK_SAME_ID_SPACE, config.linkSameIdSpace);

    readString(properties, Conts::PROPERTY::CLASSIFIER, config.classifier);
    ClassifierParameters &parameters = config.classifierParameters;
    readOptionalDouble(properties, Conts::PROPERTY::NB_BINARIZE, parameters.binarize);
    readDouble(properties, Conts::PROPERTY::NB_ALPHA, parameters.alpha);
    readDouble(properties, Conts::PROPERTY::SVM_C, parameters.svmC);
    readDouble(properties, Conts::PROPERTY::SVM_GAMMA, parameters.svmGamma);
    readDouble(properties, Conts::PROPERTY::SVM_TOLERANCE, parameters.svmTolerance);
    readInt(properties, Conts::PROPERTY::SVM_MAX_PASSES, parameters.svmMaxPasses);
    readInt(properties, Conts::PROPERTY::LSVM_EPOCHS, parameters.linearSvmEpochs);
    readInt(properties, Conts::PROPERTY::NN_EPOCHS, parameters.epochs);
    readDouble(properties, Conts::PROPERTY::NN_LEARNING_RATE, parameters.learningRate);
    readInt(properties, Conts::PROPERTY::NN_BATCH_SIZE, parameters.batchSize);
    readUnsigned(properties, Conts::PROPERTY::CLASSIFIER_SEED, parameters.seed);
    readList(properties, Conts::PROPERTY::VOTING_MEMBERS, parameters.votingMembers);
    readString(properties, Conts::PROPERTY::VOTING_MODE, parameters.votingMode);
    readString(properties, Conts::PROPERTY::MERGE_STRATEGY, config.mergeStrategy);

    vector<string> hiddenLayers;
    readList(properties, Conts::PROPERTY::MLP_HIDDEN_LAYERS, hiddenLayers);
    if (!hiddenLayers.empty()) {
        parameters.hiddenLayers.clear();
        for (const auto &layer : hiddenLayers) {
            parameters.hiddenLayers.push_back(parseInt(Conts::PROPERTY::MLP_HIDDEN_LAYERS, layer));
        }
    }

    readDouble(properties, Conts::PROPERTY::DECISION_THRESHOLD, config.decisionThreshold);
    readDouble(properties, Conts::PROPERTY::DECISION_UNDECIDED_MARGIN, config.undecidedMargin);
    readInt(properties, Conts::PROPERTY::CV_FOLDS, config.folds);
    readUnsigned(properties, Conts::PROPERTY::CV_SEED, config.cvSeed);

    readList(properties, Conts::PROPERTY::RULE_FEATURES, config.ruleFeatures);
    readBool(properties, Conts::PROPERTY::RULE_FAST_PATH, config.ruleFastPath);
    readBool(properties, Conts::PROPERTY::RULE_NAME, config.nameRule);
    readBool(properties, Conts::PROPERTY::RULE_SOURCE_URL, config.sourceUrlRule);
    readString(properties, Conts::PROPERTY::RULE_SOURCE_URL_PATTERN, config.sourceUrlPattern);

    readString(properties, Conts::PROPERTY::MODEL_DIRECTORY, config.modelDirectory);
    readString(properties, Conts::PROPERTY::SQLITE_TABLE, config.sqliteTable);
    readString(properties, Conts::PROPERTY::SQLITE_ID_COLUMN, config.sqliteIdColumn);
    readString(properties, Conts::PROPERTY::SQLITE_COLUMNS, config.sqliteColumns);

    config.validate();
    return config;
}

LinkerConfig LinkerConfig::load() {
    return fromProperties(Utils::loadProperties(Utils::getCatalogLinkerHome() + Conts::CATALOGLINKER_PROPERTIES_FILE));
}

static void requireKnown(const string &what, const string &value, const vector<string> &known) {
    if (std::find(known.begin(), known.end(), value) == known.end()) {
        throw std::invalid_argument("Unknown " + what + ": " + value);
    }
}

void LinkerConfig::validate() const {
    if (decisionThreshold < 0.0 || decisionThreshold > 1.0) {
        throw std::invalid_argument("Decision threshold must be within [0, 1]");
    }
    if (undecidedMargin < 0.0 || undecidedMargin > decisionThreshold) {
        throw std::invalid_argument("Undecided margin must be within [0, threshold]");
    }
    if (folds < 2) {
        throw std::invalid_argument("Cross-validation needs at least 2 folds");
    }
    if (workers < 0) {
        throw std::invalid_argument("Worker count must not be negative");
    }
    if (fullTextLimit <= 0) {
        throw std::invalid_argument("Full text blocking limit must be positive");
    }
    if (blockingStrategies.empty()) {
        throw std::invalid_argument("At least one blocking strategy is required");
    }
    for (const auto &strategy : blockingStrategies) {
        requireKnown("blocking strategy", strategy, Conts::BLOCKING::ALL);
    }
    if (features.empty()) {
        throw std::invalid_argument("At least one feature is required");
    }
    for (const auto &feature : features) {
        requireKnown("feature", feature, Conts::FEATURE::ALL);
        if (std::count(features.begin(), features.end(), feature) > 1) {
            throw std::invalid_argument("Duplicate feature: " + feature);
        }
    }
    requireKnown("string similarity metric", stringMetric,
                 {Conts::STRING_METRIC::LEVENSHTEIN, Conts::STRING_METRIC::JARO_WINKLER});
    if (stringThreshold && (*stringThreshold < 0.0 || *stringThreshold > 1.0)) {
        throw std::invalid_argument("String similarity threshold must be within [0, 1]");
    }
    for (const auto &feature : ruleFeatures) {
        if (std::find(features.begin(), features.end(), feature) == features.end()) {
            throw std::invalid_argument("Rule feature " + feature + " is not part of the feature set");
        }
    }

    const ClassifierParameters &parameters = classifierParameters;
    if (parameters.alpha <= 0.0 || parameters.svmC <= 0.0 || parameters.svmGamma < 0.0 ||
        parameters.svmTolerance <= 0.0 || parameters.learningRate <= 0.0) {
        throw std::invalid_argument("Classifier parameters alpha, C, tolerance and learning rate must be positive");
    }
    if (parameters.svmMaxPasses <= 0 || parameters.linearSvmEpochs <= 0 || parameters.epochs <= 0 ||
        parameters.batchSize <= 0) {
        throw std::invalid_argument("Classifier epochs, passes and batch size must be positive");
    }
    for (int layer : parameters.hiddenLayers) {
        if (layer <= 0) throw std::invalid_argument("Hidden layer sizes must be positive");
    }
    requireKnown("voting mode", parameters.votingMode, {Conts::VOTING_MODE::SOFT, Conts::VOTING_MODE::HARD});
    if (parameters.votingMembers.empty()) {
        throw std::invalid_argument("A voting ensemble needs at least one member");
    }
    requireKnown("merge strategy", mergeStrategy, Conts::MERGE::ALL);
}
