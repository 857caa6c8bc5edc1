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


#ifndef CATALOGLINKER_LINKERCONFIG_H
#define CATALOGLINKER_LINKERCONFIG_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct ClassifierParameters {
    // Naive Bayes: features above the threshold count as 1. Unset requires binary input.
    std::optional<double> binarize = 0.1;
    double alpha = 1.0;

    double svmC = 1.0;
    // RBF width, 0 picks 1 / (features * variance)
    double svmGamma = 0.0;
    double svmTolerance = 1e-3;
    int svmMaxPasses = 5;
    int linearSvmEpochs = 50;

    int epochs = 200;
    double learningRate = 0.01;
    int batchSize = 1024;
    std::vector<int> hiddenLayers = {128, 32};

    unsigned int seed = 1269;

    // Voting ensemble: member algorithms, and soft (mean probability) or hard (majority label) voting
    std::vector<std::string> votingMembers = {"naive_bayes", "single_layer_perceptron", "svm"};
    std::string votingMode = "soft";
};

/**
 * Typed view over the cataloglinker properties. Every field starts at its default, so a
 * properties file only needs to name what it changes.
 */
struct LinkerConfig {
    std::string logLevel = "info";
    int workers = 0;
    std::set<std::string> requiredAttributes;

    std::vector<std::string> blockingStrategies = {"name_token", "url"};
    std::string blockingAttribute = "name";
    int fullTextLimit = 5;

    std::vector<std::string> features = {"name_exact",  "name_similarity", "name_tokens",
                                         "birth_date",  "death_date",      "url_exact",
                                         "url_tokens",  "shared_occupations"};
    std::string stringMetric = "levenshtein";
    std::optional<double> stringThreshold;
    bool linkSameIdSpace = true;

    std::string classifier = "naive_bayes";
    ClassifierParameters classifierParameters;

    // majority_vote, union or intersection, applied when several models link together
    std::string mergeStrategy = "majority_vote";

    double decisionThreshold = 0.5;
    double undecidedMargin = 0.0;

    int folds = 5;
    unsigned int cvSeed = 1269;

    std::vector<std::string> ruleFeatures = {"name_exact", "birth_date"};
    bool ruleFastPath = true;
    bool nameRule = false;
    bool sourceUrlRule = true;
    std::string sourceUrlPattern = "wikidata\\.org/(?:wiki|entity)/(Q[0-9]+)";

    std::string modelDirectory = "models";

    std::string sqliteTable = "target_entity";
    std::string sqliteIdColumn = "catalog_id";
    // column:attribute:kind triples
    std::string sqliteColumns = "name:name:string,born:birth_date:date,died:death_date:date,url:url:link";

    /**
     * Builds a configuration from parsed properties. Throws std::invalid_argument for malformed
     * numbers, unknown names or out of range values.
     */
    static LinkerConfig fromProperties(const std::map<std::string, std::string> &properties);

    // Reads conf/cataloglinker.properties through Utils
    static LinkerConfig load();

    void validate() const;
};

#endif  // CATALOGLINKER_LINKERCONFIG_H
