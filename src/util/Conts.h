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


#ifndef CATALOGLINKER_CONTS_H
#define CATALOGLINKER_CONTS_H

#include <string>
#include <vector>

class Conts {
 public:
    static const std::string CATALOGLINKER_HOME;
    static const std::string CATALOGLINKER_PROPERTIES_FILE;
    static const int MODEL_FORMAT_VERSION;

    struct PROPERTY {
        static const std::string LOG_LEVEL;
        static const std::string LOG_FILE;
        static const std::string WORKERS;
        static const std::string ENTITY_REQUIRED;
        static const std::string BLOCKING_STRATEGIES;
        static const std::string BLOCKING_ATTRIBUTE;
        static const std::string BLOCKING_FULLTEXT_LIMIT;
        static const std::string FEATURES;
        static const std::string STRING_METRIC;
        static const std::string STRING_THRESHOLD;
        static const std::string LINK_SAME_ID_SPACE;
        static const std::string CLASSIFIER;
        static const std::string NB_BINARIZE;
        static const std::string NB_ALPHA;
        static const std::string SVM_C;
        static const std::string SVM_GAMMA;
        static const std::string SVM_TOLERANCE;
        static const std::string SVM_MAX_PASSES;
        static const std::string LSVM_EPOCHS;
        static const std::string NN_EPOCHS;
        static const std::string NN_LEARNING_RATE;
        static const std::string NN_BATCH_SIZE;
        static const std::string MLP_HIDDEN_LAYERS;
        static const std::string CLASSIFIER_SEED;
        static const std::string VOTING_MEMBERS;
        static const std::string VOTING_MODE;
        static const std::string MERGE_STRATEGY;
        static const std::string DECISION_THRESHOLD;
        static const std::string DECISION_UNDECIDED_MARGIN;
        static const std::string CV_FOLDS;
        static const std::string CV_SEED;
        static const std::string RULE_FEATURES;
        static const std::string RULE_FAST_PATH;
        static const std::string RULE_NAME;
        static const std::string RULE_SOURCE_URL;
        static const std::string RULE_SOURCE_URL_PATTERN;
        static const std::string MODEL_DIRECTORY;
        static const std::string SQLITE_TABLE;
        static const std::string SQLITE_ID_COLUMN;
        static const std::string SQLITE_COLUMNS;
    };

    // Attribute names shared by the input adapters and the feature set
    struct ATTRIBUTE {
        static const std::string NAME;
        static const std::string BIRTH_DATE;
        static const std::string DEATH_DATE;
        static const std::string URL;
        static const std::string OCCUPATIONS;
        static const std::string DESCRIPTION;
        static const std::string GENRES;
    };

    struct FEATURE {
        static const std::string NAME_EXACT;
        static const std::string NAME_SIMILARITY;
        static const std::string NAME_TOKENS;
        static const std::string BIRTH_DATE;
        static const std::string DEATH_DATE;
        static const std::string URL_EXACT;
        static const std::string URL_TOKENS;
        static const std::string SHARED_OCCUPATIONS;
        static const std::string NAME_CHARACTER_COSINE;
        static const std::string DESCRIPTION_COSINE;
        static const std::string SHARED_GENRES;
        static const std::vector<std::string> ALL;
    };

    struct BLOCKING {
        static const std::string NAME_TOKEN;
        static const std::string EXACT_ATTRIBUTE;
        static const std::string URL;
        static const std::string FULL_TEXT;
        static const std::vector<std::string> ALL;
    };

    struct STRING_METRIC {
        static const std::string LEVENSHTEIN;
        static const std::string JARO_WINKLER;
    };

    struct CLASSIFIER {
        static const std::string NAIVE_BAYES;
        static const std::string LINEAR_SVM;
        static const std::string SVM;
        static const std::string SINGLE_LAYER_PERCEPTRON;
        static const std::string MULTI_LAYER_PERCEPTRON;
        static const std::string VOTING;
    };

    struct VOTING_MODE {
        static const std::string SOFT;
        static const std::string HARD;
    };

    // How the scores of several models for one pair are combined
    struct MERGE {
        static const std::string MAJORITY_VOTE;
        static const std::string UNION;
        static const std::string INTERSECTION;
        static const std::vector<std::string> ALL;
    };

    struct RULE_PRESET {
        static const std::string PERFECT_NAME;
        static const std::string LINKS;
        static const std::string NAME_AND_LINK;
    };

    struct ATTRIBUTE_KIND {
        static const std::string STRING;
        static const std::string DATE;
        static const std::string LINK;
        static const std::string TOKENS;
    };
};

#endif  // CATALOGLINKER_CONTS_H
