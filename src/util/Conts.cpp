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


#include "Conts.h"

const std::string Conts::CATALOGLINKER_HOME = "CATALOGLINKER_HOME";
const std::string Conts::CATALOGLINKER_PROPERTIES_FILE = "conf/cataloglinker.properties";
const int Conts::MODEL_FORMAT_VERSION = 1;

const std::string Conts::PROPERTY::LOG_LEVEL = "org.cataloglinker.log.level";
const std::string Conts::PROPERTY::LOG_FILE = "org.cataloglinker.log.file";
const std::string Conts::PROPERTY::WORKERS = "org.cataloglinker.workers";
const std::string Conts::PROPERTY::ENTITY_REQUIRED = "org.cataloglinker.entity.required";
const std::string Conts::PROPERTY::BLOCKING_STRATEGIES = "org.cataloglinker.blocking.strategies";
const std::string Conts::PROPERTY::BLOCKING_ATTRIBUTE = "org.cataloglinker.blocking.attribute";
const std::string Conts::PROPERTY::BLOCKING_FULLTEXT_LIMIT = "org.cataloglinker.blocking.fulltext.limit";
const std::string Conts::PROPERTY::FEATURES = "org.cataloglinker.features";
const std::string Conts::PROPERTY::STRING_METRIC = "org.cataloglinker.features.string.metric";
const std::string Conts::PROPERTY::STRING_THRESHOLD = "org.cataloglinker.features.string.threshold";
const std::string Conts::PROPERTY::LINK_SAME_ID_SPACE = "org.cataloglinker.features.link.same_id_space";
const std::string Conts::PROPERTY::CLASSIFIER = "org.cataloglinker.classifier";
const std::string Conts::PROPERTY::NB_BINARIZE = "org.cataloglinker.classifier.nb.binarize";
const std::string Conts::PROPERTY::NB_ALPHA = "org.cataloglinker.classifier.nb.alpha";
const std::string Conts::PROPERTY::SVM_C = "org.cataloglinker.classifier.svm.c";
const std::string Conts::PROPERTY::SVM_GAMMA = "org.cataloglinker.classifier.svm.gamma";
const std::string Conts::PROPERTY::SVM_TOLERANCE = "org.cataloglinker.classifier.svm.tolerance";
const std::string Conts::PROPERTY::SVM_MAX_PASSES = "org.cataloglinker.classifier.svm.max_passes";
const std::string Conts::PROPERTY::LSVM_EPOCHS = "org.cataloglinker.classifier.lsvm.epochs";
const std::string Conts::PROPERTY::NN_EPOCHS = "org.cataloglinker.classifier.nn.epochs";
const std::string Conts::PROPERTY::NN_LEARNING_RATE = "org.cataloglinker.classifier.nn.learning_rate";
const std::string Conts::PROPERTY::NN_BATCH_SIZE = "org.cataloglinker.classifier.nn.batch_size";
const std::string Conts::PROPERTY::MLP_HIDDEN_LAYERS = "org.cataloglinker.classifier.mlp.hidden_layers";
const std::string Conts::PROPERTY::CLASSIFIER_SEED = "org.cataloglinker.classifier.seed";
const std::string Conts::PROPERTY::VOTING_MEMBERS = "org.cataloglinker.classifier.voting.members";
const std::string Conts::PROPERTY::VOTING_MODE = "org.cataloglinker.classifier.voting.mode";
const std::string Conts::PROPERTY::MERGE_STRATEGY = "org.cataloglinker.merge.strategy";
const std::string Conts::PROPERTY::DECISION_THRESHOLD = "org.cataloglinker.decision.threshold";
const std::string Conts::PROPERTY::DECISION_UNDECIDED_MARGIN = "org.cataloglinker.decision.undecided_margin";
const std::string Conts::PROPERTY::CV_FOLDS = "org.cataloglinker.cv.folds";
const std::string Conts::PROPERTY::CV_SEED = "org.cataloglinker.cv.seed";
const std::string Conts::PROPERTY::RULE_FEATURES = "org.cataloglinker.rule.features";
const std::string Conts::PROPERTY::RULE_FAST_PATH = "org.cataloglinker.rule.fast_path";
const std::string Conts::PROPERTY::RULE_NAME = "org.cataloglinker.rule.name";
const std::string Conts::PROPERTY::RULE_SOURCE_URL = "org.cataloglinker.rule.source_url";
const std::string Conts::PROPERTY::RULE_SOURCE_URL_PATTERN = "org.cataloglinker.rule.source_url.pattern";
const std::string Conts::PROPERTY::MODEL_DIRECTORY = "org.cataloglinker.model.directory";
const std::string Conts::PROPERTY::SQLITE_TABLE = "org.cataloglinker.sqlite.table";
const std::string Conts::PROPERTY::SQLITE_ID_COLUMN = "org.cataloglinker.sqlite.id_column";
const std::string Conts::PROPERTY::SQLITE_COLUMNS = "org.cataloglinker.sqlite.columns";

const std::string Conts::ATTRIBUTE::NAME = "name";
const std::string Conts::ATTRIBUTE::BIRTH_DATE = "birth_date";
const std::string Conts::ATTRIBUTE::DEATH_DATE = "death_date";
const std::string Conts::ATTRIBUTE::URL = "url";
const std::string Conts::ATTRIBUTE::OCCUPATIONS = "occupations";
const std::string Conts::ATTRIBUTE::DESCRIPTION = "description";
const std::string Conts::ATTRIBUTE::GENRES = "genres";

const std::string Conts::FEATURE::NAME_EXACT = "name_exact";
const std::string Conts::FEATURE::NAME_SIMILARITY = "name_similarity";
const std::string Conts::FEATURE::NAME_TOKENS = "name_tokens";
const std::string Conts::FEATURE::BIRTH_DATE = "birth_date";
const std::string Conts::FEATURE::DEATH_DATE = "death_date";
const std::string Conts::FEATURE::URL_EXACT = "url_exact";
const std::string Conts::FEATURE::URL_TOKENS = "url_tokens";
const std::string Conts::FEATURE::SHARED_OCCUPATIONS = "shared_occupations";
const std::string Conts::FEATURE::NAME_CHARACTER_COSINE = "name_character_cosine";
const std::string Conts::FEATURE::DESCRIPTION_COSINE = "description_cosine";
const std::string Conts::FEATURE::SHARED_GENRES = "shared_genres";
const std::vector<std::string> Conts::FEATURE::ALL = {
    Conts::FEATURE::NAME_EXACT,         Conts::FEATURE::NAME_SIMILARITY,       Conts::FEATURE::NAME_TOKENS,
    Conts::FEATURE::BIRTH_DATE,         Conts::FEATURE::DEATH_DATE,            Conts::FEATURE::URL_EXACT,
    Conts::FEATURE::URL_TOKENS,         Conts::FEATURE::SHARED_OCCUPATIONS,    Conts::FEATURE::NAME_CHARACTER_COSINE,
    Conts::FEATURE::DESCRIPTION_COSINE, Conts::FEATURE::SHARED_GENRES};

const std::string Conts::BLOCKING::NAME_TOKEN = "name_token";
const std::string Conts::BLOCKING::EXACT_ATTRIBUTE = "exact_attribute";
const std::string Conts::BLOCKING::URL = "url";
const std::string Conts::BLOCKING::FULL_TEXT = "full_text";
const std::vector<std::string> Conts::BLOCKING::ALL = {Conts::BLOCKING::NAME_TOKEN, Conts::BLOCKING::EXACT_ATTRIBUTE,
                                                       Conts::BLOCKING::URL, Conts::BLOCKING::FULL_TEXT};

const std::string Conts::STRING_METRIC::LEVENSHTEIN = "levenshtein";
const std::string Conts::STRING_METRIC::JARO_WINKLER = "jaro_winkler";

const std::string Conts::CLASSIFIER::NAIVE_BAYES = "naive_bayes";
const std::string Conts::CLASSIFIER::LINEAR_SVM = "linear_svm";
const std::string Conts::CLASSIFIER::SVM = "svm";
const std::string Conts::CLASSIFIER::SINGLE_LAYER_PERCEPTRON = "single_layer_perceptron";
const std::string Conts::CLASSIFIER::MULTI_LAYER_PERCEPTRON = "multi_layer_perceptron";
const std::string Conts::CLASSIFIER::VOTING = "voting";

const std::string Conts::VOTING_MODE::SOFT = "soft";
const std::string Conts::VOTING_MODE::HARD = "hard";

const std::string Conts::MERGE::MAJORITY_VOTE = "majority_vote";
const std::string Conts::MERGE::UNION = "union";
const std::string Conts::MERGE::INTERSECTION = "intersection";
const std::vector<std::string> Conts::MERGE::ALL = {Conts::MERGE::MAJORITY_VOTE, Conts::MERGE::UNION,
                                                    Conts::MERGE::INTERSECTION};

const std::string Conts::RULE_PRESET::PERFECT_NAME = "perfect_name";
const std::string Conts::RULE_PRESET::LINKS = "links";
const std::string Conts::RULE_PRESET::NAME_AND_LINK = "name_and_link";

const std::string Conts::ATTRIBUTE_KIND::STRING = "string";
const std::string Conts::ATTRIBUTE_KIND::DATE = "date";
const std::string Conts::ATTRIBUTE_KIND::LINK = "link";
const std::string Conts::ATTRIBUTE_KIND::TOKENS = "tokens";
