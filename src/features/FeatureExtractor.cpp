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


#include "FeatureExtractor.h"

#include <optional>
#include <stdexcept>

#include "../util/Conts.h"
#include "../util/logger/Logger.h"

Logger features_logger;

std::unique_ptr<Feature> FeatureExtractor::createFeature(const std::string &featureId, const LinkerConfig &config) {
    StringMetric metric = stringMetricFromString(config.stringMetric);
    if (featureId == Conts::FEATURE::NAME_EXACT) {
        return std::make_unique<ExactMatchFeature>(featureId, Conts::ATTRIBUTE::NAME);
    } else if (featureId == Conts::FEATURE::NAME_SIMILARITY) {
        return std::make_unique<StringSimilarityFeature>(featureId, Conts::ATTRIBUTE::NAME, metric,
                                                         config.stringThreshold);
    } else if (featureId == Conts::FEATURE::NAME_TOKENS) {
        return std::make_unique<SharedTokensFeature>(featureId, Conts::ATTRIBUTE::NAME, TokenSource::NAME_TOKENS);
    } else if (featureId == Conts::FEATURE::BIRTH_DATE) {
        return std::make_unique<DateSimilarityFeature>(featureId, Conts::ATTRIBUTE::BIRTH_DATE);
    } else if (featureId == Conts::FEATURE::DEATH_DATE) {
        return std::make_unique<DateSimilarityFeature>(featureId, Conts::ATTRIBUTE::DEATH_DATE);
    } else if (featureId == Conts::FEATURE::URL_EXACT) {
        return std::make_unique<LinkAgreementFeature>(featureId, Conts::ATTRIBUTE::URL, config.linkSameIdSpace);
    } else if (featureId == Conts::FEATURE::URL_TOKENS) {
        return std::make_unique<SharedTokensFeature>(featureId, Conts::ATTRIBUTE::URL, TokenSource::URL_TOKENS);
    } else if (featureId == Conts::FEATURE::SHARED_OCCUPATIONS) {
        return std::make_unique<SharedTokensFeature>(featureId, Conts::ATTRIBUTE::OCCUPATIONS,
                                                     TokenSource::TOKEN_SET);
    } else if (featureId == Conts::FEATURE::NAME_CHARACTER_COSINE) {
        return std::make_unique<CosineSimilarityFeature>(featureId, Conts::ATTRIBUTE::NAME,
                                                         TermSource::CHARACTER_BIGRAMS);
    } else if (featureId == Conts::FEATURE::DESCRIPTION_COSINE) {
        return std::make_unique<CosineSimilarityFeature>(featureId, Conts::ATTRIBUTE::DESCRIPTION, TermSource::WORDS);
    } else if (featureId == Conts::FEATURE::SHARED_GENRES) {
        return std::make_unique<SharedTokensFeature>(featureId, Conts::ATTRIBUTE::GENRES, TokenSource::TOKEN_WORDS,
                                                     TokenOverlap::OVERLAP_COEFFICIENT);
    }
    throw std::invalid_argument("Unknown feature: " + featureId);
}

FeatureExtractor FeatureExtractor::fromConfig(const LinkerConfig &config) {
    FeatureExtractor extractor;
    for (const auto &featureId : config.features) {
        extractor.addFeature(createFeature(featureId, config));
    }
    features_logger.info("Feature schema " + extractor.getSchema().getHash() + " with " +
                         std::to_string(extractor.getSchema().size()) + " features");
    return extractor;
}

void FeatureExtractor::addFeature(std::unique_ptr<Feature> feature) {
    if (schema.indexOf(feature->getId()) >= 0) {
        throw std::invalid_argument("Duplicate feature id: " + feature->getId());
    }
    std::vector<std::string> ids = schema.getFeatureIds();
    ids.push_back(feature->getId());
    features.push_back(std::move(feature));
    schema = FeatureSchema(ids);
}

FeatureVector FeatureExtractor::extract(const CandidatePair &pair, const Entity &source, const Entity &target) const {
    FeatureVector vector;
    vector.pair = pair;
    vector.values.reserve(features.size());
    for (const auto &feature : features) {
        vector.values.push_back(feature->compute(source, target));
    }
    return vector;
}

FeatureMatrix FeatureExtractor::extractAll(const std::vector<CandidatePair> &pairs, const EntityCollection &source,
                                           const EntityCollection &target, ParallelExecutor &executor,
                                           std::vector<PairError> &errors) const {
    struct Extraction {
        std::optional<FeatureVector> vector;
        std::optional<PairError> error;
    };

    std::vector<Extraction> extractions = executor.map<Extraction>(pairs.size(), [&](size_t index) {
        const CandidatePair &pair = pairs[index];
        Extraction extraction;
        const Entity *sourceEntity = source.find(pair.sourceId);
        const Entity *targetEntity = target.find(pair.targetId);
        if (sourceEntity == nullptr || targetEntity == nullptr) {
            extraction.error = PairError{pair.sourceId, pair.targetId, "extract", "unknown entity"};
            return extraction;
        }
        try {
            extraction.vector = extract(pair, *sourceEntity, *targetEntity);
        } catch (const std::exception &e) {
            extraction.error = PairError{pair.sourceId, pair.targetId, "extract", e.what()};
        }
        return extraction;
    });

    FeatureMatrix matrix;
    matrix.schema = schema;
    matrix.vectors.reserve(extractions.size());
    for (auto &extraction : extractions) {
        if (extraction.vector) {
            matrix.vectors.push_back(std::move(*extraction.vector));
        } else if (extraction.error) {
            features_logger.warn("Feature extraction failed " + extraction.error->toString());
            errors.push_back(*extraction.error);
        }
    }
    features_logger.info("Extracted " + std::to_string(matrix.vectors.size()) + " feature vectors from " +
                         std::to_string(pairs.size()) + " candidate pairs");
    return matrix;
}
