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


#ifndef CATALOGLINKER_FEATURE_H
#define CATALOGLINKER_FEATURE_H

#include <map>
#include <optional>
#include <string>

#include "../entity/Entity.h"
#include "Comparators.h"

/**
 * One column of the comparison vector. Implementations are stateless: compute() depends only on
 * the two entities, and a missing attribute on either side yields 0.
 */
class Feature {
 public:
    explicit Feature(std::string id, std::string attribute) : id(std::move(id)), attribute(std::move(attribute)) {}
    virtual ~Feature() = default;

    const std::string &getId() const { return id; }

    const std::string &getAttribute() const { return attribute; }

    virtual double compute(const Entity &source, const Entity &target) const = 0;

 protected:
    std::string id;
    std::string attribute;
};

/**
 * 1 when the two entities share a normalized value. Works on every attribute kind.
 */
class ExactMatchFeature : public Feature {
 public:
    ExactMatchFeature(std::string id, std::string attribute) : Feature(std::move(id), std::move(attribute)) {}

    double compute(const Entity &source, const Entity &target) const override;
};

/**
 * Maximum string similarity over all value pairs. With a threshold the result is binarized.
 */
class StringSimilarityFeature : public Feature {
 public:
    StringSimilarityFeature(std::string id, std::string attribute, StringMetric metric,
                            std::optional<double> threshold = std::nullopt)
        : Feature(std::move(id), std::move(attribute)), metric(metric), threshold(threshold) {}

    double compute(const Entity &source, const Entity &target) const override;

 private:
    StringMetric metric;
    std::optional<double> threshold;
};

class DateSimilarityFeature : public Feature {
 public:
    DateSimilarityFeature(std::string id, std::string attribute) : Feature(std::move(id), std::move(attribute)) {}

    double compute(const Entity &source, const Entity &target) const override;
};

enum class TokenSource {
    TOKEN_SET,    // the attribute already is a token set
    TEXT_TOKENS,  // word tokens of a string list
    NAME_TOKENS,  // word tokens of a string list minus name stopwords
    URL_TOKENS,   // host and path tokens of a link list
    TOKEN_WORDS   // words of every token of a token set
};

enum class TokenOverlap { JACCARD, OVERLAP_COEFFICIENT };

/**
 * Overlap of the tokens of both entities, Jaccard unless told otherwise
 */
class SharedTokensFeature : public Feature {
 public:
    SharedTokensFeature(std::string id, std::string attribute, TokenSource tokenSource,
                        TokenOverlap overlap = TokenOverlap::JACCARD)
        : Feature(std::move(id), std::move(attribute)), tokenSource(tokenSource), overlap(overlap) {}

    double compute(const Entity &source, const Entity &target) const override;

    std::set<std::string> collectTokens(const Entity &entity) const;

 private:
    TokenSource tokenSource;
    TokenOverlap overlap;
};

enum class TermSource {
    WORDS,             // word tokens, each counted once
    CHARACTER_BIGRAMS  // space padded character bigrams of every word, counted
};

/**
 * Cosine similarity of the term vectors built from all string values of the attribute
 */
class CosineSimilarityFeature : public Feature {
 public:
    CosineSimilarityFeature(std::string id, std::string attribute, TermSource termSource)
        : Feature(std::move(id), std::move(attribute)), termSource(termSource) {}

    double compute(const Entity &source, const Entity &target) const override;

    std::map<std::string, double> collectTerms(const Entity &entity) const;

 private:
    TermSource termSource;
};

/**
 * 1 when a normalized link is shared. With the same-id-space check, links that only agree on
 * their host score 0.5.
 */
class LinkAgreementFeature : public Feature {
 public:
    static constexpr double SAME_ID_SPACE_SCORE = 0.5;

    LinkAgreementFeature(std::string id, std::string attribute, bool checkSameIdSpace)
        : Feature(std::move(id), std::move(attribute)), checkSameIdSpace(checkSameIdSpace) {}

    double compute(const Entity &source, const Entity &target) const override;

 private:
    bool checkSameIdSpace;
};

#endif  // CATALOGLINKER_FEATURE_H
