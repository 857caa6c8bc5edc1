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


#include "Feature.h"

#include <set>

#include "../normalizer/Normalizer.h"

static std::vector<std::string> normalizedStrings(const Entity &entity, const std::string &attribute) {
    std::vector<std::string> values;
    for (const auto &value : entity.getStrings(attribute)) {
        std::string normalized = Normalizer::normalizeText(value);
        if (!normalized.empty()) values.push_back(normalized);
    }
    return values;
}

static std::vector<std::string> normalizedLinks(const Entity &entity, const std::string &attribute) {
    std::vector<std::string> urls;
    for (const auto &url : entity.getLinks(attribute)) {
        std::string normalized = Normalizer::normalizeUrl(url);
        if (!normalized.empty()) urls.push_back(normalized);
    }
    return urls;
}

// Canonical string forms of whatever kind the attribute holds
static std::vector<std::string> canonicalValues(const Entity &entity, const std::string &attribute) {
    const AttributeValue *value = nullptr;
    auto it = entity.getAttributes().find(attribute);
    if (it != entity.getAttributes().end()) value = &it->second;
    if (value == nullptr) return {};

    if (std::holds_alternative<StringList>(*value)) return normalizedStrings(entity, attribute);
    if (std::holds_alternative<LinkList>(*value)) return normalizedLinks(entity, attribute);

    std::vector<std::string> values;
    if (auto dates = std::get_if<DateList>(value)) {
        for (const auto &date : dates->values) values.push_back(date.toString());
    } else {
        for (const auto &token : std::get<TokenSet>(*value).tokens) {
            std::string normalized = Normalizer::normalizeText(token);
            if (!normalized.empty()) values.push_back(normalized);
        }
    }
    return values;
}

double ExactMatchFeature::compute(const Entity &source, const Entity &target) const {
    return Comparators::exactMatch(canonicalValues(source, attribute), canonicalValues(target, attribute));
}

double StringSimilarityFeature::compute(const Entity &source, const Entity &target) const {
    double score = Comparators::maxSimilarity(normalizedStrings(source, attribute),
                                              normalizedStrings(target, attribute), metric);
    if (threshold) {
        return score >= *threshold ? 1.0 : 0.0;
    }
    return score;
}

double DateSimilarityFeature::compute(const Entity &source, const Entity &target) const {
    return Comparators::maxDateSimilarity(source.getDates(attribute), target.getDates(attribute));
}

std::set<std::string> SharedTokensFeature::collectTokens(const Entity &entity) const {
    std::set<std::string> tokens;
    switch (tokenSource) {
        case TokenSource::TOKEN_SET:
            for (const auto &token : entity.getTokens(attribute)) {
                std::string normalized = Normalizer::normalizeText(token);
                if (!normalized.empty()) tokens.insert(normalized);
            }
            break;
        case TokenSource::TEXT_TOKENS:
            for (const auto &value : entity.getStrings(attribute)) {
                std::set<std::string> valueTokens = Normalizer::tokenize(value);
                tokens.insert(valueTokens.begin(), valueTokens.end());
            }
            break;
        case TokenSource::NAME_TOKENS:
            for (const auto &value : entity.getStrings(attribute)) {
                std::set<std::string> valueTokens = Normalizer::tokenizeName(value);
                tokens.insert(valueTokens.begin(), valueTokens.end());
            }
            break;
        case TokenSource::URL_TOKENS:
            for (const auto &url : entity.getLinks(attribute)) {
                std::set<std::string> urlTokens = Normalizer::tokenizeUrl(url);
                tokens.insert(urlTokens.begin(), urlTokens.end());
            }
            break;
        case TokenSource::TOKEN_WORDS:
            for (const auto &token : entity.getTokens(attribute)) {
                std::set<std::string> words = Normalizer::tokenize(token, std::set<std::string>());
                tokens.insert(words.begin(), words.end());
            }
            break;
    }
    return tokens;
}

double SharedTokensFeature::compute(const Entity &source, const Entity &target) const {
    if (overlap == TokenOverlap::OVERLAP_COEFFICIENT) {
        return Comparators::overlapCoefficient(collectTokens(source), collectTokens(target));
    }
    return Comparators::jaccard(collectTokens(source), collectTokens(target));
}

std::map<std::string, double> CosineSimilarityFeature::collectTerms(const Entity &entity) const {
    std::map<std::string, double> terms;
    if (termSource == TermSource::WORDS) {
        for (const auto &value : entity.getStrings(attribute)) {
            for (const auto &token : Normalizer::tokenize(value)) terms[token] = 1.0;
        }
        return terms;
    }
    for (const auto &value : normalizedStrings(entity, attribute)) {
        for (const auto &bigram : Normalizer::characterNgrams(value, 2)) terms[bigram] += 1.0;
    }
    return terms;
}

double CosineSimilarityFeature::compute(const Entity &source, const Entity &target) const {
    return Comparators::cosine(collectTerms(source), collectTerms(target));
}

double LinkAgreementFeature::compute(const Entity &source, const Entity &target) const {
    std::vector<std::string> sourceUrls = normalizedLinks(source, attribute);
    std::vector<std::string> targetUrls = normalizedLinks(target, attribute);
    if (Comparators::exactMatch(sourceUrls, targetUrls) > 0.0) {
        return 1.0;
    }
    if (!checkSameIdSpace) {
        return 0.0;
    }

    std::set<std::string> targetHosts;
    for (const auto &url : targetUrls) targetHosts.insert(Normalizer::urlHost(url));
    for (const auto &url : sourceUrls) {
        std::string host = Normalizer::urlHost(url);
        if (!host.empty() && targetHosts.count(host) > 0) {
            return SAME_ID_SPACE_SCORE;
        }
    }
    return 0.0;
}
