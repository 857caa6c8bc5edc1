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


#include "BlockingStrategy.h"

#include <algorithm>
#include <unordered_map>

#include "../normalizer/Normalizer.h"
#include "../util/logger/Logger.h"

Logger blocking_strategy_logger;

static std::vector<CandidatePair> flatten(std::vector<std::vector<CandidatePair>> &perSource) {
    std::vector<CandidatePair> pairs;
    for (auto &sourcePairs : perSource) {
        std::move(sourcePairs.begin(), sourcePairs.end(), std::back_inserter(pairs));
    }
    return pairs;
}

std::vector<CandidatePair> ExactKeyBlocking::block(const EntityCollection &source, const EntityCollection &target,
                                                   ParallelExecutor &executor) const {
    BlockingIndex index(target, keyFunction);
    blocking_strategy_logger.debug(name + ": " + std::to_string(index.getPartitionCount()) + " partitions, " +
                                   std::to_string(index.getUnkeyedCount()) + " target entities without a key");

    std::vector<std::vector<CandidatePair>> perSource =
        executor.map<std::vector<CandidatePair>>(source.size(), [&](size_t position) {
            const Entity &sourceEntity = source.at(position);
            std::vector<size_t> matches;
            for (const auto &key : keyFunction(sourceEntity)) {
                const std::vector<size_t> &partition = index.lookup(key);
                matches.insert(matches.end(), partition.begin(), partition.end());
            }
            std::sort(matches.begin(), matches.end());
            matches.erase(std::unique(matches.begin(), matches.end()), matches.end());

            std::vector<CandidatePair> pairs;
            pairs.reserve(matches.size());
            for (size_t targetPosition : matches) {
                pairs.emplace_back(sourceEntity.getId(), target.at(targetPosition).getId());
            }
            return pairs;
        });
    return flatten(perSource);
}

BlockingIndex::KeyFunction ExactKeyBlocking::firstTokenKey(const std::string &attribute) {
    return [attribute](const Entity &entity) {
        std::set<std::string> keys;
        for (const auto &value : entity.getStrings(attribute)) {
            std::string normalized = Normalizer::normalizeText(value);
            if (normalized.empty()) continue;
            keys.insert(normalized.substr(0, normalized.find(' ')));
        }
        return keys;
    };
}

BlockingIndex::KeyFunction ExactKeyBlocking::exactValueKey(const std::string &attribute) {
    return [attribute](const Entity &entity) {
        std::set<std::string> keys;
        for (const auto &value : entity.getStrings(attribute)) {
            std::string normalized = Normalizer::normalizeText(value);
            if (!normalized.empty()) keys.insert(normalized);
        }
        for (const auto &url : entity.getLinks(attribute)) {
            std::string normalized = Normalizer::normalizeUrl(url);
            if (!normalized.empty()) keys.insert(normalized);
        }
        for (const auto &date : entity.getDates(attribute)) {
            keys.insert(date.toString());
        }
        for (const auto &token : entity.getTokens(attribute)) {
            std::string normalized = Normalizer::normalizeText(token);
            if (!normalized.empty()) keys.insert(normalized);
        }
        return keys;
    };
}

BlockingIndex::KeyFunction ExactKeyBlocking::normalizedUrlKey(const std::string &attribute) {
    return [attribute](const Entity &entity) {
        std::set<std::string> keys;
        for (const auto &url : entity.getLinks(attribute)) {
            std::string normalized = Normalizer::normalizeUrl(url);
            if (!normalized.empty()) keys.insert(normalized);
        }
        return keys;
    };
}

std::vector<CandidatePair> FunctionBlocking::block(const EntityCollection &source, const EntityCollection &target,
                                                   ParallelExecutor &executor) const {
    std::vector<std::vector<CandidatePair>> perSource =
        executor.map<std::vector<CandidatePair>>(source.size(), [&](size_t position) {
            const Entity &sourceEntity = source.at(position);
            std::vector<CandidatePair> pairs;
            for (const auto &targetId : candidateFunction(sourceEntity)) {
                if (target.find(targetId) == nullptr) {
                    blocking_strategy_logger.debug(name + ": ignoring unknown target id " + targetId);
                    continue;
                }
                pairs.emplace_back(sourceEntity.getId(), targetId);
            }
            return pairs;
        });
    return flatten(perSource);
}

std::vector<CandidatePair> FullTextBlocking::block(const EntityCollection &source, const EntityCollection &target,
                                                   ParallelExecutor &executor) const {
    auto nameTokens = [this](const Entity &entity) {
        std::set<std::string> tokens;
        for (const auto &value : entity.getStrings(attribute)) {
            std::set<std::string> valueTokens = Normalizer::tokenizeName(value);
            tokens.insert(valueTokens.begin(), valueTokens.end());
        }
        return tokens;
    };
    BlockingIndex index(target, nameTokens);

    std::vector<std::vector<CandidatePair>> perSource =
        executor.map<std::vector<CandidatePair>>(source.size(), [&](size_t position) {
            const Entity &sourceEntity = source.at(position);
            std::unordered_map<size_t, int> sharedTokens;
            for (const auto &token : nameTokens(sourceEntity)) {
                for (size_t targetPosition : index.lookup(token)) {
                    sharedTokens[targetPosition]++;
                }
            }

            std::vector<std::pair<size_t, int>> ranked(sharedTokens.begin(), sharedTokens.end());
            std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
                if (a.second != b.second) return a.second > b.second;
                return a.first < b.first;
            });
            if (ranked.size() > limit) ranked.resize(limit);

            std::vector<CandidatePair> pairs;
            for (const auto &hit : ranked) {
                pairs.emplace_back(sourceEntity.getId(), target.at(hit.first).getId());
            }
            return pairs;
        });
    return flatten(perSource);
}
