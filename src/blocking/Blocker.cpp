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


#include "Blocker.h"

#include <set>
#include <stdexcept>

#include "../util/Conts.h"
#include "../util/LinkerErrors.h"
#include "../util/logger/Logger.h"

Logger blocker_logger;

std::unique_ptr<BlockingStrategy> Blocker::createStrategy(const std::string &name, const LinkerConfig &config) {
    if (name == Conts::BLOCKING::NAME_TOKEN) {
        return std::make_unique<ExactKeyBlocking>(name, ExactKeyBlocking::firstTokenKey(Conts::ATTRIBUTE::NAME));
    } else if (name == Conts::BLOCKING::EXACT_ATTRIBUTE) {
        return std::make_unique<ExactKeyBlocking>(name + ":" + config.blockingAttribute,
                                                  ExactKeyBlocking::exactValueKey(config.blockingAttribute));
    } else if (name == Conts::BLOCKING::URL) {
        return std::make_unique<ExactKeyBlocking>(name, ExactKeyBlocking::normalizedUrlKey(Conts::ATTRIBUTE::URL));
    } else if (name == Conts::BLOCKING::FULL_TEXT) {
        return std::make_unique<FullTextBlocking>(name, Conts::ATTRIBUTE::NAME,
                                                  static_cast<size_t>(config.fullTextLimit));
    }
    throw std::invalid_argument("Unknown blocking strategy: " + name);
}

Blocker Blocker::fromConfig(const LinkerConfig &config) {
    Blocker blocker;
    for (const auto &name : config.blockingStrategies) {
        blocker.addStrategy(createStrategy(name, config));
    }
    return blocker;
}

void Blocker::addStrategy(std::unique_ptr<BlockingStrategy> strategy) { strategies.push_back(std::move(strategy)); }

std::vector<CandidatePair> Blocker::block(const EntityCollection &source, const EntityCollection &target,
                                          ParallelExecutor &executor) const {
    std::set<CandidatePair> candidates;
    for (const auto &strategy : strategies) {
        std::vector<CandidatePair> pairs;
        try {
            pairs = strategy->block(source, target, executor);
        } catch (const LinkerError &) {
            throw;
        } catch (const std::exception &e) {
            throw BlockingError(strategy->getName(), e.what());
        }
        size_t before = candidates.size();
        candidates.insert(pairs.begin(), pairs.end());
        blocker_logger.info("Blocking strategy " + strategy->getName() + " produced " + std::to_string(pairs.size()) +
                            " pairs, " + std::to_string(candidates.size() - before) + " new");
    }
    blocker_logger.info("Blocking produced " + std::to_string(candidates.size()) + " candidate pairs for " +
                        std::to_string(source.size()) + " source and " + std::to_string(target.size()) +
                        " target entities");
    return std::vector<CandidatePair>(candidates.begin(), candidates.end());
}
