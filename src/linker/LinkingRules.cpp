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


#include "LinkingRules.h"

#include <set>
#include <stdexcept>

#include "../normalizer/Normalizer.h"
#include "../util/Conts.h"
#include "../util/logger/Logger.h"

Logger rules_logger;

static std::regex compilePattern(const std::string &pattern) {
    try {
        std::regex compiled(pattern);
        if (compiled.mark_count() < 1) {
            throw std::invalid_argument("Source URL pattern needs a capture group for the source id: " + pattern);
        }
        return compiled;
    } catch (const std::regex_error &e) {
        throw std::invalid_argument("Invalid source URL pattern '" + pattern + "': " + e.what());
    }
}

LinkingRules::LinkingRules(bool nameRule, bool sourceUrlRule, const std::string &sourceUrlPattern)
    : nameRule(nameRule), sourceUrlRule(sourceUrlRule), sourceUrlPattern(compilePattern(sourceUrlPattern)) {}

LinkingRules LinkingRules::fromConfig(const LinkerConfig &config) {
    return LinkingRules(config.nameRule, config.sourceUrlRule, config.sourceUrlPattern);
}

bool LinkingRules::namesDisjoint(const Entity &source, const Entity &target) const {
    std::set<std::string> sourceNames;
    for (const auto &name : source.getStrings(Conts::ATTRIBUTE::NAME)) {
        sourceNames.insert(Normalizer::normalizeText(name));
    }
    for (const auto &name : target.getStrings(Conts::ATTRIBUTE::NAME)) {
        if (sourceNames.count(Normalizer::normalizeText(name)) > 0) return false;
    }
    return true;
}

std::optional<std::string> LinkingRules::referencedSourceId(const Entity &target) const {
    for (const auto &url : target.getLinks(Conts::ATTRIBUTE::URL)) {
        std::smatch match;
        if (std::regex_search(url, match, sourceUrlPattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

double LinkingRules::apply(double score, const Entity &source, const Entity &target) const {
    double result = score;
    if (nameRule && namesDisjoint(source, target)) {
        result = 0.0;
    }
    if (sourceUrlRule) {
        std::optional<std::string> referenced = referencedSourceId(target);
        if (referenced) {
            result = *referenced == source.getId() ? 1.0 : 0.0;
            rules_logger.debug("Target " + target.getId() + " references source " + *referenced + ", score of " +
                               source.getId() + " set to " + std::to_string(result));
        }
    }
    return result;
}

bool LinkingRules::applyToLabel(bool match, const Entity &source, const Entity &target) const {
    return apply(match ? 1.0 : 0.0, source, target) >= 1.0;
}
