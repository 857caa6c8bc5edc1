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


#ifndef CATALOGLINKER_LINKINGRULES_H
#define CATALOGLINKER_LINKINGRULES_H

#include <optional>
#include <regex>
#include <string>

#include "../entity/Entity.h"
#include "../util/LinkerConfig.h"

/**
 * Hard evidence applied to classifier output before thresholding.
 *
 * Name rule: a pair whose normalized full names are disjoint scores 0.
 * Source URL rule: when a target URL references a source identifier, the pair scores 1 if it is
 * this source and 0 otherwise. It runs after the name rule and overrides it.
 */
class LinkingRules {
 public:
    LinkingRules(bool nameRule, bool sourceUrlRule, const std::string &sourceUrlPattern);

    static LinkingRules fromConfig(const LinkerConfig &config);

    double apply(double score, const Entity &source, const Entity &target) const;

    bool applyToLabel(bool match, const Entity &source, const Entity &target) const;

    // Source id referenced by the target's URLs, if any
    std::optional<std::string> referencedSourceId(const Entity &target) const;

    bool namesDisjoint(const Entity &source, const Entity &target) const;

 private:
    bool nameRule;
    bool sourceUrlRule;
    std::regex sourceUrlPattern;
};

#endif  // CATALOGLINKER_LINKINGRULES_H
