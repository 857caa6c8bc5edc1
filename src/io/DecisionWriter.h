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


#ifndef CATALOGLINKER_DECISIONWRITER_H
#define CATALOGLINKER_DECISIONWRITER_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../decision/LinkDecision.h"

/**
 * Serializes decisions for the ingester. Both writers return 0 on success and -1 when the
 * file cannot be written.
 */
class DecisionWriter {
 public:
    static nlohmann::json toJson(const LinkDecision &decision);

    static std::string toCsvLine(const LinkDecision &decision);

    static int writeJsonLines(const std::string &path, const std::vector<LinkDecision> &decisions);

    // With a source_id,target_id,label,confidence,strategy_id header
    static int writeCsv(const std::string &path, const std::vector<LinkDecision> &decisions);
};

#endif  // CATALOGLINKER_DECISIONWRITER_H
