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


#ifndef CATALOGLINKER_LINKDECISION_H
#define CATALOGLINKER_LINKDECISION_H

#include <optional>
#include <string>

#include "../entity/Entity.h"

enum class LinkLabel { MATCH, NON_MATCH, UNDECIDED, SUPERSEDED };

std::string linkLabelToString(LinkLabel label);

struct LinkDecision {
    CandidatePair pair;
    LinkLabel label = LinkLabel::NON_MATCH;
    // Absent for strategies without calibrated scores
    std::optional<double> confidence;
    std::string strategyId;
};

/**
 * Raised, not thrown, when an accepted pair loses against a stronger pair of the same source.
 */
struct PairConflictWarning {
    std::string sourceId;
    std::string retainedTargetId;
    std::string supersededTargetId;
    std::optional<double> retainedConfidence;
    std::optional<double> supersededConfidence;

    std::string toString() const;
};

#endif  // CATALOGLINKER_LINKDECISION_H
