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


#include "LinkDecision.h"

std::string linkLabelToString(LinkLabel label) {
    switch (label) {
        case LinkLabel::MATCH:
            return "match";
        case LinkLabel::NON_MATCH:
            return "non_match";
        case LinkLabel::UNDECIDED:
            return "undecided";
        case LinkLabel::SUPERSEDED:
            return "superseded";
    }
    return "unknown";
}

static std::string confidenceToString(const std::optional<double> &confidence) {
    return confidence ? std::to_string(*confidence) : "n/a";
}

std::string PairConflictWarning::toString() const {
    return "Source " + sourceId + " kept target " + retainedTargetId + " (" + confidenceToString(retainedConfidence) +
           ") and superseded " + supersededTargetId + " (" + confidenceToString(supersededConfidence) + ")";
}
