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


#ifndef CATALOGLINKER_COMPARATORS_H
#define CATALOGLINKER_COMPARATORS_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "../entity/Entity.h"

enum class StringMetric { LEVENSHTEIN, JARO_WINKLER };

StringMetric stringMetricFromString(const std::string &name);

/**
 * Attribute level comparison functions. Inputs are expected to be normalized already; every
 * function returns a value in [0, 1] and 0 when either side has no value.
 */
class Comparators {
 public:
    // Edit distance in code points
    static size_t levenshteinDistance(const std::string &a, const std::string &b);

    // 1 - distance / max(length)
    static double levenshteinSimilarity(const std::string &a, const std::string &b);

    static double jaroSimilarity(const std::string &a, const std::string &b);

    static double jaroWinklerSimilarity(const std::string &a, const std::string &b, double prefixScale = 0.1);

    static double similarity(const std::string &a, const std::string &b, StringMetric metric);

    /**
     * Best similarity over the cross product of both value lists. A single strong pair is
     * enough; weaker alias pairs never lower the result.
     */
    static double maxSimilarity(const std::vector<std::string> &sourceValues,
                                const std::vector<std::string> &targetValues, StringMetric metric);

    // 1 when the two lists share at least one value
    static double exactMatch(const std::vector<std::string> &sourceValues,
                             const std::vector<std::string> &targetValues);

    /**
     * Share of agreeing components among the components both dates define, walking year, month
     * and day and stopping at the first disagreement.
     */
    static double compareDates(const PartialDate &a, const PartialDate &b);

    static double maxDateSimilarity(const std::vector<PartialDate> &sourceDates,
                                    const std::vector<PartialDate> &targetDates);

    static double jaccard(const std::set<std::string> &a, const std::set<std::string> &b);

    // Shared tokens over the size of the smaller set
    static double overlapCoefficient(const std::set<std::string> &a, const std::set<std::string> &b);

    // Cosine of two sparse term weight vectors
    static double cosine(const std::map<std::string, double> &a, const std::map<std::string, double> &b);
};

#endif  // CATALOGLINKER_COMPARATORS_H
