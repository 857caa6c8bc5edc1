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


#include "Comparators.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "../util/Conts.h"

static std::u32string toCodePoints(const std::string &text) {
    std::u32string codePoints;
    codePoints.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[pos]);
        size_t length = 1;
        char32_t codePoint = lead;
        if (lead >= 0xC0 && lead <= 0xDF) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF7) {
            length = 4;
            codePoint = lead & 0x07;
        }
        if (pos + length > text.size()) {
            length = 1;
            codePoint = lead;
        } else {
            for (size_t i = 1; i < length; i++) {
                codePoint = (codePoint << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
            }
        }
        codePoints.push_back(codePoint);
        pos += length;
    }
    return codePoints;
}

StringMetric stringMetricFromString(const std::string &name) {
    if (name == Conts::STRING_METRIC::LEVENSHTEIN) return StringMetric::LEVENSHTEIN;
    if (name == Conts::STRING_METRIC::JARO_WINKLER) return StringMetric::JARO_WINKLER;
    throw std::invalid_argument("Unknown string similarity metric: " + name);
}

size_t Comparators::levenshteinDistance(const std::string &a, const std::string &b) {
    std::u32string first = toCodePoints(a);
    std::u32string second = toCodePoints(b);
    if (first.empty()) return second.size();
    if (second.empty()) return first.size();

    std::vector<size_t> previous(second.size() + 1);
    std::vector<size_t> current(second.size() + 1);
    for (size_t j = 0; j <= second.size(); j++) previous[j] = j;

    for (size_t i = 1; i <= first.size(); i++) {
        current[0] = i;
        for (size_t j = 1; j <= second.size(); j++) {
            size_t substitution = previous[j - 1] + (first[i - 1] == second[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[second.size()];
}

double Comparators::levenshteinSimilarity(const std::string &a, const std::string &b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t longest = std::max(toCodePoints(a).size(), toCodePoints(b).size());
    return 1.0 - static_cast<double>(levenshteinDistance(a, b)) / static_cast<double>(longest);
}

double Comparators::jaroSimilarity(const std::string &a, const std::string &b) {
    std::u32string first = toCodePoints(a);
    std::u32string second = toCodePoints(b);
    if (first.empty() || second.empty()) return 0.0;
    if (first == second) return 1.0;

    size_t window = std::max(first.size(), second.size()) / 2;
    window = window > 0 ? window - 1 : 0;

    std::vector<bool> firstMatched(first.size(), false);
    std::vector<bool> secondMatched(second.size(), false);
    size_t matches = 0;
    for (size_t i = 0; i < first.size(); i++) {
        size_t start = i > window ? i - window : 0;
        size_t end = std::min(i + window + 1, second.size());
        for (size_t j = start; j < end; j++) {
            if (secondMatched[j] || first[i] != second[j]) continue;
            firstMatched[i] = true;
            secondMatched[j] = true;
            matches++;
            break;
        }
    }
    if (matches == 0) return 0.0;

    size_t transpositions = 0;
    size_t k = 0;
    for (size_t i = 0; i < first.size(); i++) {
        if (!firstMatched[i]) continue;
        while (!secondMatched[k]) k++;
        if (first[i] != second[k]) transpositions++;
        k++;
    }

    double m = static_cast<double>(matches);
    return (m / first.size() + m / second.size() + (m - transpositions / 2.0) / m) / 3.0;
}

double Comparators::jaroWinklerSimilarity(const std::string &a, const std::string &b, double prefixScale) {
    double jaro = jaroSimilarity(a, b);
    std::u32string first = toCodePoints(a);
    std::u32string second = toCodePoints(b);

    size_t prefix = 0;
    size_t limit = std::min<size_t>({4, first.size(), second.size()});
    while (prefix < limit && first[prefix] == second[prefix]) prefix++;

    return jaro + prefix * prefixScale * (1.0 - jaro);
}

double Comparators::similarity(const std::string &a, const std::string &b, StringMetric metric) {
    switch (metric) {
        case StringMetric::JARO_WINKLER:
            return jaroWinklerSimilarity(a, b);
        case StringMetric::LEVENSHTEIN:
        default:
            return levenshteinSimilarity(a, b);
    }
}

double Comparators::maxSimilarity(const std::vector<std::string> &sourceValues,
                                  const std::vector<std::string> &targetValues, StringMetric metric) {
    double best = 0.0;
    for (const auto &sourceValue : sourceValues) {
        for (const auto &targetValue : targetValues) {
            best = std::max(best, similarity(sourceValue, targetValue, metric));
            if (best >= 1.0) return 1.0;
        }
    }
    return best;
}

double Comparators::exactMatch(const std::vector<std::string> &sourceValues,
                               const std::vector<std::string> &targetValues) {
    for (const auto &sourceValue : sourceValues) {
        if (sourceValue.empty()) continue;
        if (std::find(targetValues.begin(), targetValues.end(), sourceValue) != targetValues.end()) {
            return 1.0;
        }
    }
    return 0.0;
}

double Comparators::compareDates(const PartialDate &a, const PartialDate &b) {
    const std::optional<int> PartialDate::*components[] = {&PartialDate::year, &PartialDate::month,
                                                           &PartialDate::day};
    int shared = 0;
    for (auto component : components) {
        if (a.*component && b.*component) shared++;
    }
    if (shared == 0) return 0.0;

    int agreeing = 0;
    for (auto component : components) {
        if (!(a.*component) || !(b.*component)) continue;
        if (*(a.*component) != *(b.*component)) break;
        agreeing++;
    }
    return static_cast<double>(agreeing) / shared;
}

double Comparators::maxDateSimilarity(const std::vector<PartialDate> &sourceDates,
                                      const std::vector<PartialDate> &targetDates) {
    double best = 0.0;
    for (const auto &sourceDate : sourceDates) {
        for (const auto &targetDate : targetDates) {
            best = std::max(best, compareDates(sourceDate, targetDate));
        }
    }
    return best;
}

double Comparators::jaccard(const std::set<std::string> &a, const std::set<std::string> &b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t shared = 0;
    for (const auto &token : a) {
        if (b.count(token) > 0) shared++;
    }
    size_t unionSize = a.size() + b.size() - shared;
    return static_cast<double>(shared) / unionSize;
}

double Comparators::overlapCoefficient(const std::set<std::string> &a, const std::set<std::string> &b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t shared = 0;
    for (const auto &token : a) {
        if (b.count(token) > 0) shared++;
    }
    return static_cast<double>(shared) / std::min(a.size(), b.size());
}

double Comparators::cosine(const std::map<std::string, double> &a, const std::map<std::string, double> &b) {
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (const auto &term : a) {
        normA += term.second * term.second;
        auto other = b.find(term.first);
        if (other != b.end()) dot += term.second * other->second;
    }
    for (const auto &term : b) {
        normB += term.second * term.second;
    }
    if (normA <= 0.0 || normB <= 0.0) return 0.0;
    return std::min(1.0, dot / (std::sqrt(normA) * std::sqrt(normB)));
}
