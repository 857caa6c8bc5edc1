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


#ifndef CATALOGLINKER_NORMALIZER_H
#define CATALOGLINKER_NORMALIZER_H

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../entity/Entity.h"

/**
 * Canonical forms for raw attribute values. Every function is pure and idempotent:
 * normalizing an already normalized value returns it unchanged.
 */
class Normalizer {
 public:
    static const int PRECISION_YEAR = 9;
    static const int PRECISION_MONTH = 10;
    static const int PRECISION_DAY = 11;

    /**
     * Lowercases, folds Latin diacritics to base letters, removes bracketed annotations and
     * collapses whitespace. Combining marks of decomposed input are dropped. Greek, Cyrillic and
     * Armenian letters are lowercased but keep their script; other characters are kept as they are.
     */
    static std::string normalizeText(const std::string &raw);

    // Normalized word tokens longer than one byte, minus English stopwords
    static std::set<std::string> tokenize(const std::string &raw);

    // Same as tokenize() with name stopwords (honorifics, particles) removed instead
    static std::set<std::string> tokenizeName(const std::string &raw);

    static std::set<std::string> tokenize(const std::string &raw, const std::set<std::string> &stopwords);

    /**
     * Character n-grams of every whitespace separated word, each word padded with one space on
     * both sides. Counted in code points; repeated n-grams are repeated in the result.
     */
    static std::vector<std::string> characterNgrams(const std::string &text, size_t n);

    /**
     * Parses YYYY, YYYY-MM or YYYY-MM-DD, optionally signed and followed by a time part.
     * Components written as 00 or ?? are unknown. A precision below PRECISION_DAY drops the finer
     * components. Returns nullopt for malformed input or when no component is known.
     */
    static std::optional<PartialDate> parseDate(const std::string &raw, int precision = PRECISION_DAY);

    /**
     * Lowercases scheme and host, maps http to https, drops leading www. labels, default ports,
     * fragments and trailing slashes. Path and query keep their case.
     */
    static std::string normalizeUrl(const std::string &raw);

    // Host of a normalized URL
    static std::string urlHost(const std::string &normalizedUrl);

    // Host labels and path words of a URL, without top-level domains and URL stop tokens
    static std::set<std::string> tokenizeUrl(const std::string &raw);

    static const std::set<std::string> &englishStopwords();
    static const std::set<std::string> &nameStopwords();
    static const std::set<std::string> &urlStopwords();
};

#endif  // CATALOGLINKER_NORMALIZER_H
