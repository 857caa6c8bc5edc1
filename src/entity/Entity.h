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


#ifndef CATALOGLINKER_ENTITY_H
#define CATALOGLINKER_ENTITY_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

enum class Collection { SOURCE, TARGET };

std::string collectionToString(Collection collection);

/**
 * Date with independently known components. An absent component is unknown, never zero.
 */
struct PartialDate {
    std::optional<int> year;
    std::optional<int> month;
    std::optional<int> day;

    bool isEmpty() const { return !year && !month && !day; }

    // YYYY-MM-DD with ?? (or ????) for unknown components
    std::string toString() const;

    bool operator==(const PartialDate &other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const PartialDate &other) const { return !(*this == other); }
};

// Names, aliases and other free text
struct StringList {
    std::vector<std::string> values;
};

struct DateList {
    std::vector<PartialDate> values;
};

struct LinkList {
    std::vector<std::string> urls;
};

// Codes compared as a set: occupations, genres
struct TokenSet {
    std::set<std::string> tokens;
};

using AttributeValue = std::variant<StringList, DateList, LinkList, TokenSet>;

// Kind name as used in the JSON-lines input ("string", "date", "link", "tokens")
std::string attributeKindName(const AttributeValue &value);

bool isEmptyAttribute(const AttributeValue &value);

class Entity {
 public:
    Entity(std::string id, Collection collection, std::map<std::string, AttributeValue> attributes = {});

    const std::string &getId() const { return id; }

    Collection getCollection() const { return collection; }

    const std::map<std::string, AttributeValue> &getAttributes() const { return attributes; }

    bool hasAttribute(const std::string &name) const;

    /**
     * Returns the attribute when present and of kind T, nullptr otherwise.
     */
    template <typename T>
    const T *getAttributeAs(const std::string &name) const {
        auto it = attributes.find(name);
        if (it == attributes.end()) return nullptr;
        return std::get_if<T>(&it->second);
    }

    // Convenience accessors returning an empty list when the attribute is missing
    std::vector<std::string> getStrings(const std::string &name) const;
    std::vector<PartialDate> getDates(const std::string &name) const;
    std::vector<std::string> getLinks(const std::string &name) const;
    std::set<std::string> getTokens(const std::string &name) const;

 private:
    std::string id;
    Collection collection;
    std::map<std::string, AttributeValue> attributes;
};

/**
 * Ordered (source id, target id) pair produced by blocking
 */
struct CandidatePair {
    std::string sourceId;
    std::string targetId;

    CandidatePair() = default;
    CandidatePair(std::string sourceId, std::string targetId)
        : sourceId(std::move(sourceId)), targetId(std::move(targetId)) {}

    bool operator<(const CandidatePair &other) const {
        if (sourceId != other.sourceId) return sourceId < other.sourceId;
        return targetId < other.targetId;
    }
    bool operator==(const CandidatePair &other) const {
        return sourceId == other.sourceId && targetId == other.targetId;
    }

    std::string toString() const { return "(" + sourceId + ", " + targetId + ")"; }
};

#endif  // CATALOGLINKER_ENTITY_H
