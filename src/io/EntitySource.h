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


#ifndef CATALOGLINKER_ENTITYSOURCE_H
#define CATALOGLINKER_ENTITYSOURCE_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "../entity/EntityCollection.h"

/**
 * Enumerable supply of entity records for one collection. Records that cannot be parsed are
 * logged, skipped and listed in getRejections().
 */
class EntitySource {
 public:
    explicit EntitySource(Collection collection) : collection(collection) {}
    virtual ~EntitySource() = default;

    virtual std::vector<Entity> readEntities() = 0;

    // Reads and validates every entity
    EntityCollection load(const std::set<std::string> &requiredAttributes = {});

    Collection getCollection() const { return collection; }
    const std::vector<std::string> &getRejections() const { return rejections; }

    /**
     * Adds one raw value to the named attribute, creating it with the given kind
     * ("string", "date", "link" or "tokens"). Unparseable dates and empty values are dropped.
     * Throws std::invalid_argument for an unknown kind or a kind clash with an existing value.
     */
    static void appendValue(std::map<std::string, AttributeValue> &attributes, const std::string &name,
                            const std::string &kind, const std::string &raw, int datePrecision = 11);

 protected:
    Collection collection;
    std::vector<std::string> rejections;
};

#endif  // CATALOGLINKER_ENTITYSOURCE_H
