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


#ifndef CATALOGLINKER_ENTITYCOLLECTION_H
#define CATALOGLINKER_ENTITYCOLLECTION_H

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "Entity.h"

/**
 * Validated, immutable arena of the entities of one collection. Entities are addressed either by
 * id or by their position in the arena, which is what blocking indices store.
 */
class EntityCollection {
 public:
    explicit EntityCollection(Collection collection, std::set<std::string> requiredAttributes = {});

    /**
     * Builds a collection, excluding every entity that fails validation. Each exclusion is
     * logged and kept in getRejections().
     */
    static EntityCollection fromEntities(Collection collection, std::vector<Entity> entities,
                                         const std::set<std::string> &requiredAttributes = {});

    /**
     * Adds one entity. Throws DataError when the id is empty or already present, when the
     * collection tag differs or when a required attribute is missing.
     */
    void add(Entity entity);

    // Collection restricted to the given ids, in arena order. Unknown ids are ignored.
    EntityCollection subset(const std::set<std::string> &ids) const;

    const Entity *find(const std::string &id) const;

    const Entity &at(size_t index) const { return entities.at(index); }

    const std::vector<Entity> &getEntities() const { return entities; }

    size_t size() const { return entities.size(); }

    Collection getCollection() const { return collection; }

    const std::vector<std::string> &getRejections() const { return rejections; }

 private:
    Collection collection;
    std::set<std::string> requiredAttributes;
    std::vector<Entity> entities;
    std::unordered_map<std::string, size_t> positions;
    std::vector<std::string> rejections;
};

#endif  // CATALOGLINKER_ENTITYCOLLECTION_H
