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


#include "EntityCollection.h"

#include "../util/LinkerErrors.h"
#include "../util/logger/Logger.h"

Logger entity_logger;

EntityCollection::EntityCollection(Collection collection, std::set<std::string> requiredAttributes)
    : collection(collection), requiredAttributes(std::move(requiredAttributes)) {}

EntityCollection EntityCollection::fromEntities(Collection collection, std::vector<Entity> entities,
                                                const std::set<std::string> &requiredAttributes) {
    EntityCollection result(collection, requiredAttributes);
    result.entities.reserve(entities.size());
    for (auto &entity : entities) {
        try {
            result.add(std::move(entity));
        } catch (const DataError &e) {
            entity_logger.warn("Excluding " + collectionToString(collection) + " entity: " + e.what());
            result.rejections.push_back(e.what());
        }
    }
    entity_logger.info("Loaded " + std::to_string(result.size()) + " " + collectionToString(collection) +
                       " entities, excluded " + std::to_string(result.rejections.size()));
    return result;
}

void EntityCollection::add(Entity entity) {
    const std::string &id = entity.getId();
    if (id.empty()) {
        throw DataError(id, "empty identifier");
    }
    if (entity.getCollection() != collection) {
        throw DataError(id, "tagged as " + collectionToString(entity.getCollection()) + " but loaded into the " +
                                collectionToString(collection) + " collection");
    }
    if (positions.find(id) != positions.end()) {
        throw DataError(id, "duplicate identifier");
    }
    for (const auto &attribute : requiredAttributes) {
        if (!entity.hasAttribute(attribute)) {
            throw DataError(id, "missing required attribute '" + attribute + "'");
        }
    }
    positions[id] = entities.size();
    entities.push_back(std::move(entity));
}

EntityCollection EntityCollection::subset(const std::set<std::string> &ids) const {
    EntityCollection result(collection, requiredAttributes);
    for (const auto &entity : entities) {
        if (ids.count(entity.getId()) > 0) {
            result.positions[entity.getId()] = result.entities.size();
            result.entities.push_back(entity);
        }
    }
    return result;
}

const Entity *EntityCollection::find(const std::string &id) const {
    auto it = positions.find(id);
    if (it == positions.end()) return nullptr;
    return &entities[it->second];
}
