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


#ifndef CATALOGLINKER_JSONLINESENTITYSOURCE_H
#define CATALOGLINKER_JSONLINESENTITYSOURCE_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "EntitySource.h"

/**
 * One JSON object per line:
 *   {"id": "Q1", "attributes": {"name": {"type": "string", "values": ["..."]},
 *                               "birth_date": {"type": "date", "values": ["1897"], "precision": 9}}}
 * Blank lines are ignored.
 */
class JsonLinesEntitySource : public EntitySource {
 public:
    JsonLinesEntitySource(std::string path, Collection collection);

    // Throws LinkerError when the file cannot be opened
    std::vector<Entity> readEntities() override;

    // Throws DataError when the record is malformed
    static Entity parseEntity(const nlohmann::json &record, Collection collection);

 private:
    std::string path;
};

#endif  // CATALOGLINKER_JSONLINESENTITYSOURCE_H
