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


#ifndef CATALOGLINKER_MODELSTORE_H
#define CATALOGLINKER_MODELSTORE_H

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "Model.h"

/**
 * Persists models as JSON artifacts named <algorithm>-<schema hash>.json. Every failure to
 * read or write an artifact raises ModelStoreError; an artifact built for another feature
 * schema raises SchemaMismatch.
 */
class ModelStore {
 public:
    explicit ModelStore(std::string directory) : directory(std::move(directory)) {}

    static std::string fileName(const std::string &algorithm, const std::string &schemaHash);

    std::string pathFor(const std::string &algorithm, const FeatureSchema &schema) const;

    // Returns the path written
    std::string save(const Model &model) const;

    std::shared_ptr<const Model> load(const std::string &path, const FeatureSchema &expected) const;

    // Loads the artifact of this algorithm trained for the expected schema
    std::shared_ptr<const Model> loadFor(const std::string &algorithm, const FeatureSchema &expected) const;

    static nlohmann::json toJson(const Model &model);

    static std::shared_ptr<const Model> fromJson(const nlohmann::json &artifact, const FeatureSchema &expected);

 private:
    std::string directory;
};

#endif  // CATALOGLINKER_MODELSTORE_H
