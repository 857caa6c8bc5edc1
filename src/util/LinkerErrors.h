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


#ifndef CATALOGLINKER_LINKERERRORS_H
#define CATALOGLINKER_LINKERERRORS_H

#include <stdexcept>
#include <string>

class LinkerError : public std::runtime_error {
 public:
    explicit LinkerError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Malformed or missing required attribute on an entity. The entity is excluded from the run.
 */
class DataError : public LinkerError {
 public:
    DataError(const std::string &entityId, const std::string &message)
        : LinkerError("Entity [" + entityId + "]: " + message), entityId(entityId) {}

    const std::string &getEntityId() const { return entityId; }

 private:
    std::string entityId;
};

/**
 * Feature vector shape or schema disagrees with a model.
 */
class SchemaMismatch : public LinkerError {
 public:
    SchemaMismatch(const std::string &message, size_t expectedFeatures, size_t actualFeatures)
        : LinkerError(message + " (expected " + std::to_string(expectedFeatures) + " features, got " +
                      std::to_string(actualFeatures) + ")"),
          expectedFeatures(expectedFeatures),
          actualFeatures(actualFeatures) {}

    size_t getExpectedFeatures() const { return expectedFeatures; }
    size_t getActualFeatures() const { return actualFeatures; }

 private:
    size_t expectedFeatures;
    size_t actualFeatures;
};

class TrainingError : public LinkerError {
 public:
    explicit TrainingError(const std::string &message) : LinkerError("Training failed: " + message) {}
};

class BlockingError : public LinkerError {
 public:
    BlockingError(const std::string &strategy, const std::string &message)
        : LinkerError("Blocking strategy [" + strategy + "] failed: " + message) {}
};

class ModelStoreError : public LinkerError {
 public:
    explicit ModelStoreError(const std::string &message) : LinkerError(message) {}
};

/**
 * Failure confined to a single candidate pair. Collected and returned next to the decisions.
 */
struct PairError {
    std::string sourceId;
    std::string targetId;
    std::string stage;
    std::string message;

    std::string toString() const { return "[" + stage + "] (" + sourceId + ", " + targetId + "): " + message; }
};

#endif  // CATALOGLINKER_LINKERERRORS_H
