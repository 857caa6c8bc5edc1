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


#include "ModelStore.h"

#include <fstream>
#include <vector>

#include "../util/Conts.h"
#include "../util/LinkerErrors.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"
#include "ClassifierFactory.h"

using namespace std;
using json = nlohmann::json;

Logger store_logger;

string ModelStore::fileName(const string &algorithm, const string &schemaHash) {
    return algorithm + "-" + schemaHash + ".json";
}

string ModelStore::pathFor(const string &algorithm, const FeatureSchema &schema) const {
    return directory + "/" + fileName(ClassifierFactory::canonicalName(algorithm), schema.getHash());
}

json ModelStore::toJson(const Model &model) {
    json artifact;
    artifact["format_version"] = Conts::MODEL_FORMAT_VERSION;
    artifact["algorithm"] = model.getAlgorithm();
    artifact["calibrated"] = model.isCalibrated();
    artifact["schema"]["features"] = model.getSchema().getFeatureIds();
    artifact["schema"]["hash"] = model.getSchema().getHash();
    artifact["trained_at"] = model.getTrainedAt();
    artifact["training_set_id"] = model.getTrainingSetId();
    artifact["parameters"] = model.getParameters();
    return artifact;
}

shared_ptr<const Model> ModelStore::fromJson(const json &artifact, const FeatureSchema &expected) {
    try {
        int version = artifact.at("format_version").get<int>();
        if (version != Conts::MODEL_FORMAT_VERSION) {
            throw ModelStoreError("Unsupported model format version " + to_string(version) + ", expected " +
                                  to_string(Conts::MODEL_FORMAT_VERSION));
        }
        FeatureSchema schema(artifact.at("schema").at("features").get<vector<string>>());
        string storedHash = artifact.at("schema").at("hash").get<string>();
        if (schema.getHash() != storedHash) {
            throw ModelStoreError("Model schema hash " + storedHash + " does not match its feature ids");
        }
        if (schema != expected) {
            throw SchemaMismatch("Model trained for schema " + schema.getHash() + " cannot score schema " +
                                     expected.getHash(),
                                 schema.size(), expected.size());
        }

        unique_ptr<Classifier> classifier =
            ClassifierFactory::create(artifact.at("algorithm").get<string>(), ClassifierParameters());
        const json &parameters = artifact.at("parameters");
        shared_ptr<const ClassifierKernel> kernel = classifier->restoreKernel(parameters);
        return make_shared<const Model>(classifier->getName(), schema, classifier->isCalibratedFor(parameters),
                                        artifact.at("trained_at").get<string>(),
                                        artifact.at("training_set_id").get<string>(), kernel);
    } catch (const json::exception &e) {
        throw ModelStoreError(string("Malformed model artifact: ") + e.what());
    } catch (const invalid_argument &e) {
        throw ModelStoreError(string("Invalid model parameters: ") + e.what());
    }
}

string ModelStore::save(const Model &model) const {
    if (Utils::createDirectory(directory) != 0) {
        throw ModelStoreError("Cannot create model directory " + directory);
    }
    string path = directory + "/" + fileName(model.getAlgorithm(), model.getSchema().getHash());
    if (Utils::writeFileContent(path, toJson(model).dump(2) + "\n") != 0) {
        throw ModelStoreError("Cannot write model to " + path);
    }
    store_logger.info("Saved " + model.getAlgorithm() + " model to " + path);
    return path;
}

shared_ptr<const Model> ModelStore::load(const string &path, const FeatureSchema &expected) const {
    ifstream in(path);
    if (!in.is_open()) {
        throw ModelStoreError("Cannot open model artifact " + path);
    }
    json artifact;
    try {
        in >> artifact;
    } catch (const json::parse_error &e) {
        throw ModelStoreError("Model artifact " + path + " is not valid JSON: " + e.what());
    }
    shared_ptr<const Model> model = fromJson(artifact, expected);
    store_logger.info("Loaded " + model->getAlgorithm() + " model trained at " + model->getTrainedAt() + " from " +
                      path);
    return model;
}

shared_ptr<const Model> ModelStore::loadFor(const string &algorithm, const FeatureSchema &expected) const {
    string path = pathFor(algorithm, expected);
    if (!Utils::fileExists(path)) {
        throw ModelStoreError("No " + algorithm + " model for feature schema " + expected.getHash() + " in " +
                              directory);
    }
    return load(path, expected);
}
