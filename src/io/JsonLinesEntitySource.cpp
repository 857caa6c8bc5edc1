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


#include "JsonLinesEntitySource.h"

#include <fstream>

#include "../util/LinkerErrors.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;
using json = nlohmann::json;

Logger jsonl_logger;

JsonLinesEntitySource::JsonLinesEntitySource(string path, Collection collection)
    : EntitySource(collection), path(std::move(path)) {}

static string valueToString(const json &value) {
    if (value.is_string()) return value.get<string>();
    if (value.is_number_integer()) return to_string(value.get<long long>());
    if (value.is_number()) return value.dump();
    throw invalid_argument("values must be strings or numbers, got " + value.dump());
}

Entity JsonLinesEntitySource::parseEntity(const json &record, Collection collection) {
    if (!record.is_object() || !record.contains("id") || !record["id"].is_string()) {
        throw DataError("", "record has no string id");
    }
    string id = record["id"].get<string>();
    map<string, AttributeValue> attributes;
    if (record.contains("attributes")) {
        const json &fields = record["attributes"];
        if (!fields.is_object()) {
            throw DataError(id, "attributes must be an object");
        }
        try {
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                const json &field = it.value();
                if (!field.is_object() || !field.contains("type") || !field["type"].is_string()) {
                    throw invalid_argument("attribute " + it.key() + " has no type");
                }
                string kind = field["type"].get<string>();
                int precision = field.value("precision", 11);
                const json values = field.contains("values") ? field["values"] : json::array();
                if (!values.is_array()) {
                    throw invalid_argument("values of " + it.key() + " must be an array");
                }
                // Creates the attribute even when it has no values
                EntitySource::appendValue(attributes, it.key(), kind, "", precision);
                for (const auto &value : values) {
                    EntitySource::appendValue(attributes, it.key(), kind, valueToString(value), precision);
                }
            }
        } catch (const invalid_argument &e) {
            throw DataError(id, e.what());
        } catch (const json::exception &e) {
            throw DataError(id, e.what());
        }
    }
    return Entity(id, collection, attributes);
}

vector<Entity> JsonLinesEntitySource::readEntities() {
    ifstream in(path);
    if (!in.is_open()) {
        throw LinkerError("Cannot open entity file " + path);
    }
    vector<Entity> entities;
    string line;
    size_t lineNumber = 0;
    while (getline(in, line)) {
        lineNumber++;
        if (Utils::trim_copy(line).empty()) continue;
        try {
            entities.push_back(parseEntity(json::parse(line), collection));
        } catch (const json::parse_error &e) {
            string message = path + ":" + to_string(lineNumber) + " is not valid JSON: " + e.what();
            jsonl_logger.warn(message);
            rejections.push_back(message);
        } catch (const DataError &e) {
            string message = path + ":" + to_string(lineNumber) + " " + e.what();
            jsonl_logger.warn(message);
            rejections.push_back(message);
        }
    }
    jsonl_logger.info("Read " + to_string(entities.size()) + " entities from " + path);
    return entities;
}
