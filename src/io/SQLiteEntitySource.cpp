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


#include "SQLiteEntitySource.h"

#include <map>
#include <stdexcept>

#include "../metadb/SQLiteDBInterface.h"
#include "../util/Conts.h"
#include "../util/LinkerErrors.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;

Logger sqlite_source_logger;

SQLiteEntitySource::SQLiteEntitySource(string databasePath, string table, string idColumn,
                                       vector<ColumnMapping> columns, Collection collection)
    : EntitySource(collection),
      databasePath(std::move(databasePath)),
      table(std::move(table)),
      idColumn(std::move(idColumn)),
      columns(std::move(columns)) {
    if (this->table.empty() || this->idColumn.empty()) {
        throw invalid_argument("SQLite entity source needs a table and an id column");
    }
}

SQLiteEntitySource SQLiteEntitySource::fromConfig(const string &databasePath, const LinkerConfig &config) {
    return SQLiteEntitySource(databasePath, config.sqliteTable, config.sqliteIdColumn,
                              parseColumns(config.sqliteColumns));
}

vector<ColumnMapping> SQLiteEntitySource::parseColumns(const string &definition) {
    vector<ColumnMapping> mappings;
    for (const auto &triple : Utils::splitAndTrim(definition, ',')) {
        vector<string> parts = Utils::split(triple, ':');
        if (parts.size() != 3) {
            throw invalid_argument("Column mapping '" + triple + "' is not column:attribute:kind");
        }
        ColumnMapping mapping{Utils::trim_copy(parts[0]), Utils::trim_copy(parts[1]), Utils::trim_copy(parts[2])};
        if (mapping.column.empty() || mapping.attribute.empty()) {
            throw invalid_argument("Column mapping '" + triple + "' has an empty name");
        }
        if (mapping.kind != Conts::ATTRIBUTE_KIND::STRING && mapping.kind != Conts::ATTRIBUTE_KIND::DATE &&
            mapping.kind != Conts::ATTRIBUTE_KIND::LINK && mapping.kind != Conts::ATTRIBUTE_KIND::TOKENS) {
            throw invalid_argument("Column mapping '" + triple + "' has unknown kind " + mapping.kind);
        }
        mappings.push_back(mapping);
    }
    if (mappings.empty()) {
        throw invalid_argument("No column mappings given");
    }
    return mappings;
}

string SQLiteEntitySource::selectQuery() const {
    string query = "SELECT " + SQLiteDBInterface::quoteIdentifier(idColumn);
    for (const auto &mapping : columns) {
        query += ", " + SQLiteDBInterface::quoteIdentifier(mapping.column);
    }
    query += " FROM " + SQLiteDBInterface::quoteIdentifier(table) + " ORDER BY " +
             SQLiteDBInterface::quoteIdentifier(idColumn) + ";";
    return query;
}

vector<Entity> SQLiteEntitySource::readEntities() {
    SQLiteDBInterface database(databasePath);
    if (database.init() != 0) {
        throw LinkerError("Cannot open catalog database " + databasePath);
    }
    int status = 0;
    table_type rows = database.runSelect(selectQuery(), status);
    database.finalize();
    if (status != 0) {
        throw LinkerError("Cannot read table " + table + " from " + databasePath);
    }

    vector<string> order;
    map<string, map<string, AttributeValue>> grouped;
    map<string, string> broken;
    for (const auto &row : rows) {
        // Column order follows selectQuery()
        const string &id = row.at(0).second;
        if (id.empty()) {
            string message = "Row of " + table + " without " + idColumn + " skipped";
            sqlite_source_logger.warn(message);
            rejections.push_back(message);
            continue;
        }
        auto group = grouped.find(id);
        if (group == grouped.end()) {
            order.push_back(id);
            group = grouped.emplace(id, map<string, AttributeValue>()).first;
        }
        for (size_t c = 0; c < columns.size(); c++) {
            try {
                EntitySource::appendValue(group->second, columns[c].attribute, columns[c].kind,
                                          row.at(c + 1).second);
            } catch (const invalid_argument &e) {
                broken.emplace(id, e.what());
            }
        }
    }

    vector<Entity> entities;
    entities.reserve(order.size());
    for (const auto &id : order) {
        auto failure = broken.find(id);
        if (failure != broken.end()) {
            string message = DataError(id, failure->second).what();
            sqlite_source_logger.warn(message);
            rejections.push_back(message);
            continue;
        }
        entities.emplace_back(id, collection, grouped[id]);
    }
    sqlite_source_logger.info("Read " + to_string(entities.size()) + " entities from " + to_string(rows.size()) +
                              " rows of " + table);
    return entities;
}
