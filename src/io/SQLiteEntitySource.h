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


#ifndef CATALOGLINKER_SQLITEENTITYSOURCE_H
#define CATALOGLINKER_SQLITEENTITYSOURCE_H

#include <string>
#include <vector>

#include "../util/LinkerConfig.h"
#include "EntitySource.h"

struct ColumnMapping {
    std::string column;
    std::string attribute;
    std::string kind;
};

/**
 * Reads a denormalized catalog table where one entity may span several rows. Rows are grouped
 * by the id column and the values of every mapped column are gathered into one attribute.
 */
class SQLiteEntitySource : public EntitySource {
 public:
    SQLiteEntitySource(std::string databasePath, std::string table, std::string idColumn,
                       std::vector<ColumnMapping> columns, Collection collection = Collection::TARGET);

    static SQLiteEntitySource fromConfig(const std::string &databasePath, const LinkerConfig &config);

    /**
     * Parses "column:attribute:kind" triples separated by commas. Throws std::invalid_argument
     * for a malformed triple or an unknown kind.
     */
    static std::vector<ColumnMapping> parseColumns(const std::string &definition);

    // Throws LinkerError when the database cannot be opened or queried
    std::vector<Entity> readEntities() override;

    std::string selectQuery() const;

 private:
    std::string databasePath;
    std::string table;
    std::string idColumn;
    std::vector<ColumnMapping> columns;
};

#endif  // CATALOGLINKER_SQLITEENTITYSOURCE_H
