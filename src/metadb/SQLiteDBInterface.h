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


#ifndef CATALOGLINKER_SQLITEDBINTERFACE_H
#define CATALOGLINKER_SQLITEDBINTERFACE_H

#include <sqlite3.h>

#include <string>
#include <utility>
#include <vector>

typedef std::vector<std::vector<std::pair<std::string, std::string>>> table_type;

class SQLiteDBInterface {
 private:
    sqlite3 *database = nullptr;
    std::string databaseLocation;
    bool createIfMissing;

 public:
    /**
     * Opens databaseLocation on init(). Without createIfMissing a missing file is an error,
     * which is what catalog readers want.
     */
    explicit SQLiteDBInterface(std::string databaseLocation, bool createIfMissing = false);
    ~SQLiteDBInterface();

    SQLiteDBInterface(const SQLiteDBInterface &) = delete;
    SQLiteDBInterface &operator=(const SQLiteDBInterface &) = delete;

    int init();

    int finalize();

    bool isOpen() const { return database != nullptr; }

    // Rows as (column, value) pairs. NULL values come back as empty strings.
    table_type runSelect(const std::string &query, int &status);

    table_type runSelect(const std::string &query);

    // Returns the last inserted row id, -1 on error
    int runInsert(const std::string &query);

    int runUpdate(const std::string &query);

    // Double quoted SQL identifier
    static std::string quoteIdentifier(const std::string &identifier);
};

#endif  // CATALOGLINKER_SQLITEDBINTERFACE_H
