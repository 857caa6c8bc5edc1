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


#include "SQLiteDBInterface.h"

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;
Logger db_logger;

SQLiteDBInterface::SQLiteDBInterface(string databaseLocation, bool createIfMissing)
    : databaseLocation(std::move(databaseLocation)), createIfMissing(createIfMissing) {}

SQLiteDBInterface::~SQLiteDBInterface() { finalize(); }

int SQLiteDBInterface::init() {
    if (!createIfMissing && !Utils::fileExists(this->databaseLocation)) {
        db_logger.error("Database does not exist: " + this->databaseLocation);
        return -1;
    }
    int flags = SQLITE_OPEN_READWRITE | (createIfMissing ? SQLITE_OPEN_CREATE : 0);
    if (sqlite3_open_v2(this->databaseLocation.c_str(), &database, flags, nullptr) != SQLITE_OK) {
        db_logger.error("Cannot open database: " + string(sqlite3_errmsg(database)));
        sqlite3_close(database);
        database = nullptr;
        return -1;
    }
    db_logger.debug("Database opened successfully :" + this->databaseLocation);
    return 0;
}

int SQLiteDBInterface::finalize() {
    if (database == nullptr) {
        return 0;
    }
    int rc = sqlite3_close(database);
    if (rc != SQLITE_OK) {
        db_logger.error("Cannot close database " + this->databaseLocation + ": " + string(sqlite3_errmsg(database)));
        return -1;
    }
    database = nullptr;
    return 0;
}

static int callback(void *ptr, int argc, char **argv, char **azColName) {
    table_type *dbResults = static_cast<table_type *>(ptr);
    vector<pair<string, string>> results;
    for (int i = 0; i < argc; i++) {
        results.push_back(make_pair(azColName[i], argv[i] ? argv[i] : ""));
    }
    dbResults->push_back(results);
    return 0;
}

table_type SQLiteDBInterface::runSelect(const string &query, int &status) {
    char *zErrMsg = 0;
    table_type dbResults;
    status = 0;
    if (database == nullptr) {
        db_logger.error("SQL Error: database " + this->databaseLocation + " is not open");
        status = -1;
        return dbResults;
    }
    if (sqlite3_exec(database, query.c_str(), callback, &dbResults, &zErrMsg) != SQLITE_OK) {
        db_logger.error("SQL Error: " + string(zErrMsg) + " " + query);
        sqlite3_free(zErrMsg);
        dbResults.clear();
        status = -1;
    }
    return dbResults;
}

table_type SQLiteDBInterface::runSelect(const string &query) {
    int status;
    return runSelect(query, status);
}

int SQLiteDBInterface::runInsert(const string &query) {
    if (runUpdate(query) != 0) {
        return -1;
    }
    return static_cast<int>(sqlite3_last_insert_rowid(database));
}

int SQLiteDBInterface::runUpdate(const string &query) {
    if (database == nullptr) {
        db_logger.error("SQL Error: database " + this->databaseLocation + " is not open");
        return -1;
    }
    char *zErrMsg = 0;
    int rc = sqlite3_exec(database, query.c_str(), NULL, NULL, &zErrMsg);
    if (rc != SQLITE_OK) {
        db_logger.error("SQL Error: " + string(zErrMsg) + " " + query);
        sqlite3_free(zErrMsg);
        return -1;
    }
    return 0;
}

string SQLiteDBInterface::quoteIdentifier(const string &identifier) {
    string quoted = "\"";
    for (char c : identifier) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}
