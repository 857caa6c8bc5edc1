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

#ifndef CATALOGLINKER_UTILS_H
#define CATALOGLINKER_UTILS_H

#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

using std::map;
using std::unordered_map;

class Utils {
 private:
    static unordered_map<std::string, std::string> propertiesMap;

 public:
    static std::string getCatalogLinkerProperty(std::string key);

    /**
     * Parses a properties file of key=value lines. Lines starting with # are comments and
     * values keep everything after the first '='.
     */
    static map<std::string, std::string> loadProperties(const std::string &path);

    static std::string getCatalogLinkerHome();

    static std::vector<std::string> getFileContent(std::string);

    static int writeFileContent(const std::string &filePath, const std::string &content);

    static std::vector<std::string> split(const std::string &, char delimiter);

    // Splits on the delimiter, trims every item and drops the empty ones.
    static std::vector<std::string> splitAndTrim(const std::string &, char delimiter);

    static std::string join(const std::vector<std::string> &items, const std::string &separator);

    static std::string trim_copy(const std::string &, const std::string &delimiters = " \f\n\r\t\v");

    static bool parseBoolean(const std::string str);

    static bool fileExists(std::string fileName);

    static bool is_number(const std::string &compareString);

    static std::string getCurrentTimestamp();

    // Returns 0 when the directory exists afterwards
    static int createDirectory(const std::string &dirName);

    /**
     * Fisher-Yates permutation of [0, n). The draw sequence depends only on the generator, so a
     * seed gives the same permutation on every platform.
     */
    static std::vector<size_t> shuffledIndices(size_t n, std::mt19937 &generator);
};

#endif  // CATALOGLINKER_UTILS_H
