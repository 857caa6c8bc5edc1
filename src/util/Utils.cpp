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

#include "Utils.h"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "Conts.h"
#include "logger/Logger.h"

using namespace std;
Logger util_logger;

unordered_map<string, string> Utils::propertiesMap;

std::vector<std::string> Utils::split(const std::string &s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> Utils::splitAndTrim(const std::string &s, char delimiter) {
    std::vector<std::string> items;
    for (const auto &token : split(s, delimiter)) {
        std::string item = trim_copy(token);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string Utils::join(const std::vector<std::string> &items, const std::string &separator) {
    std::string joined;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) joined += separator;
        joined += items[i];
    }
    return joined;
}

std::vector<std::string> Utils::getFileContent(std::string file) {
    ifstream in(file);

    std::string str;
    vector<std::string> vec;
    if (!in.is_open()) return vec;
    while (std::getline(in, str)) {
        if (str.length() > 0) {
            vec.push_back(str);
        }
    }
    return vec;
}

int Utils::writeFileContent(const std::string &filePath, const std::string &content) {
    std::ofstream out(filePath);
    if (!out.is_open()) {
        util_logger.error("Cannot write to file path: " + filePath);
        return -1;
    }
    out << content;
    out.close();
    return 0;
}

map<string, string> Utils::loadProperties(const std::string &path) {
    map<string, string> properties;
    const vector<std::string> &lines = Utils::getFileContent(path);
    for (const auto &line : lines) {
        std::string item = trim_copy(line);
        if (item.empty() || item.rfind("#", 0) == 0) {
            continue;
        }
        size_t pos = item.find('=');
        if (pos == std::string::npos) {
            properties[item] = "";
        } else {
            properties[trim_copy(item.substr(0, pos))] = trim_copy(item.substr(pos + 1));
        }
    }
    return properties;
}

std::string Utils::getCatalogLinkerHome() {
    char const *temp = getenv(Conts::CATALOGLINKER_HOME.c_str());
    if (temp != nullptr) {
        std::string home(temp);
        if (!home.empty() && home.back() != '/') home += "/";
        return home;
    }
    return ROOT_DIR;
}

static std::mutex propertiesMapMutex;
static bool propertiesMapInitialized = false;
std::string Utils::getCatalogLinkerProperty(std::string key) {
    if (!propertiesMapInitialized) {
        propertiesMapMutex.lock();
        if (!propertiesMapInitialized) {  // double-checking lock
            const map<string, string> &loaded =
                loadProperties(getCatalogLinkerHome() + Conts::CATALOGLINKER_PROPERTIES_FILE);
            Utils::propertiesMap.insert(loaded.begin(), loaded.end());
        }
        propertiesMapInitialized = true;
        propertiesMapMutex.unlock();
    }
    auto it = Utils::propertiesMap.find(key);
    if (it != Utils::propertiesMap.end()) {
        return it->second;
    }
    return "";
}

static inline std::string trim_right_copy(const std::string &s, const std::string &delimiters) {
    size_t end = s.find_last_not_of(delimiters);
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

static inline std::string trim_left_copy(const std::string &s, const std::string &delimiters) {
    size_t start = s.find_first_not_of(delimiters);
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string Utils::trim_copy(const std::string &s, const std::string &delimiters) {
    return trim_left_copy(trim_right_copy(s, delimiters), delimiters);
}

bool Utils::parseBoolean(const std::string str) {
    if (str == "true" || str == "TRUE" || str == "True") {
        return true;
    }
    return false;
}

bool Utils::fileExists(std::string fileName) { return access(fileName.c_str(), F_OK) == 0; }

bool Utils::is_number(const std::string &compareString) {
    return !compareString.empty() && std::find_if(compareString.begin(), compareString.end(),
                                                  [](char c) { return !std::isdigit(c); }) == compareString.end();
}

std::string Utils::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc;
    gmtime_r(&time, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

int Utils::createDirectory(const std::string &dirName) {
    if (dirName.empty()) {
        util_logger.error("Cannot create a directory with an empty name");
        return -1;
    }
    std::error_code error;
    std::filesystem::create_directories(dirName, error);
    if (error) {
        util_logger.error("Could not create directory " + dirName + ": " + error.message());
        return -1;
    }
    return 0;
}

std::vector<size_t> Utils::shuffledIndices(size_t n, std::mt19937 &generator) {
    std::vector<size_t> indices(n);
    for (size_t i = 0; i < n; i++) {
        indices[i] = i;
    }
    for (size_t i = n; i > 1; i--) {
        size_t j = static_cast<size_t>(generator() % i);
        std::swap(indices[i - 1], indices[j]);
    }
    return indices;
}
