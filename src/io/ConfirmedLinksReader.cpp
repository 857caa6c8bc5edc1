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


#include "ConfirmedLinksReader.h"

#include <fstream>

#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;

Logger links_logger;

int ConfirmedLinksReader::read(const string &path, ConfirmedLinks &links) {
    ifstream in(path);
    if (!in.is_open()) {
        links_logger.error("Cannot open confirmed links file " + path);
        return -1;
    }
    string line;
    size_t lineNumber = 0;
    size_t skipped = 0;
    while (getline(in, line)) {
        lineNumber++;
        string trimmed = Utils::trim_copy(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        vector<string> fields = Utils::split(trimmed, ',');
        if (fields.size() != 2 || Utils::trim_copy(fields[0]).empty() || Utils::trim_copy(fields[1]).empty()) {
            links_logger.warn(path + ":" + to_string(lineNumber) + " is not source_id,target_id");
            skipped++;
            continue;
        }
        string sourceId = Utils::trim_copy(fields[0]);
        string targetId = Utils::trim_copy(fields[1]);
        if (sourceId == "source_id" && targetId == "target_id") continue;
        auto inserted = links.emplace(sourceId, targetId);
        if (!inserted.second && inserted.first->second != targetId) {
            links_logger.warn("Source " + sourceId + " already linked to " + inserted.first->second + ", ignoring " +
                              targetId);
            skipped++;
        }
    }
    links_logger.info("Read " + to_string(links.size()) + " confirmed links from " + path + " (" +
                      to_string(skipped) + " lines skipped)");
    return 0;
}
