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


#include "DecisionWriter.h"

#include <fstream>
#include <sstream>

#include "../util/logger/Logger.h"

using namespace std;
using json = nlohmann::json;

Logger writer_logger;

json DecisionWriter::toJson(const LinkDecision &decision) {
    json record;
    record["source_id"] = decision.pair.sourceId;
    record["target_id"] = decision.pair.targetId;
    record["label"] = linkLabelToString(decision.label);
    record["confidence"] = decision.confidence ? json(*decision.confidence) : json(nullptr);
    record["strategy_id"] = decision.strategyId;
    return record;
}

// Quotes a field when it holds a separator, a quote or a line break
static string csvField(const string &value) {
    if (value.find_first_of(",\"\r\n") == string::npos) return value;
    string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

string DecisionWriter::toCsvLine(const LinkDecision &decision) {
    ostringstream line;
    line << csvField(decision.pair.sourceId) << "," << csvField(decision.pair.targetId) << ","
         << linkLabelToString(decision.label) << ",";
    if (decision.confidence) {
        line << *decision.confidence;
    }
    line << "," << csvField(decision.strategyId);
    return line.str();
}

int DecisionWriter::writeJsonLines(const string &path, const vector<LinkDecision> &decisions) {
    ofstream out(path);
    if (!out.is_open()) {
        writer_logger.error("Cannot write decisions to " + path);
        return -1;
    }
    for (const auto &decision : decisions) {
        out << toJson(decision).dump() << "\n";
    }
    writer_logger.info("Wrote " + to_string(decisions.size()) + " decisions to " + path);
    return 0;
}

int DecisionWriter::writeCsv(const string &path, const vector<LinkDecision> &decisions) {
    ofstream out(path);
    if (!out.is_open()) {
        writer_logger.error("Cannot write decisions to " + path);
        return -1;
    }
    out << "source_id,target_id,label,confidence,strategy_id\n";
    for (const auto &decision : decisions) {
        out << toCsvLine(decision) << "\n";
    }
    writer_logger.info("Wrote " + to_string(decisions.size()) + " decisions to " + path);
    return 0;
}
