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


#include "../../../src/io/DecisionWriter.h"

#include <cstdio>

#include "../../../src/util/Utils.h"
#include "gtest/gtest.h"

static LinkDecision decision(const std::string &source, const std::string &target, LinkLabel label,
                             std::optional<double> confidence, const std::string &strategyId) {
    LinkDecision result;
    result.pair = CandidatePair(source, target);
    result.label = label;
    result.confidence = confidence;
    result.strategyId = strategyId;
    return result;
}

TEST(DecisionWriterTest, TestJsonRecord) {
    nlohmann::json record =
        DecisionWriter::toJson(decision("Q1", "T1", LinkLabel::MATCH, 0.75, "classifier:naive_bayes"));
    ASSERT_EQ(record["source_id"], "Q1");
    ASSERT_EQ(record["target_id"], "T1");
    ASSERT_EQ(record["label"], "match");
    ASSERT_DOUBLE_EQ(record["confidence"].get<double>(), 0.75);
    ASSERT_EQ(record["strategy_id"], "classifier:naive_bayes");

    nlohmann::json unscored = DecisionWriter::toJson(decision("Q1", "T2", LinkLabel::NON_MATCH, std::nullopt, "r"));
    ASSERT_TRUE(unscored["confidence"].is_null());
}

TEST(DecisionWriterTest, TestCsvLine) {
    ASSERT_EQ(DecisionWriter::toCsvLine(decision("Q1", "T1", LinkLabel::SUPERSEDED, 0.5, "svm")),
              "Q1,T1,superseded,0.5,svm");
    ASSERT_EQ(DecisionWriter::toCsvLine(decision("Q1", "T,2", LinkLabel::NON_MATCH, std::nullopt, "rule:links")),
              "Q1,\"T,2\",non_match,,rule:links");
}

TEST(DecisionWriterTest, TestWriteFiles) {
    std::vector<LinkDecision> decisions = {decision("Q1", "T1", LinkLabel::MATCH, 1.0, "rule:perfect_name"),
                                           decision("Q2", "T2", LinkLabel::UNDECIDED, 0.45, "classifier:svm")};
    std::string jsonPath = TEST_RESOURCE_DIR "temp/decisions.jsonl";
    std::string csvPath = TEST_RESOURCE_DIR "temp/decisions.csv";

    ASSERT_EQ(DecisionWriter::writeJsonLines(jsonPath, decisions), 0);
    std::vector<std::string> jsonLines = Utils::getFileContent(jsonPath);
    ASSERT_EQ(jsonLines.size(), 2);
    ASSERT_EQ(nlohmann::json::parse(jsonLines[1])["label"], "undecided");

    ASSERT_EQ(DecisionWriter::writeCsv(csvPath, decisions), 0);
    std::vector<std::string> csvLines = Utils::getFileContent(csvPath);
    ASSERT_EQ(csvLines.size(), 3);
    ASSERT_EQ(csvLines[0], "source_id,target_id,label,confidence,strategy_id");
    ASSERT_EQ(csvLines[1], "Q1,T1,match,1,rule:perfect_name");

    ASSERT_EQ(DecisionWriter::writeCsv(TEST_RESOURCE_DIR "temp/missing/dir/out.csv", decisions), -1);
    remove(jsonPath.c_str());
    remove(csvPath.c_str());
}
