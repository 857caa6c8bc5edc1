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

#include "../../../src/decision/PredictionMerger.h"

#include <stdexcept>

#include "../../../src/util/Conts.h"
#include "gtest/gtest.h"

TEST(PredictionMergerTest, TestMajorityVote) {
    PredictionMerger merger(Conts::MERGE::MAJORITY_VOTE, 0.5);
    // Two of three reach the threshold: the strongest score wins
    ASSERT_DOUBLE_EQ(merger.merge({0.6, 0.2, 0.9}), 0.9);
    // One of three: the weakest score wins
    ASSERT_DOUBLE_EQ(merger.merge({0.6, 0.2, 0.1}), 0.1);
    // Half is enough
    ASSERT_DOUBLE_EQ(merger.merge({0.5, 0.3}), 0.5);
    ASSERT_DOUBLE_EQ(merger.merge({0.7}), 0.7);
}

TEST(PredictionMergerTest, TestMajorityVoteOverMargins) {
    PredictionMerger merger(Conts::MERGE::MAJORITY_VOTE, 0.0);
    ASSERT_DOUBLE_EQ(merger.merge({1.5, -0.2, 0.0}), 1.5);
    ASSERT_DOUBLE_EQ(merger.merge({-1.5, -0.2, 0.3}), -1.5);
}

TEST(PredictionMergerTest, TestUnionAndIntersection) {
    PredictionMerger unionMerger(Conts::MERGE::UNION, 0.5);
    PredictionMerger intersection(Conts::MERGE::INTERSECTION, 0.5);
    std::vector<double> scores = {0.3, 0.8, 0.55};
    ASSERT_DOUBLE_EQ(unionMerger.merge(scores), 0.8);
    ASSERT_DOUBLE_EQ(intersection.merge(scores), 0.3);
    ASSERT_EQ(intersection.getStrategy(), "intersection");
}

TEST(PredictionMergerTest, TestInvalidInput) {
    ASSERT_THROW(PredictionMerger("stacked", 0.5), std::invalid_argument);
    PredictionMerger merger(Conts::MERGE::UNION, 0.5);
    ASSERT_THROW(merger.merge({}), std::invalid_argument);
}
