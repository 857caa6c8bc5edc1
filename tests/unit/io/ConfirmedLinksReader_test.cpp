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


#include "../../../src/io/ConfirmedLinksReader.h"

#include "gtest/gtest.h"

TEST(ConfirmedLinksReaderTest, TestReadLinks) {
    ConfirmedLinks links;
    ASSERT_EQ(ConfirmedLinksReader::read(TEST_RESOURCE_DIR "links.csv", links), 0);

    // Header, comment, blank and malformed lines are skipped; Q1 keeps its first target
    ASSERT_EQ(links.size(), 2);
    ASSERT_EQ(links.at("Q1"), "T1");
    ASSERT_EQ(links.at("Q2"), "T2");
    ASSERT_EQ(links.count("Q4"), 0);
    ASSERT_EQ(links.count("Q5"), 0);
}

TEST(ConfirmedLinksReaderTest, TestMissingFile) {
    ConfirmedLinks links;
    ASSERT_EQ(ConfirmedLinksReader::read(TEST_RESOURCE_DIR "no_such_links.csv", links), -1);
    ASSERT_TRUE(links.empty());
}
