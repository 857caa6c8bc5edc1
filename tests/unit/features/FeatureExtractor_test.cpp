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


#include "../../../src/features/FeatureExtractor.h"

#include <cmath>
#include <stdexcept>

#include "../../../src/normalizer/Normalizer.h"
#include "../../../src/util/Conts.h"
#include "gtest/gtest.h"

class FeatureExtractorTest : public ::testing::Test {
 protected:
    EntityCollection source{Collection::SOURCE};
    EntityCollection target{Collection::TARGET};
    ParallelExecutor executor{2};
    LinkerConfig config;

    void SetUp() override {
        std::map<std::string, AttributeValue> hartshorne;
        hartshorne[Conts::ATTRIBUTE::NAME] = StringList{{"Charles Hartshorne"}};
        hartshorne[Conts::ATTRIBUTE::BIRTH_DATE] =
            DateList{{*Normalizer::parseDate("1897-06-05", Normalizer::PRECISION_YEAR)}};
        hartshorne[Conts::ATTRIBUTE::OCCUPATIONS] = TokenSet{{"philosopher", "professor"}};
        source.add(Entity("Q1", Collection::SOURCE, hartshorne));

        std::map<std::string, AttributeValue> ada;
        ada[Conts::ATTRIBUTE::NAME] = StringList{{"Ada Lovelace", "Augusta Ada King"}};
        ada[Conts::ATTRIBUTE::URL] = LinkList{{"http://www.example.org/people/ada"}};
        source.add(Entity("Q2", Collection::SOURCE, ada));

        std::map<std::string, AttributeValue> t1;
        t1[Conts::ATTRIBUTE::NAME] = StringList{{"charles hartshorne"}};
        t1[Conts::ATTRIBUTE::BIRTH_DATE] = DateList{{*Normalizer::parseDate("1897")}};
        t1[Conts::ATTRIBUTE::OCCUPATIONS] = TokenSet{{"Philosopher"}};
        target.add(Entity("T1", Collection::TARGET, t1));

        std::map<std::string, AttributeValue> t2;
        t2[Conts::ATTRIBUTE::NAME] = StringList{{"Ada King"}};
        t2[Conts::ATTRIBUTE::URL] = LinkList{{"https://example.org/people/ada/"}};
        target.add(Entity("T2", Collection::TARGET, t2));

        std::map<std::string, AttributeValue> t3;
        t3[Conts::ATTRIBUTE::URL] = LinkList{{"https://example.org/people/charles"}};
        target.add(Entity("T3", Collection::TARGET, t3));
    }

    double value(const FeatureVector &vector, const FeatureExtractor &extractor, const std::string &featureId) {
        int index = extractor.getSchema().indexOf(featureId);
        EXPECT_GE(index, 0);
        return vector.values.at(index);
    }
};

TEST_F(FeatureExtractorTest, TestSchemaFollowsConfiguredOrder) {
    FeatureExtractor extractor = FeatureExtractor::fromConfig(config);
    ASSERT_EQ(extractor.getSchema().getFeatureIds(), config.features);

    LinkerConfig reordered = config;
    std::swap(reordered.features[0], reordered.features[1]);
    FeatureExtractor other = FeatureExtractor::fromConfig(reordered);
    ASSERT_NE(other.getSchema().getHash(), extractor.getSchema().getHash());
    ASSERT_EQ(FeatureSchema().getHash(), "cbf29ce484222325");
}

TEST_F(FeatureExtractorTest, TestExactNameAndBirthYear) {
    FeatureExtractor extractor = FeatureExtractor::fromConfig(config);
    CandidatePair pair("Q1", "T1");
    FeatureVector vector = extractor.extract(pair, *source.find("Q1"), *target.find("T1"));

    ASSERT_EQ(vector.values.size(), extractor.getSchema().size());
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::NAME_EXACT), 1.0);
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::NAME_SIMILARITY), 1.0);
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::BIRTH_DATE), 1.0);
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::SHARED_OCCUPATIONS), 0.5);
    // Neither side has a death date or a link
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::DEATH_DATE), 0.0);
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::URL_EXACT), 0.0);
}

TEST_F(FeatureExtractorTest, TestAliasesAndLinks) {
    FeatureExtractor extractor = FeatureExtractor::fromConfig(config);
    FeatureVector ada = extractor.extract(CandidatePair("Q2", "T2"), *source.find("Q2"), *target.find("T2"));
    ASSERT_DOUBLE_EQ(value(ada, extractor, Conts::FEATURE::NAME_EXACT), 0.0);
    ASSERT_DOUBLE_EQ(value(ada, extractor, Conts::FEATURE::URL_EXACT), 1.0);
    // "augusta ada king" against "ada king" is the closest alias pair
    ASSERT_DOUBLE_EQ(value(ada, extractor, Conts::FEATURE::NAME_SIMILARITY), 0.5);

    // Same host, different path
    FeatureVector sameSpace = extractor.extract(CandidatePair("Q2", "T3"), *source.find("Q2"), *target.find("T3"));
    ASSERT_DOUBLE_EQ(value(sameSpace, extractor, Conts::FEATURE::URL_EXACT), LinkAgreementFeature::SAME_ID_SPACE_SCORE);

    LinkerConfig strict = config;
    strict.linkSameIdSpace = false;
    FeatureExtractor strictExtractor = FeatureExtractor::fromConfig(strict);
    FeatureVector strictVector =
        strictExtractor.extract(CandidatePair("Q2", "T3"), *source.find("Q2"), *target.find("T3"));
    ASSERT_DOUBLE_EQ(value(strictVector, strictExtractor, Conts::FEATURE::URL_EXACT), 0.0);
}

TEST_F(FeatureExtractorTest, TestThresholdBinarizesSimilarity) {
    LinkerConfig binarized = config;
    binarized.stringThreshold = 0.99;
    FeatureExtractor extractor = FeatureExtractor::fromConfig(binarized);
    FeatureVector ada = extractor.extract(CandidatePair("Q2", "T2"), *source.find("Q2"), *target.find("T2"));
    ASSERT_DOUBLE_EQ(value(ada, extractor, Conts::FEATURE::NAME_SIMILARITY), 0.0);
}

TEST_F(FeatureExtractorTest, TestExtractAllIsDeterministic) {
    FeatureExtractor extractor = FeatureExtractor::fromConfig(config);
    std::vector<CandidatePair> pairs = {{"Q1", "T1"}, {"Q1", "T3"}, {"Q2", "T2"}, {"Q2", "T3"}};

    std::vector<PairError> errors;
    FeatureMatrix first = extractor.extractAll(pairs, source, target, executor, errors);
    ParallelExecutor single(1);
    FeatureMatrix second = extractor.extractAll(pairs, source, target, single, errors);

    ASSERT_TRUE(errors.empty());
    ASSERT_EQ(first.schema, extractor.getSchema());
    ASSERT_EQ(first.vectors.size(), pairs.size());
    for (size_t i = 0; i < pairs.size(); i++) {
        ASSERT_EQ(first.vectors[i].pair, pairs[i]);
        ASSERT_EQ(first.vectors[i].values, second.vectors[i].values);
    }
}

TEST_F(FeatureExtractorTest, TestUnknownEntityBecomesPairError) {
    FeatureExtractor extractor = FeatureExtractor::fromConfig(config);
    std::vector<CandidatePair> pairs = {{"Q1", "T1"}, {"Q1", "T404"}, {"Q9", "T2"}};

    std::vector<PairError> errors;
    FeatureMatrix matrix = extractor.extractAll(pairs, source, target, executor, errors);
    ASSERT_EQ(matrix.vectors.size(), 1);
    ASSERT_EQ(errors.size(), 2);
    ASSERT_EQ(errors[0].targetId, "T404");
    ASSERT_EQ(errors[0].stage, "extract");
    ASSERT_EQ(errors[1].sourceId, "Q9");
}

TEST_F(FeatureExtractorTest, TestRegistryRejectsUnknownAndDuplicates) {
    ASSERT_THROW(FeatureExtractor::createFeature("shoe_size", config), std::invalid_argument);

    FeatureExtractor extractor;
    extractor.addFeature(FeatureExtractor::createFeature(Conts::FEATURE::NAME_EXACT, config));
    ASSERT_THROW(extractor.addFeature(FeatureExtractor::createFeature(Conts::FEATURE::NAME_EXACT, config)),
                 std::invalid_argument);
    ASSERT_EQ(extractor.getSchema().size(), 1);
}

TEST_F(FeatureExtractorTest, TestDescriptionGenreAndCharacterFeatures) {
    std::map<std::string, AttributeValue> writer;
    writer[Conts::ATTRIBUTE::NAME] = StringList{{"Ann"}};
    writer[Conts::ATTRIBUTE::DESCRIPTION] = StringList{{"German philosopher and logician"}};
    writer[Conts::ATTRIBUTE::GENRES] = TokenSet{{"Science fiction", "Horror"}};
    Entity sourceWriter("Q7", Collection::SOURCE, writer);

    std::map<std::string, AttributeValue> candidate;
    candidate[Conts::ATTRIBUTE::NAME] = StringList{{"Anna"}};
    candidate[Conts::ATTRIBUTE::DESCRIPTION] = StringList{{"American philosopher,", "logician"}};
    candidate[Conts::ATTRIBUTE::GENRES] = TokenSet{{"science", "Fantasy"}};
    Entity targetWriter("T7", Collection::TARGET, candidate);

    LinkerConfig everything = config;
    everything.features = Conts::FEATURE::ALL;
    FeatureExtractor extractor = FeatureExtractor::fromConfig(everything);
    ASSERT_EQ(extractor.getSchema().size(), Conts::FEATURE::ALL.size());
    FeatureVector vector = extractor.extract(CandidatePair("Q7", "T7"), sourceWriter, targetWriter);

    // " ann " and " anna " share " a", "an", "nn" out of 4 and 5 bigrams
    ASSERT_NEAR(value(vector, extractor, Conts::FEATURE::NAME_CHARACTER_COSINE), 3.0 / (2.0 * std::sqrt(5.0)), 1e-9);
    // {german, philosopher, logician} against {american, philosopher, logician}
    ASSERT_NEAR(value(vector, extractor, Conts::FEATURE::DESCRIPTION_COSINE), 2.0 / 3.0, 1e-9);
    // {science, fiction, horror} against {science, fantasy}: one shared word over the smaller set
    ASSERT_DOUBLE_EQ(value(vector, extractor, Conts::FEATURE::SHARED_GENRES), 0.5);
}

TEST_F(FeatureExtractorTest, TestCharacterCosineOfIdenticalAndMissingNames) {
    auto feature = FeatureExtractor::createFeature(Conts::FEATURE::NAME_CHARACTER_COSINE, config);
    ASSERT_NEAR(feature->compute(*source.find("Q1"), *target.find("T1")), 1.0, 1e-12);
    // T3 has no name
    ASSERT_DOUBLE_EQ(feature->compute(*source.find("Q1"), *target.find("T3")), 0.0);

    // Neither side describes itself
    auto description = FeatureExtractor::createFeature(Conts::FEATURE::DESCRIPTION_COSINE, config);
    ASSERT_DOUBLE_EQ(description->compute(*source.find("Q1"), *target.find("T1")), 0.0);
}

