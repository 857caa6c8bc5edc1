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


#include "../../../src/normalizer/Normalizer.h"

#include "gtest/gtest.h"

TEST(NormalizerTest, TestNormalizeTextFoldsCaseAndDiacritics) {
    ASSERT_EQ(Normalizer::normalizeText("Émile DURKHEIM"), "emile durkheim");
    ASSERT_EQ(Normalizer::normalizeText("Łukasz Żółć"), "lukasz zolc");
    ASSERT_EQ(Normalizer::normalizeText("  Ada\t  Lovelace \n"), "ada lovelace");
}

TEST(NormalizerTest, TestNormalizeTextRemovesBracketedAnnotations) {
    ASSERT_EQ(Normalizer::normalizeText("John Smith (painter)"), "john smith");
    ASSERT_EQ(Normalizer::normalizeText("Smith [b. 1900 (approx)] John"), "smith john");
    // Unbalanced brackets are kept
    ASSERT_EQ(Normalizer::normalizeText("Smith (painter"), "smith (painter");
}

TEST(NormalizerTest, TestNormalizeTextFoldsExtendedLatin) {
    // Comma below (Romanian) and the legacy cedilla forms fold alike
    ASSERT_EQ(Normalizer::normalizeText("Ștefan Lupașcu"), "stefan lupascu");
    ASSERT_EQ(Normalizer::normalizeText("Ştefan Lupaşcu"), "stefan lupascu");
    ASSERT_EQ(Normalizer::normalizeText("Țara"), "tara");
    ASSERT_EQ(Normalizer::normalizeText("Ǎda"), "ada");
    ASSERT_EQ(Normalizer::normalizeText("Nguyễn Du"), "nguyen du");
    ASSERT_EQ(Normalizer::normalizeText("Hồ Xuân Hương"), "ho xuan huong");
    ASSERT_EQ(Normalizer::normalizeText("Trần Hưng Đạo"), "tran hung dao");
}

TEST(NormalizerTest, TestNormalizeTextDropsCombiningMarks) {
    // E followed by U+0301 COMBINING ACUTE ACCENT
    std::string decomposed = "E\xCC\x81mile";
    ASSERT_EQ(Normalizer::normalizeText(decomposed), "emile");
    ASSERT_EQ(Normalizer::normalizeText(decomposed), Normalizer::normalizeText("Émile"));
    // n followed by U+0303 COMBINING TILDE
    ASSERT_EQ(Normalizer::normalizeText("Pen\xCC\x83" "a"), "pena");
}

TEST(NormalizerTest, TestNormalizeTextLowercasesNonLatinScripts) {
    ASSERT_EQ(Normalizer::normalizeText("Лев Толстой"), "лев толстой");
    ASSERT_EQ(Normalizer::normalizeText("ЁЖИК Ѓ"), "ёжик ѓ");
    ASSERT_EQ(Normalizer::normalizeText("Νίκος Καζαντζάκης"), "νίκος καζαντζάκης");
    ASSERT_EQ(Normalizer::normalizeText("ΆΈΉΊΌΎΏ"), "άέήίόύώ");
    ASSERT_EQ(Normalizer::normalizeText("Հայ"), "հայ");
    // Scripts without case are kept as they are
    ASSERT_EQ(Normalizer::normalizeText("夏目 漱石"), "夏目 漱石");
    std::set<std::string> tokens = Normalizer::tokenize("夏目 漱石");
    ASSERT_EQ(tokens.size(), 2);
    std::set<std::string> cyrillic = Normalizer::tokenizeName("ЛЕВ Толстой");
    std::set<std::string> expected = {"лев", "толстой"};
    ASSERT_EQ(cyrillic, expected);
}

TEST(NormalizerTest, TestNormalizationIsIdempotent) {
    std::vector<std::string> samples = {"Émile Durkheim (sociologist)",
                                        "  Ada   King ",
                                        "Лев Толстой",
                                        "",
                                        "O'Brien, Flann",
                                        "Ștefan Lupașcu",
                                        "Nguyễn Du",
                                        "Ǎda Ǆemal",
                                        "E\xCC\x81mile",
                                        "Νίκος ΚΑΖΑΝΤΖΆΚΗΣ",
                                        "ЁЖИК Ѓ Ӂ Ӏ"};
    for (const auto &sample : samples) {
        std::string once = Normalizer::normalizeText(sample);
        ASSERT_EQ(Normalizer::normalizeText(once), once);
    }
    std::string url = Normalizer::normalizeUrl("HTTP://WWW.Example.org:80/People/Ada/#bio");
    ASSERT_EQ(Normalizer::normalizeUrl(url), url);
}

TEST(NormalizerTest, TestTokenizeDropsStopwordsAndSingleLetters) {
    std::set<std::string> tokens = Normalizer::tokenize("The Life of J. Smith");
    std::set<std::string> expected = {"life", "smith"};
    ASSERT_EQ(tokens, expected);

    std::set<std::string> nameTokens = Normalizer::tokenizeName("Dr. Ada King, Countess of Lovelace");
    std::set<std::string> expectedName = {"ada", "king", "countess", "lovelace"};
    ASSERT_EQ(nameTokens, expectedName);
}

TEST(NormalizerTest, TestCharacterNgramsArePaddedPerWord) {
    std::vector<std::string> bigrams = Normalizer::characterNgrams("ab c", 2);
    std::vector<std::string> expected = {" a", "ab", "b ", " c", "c "};
    ASSERT_EQ(bigrams, expected);

    // Code points, not bytes
    std::vector<std::string> cyrillic = Normalizer::characterNgrams("лев", 2);
    std::vector<std::string> expectedCyrillic = {" л", "ле", "ев", "в "};
    ASSERT_EQ(cyrillic, expectedCyrillic);

    ASSERT_TRUE(Normalizer::characterNgrams("   ", 2).empty());
    ASSERT_TRUE(Normalizer::characterNgrams("abc", 0).empty());
    ASSERT_EQ(Normalizer::characterNgrams("aa aa", 2).size(), 6);
}

TEST(NormalizerTest, TestParseDateFullAndPartial) {
    auto full = Normalizer::parseDate("1897-06-05");
    ASSERT_TRUE(full.has_value());
    ASSERT_EQ(full->toString(), "1897-06-05");

    auto yearOnly = Normalizer::parseDate("1897");
    ASSERT_TRUE(yearOnly.has_value());
    ASSERT_EQ(*yearOnly->year, 1897);
    ASSERT_FALSE(yearOnly->month.has_value());

    auto unknownMonth = Normalizer::parseDate("1897-00-05");
    ASSERT_TRUE(unknownMonth.has_value());
    ASSERT_FALSE(unknownMonth->month.has_value());
    ASSERT_EQ(*unknownMonth->day, 5);

    auto withTime = Normalizer::parseDate("+1815-12-10T00:00:00Z");
    ASSERT_TRUE(withTime.has_value());
    ASSERT_EQ(withTime->toString(), "1815-12-10");

    auto bce = Normalizer::parseDate("-0450");
    ASSERT_TRUE(bce.has_value());
    ASSERT_EQ(*bce->year, -450);
}

TEST(NormalizerTest, TestParseDateHonoursPrecision) {
    auto year = Normalizer::parseDate("1897-06-05", Normalizer::PRECISION_YEAR);
    ASSERT_TRUE(year.has_value());
    ASSERT_EQ(*year->year, 1897);
    ASSERT_FALSE(year->month.has_value());
    ASSERT_FALSE(year->day.has_value());

    auto month = Normalizer::parseDate("1897-06-05", Normalizer::PRECISION_MONTH);
    ASSERT_TRUE(month.has_value());
    ASSERT_EQ(*month->month, 6);
    ASSERT_FALSE(month->day.has_value());

    // Nothing left below year precision
    ASSERT_FALSE(Normalizer::parseDate("1897-06-05", 7).has_value());
}

TEST(NormalizerTest, TestParseDateRejectsMalformedInput) {
    ASSERT_FALSE(Normalizer::parseDate("not a date").has_value());
    ASSERT_FALSE(Normalizer::parseDate("1897-13-01").has_value());
    ASSERT_FALSE(Normalizer::parseDate("1897-06-32").has_value());
    ASSERT_FALSE(Normalizer::parseDate("1897-06-05-01").has_value());
    ASSERT_FALSE(Normalizer::parseDate("").has_value());
    ASSERT_FALSE(Normalizer::parseDate("0000-00-00").has_value());
}

TEST(NormalizerTest, TestNormalizeUrl) {
    ASSERT_EQ(Normalizer::normalizeUrl("http://www.example.org/people/ada"), "https://example.org/people/ada");
    ASSERT_EQ(Normalizer::normalizeUrl("https://example.org/people/ada/"), "https://example.org/people/ada");
    ASSERT_EQ(Normalizer::normalizeUrl("HTTPS://Example.ORG:443/People?id=7#top"), "https://example.org/People?id=7");
    ASSERT_EQ(Normalizer::normalizeUrl("example.org"), "https://example.org");
    ASSERT_EQ(Normalizer::normalizeUrl("   "), "");
    ASSERT_EQ(Normalizer::urlHost("https://example.org/people/ada"), "example.org");
}

TEST(NormalizerTest, TestTokenizeUrl) {
    std::set<std::string> tokens = Normalizer::tokenizeUrl("https://www.imdb.com/name/nm0000123/index.html");
    std::set<std::string> expected = {"imdb", "name", "nm0000123"};
    ASSERT_EQ(tokens, expected);
}
