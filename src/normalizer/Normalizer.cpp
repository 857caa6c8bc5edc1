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


#include "Normalizer.h"

#include <cstdint>
#include <vector>

#include "../util/Utils.h"

namespace {

struct FoldRange {
    uint32_t first;
    uint32_t last;
    const char *folded;
};

// Latin-1 Supplement, Latin Extended-A, Latin Extended-B and Latin Extended Additional,
// upper and lower case folded together
const FoldRange LATIN_FOLDS[] = {
    {0x00A0, 0x00A0, " "},  {0x00C0, 0x00C5, "a"},  {0x00C6, 0x00C6, "ae"}, {0x00C7, 0x00C7, "c"},
    {0x00C8, 0x00CB, "e"},  {0x00CC, 0x00CF, "i"},  {0x00D0, 0x00D0, "d"},  {0x00D1, 0x00D1, "n"},
    {0x00D2, 0x00D6, "o"},  {0x00D8, 0x00D8, "o"},  {0x00D9, 0x00DC, "u"},  {0x00DD, 0x00DD, "y"},
    {0x00DE, 0x00DE, "th"}, {0x00DF, 0x00DF, "ss"}, {0x00E0, 0x00E5, "a"},  {0x00E6, 0x00E6, "ae"},
    {0x00E7, 0x00E7, "c"},  {0x00E8, 0x00EB, "e"},  {0x00EC, 0x00EF, "i"},  {0x00F0, 0x00F0, "d"},
    {0x00F1, 0x00F1, "n"},  {0x00F2, 0x00F6, "o"},  {0x00F8, 0x00F8, "o"},  {0x00F9, 0x00FC, "u"},
    {0x00FD, 0x00FD, "y"},  {0x00FE, 0x00FE, "th"}, {0x00FF, 0x00FF, "y"},  {0x0100, 0x0105, "a"},
    {0x0106, 0x010D, "c"},  {0x010E, 0x0111, "d"},  {0x0112, 0x011B, "e"},  {0x011C, 0x0123, "g"},
    {0x0124, 0x0127, "h"},  {0x0128, 0x0131, "i"},  {0x0132, 0x0133, "ij"}, {0x0134, 0x0135, "j"},
    {0x0136, 0x0138, "k"},  {0x0139, 0x0142, "l"},  {0x0143, 0x014B, "n"},  {0x014C, 0x0151, "o"},
    {0x0152, 0x0153, "oe"}, {0x0154, 0x0159, "r"},  {0x015A, 0x0161, "s"},  {0x0162, 0x0167, "t"},
    {0x0168, 0x0173, "u"},  {0x0174, 0x0175, "w"},  {0x0176, 0x0178, "y"},  {0x0179, 0x017E, "z"},
    {0x017F, 0x017F, "s"},  {0x0180, 0x0183, "b"},  {0x0187, 0x0188, "c"},  {0x0189, 0x018C, "d"},
    {0x0191, 0x0192, "f"},  {0x0193, 0x0193, "g"},  {0x0197, 0x0197, "i"},  {0x0198, 0x0199, "k"},
    {0x019A, 0x019A, "l"},  {0x019D, 0x019E, "n"},  {0x019F, 0x01A1, "o"},  {0x01A4, 0x01A5, "p"},
    {0x01AB, 0x01AE, "t"},  {0x01AF, 0x01B0, "u"},  {0x01B2, 0x01B2, "v"},  {0x01B3, 0x01B4, "y"},
    {0x01B5, 0x01B6, "z"},  {0x01C4, 0x01C6, "dz"}, {0x01C7, 0x01C9, "lj"}, {0x01CA, 0x01CC, "nj"},
    {0x01CD, 0x01CE, "a"},  {0x01CF, 0x01D0, "i"},  {0x01D1, 0x01D2, "o"},  {0x01D3, 0x01DC, "u"},
    {0x01DE, 0x01E1, "a"},  {0x01E2, 0x01E3, "ae"}, {0x01E4, 0x01E7, "g"},  {0x01E8, 0x01E9, "k"},
    {0x01EA, 0x01ED, "o"},  {0x01F0, 0x01F0, "j"},  {0x01F1, 0x01F3, "dz"}, {0x01F4, 0x01F5, "g"},
    {0x01F8, 0x01F9, "n"},  {0x01FA, 0x01FB, "a"},  {0x01FC, 0x01FD, "ae"}, {0x01FE, 0x01FF, "o"},
    {0x0200, 0x0203, "a"},  {0x0204, 0x0207, "e"},  {0x0208, 0x020B, "i"},  {0x020C, 0x020F, "o"},
    {0x0210, 0x0213, "r"},  {0x0214, 0x0217, "u"},  {0x0218, 0x0219, "s"},  {0x021A, 0x021B, "t"},
    {0x021E, 0x021F, "h"},  {0x0220, 0x0220, "n"},  {0x0221, 0x0221, "d"},  {0x0224, 0x0225, "z"},
    {0x0226, 0x0227, "a"},  {0x0228, 0x0229, "e"},  {0x022A, 0x0231, "o"},  {0x0232, 0x0233, "y"},
    {0x0234, 0x0234, "l"},  {0x0235, 0x0235, "n"},  {0x0236, 0x0236, "t"},  {0x0237, 0x0237, "j"},
    {0x023A, 0x023A, "a"},  {0x023B, 0x023C, "c"},  {0x023D, 0x023D, "l"},  {0x023E, 0x023E, "t"},
    {0x023F, 0x023F, "s"},  {0x0240, 0x0240, "z"},  {0x0243, 0x0243, "b"},  {0x0244, 0x0244, "u"},
    {0x0246, 0x0247, "e"},  {0x0248, 0x0249, "j"},  {0x024A, 0x024B, "q"},  {0x024C, 0x024D, "r"},
    {0x024E, 0x024F, "y"},  {0x1E00, 0x1E01, "a"},  {0x1E02, 0x1E07, "b"},  {0x1E08, 0x1E09, "c"},
    {0x1E0A, 0x1E13, "d"},  {0x1E14, 0x1E1D, "e"},  {0x1E1E, 0x1E1F, "f"},  {0x1E20, 0x1E21, "g"},
    {0x1E22, 0x1E2B, "h"},  {0x1E2C, 0x1E2F, "i"},  {0x1E30, 0x1E35, "k"},  {0x1E36, 0x1E3D, "l"},
    {0x1E3E, 0x1E43, "m"},  {0x1E44, 0x1E4B, "n"},  {0x1E4C, 0x1E53, "o"},  {0x1E54, 0x1E57, "p"},
    {0x1E58, 0x1E5F, "r"},  {0x1E60, 0x1E69, "s"},  {0x1E6A, 0x1E71, "t"},  {0x1E72, 0x1E7B, "u"},
    {0x1E7C, 0x1E7F, "v"},  {0x1E80, 0x1E89, "w"},  {0x1E8A, 0x1E8D, "x"},  {0x1E8E, 0x1E8F, "y"},
    {0x1E90, 0x1E95, "z"},  {0x1E96, 0x1E96, "h"},  {0x1E97, 0x1E97, "t"},  {0x1E98, 0x1E98, "w"},
    {0x1E99, 0x1E99, "y"},  {0x1E9A, 0x1E9A, "a"},  {0x1E9B, 0x1E9D, "s"},  {0x1E9E, 0x1E9E, "ss"},
    {0x1EA0, 0x1EB7, "a"},  {0x1EB8, 0x1EC7, "e"},  {0x1EC8, 0x1ECB, "i"},  {0x1ECC, 0x1EE3, "o"},
    {0x1EE4, 0x1EF1, "u"},  {0x1EF2, 0x1EF9, "y"},  {0x1EFE, 0x1EFF, "y"},
};

const char *foldLatin(uint32_t codePoint) {
    for (const auto &range : LATIN_FOLDS) {
        if (codePoint >= range.first && codePoint <= range.last) {
            return range.folded;
        }
    }
    return nullptr;
}

// Combining diacritical marks left over from decomposed (NFD) input
bool isCombiningMark(uint32_t codePoint) {
    return (codePoint >= 0x0300 && codePoint <= 0x036F) || (codePoint >= 0x1AB0 && codePoint <= 0x1AFF) ||
           (codePoint >= 0x1DC0 && codePoint <= 0x1DFF) || (codePoint >= 0x20D0 && codePoint <= 0x20FF) ||
           (codePoint >= 0xFE20 && codePoint <= 0xFE2F);
}

// Lowercase form of Greek, Cyrillic, Armenian and fullwidth Latin capitals, the code point itself otherwise
uint32_t lowerNonLatin(uint32_t codePoint) {
    if (codePoint < 0x0370) return codePoint;
    // Greek
    if (codePoint == 0x0386) return 0x03AC;
    if (codePoint >= 0x0388 && codePoint <= 0x038A) return codePoint + 0x25;
    if (codePoint == 0x038C) return 0x03CC;
    if (codePoint == 0x038E || codePoint == 0x038F) return codePoint + 0x3F;
    if ((codePoint >= 0x0391 && codePoint <= 0x03A1) || (codePoint >= 0x03A3 && codePoint <= 0x03AB)) {
        return codePoint + 0x20;
    }
    if (codePoint >= 0x03D8 && codePoint <= 0x03EF) return (codePoint % 2 == 0) ? codePoint + 1 : codePoint;
    // Cyrillic
    if (codePoint >= 0x0400 && codePoint <= 0x040F) return codePoint + 0x50;
    if (codePoint >= 0x0410 && codePoint <= 0x042F) return codePoint + 0x20;
    if ((codePoint >= 0x0460 && codePoint <= 0x0481) || (codePoint >= 0x048A && codePoint <= 0x04BF) ||
        (codePoint >= 0x04D0 && codePoint <= 0x052F)) {
        return (codePoint % 2 == 0) ? codePoint + 1 : codePoint;
    }
    if (codePoint == 0x04C0) return 0x04CF;
    if (codePoint >= 0x04C1 && codePoint <= 0x04CE) return (codePoint % 2 == 1) ? codePoint + 1 : codePoint;
    // Armenian
    if (codePoint >= 0x0531 && codePoint <= 0x0556) return codePoint + 0x30;
    // Fullwidth Latin
    if (codePoint >= 0xFF21 && codePoint <= 0xFF3A) return codePoint + 0x20;
    return codePoint;
}

void appendUtf8(std::string &text, uint32_t codePoint) {
    if (codePoint < 0x80) {
        text += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        text += static_cast<char>(0xC0 | (codePoint >> 6));
        text += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        text += static_cast<char>(0xE0 | (codePoint >> 12));
        text += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        text += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        text += static_cast<char>(0xF0 | (codePoint >> 18));
        text += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        text += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        text += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

// Byte length of the UTF-8 sequence at pos, 0 when it is not a valid sequence
size_t decodeUtf8(const std::string &text, size_t pos, uint32_t &codePoint) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        codePoint = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + length > text.size()) return 0;
    for (size_t i = 1; i < length; i++) {
        unsigned char byte = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(byte)) return 0;
        codePoint = (codePoint << 6) | (byte & 0x3F);
    }
    return length;
}

bool isAsciiSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

bool isOpenBracket(char c) { return c == '(' || c == '[' || c == '{'; }

bool isCloseBracket(char c) { return c == ')' || c == ']' || c == '}'; }

// Non-ASCII bytes belong to words so that non-Latin scripts survive tokenization
bool isWordByte(char c) {
    unsigned char byte = static_cast<unsigned char>(c);
    return byte >= 0x80 || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

std::string asciiLower(std::string text) {
    for (auto &c : text) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return text;
}

// Each bracketed group, nested ones included, becomes a single space. Unbalanced brackets stay.
std::string stripBracketedGroups(const std::string &text) {
    std::vector<bool> removed(text.size(), false);
    std::vector<size_t> open;
    for (size_t i = 0; i < text.size(); i++) {
        if (isOpenBracket(text[i])) {
            open.push_back(i);
        } else if (isCloseBracket(text[i]) && !open.empty()) {
            size_t start = open.back();
            open.pop_back();
            for (size_t j = start; j <= i; j++) removed[j] = true;
        }
    }

    std::string stripped;
    stripped.reserve(text.size());
    bool inGroup = false;
    for (size_t i = 0; i < text.size(); i++) {
        if (removed[i]) {
            if (!inGroup) stripped += ' ';
            inGroup = true;
        } else {
            inGroup = false;
            stripped += text[i];
        }
    }
    return stripped;
}

std::string collapseWhitespace(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isAsciiSpace(c)) {
            pendingSpace = !result.empty();
        } else {
            if (pendingSpace) result += ' ';
            pendingSpace = false;
            result += c;
        }
    }
    return result;
}

std::vector<std::string> splitWords(const std::string &text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (isWordByte(c)) {
            current += c;
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

// Parses one date component into out. Returns false when the component is malformed.
bool parseDateComponent(const std::string &part, int maximum, std::optional<int> &out) {
    if (part == "?" || part == "??" || part == "????") {
        out.reset();
        return true;
    }
    if (!Utils::is_number(part) || part.size() > 9) return false;
    int value = std::stoi(part);
    if (value > maximum) return false;
    if (value == 0) {
        out.reset();
    } else {
        out = value;
    }
    return true;
}

}  // namespace

std::string Normalizer::normalizeText(const std::string &raw) {
    std::string folded;
    folded.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        uint32_t codePoint = 0;
        size_t length = decodeUtf8(raw, pos, codePoint);
        if (length == 0) {
            folded += raw[pos];
            pos++;
            continue;
        }
        if (length == 1) {
            char c = raw[pos];
            folded += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        } else if (!isCombiningMark(codePoint)) {
            const char *replacement = foldLatin(codePoint);
            uint32_t lower = lowerNonLatin(codePoint);
            if (replacement) {
                folded += replacement;
            } else if (lower != codePoint) {
                appendUtf8(folded, lower);
            } else {
                folded.append(raw, pos, length);
            }
        }
        pos += length;
    }
    return collapseWhitespace(stripBracketedGroups(folded));
}

std::set<std::string> Normalizer::tokenize(const std::string &raw) { return tokenize(raw, englishStopwords()); }

std::set<std::string> Normalizer::tokenizeName(const std::string &raw) { return tokenize(raw, nameStopwords()); }

std::set<std::string> Normalizer::tokenize(const std::string &raw, const std::set<std::string> &stopwords) {
    std::set<std::string> tokens;
    for (const auto &word : splitWords(normalizeText(raw))) {
        if (word.size() > 1 && stopwords.count(word) == 0) {
            tokens.insert(word);
        }
    }
    return tokens;
}

std::vector<std::string> Normalizer::characterNgrams(const std::string &text, size_t n) {
    std::vector<std::string> ngrams;
    if (n == 0) return ngrams;
    std::vector<std::string> characters;
    auto flushWord = [&]() {
        if (characters.empty()) return;
        characters.insert(characters.begin(), " ");
        characters.push_back(" ");
        for (size_t i = 0; i + n <= characters.size(); i++) {
            std::string ngram;
            for (size_t j = i; j < i + n; j++) ngram += characters[j];
            ngrams.push_back(ngram);
        }
        characters.clear();
    };

    size_t pos = 0;
    while (pos < text.size()) {
        if (isAsciiSpace(text[pos])) {
            flushWord();
            pos++;
            continue;
        }
        uint32_t codePoint = 0;
        size_t length = decodeUtf8(text, pos, codePoint);
        if (length == 0) length = 1;
        characters.push_back(text.substr(pos, length));
        pos += length;
    }
    flushWord();
    return ngrams;
}

std::optional<PartialDate> Normalizer::parseDate(const std::string &raw, int precision) {
    std::string text = Utils::trim_copy(raw);
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text[0] == '+') {
        text = text.substr(1);
    } else if (text[0] == '-') {
        negative = true;
        text = text.substr(1);
    }
    size_t timePart = text.find('T');
    if (timePart != std::string::npos) {
        text = text.substr(0, timePart);
    }

    std::vector<std::string> parts = Utils::split(text, '-');
    if (parts.empty() || parts.size() > 3) return std::nullopt;

    PartialDate date;
    if (!parseDateComponent(parts[0], 999999999, date.year)) return std::nullopt;
    if (parts.size() > 1 && !parseDateComponent(parts[1], 12, date.month)) return std::nullopt;
    if (parts.size() > 2 && !parseDateComponent(parts[2], 31, date.day)) return std::nullopt;
    if (negative && date.year) date.year = -*date.year;

    if (precision < PRECISION_YEAR) date.year.reset();
    if (precision < PRECISION_MONTH) date.month.reset();
    if (precision < PRECISION_DAY) date.day.reset();

    if (date.isEmpty()) return std::nullopt;
    return date;
}

std::string Normalizer::normalizeUrl(const std::string &raw) {
    std::string url = Utils::trim_copy(raw);
    if (url.empty()) return "";

    std::string scheme = "https";
    std::string rest = url;
    size_t separator = url.find("://");
    if (separator != std::string::npos) {
        scheme = asciiLower(url.substr(0, separator));
        rest = url.substr(separator + 3);
    } else if (url.rfind("//", 0) == 0) {
        rest = url.substr(2);
    }
    if (scheme == "http") scheme = "https";

    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) rest = rest.substr(0, fragment);

    size_t hostEnd = rest.find_first_of("/?");
    std::string host = asciiLower(rest.substr(0, hostEnd));
    std::string remainder = hostEnd == std::string::npos ? "" : rest.substr(hostEnd);

    for (const std::string port : {":80", ":443"}) {
        if (host.size() > port.size() && host.compare(host.size() - port.size(), port.size(), port) == 0) {
            host = host.substr(0, host.size() - port.size());
        }
    }
    while (host.rfind("www.", 0) == 0) host = host.substr(4);

    size_t queryStart = remainder.find('?');
    std::string path = remainder.substr(0, queryStart);
    std::string query = queryStart == std::string::npos ? "" : remainder.substr(queryStart);
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (query == "?") query.clear();

    return scheme + "://" + host + path + query;
}

std::string Normalizer::urlHost(const std::string &normalizedUrl) {
    size_t separator = normalizedUrl.find("://");
    size_t start = separator == std::string::npos ? 0 : separator + 3;
    size_t end = normalizedUrl.find_first_of("/?", start);
    return normalizedUrl.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::set<std::string> Normalizer::tokenizeUrl(const std::string &raw) {
    std::set<std::string> tokens;
    std::string url = normalizeUrl(raw);
    if (url.empty()) return tokens;

    std::string host = urlHost(url);
    std::vector<std::string> labels = Utils::split(host, '.');
    if (labels.size() > 1) labels.pop_back();  // top-level domain
    for (const auto &label : labels) {
        for (const auto &word : splitWords(label)) {
            std::string token = asciiLower(word);
            if (token.size() > 1 && urlStopwords().count(token) == 0) tokens.insert(token);
        }
    }

    size_t pathStart = url.find(host) + host.size();
    for (const auto &word : splitWords(url.substr(pathStart))) {
        std::string token = asciiLower(word);
        if (token.size() > 1 && urlStopwords().count(token) == 0) tokens.insert(token);
    }
    return tokens;
}

const std::set<std::string> &Normalizer::englishStopwords() {
    static const std::set<std::string> stopwords = {
        "a",     "about", "above", "after", "again", "against", "all",   "am",    "an",    "and",   "any",
        "are",   "as",    "at",    "be",    "because", "been",  "before", "being", "below", "between", "both",
        "but",   "by",    "can",   "did",   "do",    "does",    "doing", "down",  "during", "each", "few",
        "for",   "from",  "further", "had", "has",   "have",    "having", "he",   "her",   "here",  "hers",
        "him",   "his",   "how",   "i",     "if",    "in",      "into",  "is",    "it",    "its",   "me",
        "more",  "most",  "my",    "no",    "nor",   "not",     "of",    "off",   "on",    "once",  "only",
        "or",    "other", "our",   "out",   "over",  "own",     "same",  "she",   "should", "so",   "some",
        "such",  "than",  "that",  "the",   "their", "them",    "then",  "there", "these", "they",  "this",
        "those", "through", "to",  "too",   "under", "until",   "up",    "very",  "was",   "we",    "were",
        "what",  "when",  "where", "which", "while", "who",     "whom",  "why",   "will",  "with",  "you",
        "your"};
    return stopwords;
}

const std::set<std::string> &Normalizer::nameStopwords() {
    static const std::set<std::string> stopwords = {"mr", "mrs", "ms",  "miss", "dr",  "prof", "sir",
                                                    "lord", "lady", "jr", "sr", "the", "and", "of"};
    return stopwords;
}

const std::set<std::string> &Normalizer::urlStopwords() {
    static const std::set<std::string> stopwords = {"http", "https", "www",  "com",  "org",  "net",
                                                    "info", "html",  "htm",  "php",  "asp",  "aspx",
                                                    "jsp",  "index", "wiki", "home", "page", "en"};
    return stopwords;
}
