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


#include "Entity.h"

#include <cstdio>

#include "../util/Conts.h"

std::string collectionToString(Collection collection) {
    return collection == Collection::SOURCE ? "source" : "target";
}

std::string PartialDate::toString() const {
    char buffer[32];
    std::string result;
    if (year) {
        if (*year < 0) {
            snprintf(buffer, sizeof(buffer), "-%04d", -*year);
        } else {
            snprintf(buffer, sizeof(buffer), "%04d", *year);
        }
        result += buffer;
    } else {
        result += "????";
    }
    result += "-";
    if (month) {
        snprintf(buffer, sizeof(buffer), "%02d", *month);
        result += buffer;
    } else {
        result += "??";
    }
    result += "-";
    if (day) {
        snprintf(buffer, sizeof(buffer), "%02d", *day);
        result += buffer;
    } else {
        result += "??";
    }
    return result;
}

std::string attributeKindName(const AttributeValue &value) {
    switch (value.index()) {
        case 0:
            return Conts::ATTRIBUTE_KIND::STRING;
        case 1:
            return Conts::ATTRIBUTE_KIND::DATE;
        case 2:
            return Conts::ATTRIBUTE_KIND::LINK;
        default:
            return Conts::ATTRIBUTE_KIND::TOKENS;
    }
}

bool isEmptyAttribute(const AttributeValue &value) {
    if (auto strings = std::get_if<StringList>(&value)) return strings->values.empty();
    if (auto dates = std::get_if<DateList>(&value)) return dates->values.empty();
    if (auto links = std::get_if<LinkList>(&value)) return links->urls.empty();
    return std::get<TokenSet>(value).tokens.empty();
}

Entity::Entity(std::string id, Collection collection, std::map<std::string, AttributeValue> attributes)
    : id(std::move(id)), collection(collection), attributes(std::move(attributes)) {}

bool Entity::hasAttribute(const std::string &name) const {
    auto it = attributes.find(name);
    return it != attributes.end() && !isEmptyAttribute(it->second);
}

std::vector<std::string> Entity::getStrings(const std::string &name) const {
    const StringList *strings = getAttributeAs<StringList>(name);
    return strings ? strings->values : std::vector<std::string>();
}

std::vector<PartialDate> Entity::getDates(const std::string &name) const {
    const DateList *dates = getAttributeAs<DateList>(name);
    return dates ? dates->values : std::vector<PartialDate>();
}

std::vector<std::string> Entity::getLinks(const std::string &name) const {
    const LinkList *links = getAttributeAs<LinkList>(name);
    return links ? links->urls : std::vector<std::string>();
}

std::set<std::string> Entity::getTokens(const std::string &name) const {
    const TokenSet *tokens = getAttributeAs<TokenSet>(name);
    return tokens ? tokens->tokens : std::set<std::string>();
}
