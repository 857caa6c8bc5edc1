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


#include "EntitySource.h"

#include <stdexcept>

#include "../normalizer/Normalizer.h"
#include "../util/Conts.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;

Logger source_logger;

EntityCollection EntitySource::load(const set<string> &requiredAttributes) {
    vector<Entity> entities = readEntities();
    size_t read = entities.size();
    EntityCollection entityCollection =
        EntityCollection::fromEntities(collection, std::move(entities), requiredAttributes);
    for (const auto &rejection : entityCollection.getRejections()) {
        rejections.push_back(rejection);
    }
    source_logger.info("Loaded " + to_string(entityCollection.size()) + " of " + to_string(read) + " " +
                       collectionToString(collection) + " entities");
    return entityCollection;
}

template <typename T>
static T &slotFor(map<string, AttributeValue> &attributes, const string &name, const string &kind) {
    auto it = attributes.find(name);
    if (it == attributes.end()) {
        it = attributes.emplace(name, T{}).first;
    }
    T *slot = get_if<T>(&it->second);
    if (slot == nullptr) {
        throw invalid_argument("attribute " + name + " holds " + attributeKindName(it->second) +
                               " values, cannot add " + kind);
    }
    return *slot;
}

void EntitySource::appendValue(map<string, AttributeValue> &attributes, const string &name, const string &kind,
                               const string &raw, int datePrecision) {
    string value = Utils::trim_copy(raw);
    if (kind == Conts::ATTRIBUTE_KIND::STRING) {
        StringList &slot = slotFor<StringList>(attributes, name, kind);
        if (!value.empty()) slot.values.push_back(value);
    } else if (kind == Conts::ATTRIBUTE_KIND::DATE) {
        DateList &slot = slotFor<DateList>(attributes, name, kind);
        if (value.empty()) return;
        optional<PartialDate> date = Normalizer::parseDate(value, datePrecision);
        if (date) {
            slot.values.push_back(*date);
        } else {
            source_logger.debug("Dropping unparseable date '" + value + "' of " + name);
        }
    } else if (kind == Conts::ATTRIBUTE_KIND::LINK) {
        LinkList &slot = slotFor<LinkList>(attributes, name, kind);
        if (!value.empty()) slot.urls.push_back(value);
    } else if (kind == Conts::ATTRIBUTE_KIND::TOKENS) {
        TokenSet &slot = slotFor<TokenSet>(attributes, name, kind);
        if (!value.empty()) slot.tokens.insert(value);
    } else {
        throw invalid_argument("unknown attribute kind '" + kind + "' for " + name);
    }
}
