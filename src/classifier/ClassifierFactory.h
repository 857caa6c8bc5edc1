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


#ifndef CATALOGLINKER_CLASSIFIERFACTORY_H
#define CATALOGLINKER_CLASSIFIERFACTORY_H

#include <memory>
#include <string>
#include <vector>

#include "../util/LinkerConfig.h"
#include "Classifier.h"

class ClassifierFactory {
 public:
    /**
     * Resolves a classifier name or its short alias (nb, lsvm, svm, slp, mlp) to the canonical
     * algorithm name. Throws std::invalid_argument for anything else.
     */
    static std::string canonicalName(const std::string &name);

    // The voting ensemble builds its members from the same parameters
    static std::unique_ptr<Classifier> create(const std::string &name, const ClassifierParameters &parameters);

    static std::vector<std::string> getAlgorithms();
};

#endif  // CATALOGLINKER_CLASSIFIERFACTORY_H
