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


#ifndef CATALOGLINKER_ARMAJSON_H
#define CATALOGLINKER_ARMAJSON_H

#include <armadillo>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Matrices are stored row by row as nested arrays
json matToJson(const arma::mat &matrix);

json vecToJson(const arma::vec &vector);

// Throw std::invalid_argument when the JSON is not a rectangular array of numbers
arma::mat matFromJson(const json &value);

arma::vec vecFromJson(const json &value);

#endif  // CATALOGLINKER_ARMAJSON_H
