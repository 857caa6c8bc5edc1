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


#include "ArmaJson.h"

#include <stdexcept>
#include <vector>

json matToJson(const arma::mat &matrix) {
    json rows = json::array();
    for (arma::uword r = 0; r < matrix.n_rows; r++) {
        json row = json::array();
        for (arma::uword c = 0; c < matrix.n_cols; c++) {
            row.push_back(matrix(r, c));
        }
        rows.push_back(row);
    }
    return rows;
}

json vecToJson(const arma::vec &vector) {
    json values = json::array();
    for (arma::uword i = 0; i < vector.n_elem; i++) {
        values.push_back(vector(i));
    }
    return values;
}

arma::mat matFromJson(const json &value) {
    if (!value.is_array()) throw std::invalid_argument("matrix must be an array of rows");
    if (value.empty()) return arma::mat();

    size_t columns = value.at(0).size();
    arma::mat matrix(value.size(), columns);
    for (size_t r = 0; r < value.size(); r++) {
        const json &row = value.at(r);
        if (!row.is_array() || row.size() != columns) {
            throw std::invalid_argument("matrix rows must all have " + std::to_string(columns) + " columns");
        }
        for (size_t c = 0; c < columns; c++) {
            if (!row.at(c).is_number()) throw std::invalid_argument("matrix values must be numbers");
            matrix(r, c) = row.at(c).get<double>();
        }
    }
    return matrix;
}

arma::vec vecFromJson(const json &value) {
    if (!value.is_array()) throw std::invalid_argument("vector must be an array");
    arma::vec vector(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        if (!value.at(i).is_number()) throw std::invalid_argument("vector values must be numbers");
        vector(i) = value.at(i).get<double>();
    }
    return vector;
}
