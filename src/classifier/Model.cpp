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


#include "Model.h"

#include <cmath>
#include <stdexcept>

#include "../util/LinkerErrors.h"

Model::Model(std::string algorithm, FeatureSchema schema, bool calibrated, std::string trainedAt,
             std::string trainingSetId, std::shared_ptr<const ClassifierKernel> kernel)
    : algorithm(std::move(algorithm)),
      schema(std::move(schema)),
      calibrated(calibrated),
      trainedAt(std::move(trainedAt)),
      trainingSetId(std::move(trainingSetId)),
      kernel(std::move(kernel)) {
    if (!this->kernel) {
        throw std::invalid_argument("Model " + this->algorithm + " has no kernel");
    }
}

double Model::score(const std::vector<double> &values) const {
    if (values.size() != schema.size()) {
        throw SchemaMismatch("Feature vector does not fit model " + algorithm + " schema " + schema.getHash(),
                             schema.size(), values.size());
    }
    for (double value : values) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("non-finite feature value");
        }
    }
    return kernel->decisionValue(arma::rowvec(values));
}

bool Model::predictLabel(const std::vector<double> &values) const {
    double value = score(values);
    return calibrated ? value >= 0.5 : value >= 0.0;
}
