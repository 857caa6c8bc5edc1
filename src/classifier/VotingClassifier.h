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

#ifndef CATALOGLINKER_VOTINGCLASSIFIER_H
#define CATALOGLINKER_VOTINGCLASSIFIER_H

#include <memory>
#include <string>
#include <vector>

#include "Classifier.h"

/**
 * Kernels of several algorithms trained on the same set. Soft voting averages the member
 * probabilities. Hard voting returns (matches - non-matches) / members as a margin, so a tie
 * counts as a match.
 */
class VotingKernel : public ClassifierKernel {
 public:
    struct Member {
        std::string algorithm;
        bool calibrated;
        std::shared_ptr<const ClassifierKernel> kernel;
    };

    VotingKernel(std::string voting, std::vector<Member> members);

    double decisionValue(const arma::rowvec &features) const override;
    nlohmann::json toJson() const override;

    static std::shared_ptr<const VotingKernel> fromJson(const nlohmann::json &parameters);

    const std::vector<Member> &getMembers() const { return members; }

 private:
    std::string voting;
    std::vector<Member> members;
};

class VotingClassifier : public Classifier {
 public:
    // Throws std::invalid_argument for no members, a nested ensemble or soft voting over margins
    VotingClassifier(std::string voting, std::vector<std::unique_ptr<Classifier>> members);

    std::string getName() const override;
    bool isCalibrated() const override;
    bool isCalibratedFor(const nlohmann::json &parameters) const override;
    std::shared_ptr<const ClassifierKernel> restoreKernel(const nlohmann::json &parameters) const override;

 protected:
    std::shared_ptr<const ClassifierKernel> train(const arma::mat &features, const arma::vec &labels) const override;

 private:
    std::string voting;
    std::vector<std::unique_ptr<Classifier>> members;
};

#endif  // CATALOGLINKER_VOTINGCLASSIFIER_H
