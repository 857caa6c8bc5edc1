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

#include "VotingClassifier.h"

#include "../util/Conts.h"
#include "../util/logger/Logger.h"
#include "ClassifierFactory.h"

using namespace std;
using json = nlohmann::json;

Logger voting_logger;

static void requireVotingMode(const string &voting) {
    if (voting != Conts::VOTING_MODE::SOFT && voting != Conts::VOTING_MODE::HARD) {
        throw invalid_argument("Unknown voting mode: " + voting);
    }
}

VotingKernel::VotingKernel(string voting, vector<Member> members)
    : voting(std::move(voting)), members(std::move(members)) {
    requireVotingMode(this->voting);
    if (this->members.empty()) {
        throw invalid_argument("a voting ensemble needs at least one member");
    }
    for (const auto &member : this->members) {
        if (!member.kernel) {
            throw invalid_argument("voting member " + member.algorithm + " has no parameters");
        }
        if (this->voting == Conts::VOTING_MODE::SOFT && !member.calibrated) {
            throw invalid_argument("soft voting needs probabilities, " + member.algorithm + " only gives margins");
        }
    }
}

double VotingKernel::decisionValue(const arma::rowvec &features) const {
    if (voting == Conts::VOTING_MODE::SOFT) {
        double sum = 0.0;
        for (const auto &member : members) {
            sum += member.kernel->decisionValue(features);
        }
        return sum / static_cast<double>(members.size());
    }
    int balance = 0;
    for (const auto &member : members) {
        double value = member.kernel->decisionValue(features);
        bool match = member.calibrated ? value >= 0.5 : value >= 0.0;
        balance += match ? 1 : -1;
    }
    return static_cast<double>(balance) / static_cast<double>(members.size());
}

json VotingKernel::toJson() const {
    json parameters;
    parameters["voting"] = voting;
    parameters["members"] = json::array();
    for (const auto &member : members) {
        json entry;
        entry["algorithm"] = member.algorithm;
        entry["calibrated"] = member.calibrated;
        entry["parameters"] = member.kernel->toJson();
        parameters["members"].push_back(entry);
    }
    return parameters;
}

shared_ptr<const VotingKernel> VotingKernel::fromJson(const json &parameters) {
    if (!parameters.is_object() || !parameters.contains("voting") || !parameters.contains("members") ||
        !parameters["members"].is_array()) {
        throw invalid_argument("voting parameters are incomplete");
    }
    vector<Member> members;
    for (const auto &entry : parameters["members"]) {
        string algorithm = ClassifierFactory::canonicalName(entry.at("algorithm").get<string>());
        if (algorithm == Conts::CLASSIFIER::VOTING) {
            throw invalid_argument("voting ensembles cannot be nested");
        }
        unique_ptr<Classifier> classifier = ClassifierFactory::create(algorithm, ClassifierParameters());
        members.push_back({algorithm, classifier->isCalibrated(), classifier->restoreKernel(entry.at("parameters"))});
    }
    return make_shared<const VotingKernel>(parameters["voting"].get<string>(), std::move(members));
}

VotingClassifier::VotingClassifier(string voting, vector<unique_ptr<Classifier>> members)
    : voting(std::move(voting)), members(std::move(members)) {
    requireVotingMode(this->voting);
    if (this->members.empty()) {
        throw invalid_argument("a voting ensemble needs at least one member");
    }
    for (const auto &member : this->members) {
        if (member->getName() == Conts::CLASSIFIER::VOTING) {
            throw invalid_argument("voting ensembles cannot be nested");
        }
        if (this->voting == Conts::VOTING_MODE::SOFT && !member->isCalibrated()) {
            throw invalid_argument("soft voting needs probabilities, " + member->getName() + " only gives margins");
        }
    }
}

string VotingClassifier::getName() const { return Conts::CLASSIFIER::VOTING; }

bool VotingClassifier::isCalibrated() const { return voting == Conts::VOTING_MODE::SOFT; }

bool VotingClassifier::isCalibratedFor(const json &parameters) const {
    return parameters.is_object() && parameters.contains("voting") && parameters["voting"] == Conts::VOTING_MODE::SOFT;
}

shared_ptr<const ClassifierKernel> VotingClassifier::restoreKernel(const json &parameters) const {
    return VotingKernel::fromJson(parameters);
}

shared_ptr<const ClassifierKernel> VotingClassifier::train(const arma::mat &features, const arma::vec &labels) const {
    vector<VotingKernel::Member> trained;
    for (const auto &member : members) {
        voting_logger.debug("Training voting member " + member->getName());
        shared_ptr<const ClassifierKernel> kernel;
        try {
            kernel = member->train(features, labels);
        } catch (const TrainingError &) {
            throw;
        } catch (const exception &e) {
            throw TrainingError(member->getName() + " inside the voting ensemble: " + e.what());
        }
        if (!kernel) {
            throw TrainingError(member->getName() + " produced no model inside the voting ensemble");
        }
        trained.push_back({member->getName(), member->isCalibrated(), kernel});
    }
    return make_shared<const VotingKernel>(voting, std::move(trained));
}
