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


#include "ResolutionEngine.h"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "../classifier/ClassifierFactory.h"
#include "../decision/PredictionMerger.h"
#include "../util/Utils.h"
#include "../util/logger/Logger.h"

using namespace std;

Logger engine_logger;

size_t ResolutionResult::count(LinkLabel label) const {
    return count_if(decisions.begin(), decisions.end(),
                    [label](const LinkDecision &decision) { return decision.label == label; });
}

static LinkerConfig validated(LinkerConfig config) {
    config.validate();
    return config;
}

ResolutionEngine::ResolutionEngine(LinkerConfig config)
    : config(validated(std::move(config))),
      blocker(Blocker::fromConfig(this->config)),
      extractor(FeatureExtractor::fromConfig(this->config)),
      ruleLinker("rule:" + Utils::join(this->config.ruleFeatures, "+"), this->config.ruleFeatures),
      linkingRules(LinkingRules::fromConfig(this->config)),
      decisionLayer(DecisionLayer::fromConfig(this->config)),
      executor(make_unique<ParallelExecutor>(this->config.workers)) {
    // Fail on an unknown algorithm or ensemble member before any work is done
    ClassifierFactory::create(this->config.classifier, this->config.classifierParameters);
    engine_logger.info("Resolution engine ready: " + to_string(blocker.getStrategyCount()) +
                       " blocking strategies, schema " + extractor.getSchema().getHash() + ", " +
                       to_string(executor->getWorkerCount()) + " workers");
}

shared_ptr<const Model> ResolutionEngine::train(const EntityCollection &source, const EntityCollection &target,
                                                const ConfirmedLinks &links) const {
    TrainingSet trainingSet = TrainingSetBuilder(blocker, extractor, *executor).build(source, target, links);
    unique_ptr<Classifier> classifier = ClassifierFactory::create(config.classifier, config.classifierParameters);
    return classifier->fit(trainingSet);
}

EvaluationResult ResolutionEngine::evaluate(const EntityCollection &source, const EntityCollection &target,
                                            const ConfirmedLinks &links) const {
    TrainingSet trainingSet = TrainingSetBuilder(blocker, extractor, *executor).build(source, target, links);
    unique_ptr<Classifier> classifier = ClassifierFactory::create(config.classifier, config.classifierParameters);
    CrossValidator validator(config.folds, config.cvSeed, config.decisionThreshold);
    return validator.evaluate(*classifier, trainingSet, *executor);
}

void ResolutionEngine::requireExtractorSchema(const Model &model) const {
    if (model.getSchema() != extractor.getSchema()) {
        throw SchemaMismatch("Model " + model.getAlgorithm() + " was trained for schema " +
                                 model.getSchema().getHash() + ", extractor produces " +
                                 extractor.getSchema().getHash(),
                             model.getSchema().size(), extractor.getSchema().size());
    }
}

ResolutionResult ResolutionEngine::resolve(const EntityCollection &source, const EntityCollection &target,
                                           const Model *model) const {
    vector<const Model *> models;
    if (model != nullptr) {
        requireExtractorSchema(*model);
        models.push_back(model);
    }
    return link(source, target, ruleLinker, models);
}

ResolutionResult ResolutionEngine::resolve(const EntityCollection &source, const EntityCollection &target,
                                           const vector<shared_ptr<const Model>> &models) const {
    vector<const Model *> members;
    for (const auto &model : models) {
        if (!model) {
            throw invalid_argument("Cannot link with an empty model");
        }
        requireExtractorSchema(*model);
        if (model->isCalibrated() != models.front()->isCalibrated()) {
            throw invalid_argument("Cannot merge " + models.front()->getAlgorithm() + " and " + model->getAlgorithm() +
                                   ": one scores probabilities, the other margins");
        }
        members.push_back(model.get());
    }
    return link(source, target, ruleLinker, members);
}

ResolutionResult ResolutionEngine::baseline(const EntityCollection &source, const EntityCollection &target,
                                            const string &preset) const {
    return link(source, target, RuleBasedLinker::fromPreset(preset), {});
}

ResolutionResult ResolutionEngine::link(const EntityCollection &source, const EntityCollection &target,
                                        const RuleBasedLinker &rule, const vector<const Model *> &models) const {
    const FeatureSchema &schema = extractor.getSchema();
    for (const auto &feature : rule.getRequiredFeatures()) {
        if (schema.indexOf(feature) < 0) {
            throw SchemaMismatch("Rule " + rule.getStrategyId() + " needs feature " + feature +
                                     " which is not extracted",
                                 rule.getRequiredFeatures().size(), schema.size());
        }
    }

    vector<CandidatePair> pairs = blocker.block(source, target, *executor);
    ResolutionResult result;
    FeatureMatrix matrix = extractor.extractAll(pairs, source, target, *executor, result.errors);

    const bool fastPath = models.empty() || config.ruleFastPath;
    const bool calibrated = !models.empty() && models.front()->isCalibrated();
    const PredictionMerger merger(config.mergeStrategy, calibrated ? config.decisionThreshold : 0.0);
    string classifierStrategy;
    if (models.size() == 1) {
        classifierStrategy = "classifier:" + models.front()->getAlgorithm();
    } else if (models.size() > 1) {
        vector<string> algorithms;
        for (const Model *model : models) algorithms.push_back(model->getAlgorithm());
        classifierStrategy = "merge:" + config.mergeStrategy + ":" + Utils::join(algorithms, "+");
    }

    struct Outcome {
        optional<LinkDecision> decision;
        optional<PairError> error;
    };
    const vector<FeatureVector> &vectors = matrix.vectors;
    vector<Outcome> outcomes = executor->map<Outcome>(vectors.size(), [&](size_t index) {
        const FeatureVector &row = vectors[index];
        Outcome outcome;
        try {
            if (fastPath && rule.accepts(row, schema)) {
                outcome.decision = rule.link(row, schema);
                return outcome;
            }
            if (models.empty()) {
                outcome.decision = rule.link(row, schema);
                return outcome;
            }
            const Entity &sourceEntity = *source.find(row.pair.sourceId);
            const Entity &targetEntity = *target.find(row.pair.targetId);
            vector<double> scores;
            scores.reserve(models.size());
            for (const Model *model : models) {
                scores.push_back(model->score(row.values));
            }
            double score = merger.merge(scores);
            if (calibrated) {
                score = linkingRules.apply(score, sourceEntity, targetEntity);
                outcome.decision = decisionLayer.decide(row.pair, score, classifierStrategy);
            } else {
                bool match = linkingRules.applyToLabel(score >= 0.0, sourceEntity, targetEntity);
                outcome.decision = decisionLayer.decideLabel(row.pair, match, classifierStrategy);
            }
        } catch (const exception &e) {
            outcome.error = PairError{row.pair.sourceId, row.pair.targetId, "score", e.what()};
        }
        return outcome;
    });

    vector<LinkDecision> decisions;
    decisions.reserve(outcomes.size());
    for (auto &outcome : outcomes) {
        if (outcome.decision) {
            decisions.push_back(std::move(*outcome.decision));
        } else if (outcome.error) {
            engine_logger.warn("Scoring failed " + outcome.error->toString());
            result.errors.push_back(*outcome.error);
        }
    }
    stable_sort(result.errors.begin(), result.errors.end(), [](const PairError &a, const PairError &b) {
        return CandidatePair{a.sourceId, a.targetId} < CandidatePair{b.sourceId, b.targetId};
    });

    ResolvedDecisions resolved = decisionLayer.resolveConflicts(std::move(decisions));
    result.decisions = std::move(resolved.decisions);
    result.warnings = std::move(resolved.warnings);
    engine_logger.info("Resolved " + to_string(pairs.size()) + " candidate pairs: " +
                       to_string(result.count(LinkLabel::MATCH)) + " matches, " +
                       to_string(result.count(LinkLabel::UNDECIDED)) + " undecided, " +
                       to_string(result.count(LinkLabel::SUPERSEDED)) + " superseded, " +
                       to_string(result.errors.size()) + " errors");
    return result;
}
