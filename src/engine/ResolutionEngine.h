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


#ifndef CATALOGLINKER_RESOLUTIONENGINE_H
#define CATALOGLINKER_RESOLUTIONENGINE_H

#include <memory>
#include <string>
#include <vector>

#include "../blocking/Blocker.h"
#include "../classifier/CrossValidator.h"
#include "../classifier/Model.h"
#include "../classifier/TrainingSetBuilder.h"
#include "../decision/DecisionLayer.h"
#include "../features/FeatureExtractor.h"
#include "../linker/LinkingRules.h"
#include "../linker/RuleBasedLinker.h"
#include "../util/LinkerConfig.h"
#include "../util/executor/ParallelExecutor.h"

struct ResolutionResult {
    // One decision per scored candidate pair, sorted by pair
    std::vector<LinkDecision> decisions;
    std::vector<PairError> errors;
    std::vector<PairConflictWarning> warnings;

    size_t count(LinkLabel label) const;
};

/**
 * Blocking, feature extraction, rule and classifier linking and the decision layer wired
 * together from one LinkerConfig. Every call is synchronous and leaves the engine unchanged.
 */
class ResolutionEngine {
 public:
    explicit ResolutionEngine(LinkerConfig config);

    const LinkerConfig &getConfig() const { return config; }
    const FeatureSchema &getSchema() const { return extractor.getSchema(); }
    ParallelExecutor &getExecutor() const { return *executor; }

    // Throws TrainingError when no usable training set can be derived or the algorithm fails
    std::shared_ptr<const Model> train(const EntityCollection &source, const EntityCollection &target,
                                       const ConfirmedLinks &links) const;

    EvaluationResult evaluate(const EntityCollection &source, const EntityCollection &target,
                              const ConfirmedLinks &links) const;

    /**
     * Links every blocked pair. With a model, pairs the rule accepts skip the classifier when
     * the fast path is on and the rest are scored; without one the rule decides every pair.
     * Throws SchemaMismatch when the model was trained for another feature schema.
     */
    ResolutionResult resolve(const EntityCollection &source, const EntityCollection &target,
                             const Model *model) const;

    /**
     * Links with several models at once. Every pair the classifiers score gets one score per
     * model, merged under the configured merge strategy. Throws SchemaMismatch as above and
     * std::invalid_argument when the models mix probabilities and margins.
     */
    ResolutionResult resolve(const EntityCollection &source, const EntityCollection &target,
                             const std::vector<std::shared_ptr<const Model>> &models) const;

    // Rule-based linking alone under a preset rule
    ResolutionResult baseline(const EntityCollection &source, const EntityCollection &target,
                              const std::string &preset) const;

 private:
    ResolutionResult link(const EntityCollection &source, const EntityCollection &target,
                          const RuleBasedLinker &rule, const std::vector<const Model *> &models) const;

    void requireExtractorSchema(const Model &model) const;

    LinkerConfig config;
    Blocker blocker;
    FeatureExtractor extractor;
    RuleBasedLinker ruleLinker;
    LinkingRules linkingRules;
    DecisionLayer decisionLayer;
    std::unique_ptr<ParallelExecutor> executor;
};

#endif  // CATALOGLINKER_RESOLUTIONENGINE_H
