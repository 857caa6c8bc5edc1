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


#include <iostream>
#include <memory>
#include <vector>

#include "src/classifier/ModelStore.h"
#include "src/engine/ResolutionEngine.h"
#include "src/io/ConfirmedLinksReader.h"
#include "src/io/DecisionWriter.h"
#include "src/io/JsonLinesEntitySource.h"
#include "src/io/SQLiteEntitySource.h"
#include "src/util/LinkerConfig.h"
#include "src/util/Utils.h"
#include "src/util/logger/Logger.h"

Logger main_logger;

enum args { MODE = 1, SOURCE = 2, TARGET = 3, EXTRA = 4, OUTPUT = 5 };

static void printUsage() {
    std::cerr << "Usage:\n"
              << "  CatalogLinker train <source.jsonl> <target.jsonl|target.db> <links.csv>\n"
              << "  CatalogLinker evaluate <source.jsonl> <target.jsonl|target.db> <links.csv>\n"
              << "  CatalogLinker link <source.jsonl> <target.jsonl|target.db> <model.json|algorithm[,algorithm...]|-> "
                 "<decisions.jsonl|.csv>\n"
              << "  CatalogLinker baseline <source.jsonl> <target.jsonl|target.db> <perfect_name|links|name_and_link> "
                 "<decisions.jsonl|.csv>"
              << std::endl;
}

static bool endsWith(const std::string &value, const std::string &suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static EntityCollection loadTarget(const std::string &path, const LinkerConfig &config) {
    if (endsWith(path, ".db") || endsWith(path, ".sqlite")) {
        return SQLiteEntitySource::fromConfig(path, config).load(config.requiredAttributes);
    }
    return JsonLinesEntitySource(path, Collection::TARGET).load(config.requiredAttributes);
}

static int writeDecisions(const std::string &path, const ResolutionResult &result) {
    for (const auto &error : result.errors) {
        main_logger.warn("Pair error " + error.toString());
    }
    main_logger.info(std::to_string(result.count(LinkLabel::MATCH)) + " matches, " +
                     std::to_string(result.warnings.size()) + " superseded, " + std::to_string(result.errors.size()) +
                     " pair errors");
    if (endsWith(path, ".csv")) {
        return DecisionWriter::writeCsv(path, result.decisions);
    }
    return DecisionWriter::writeJsonLines(path, result.decisions);
}

int main(int argc, char *argv[]) {
    if (argc <= args::EXTRA) {
        printUsage();
        return -1;
    }
    std::string mode = argv[args::MODE];
    bool needsOutput = mode == "link" || mode == "baseline";
    if (needsOutput && argc <= args::OUTPUT) {
        printUsage();
        return -1;
    }

    try {
        LinkerConfig config = LinkerConfig::load();
        Logger::configure(config.logLevel);
        main_logger.info("Using CATALOGLINKER_HOME=" + Utils::getCatalogLinkerHome());

        ResolutionEngine engine(config);
        EntityCollection source =
            JsonLinesEntitySource(argv[args::SOURCE], Collection::SOURCE).load(config.requiredAttributes);
        EntityCollection target = loadTarget(argv[args::TARGET], config);

        if (mode == "train" || mode == "evaluate") {
            ConfirmedLinks links;
            if (ConfirmedLinksReader::read(argv[args::EXTRA], links) != 0) {
                return -1;
            }
            if (mode == "train") {
                std::shared_ptr<const Model> model = engine.train(source, target, links);
                std::string path = ModelStore(config.modelDirectory).save(*model);
                std::cout << path << std::endl;
            } else {
                EvaluationResult result = engine.evaluate(source, target, links);
                std::cout << result.toString() << std::endl;
            }
        } else if (mode == "link") {
            // A .json path, or stored algorithms whose scores are merged
            ModelStore store(config.modelDirectory);
            std::vector<std::shared_ptr<const Model>> models;
            std::string modelArgument = argv[args::EXTRA];
            if (endsWith(modelArgument, ".json")) {
                models.push_back(store.load(modelArgument, engine.getSchema()));
            } else if (modelArgument != "-") {
                for (const auto &algorithm : Utils::splitAndTrim(modelArgument, ',')) {
                    models.push_back(store.loadFor(algorithm, engine.getSchema()));
                }
            }
            ResolutionResult result = engine.resolve(source, target, models);
            return writeDecisions(argv[args::OUTPUT], result);
        } else if (mode == "baseline") {
            ResolutionResult result = engine.baseline(source, target, argv[args::EXTRA]);
            return writeDecisions(argv[args::OUTPUT], result);
        } else {
            main_logger.error("Unknown mode " + mode);
            printUsage();
            return -1;
        }
    } catch (const LinkerError &e) {
        main_logger.error(e.what());
        return -1;
    } catch (const std::invalid_argument &e) {
        main_logger.error(std::string("Invalid configuration: ") + e.what());
        return -1;
    }
    return 0;
}
