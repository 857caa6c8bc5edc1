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

#include "Logger.h"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <vector>

#include "../Utils.h"

using namespace std;

static std::once_flag sinksInitialized;
static std::shared_ptr<spdlog::logger> logger;

static void initSinks() {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    // Daily rotating file, created at 00:01 like the server logs.
    string logFile = Utils::getCatalogLinkerProperty("org.cataloglinker.log.file");
    if (!logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(logFile, 0, 1));
    }
    logger = std::make_shared<spdlog::logger>("CatalogLinker", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    string level = Utils::getCatalogLinkerProperty("org.cataloglinker.log.level");
    logger->set_level(level.empty() ? spdlog::level::info : spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Logger::configure(const std::string &level) {
    std::call_once(sinksInitialized, initSinks);
    logger->set_level(spdlog::level::from_str(level));
}

void Logger::log(std::string message, const std::string log_type) {
    std::call_once(sinksInitialized, initSinks);

    if (log_type.compare("info") == 0) {
        logger->info(message);
    } else if (log_type.compare("warn") == 0) {
        logger->warn(message);
    } else if (log_type.compare("trace") == 0) {
        logger->trace(message);
    } else if (log_type.compare("error") == 0) {
        logger->error(message);
    } else if (log_type.compare("debug") == 0) {
        logger->debug(message);
    }
}
