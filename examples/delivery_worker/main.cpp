// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Reconciliation Task Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

// Delivery worker: drives webhook deliveries through a small state graph
// stored in SQLite. Run several copies against the same database to spread
// the work; leases keep every delivery on one worker at a time.

#include "common/EngineConfig.h"
#include "common/Errors.h"
#include "common/IClock.h"
#include "common/Logger.h"
#include "runtime/EntityManager.h"
#include "runtime/GraphRegistry.h"
#include "storage/SqliteEntityRepository.h"
#include "worker/WorkerLoop.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_DRAIN_TIMED_OUT = 2;  // Also used when readiness rounds stall
constexpr int EXIT_FORCED = 130;

std::atomic<RTE::WorkerLoop *> activeLoop{nullptr};

extern "C" void onShutdownSignal(int) {
    if (auto *loop = activeLoop.load()) {
        loop->requestShutdown();
    }
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = onShutdownSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        JSON configuration file\n";
    std::cout << "  --database <path>      SQLite database (overrides config)\n";
    std::cout << "  --concurrency <n>      Handlers in flight per process\n";
    std::cout << "  --run-for <seconds>    Stop after this many seconds\n";
    std::cout << "  --log-level <level>    trace, debug, info, warn, error\n";
    std::cout << "  --seed <n>             Create n demo deliveries before starting\n";
    std::cout << "  --once                 Run a single pass and exit\n";
    std::cout << "  --help                 Show this help\n\n";
    std::cout << "SIGINT/SIGTERM once drains in-flight deliveries, twice exits immediately.\n";
}

struct Options {
    std::string configFile;
    std::string database;
    std::string logLevel;
    long concurrency = 0;
    double runForSeconds = 0;
    long seed = 0;
    bool once = false;
    bool help = false;
};

Options parseArguments(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw RTE::ConfigError("Missing value for " + arg);
            }
            return argv[++i];
        };

        try {
            if (arg == "--config") {
                options.configFile = value();
            } else if (arg == "--database") {
                options.database = value();
            } else if (arg == "--concurrency") {
                options.concurrency = std::stol(value());
            } else if (arg == "--run-for") {
                options.runForSeconds = std::stod(value());
            } else if (arg == "--log-level") {
                options.logLevel = value();
            } else if (arg == "--seed") {
                options.seed = std::stol(value());
            } else if (arg == "--once") {
                options.once = true;
            } else if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else {
                throw RTE::ConfigError("Unknown option " + arg);
            }
        } catch (const std::logic_error &e) {
            // std::stol / std::stod rejected the value
            throw RTE::ConfigError("Invalid value for " + arg + ": " + e.what());
        }
    }
    return options;
}

RTE::EngineConfig buildConfig(const Options &options) {
    RTE::EngineConfig config;
    if (!options.configFile.empty()) {
        config = RTE::EngineConfig::loadFile(options.configFile);
    }
    if (!options.database.empty()) {
        config.databasePath = options.database;
    }
    if (!options.logLevel.empty()) {
        config.logLevel = options.logLevel;
    }
    if (options.concurrency != 0) {
        if (options.concurrency < 0) {
            throw RTE::ConfigError("--concurrency must be positive");
        }
        config.concurrency = static_cast<size_t>(options.concurrency);
        config.concurrencyPerType = std::min(config.concurrencyPerType, config.concurrency);
    }
    if (options.runForSeconds > 0) {
        config.runFor = std::chrono::duration_cast<RTE::Duration>(std::chrono::duration<double>(options.runForSeconds));
    }
    config.validate();
    return config;
}

// Stand-in for an HTTP client: ids ending in '7' never get through
bool deliver(const RTE::EntityKey &key) {
    return key.id.empty() || key.id.back() != '7';
}

std::shared_ptr<const RTE::StateGraph> buildDeliveryGraph() {
    using namespace std::chrono_literals;

    auto prepare = std::make_shared<RTE::FunctionHandler>([](RTE::HandlerContext &context) -> RTE::TransitionResult {
        LOG_DEBUG("delivery: Preparing payload for {}", context.key().toString());
        return "sending";
    });

    auto send = std::make_shared<RTE::FunctionHandler>([](RTE::HandlerContext &context) -> RTE::TransitionResult {
        if (!deliver(context.key())) {
            throw std::runtime_error("endpoint refused " + context.key().id);
        }
        return "delivered";
    });

    RTE::StateOptions sendingOptions;
    sendingOptions.tryInterval = 10s;
    sendingOptions.handler = send;

    RTE::StateOptions newOptions;
    newOptions.tryInterval = 30s;
    newOptions.handler = prepare;

    return RTE::StateGraph::Builder("delivery")
        .state("new", newOptions)
        .state("sending", sendingOptions)
        .state("delivered")
        .state("abandoned")
        .transition("new", "sending")
        .transition("sending", "delivered")
        .timeout("sending", "abandoned", 2min)
        .build();
}

}  // namespace

int main(int argc, char **argv) {
    Options options;
    RTE::EngineConfig config;
    try {
        options = parseArguments(argc, argv);
        if (options.help) {
            printUsage(argv[0]);
            return EXIT_CLEAN;
        }
        config = buildConfig(options);
    } catch (const RTE::ConfigError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    RTE::Logger::initialize(config.logDirectory, config.logToFile);
    if (auto level = RTE::Logger::parseLevel(config.logLevel)) {
        RTE::Logger::setLevel(*level);
    }

    std::shared_ptr<RTE::GraphRegistry> graphs = std::make_shared<RTE::GraphRegistry>();
    std::shared_ptr<RTE::SqliteEntityRepository> repository;
    auto clock = std::make_shared<RTE::SystemClock>();
    try {
        graphs->add(buildDeliveryGraph());
        repository = std::make_shared<RTE::SqliteEntityRepository>(config.databasePath);

        if (options.seed > 0) {
            RTE::EntityManager manager(repository, graphs, clock);
            size_t created = 0;
            for (long i = 0; i < options.seed; ++i) {
                if (manager.create("delivery", std::to_string(i))) {
                    created++;
                }
            }
            LOG_INFO("delivery_worker: Seeded {} deliveries", created);
        }
    } catch (const RTE::GraphDefinitionError &e) {
        LOG_ERROR("delivery_worker: Invalid state graph: {}", e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const RTE::StorageError &e) {
        LOG_ERROR("delivery_worker: Store {} unusable: {}", config.databasePath, e.what());
        return EXIT_CONFIG_ERROR;
    }

    RTE::WorkerLoop loop(repository, graphs, clock, config);
    activeLoop = &loop;
    installSignalHandlers();

    RTE::RunStats stats;
    try {
        stats = options.once ? loop.runOnce() : loop.run();
    } catch (const RTE::StorageError &e) {
        LOG_ERROR("delivery_worker: {}", e.what());
        activeLoop = nullptr;
        return EXIT_CONFIG_ERROR;
    }

    RTE::Logger::flush();
    switch (stats.outcome) {
    case RTE::RunOutcome::CLEAN:
        break;
    // Handlers still running keep their leases until expiry; skip the pool join
    case RTE::RunOutcome::DRAIN_TIMED_OUT:
    case RTE::RunOutcome::SCHEDULER_STALLED:
        std::_Exit(EXIT_DRAIN_TIMED_OUT);
    case RTE::RunOutcome::FORCED:
        std::_Exit(EXIT_FORCED);
    }

    activeLoop = nullptr;
    return EXIT_CLEAN;
}
