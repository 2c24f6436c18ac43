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

#include "common/Errors.h"
#include "common/TestUtils.h"
#include "scheduler/ReadinessScheduler.h"
#include "storage/InMemoryEntityRepository.h"

#include <fstream>
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;

namespace RTE {

class ReadinessSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository = std::make_shared<InMemoryEntityRepository>();
        clock = std::make_shared<ManualClock>();

        auto handler = std::make_shared<FunctionHandler>([](HandlerContext &) -> TransitionResult { return {}; });

        StateOptions retried;
        retried.tryInterval = 30s;
        retried.handler = handler;

        StateOptions manual;
        manual.manualOnly = true;
        manual.handler = handler;

        StateOptions external;
        external.externallyProgressed = true;

        auto registry = std::make_shared<GraphRegistry>();
        registry->add(StateGraph::Builder("job")
                          .state("new", retried)
                          .state("review", manual)
                          .state("waiting", external)
                          .state("done")
                          .transition("new", "review")
                          .transition("review", "waiting")
                          .transition("waiting", "done")
                          .build());
        graphs = registry;

        scheduler = std::make_unique<ReadinessScheduler>(repository, graphs, clock, 1s);
    }

    void insertAttempted(const std::string &id, const std::string &state) {
        EntityRecord record;
        record.key = {"job", id};
        record.state = state;
        record.ready = false;
        record.changedAt = clock->now();
        record.lastAttemptedAt = clock->now();
        ASSERT_TRUE(repository->insert(record));
    }

    bool isReady(const std::string &id) {
        auto record = repository->fetch({"job", id});
        return record && record->ready;
    }

    std::shared_ptr<InMemoryEntityRepository> repository;
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<const GraphRegistry> graphs;
    std::unique_ptr<ReadinessScheduler> scheduler;
};

TEST_F(ReadinessSchedulerTest, RearmsAfterTryInterval) {
    insertAttempted("1", "new");
    Timestamp attempted = clock->now();

    auto early = scheduler->runPass(attempted + 10s);
    EXPECT_EQ(early.markedReady, 0u);
    EXPECT_FALSE(isReady("1"));

    auto late = scheduler->runPass(attempted + 31s);
    EXPECT_EQ(late.markedReady, 1u);
    EXPECT_TRUE(isReady("1"));
    EXPECT_EQ(late.readyCounts.at("job"), 1u);
}

TEST_F(ReadinessSchedulerTest, RearmsAtExactlyOneInterval) {
    insertAttempted("1", "new");
    scheduler->runPass(clock->now() + 30s);
    EXPECT_TRUE(isReady("1"));
}

TEST_F(ReadinessSchedulerTest, NeverAttemptedIsRearmedImmediately) {
    EntityRecord record;
    record.key = {"job", "1"};
    record.state = "new";
    record.ready = false;
    record.changedAt = clock->now();
    ASSERT_TRUE(repository->insert(record));

    EXPECT_EQ(scheduler->runPass().markedReady, 1u);
    EXPECT_TRUE(isReady("1"));
}

TEST_F(ReadinessSchedulerTest, ManualExternalAndTerminalStatesStayPut) {
    insertAttempted("manual", "review");
    insertAttempted("external", "waiting");
    insertAttempted("terminal", "done");

    auto result = scheduler->runPass(clock->now() + 24h);
    EXPECT_EQ(result.markedReady, 0u);
    EXPECT_FALSE(isReady("manual"));
    EXPECT_FALSE(isReady("external"));
    EXPECT_FALSE(isReady("terminal"));
}

TEST_F(ReadinessSchedulerTest, ClearsExpiredLeases) {
    EntityRecord record;
    record.key = {"job", "1"};
    record.state = "new";
    record.changedAt = clock->now();
    record.leaseExpiresAt = clock->now() + 5s;
    ASSERT_TRUE(repository->insert(record));

    EXPECT_EQ(scheduler->runPass(clock->now() + 5s).leasesCleared, 0u);
    EXPECT_EQ(scheduler->runPass(clock->now() + 6s).leasesCleared, 1u);
    EXPECT_FALSE(repository->fetch(record.key)->leaseExpiresAt.has_value());
}

TEST_F(ReadinessSchedulerTest, DrainsDispatchStats) {
    auto stats = std::make_shared<DispatchStats>();
    scheduler->setStats(stats);
    stats->recordHandled("job");
    stats->recordTransition("job");

    scheduler->runPass();
    EXPECT_TRUE(stats->drain().empty());
    EXPECT_EQ(stats->totals().at("job").handled, 1u);
}

TEST_F(ReadinessSchedulerTest, WritesLivenessFile) {
    RTE::Test::Utils::TempPath liveness("rte_liveness");
    scheduler->setLivenessFile(liveness.str());

    scheduler->runPass();

    std::ifstream file(liveness.str());
    long long written = 0;
    file >> written;
    EXPECT_GT(written, 0);
}

TEST_F(ReadinessSchedulerTest, StoreFailurePropagatesFromManualPass) {
    repository->setAvailable(false);
    EXPECT_THROW(scheduler->runPass(), StorageError);
}

TEST_F(ReadinessSchedulerTest, TimerThreadRunsPassesUntilStopped) {
    insertAttempted("1", "new");
    clock->advance(31s);

    scheduler->start();
    EXPECT_TRUE(scheduler->isRunning());
    EXPECT_TRUE(RTE::Test::Utils::waitUntil([this] { return isReady("1"); }));

    scheduler->stop();
    EXPECT_FALSE(scheduler->isRunning());
    EXPECT_GE(scheduler->completedPasses(), 1u);
}

TEST_F(ReadinessSchedulerTest, TimerThreadSurvivesStoreFailure) {
    repository->setAvailable(false);
    scheduler->start();
    std::this_thread::sleep_for(RTE::Test::Utils::STANDARD_WAIT_MS);
    EXPECT_TRUE(scheduler->isRunning());
    EXPECT_EQ(scheduler->completedPasses(), 0u);
    // A failed round still counts as the thread making progress
    EXPECT_GE(scheduler->finishedRounds(), 1u);

    repository->setAvailable(true);
    insertAttempted("1", "new");
    clock->advance(31s);
    EXPECT_TRUE(RTE::Test::Utils::waitUntil([this] { return isReady("1"); }, std::chrono::milliseconds(3000)));
    scheduler->stop();
}

}  // namespace RTE
