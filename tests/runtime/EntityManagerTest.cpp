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

#include "runtime/EntityManager.h"
#include "storage/InMemoryEntityRepository.h"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace RTE {

class EntityManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository = std::make_shared<InMemoryEntityRepository>();
        clock = std::make_shared<ManualClock>();

        auto handler = std::make_shared<FunctionHandler>([](HandlerContext &) -> TransitionResult { return {}; });
        StateOptions retried;
        retried.tryInterval = 1min;
        retried.handler = handler;
        StateOptions deferred = retried;
        deferred.attemptImmediately = false;
        StateOptions manual;
        manual.manualOnly = true;
        manual.handler = handler;

        auto registry = std::make_shared<GraphRegistry>();
        registry->add(StateGraph::Builder("ticket")
                          .state("open", retried)
                          .state("triage", manual)
                          .state("cooldown", deferred)
                          .state("closed")
                          .transition("open", "triage")
                          .transition("triage", "cooldown")
                          .transition("cooldown", "closed")
                          .build());
        manager = std::make_unique<EntityManager>(repository, registry, clock);
    }

    std::shared_ptr<InMemoryEntityRepository> repository;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<EntityManager> manager;
};

TEST_F(EntityManagerTest, CreateInsertsInitialRecordOnce) {
    auto created = manager->create("ticket", "7");
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->state, "open");
    EXPECT_TRUE(created->ready);
    EXPECT_EQ(created->changedAt, clock->now());
    EXPECT_EQ(manager->get({"ticket", "7"}), created);

    EXPECT_FALSE(manager->create("ticket", "7").has_value());
}

TEST_F(EntityManagerTest, RejectsUnknownTypesAndStates) {
    EXPECT_THROW(manager->create("invoice", "1"), std::invalid_argument);
    EXPECT_THROW(manager->create("ticket", ""), std::invalid_argument);
    EXPECT_THROW(manager->markReady({"invoice", "1"}), std::invalid_argument);

    ASSERT_TRUE(manager->create("ticket", "1"));
    EXPECT_THROW(manager->forceState({"ticket", "1"}, "reopened"), std::invalid_argument);
}

TEST_F(EntityManagerTest, MarkReadyTriggersManualState) {
    ASSERT_TRUE(manager->create("ticket", "1"));
    EntityUpdate update;
    update.state = "triage";
    update.ready = false;
    ASSERT_TRUE(repository->conditionalUpdate({"ticket", "1"}, LeaseCondition::any(), update));

    EXPECT_TRUE(manager->markReady({"ticket", "1"}));
    EXPECT_TRUE(repository->fetch({"ticket", "1"})->ready);
    EXPECT_FALSE(manager->markReady({"ticket", "missing"}));
}

TEST_F(EntityManagerTest, ForceStateAppliesEntrySemantics) {
    ASSERT_TRUE(manager->create("ticket", "1"));
    clock->advance(1h);

    EXPECT_TRUE(manager->forceState({"ticket", "1"}, "cooldown"));
    auto record = repository->fetch({"ticket", "1"});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, "cooldown");
    EXPECT_EQ(record->changedAt, clock->now());
    EXPECT_FALSE(record->ready);
    EXPECT_EQ(record->lastAttemptedAt, clock->now());

    EXPECT_TRUE(manager->forceState({"ticket", "1"}, "closed"));
    record = repository->fetch({"ticket", "1"});
    EXPECT_TRUE(record->ready);
    EXPECT_FALSE(record->lastAttemptedAt.has_value());
}

TEST_F(EntityManagerTest, ForceStateRefusedWhileLeased) {
    ASSERT_TRUE(manager->create("ticket", "1"));
    EntityUpdate lease;
    lease.leaseExpiresAt = std::optional<Timestamp>(clock->now() + 30s);
    ASSERT_TRUE(repository->conditionalUpdate({"ticket", "1"}, LeaseCondition::any(), lease));

    EXPECT_FALSE(manager->forceState({"ticket", "1"}, "closed"));
    EXPECT_EQ(repository->fetch({"ticket", "1"})->state, "open");

    clock->advance(31s);
    EXPECT_TRUE(manager->forceState({"ticket", "1"}, "closed"));
    EXPECT_FALSE(manager->forceState({"ticket", "missing"}, "closed"));
}

}  // namespace RTE
