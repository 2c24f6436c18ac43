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

#include "lease/LeaseManager.h"
#include "storage/InMemoryEntityRepository.h"

#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace RTE {

class LeaseManagerTest : public ::testing::Test {
protected:
    static constexpr int NUM_THREADS = 8;

    void SetUp() override {
        repository = std::make_shared<InMemoryEntityRepository>();
        clock = std::make_shared<ManualClock>();
        leases = std::make_unique<LeaseManager>(repository, clock);

        EntityRecord record;
        record.key = key;
        record.state = "new";
        record.changedAt = clock->now();
        ASSERT_TRUE(repository->insert(record));
    }

    EntityKey key{"job", "1"};
    std::shared_ptr<InMemoryEntityRepository> repository;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<LeaseManager> leases;
};

TEST_F(LeaseManagerTest, AcquireSetsExpiry) {
    auto lease = leases->tryAcquire(key, 300s);
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->key, key);
    EXPECT_EQ(lease->expiresAt, clock->now() + 300s);
    EXPECT_EQ(repository->fetch(key)->leaseExpiresAt, lease->expiresAt);
    EXPECT_TRUE(leases->isHeld(key));
}

TEST_F(LeaseManagerTest, SecondAcquireFailsWhileHeld) {
    ASSERT_TRUE(leases->tryAcquire(key, 10s).has_value());
    EXPECT_FALSE(leases->tryAcquire(key, 10s).has_value());
}

TEST_F(LeaseManagerTest, ClaimLeasesAndMarksAttempted) {
    auto fetched = repository->fetch(key);
    ASSERT_TRUE(fetched.has_value());
    clock->advance(5s);

    auto lease = leases->tryClaim(*fetched, 60s);
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->expiresAt, clock->now() + 60s);

    auto stored = repository->fetch(key);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->ready);
    EXPECT_EQ(stored->lastAttemptedAt, clock->now());
    EXPECT_EQ(stored->leaseExpiresAt, lease->expiresAt);
}

TEST_F(LeaseManagerTest, ClaimRefusesRowHandledSinceFetch) {
    auto fetched = repository->fetch(key);
    ASSERT_TRUE(fetched.has_value());

    // Another holder claims, handles and releases in between
    auto other = leases->tryClaim(*fetched, 60s);
    ASSERT_TRUE(other.has_value());
    ASSERT_TRUE(leases->release(*other));

    EXPECT_FALSE(leases->tryClaim(*fetched, 60s).has_value());
    EXPECT_FALSE(leases->isHeld(key));

    // Ready again, but moved on to another state
    EntityUpdate moved;
    moved.state = "active";
    moved.ready = true;
    ASSERT_TRUE(repository->conditionalUpdate(key, LeaseCondition::any(), moved));
    EXPECT_FALSE(leases->tryClaim(*fetched, 60s).has_value());
}

TEST_F(LeaseManagerTest, MissingEntityCannotBeLeased) {
    EXPECT_FALSE(leases->tryAcquire({"job", "missing"}, 10s).has_value());
}

TEST_F(LeaseManagerTest, ExpiryBoundary) {
    auto first = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(first.has_value());

    clock->advance(10s - 1ms);
    EXPECT_FALSE(leases->tryAcquire(key, 10s).has_value());

    // At exactly the expiry the lease is still held
    clock->advance(1ms);
    EXPECT_FALSE(leases->tryAcquire(key, 10s).has_value());
    EXPECT_TRUE(leases->isHeld(key));

    clock->advance(1ms);
    EXPECT_FALSE(leases->isHeld(key));
    auto second = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(second->expiresAt, first->expiresAt);
}

TEST_F(LeaseManagerTest, ReleaseFreesEntity) {
    auto lease = leases->tryAcquire(key, 60s);
    ASSERT_TRUE(lease.has_value());

    EXPECT_TRUE(leases->release(*lease));
    EXPECT_FALSE(repository->fetch(key)->leaseExpiresAt.has_value());
    EXPECT_TRUE(leases->tryAcquire(key, 60s).has_value());
}

TEST_F(LeaseManagerTest, StaleHolderCannotReleaseNewLease) {
    auto stale = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(stale.has_value());

    clock->advance(11s);
    auto current = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(current.has_value());

    EXPECT_FALSE(leases->release(*stale));
    EXPECT_EQ(repository->fetch(key)->leaseExpiresAt, current->expiresAt);
    EXPECT_TRUE(leases->release(*current));
}

TEST_F(LeaseManagerTest, ExtendMovesToken) {
    auto lease = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(lease.has_value());
    Lease old = *lease;

    clock->advance(8s);
    EXPECT_TRUE(leases->extend(*lease, 10s));
    EXPECT_EQ(lease->expiresAt, clock->now() + 10s);
    EXPECT_EQ(repository->fetch(key)->leaseExpiresAt, lease->expiresAt);

    // The previous token is no longer valid
    EXPECT_FALSE(leases->release(old));

    clock->advance(5s);
    EXPECT_FALSE(leases->tryAcquire(key, 10s).has_value());
}

TEST_F(LeaseManagerTest, ExtendFailsAfterLoss) {
    auto lease = leases->tryAcquire(key, 10s);
    ASSERT_TRUE(lease.has_value());
    Timestamp before = lease->expiresAt;

    clock->advance(11s);
    ASSERT_TRUE(leases->tryAcquire(key, 10s).has_value());

    EXPECT_FALSE(leases->extend(*lease, 10s));
    EXPECT_EQ(lease->expiresAt, before);
}

TEST_F(LeaseManagerTest, RejectsNonPositiveDuration) {
    EXPECT_THROW(leases->tryAcquire(key, 0s), std::invalid_argument);
    EXPECT_THROW(leases->tryClaim(*repository->fetch(key), 0s), std::invalid_argument);
    auto lease = leases->tryAcquire(key, 1s);
    ASSERT_TRUE(lease.has_value());
    EXPECT_THROW(leases->extend(*lease, -1s), std::invalid_argument);
}

TEST_F(LeaseManagerTest, ConcurrentAcquireHasExactlyOneWinner) {
    std::atomic<bool> startFlag{false};
    std::vector<std::future<bool>> futures;

    for (int i = 0; i < NUM_THREADS; ++i) {
        futures.push_back(std::async(std::launch::async, [this, &startFlag]() {
            while (!startFlag.load()) {
                std::this_thread::yield();
            }
            return leases->tryAcquire(key, 30s).has_value();
        }));
    }

    startFlag = true;
    int winners = 0;
    for (auto &future : futures) {
        if (future.get()) {
            winners++;
        }
    }
    EXPECT_EQ(winners, 1);
}

}  // namespace RTE
