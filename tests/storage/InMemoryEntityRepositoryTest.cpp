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
#include "storage/InMemoryEntityRepository.h"

#include <gtest/gtest.h>

namespace RTE {

class InMemoryEntityRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        EntityRecord r;
        r.key = {"job", "1"};
        r.state = "new";
        ASSERT_TRUE(repository.insert(r));
    }

    InMemoryEntityRepository repository;
};

TEST_F(InMemoryEntityRepositoryTest, UnavailableStoreThrowsStorageError) {
    repository.setAvailable(false);

    EXPECT_THROW(repository.fetch({"job", "1"}), StorageError);
    EXPECT_THROW(repository.fetchReadyBatch("job", 10, true, Timestamp{}, {"new"}), StorageError);
    EXPECT_THROW(repository.conditionalUpdate({"job", "1"}, LeaseCondition::any(), EntityUpdate{}), StorageError);
    EXPECT_THROW(repository.bulkMarkReady("job", "new", Timestamp{}), StorageError);
    EXPECT_THROW(repository.countReady("job"), StorageError);

    repository.setAvailable(true);
    EXPECT_TRUE(repository.fetch({"job", "1"}).has_value());
}

TEST_F(InMemoryEntityRepositoryTest, SizeCountsAllTypes) {
    EntityRecord other;
    other.key = {"mail", "1"};
    other.state = "new";
    ASSERT_TRUE(repository.insert(other));

    EXPECT_EQ(repository.size(), 2u);
    EXPECT_EQ(repository.countReady("job"), 1u);
    EXPECT_EQ(repository.countReady("mail"), 1u);
}

}  // namespace RTE
