/**
 * @file RowLockTableTest.cpp
 * @brief Unit tests for RowLockTable
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/RowLockTable.hpp"
#include "domain/LedgerError.hpp"
#include <future>
#include <thread>

using namespace finance;
using namespace finance::adapters::secondary;
using namespace std::chrono_literals;

TEST(RowLockTableTest, Acquire_IsReentrantForOwner) {
    RowLockTable locks(50ms);
    RowKey key{"accounts", 1};

    locks.acquire(key, 1);
    EXPECT_NO_THROW(locks.acquire(key, 1));
    EXPECT_TRUE(locks.isHeldBy(key, 1));
    EXPECT_FALSE(locks.isHeldBy(key, 2));
}

TEST(RowLockTableTest, Acquire_TimesOutWhenHeldByOther) {
    RowLockTable locks(50ms);
    RowKey key{"accounts", 1};
    locks.acquire(key, 1);

    EXPECT_THROW(locks.acquire(key, 2), domain::ConcurrencyTimeout);
    EXPECT_TRUE(locks.isHeldBy(key, 1));
}

TEST(RowLockTableTest, Acquire_DifferentRowsDoNotConflict) {
    RowLockTable locks(50ms);
    locks.acquire(RowKey{"accounts", 1}, 1);

    EXPECT_NO_THROW(locks.acquire(RowKey{"accounts", 2}, 2));
    EXPECT_NO_THROW(locks.acquire(RowKey{"transfers", 1}, 2));
}

TEST(RowLockTableTest, ReleaseAll_WakesWaiter) {
    RowLockTable locks(2000ms);
    RowKey key{"accounts", 7};
    locks.acquire(key, 1);
    locks.acquire(RowKey{"accounts", 8}, 1);

    auto waiter = std::async(std::launch::async, [&]() {
        locks.acquire(key, 2);
        return locks.isHeldBy(key, 2);
    });

    std::this_thread::sleep_for(30ms);
    locks.releaseAll(1);

    EXPECT_TRUE(waiter.get());
    EXPECT_FALSE(locks.isHeldBy(RowKey{"accounts", 8}, 1));
}

TEST(RowLockTableTest, Timeout_ReportsConfiguredValue) {
    RowLockTable locks(250ms);

    EXPECT_EQ(locks.timeout(), 250ms);
}
