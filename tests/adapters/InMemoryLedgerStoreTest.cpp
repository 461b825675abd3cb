/**
 * @file InMemoryLedgerStoreTest.cpp
 * @brief Unit tests for InMemoryLedgerStore (transactions, locks, constraints)
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "domain/LedgerError.hpp"
#include <future>
#include <thread>

using namespace finance;
using namespace finance::adapters::secondary;
using namespace std::chrono_literals;

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>("memory", 200, "External (System)");
        store_ = std::make_shared<InMemoryLedgerStore>(settings_);
    }

    domain::Account createAccount(const std::string& userId, const std::string& name) {
        auto uow = store_->begin();
        auto account = uow->accounts().insert(domain::Account(userId, name));
        uow->commit();
        return account;
    }

    domain::Money balanceOf(int64_t accountId) {
        auto uow = store_->begin();
        auto account = uow->accounts().findById(accountId);
        uow->commit();
        return account ? account->balance : domain::Money();
    }

    domain::Income makeIncome(const std::string& userId, int64_t accountId, int64_t cents,
                              domain::Timestamp createdAt) {
        domain::Income income;
        income.userId = userId;
        income.accountId = accountId;
        income.amount = domain::Money::fromCents(cents);
        income.createdAt = createdAt;
        income.updatedAt = createdAt;
        return income;
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<InMemoryLedgerStore> store_;
};

// ============================================================================
// COMMIT / ROLLBACK
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Commit_MakesChangesDurable) {
    auto account = createAccount("user-1", "Cash");

    {
        auto uow = store_->begin();
        uow->accounts().adjustBalance(account.id, domain::Money::fromCents(50000));
        uow->commit();
    }

    EXPECT_EQ(account.id, 1);
    EXPECT_EQ(balanceOf(account.id).toString(), "500.00");
}

TEST_F(InMemoryLedgerStoreTest, Rollback_UndoesEveryChange) {
    auto account = createAccount("user-1", "Cash");

    {
        auto uow = store_->begin();
        uow->accounts().adjustBalance(account.id, domain::Money::fromCents(50000));
        uow->accounts().rename(account.id, "Wallet");
        uow->incomes().insert(makeIncome("user-1", account.id, 50000, domain::Timestamp::now()));
        uow->rollback();
    }

    auto uow = store_->begin();
    auto reloaded = uow->accounts().findById(account.id);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->name, "Cash");
    EXPECT_TRUE(reloaded->balance.isZero());
    EXPECT_TRUE(uow->incomes().findByUserId("user-1", domain::EntryFilter()).empty());
}

TEST_F(InMemoryLedgerStoreTest, Destructor_RollsBackUncommittedWork) {
    {
        auto uow = store_->begin();
        uow->accounts().insert(domain::Account("user-1", "Cash"));
    }

    auto uow = store_->begin();
    EXPECT_TRUE(uow->accounts().findByUserId("user-1").empty());
}

TEST_F(InMemoryLedgerStoreTest, RolledBackDelete_RestoresRow) {
    auto account = createAccount("user-1", "Cash");

    {
        auto uow = store_->begin();
        EXPECT_TRUE(uow->accounts().deleteById(account.id));
        EXPECT_FALSE(uow->accounts().findById(account.id).has_value());
        uow->rollback();
    }

    EXPECT_TRUE(store_->begin()->accounts().findById(account.id).has_value());
}

// ============================================================================
// CONSTRAINTS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, AccountName_UniquePerUser) {
    createAccount("user-1", "Cash");

    auto uow = store_->begin();
    EXPECT_THROW(uow->accounts().insert(domain::Account("user-1", "Cash")), domain::ValidationError);
    EXPECT_FALSE(uow->accounts().insertIfAbsent(domain::Account("user-1", "Cash")).has_value());
    EXPECT_NO_THROW(uow->accounts().insert(domain::Account("user-2", "Cash")));
}

TEST_F(InMemoryLedgerStoreTest, SystemAccount_OnePerUser) {
    auto uow = store_->begin();
    auto first = uow->accounts().insertIfAbsent(domain::Account("user-1", "External", true));
    auto second = uow->accounts().insertIfAbsent(domain::Account("user-1", "Other", true));
    auto foreign = uow->accounts().insertIfAbsent(domain::Account("user-2", "External", true));

    EXPECT_TRUE(first.has_value());
    EXPECT_FALSE(second.has_value());
    EXPECT_TRUE(foreign.has_value());
}

TEST_F(InMemoryLedgerStoreTest, DeleteReferencedAccount_Rejected) {
    auto account = createAccount("user-1", "Cash");
    {
        auto uow = store_->begin();
        uow->incomes().insert(makeIncome("user-1", account.id, 100, domain::Timestamp::now()));
        uow->commit();
    }

    auto uow = store_->begin();
    EXPECT_TRUE(uow->accounts().isReferenced(account.id));
    EXPECT_THROW(uow->accounts().deleteById(account.id), domain::ValidationError);
}

TEST_F(InMemoryLedgerStoreTest, EntryWithMissingAccount_Rejected) {
    auto uow = store_->begin();

    EXPECT_THROW(
        uow->incomes().insert(makeIncome("user-1", 99, 100, domain::Timestamp::now())),
        domain::ValidationError);
}

TEST_F(InMemoryLedgerStoreTest, AdjustBalance_MissingAccount_NotFound) {
    auto uow = store_->begin();

    EXPECT_THROW(uow->accounts().adjustBalance(42, domain::Money::fromCents(1)), domain::NotFoundError);
}

TEST_F(InMemoryLedgerStoreTest, AdjustBalance_BeyondNumericBound_Rejected) {
    auto account = createAccount("user-1", "Cash");
    auto max = domain::Money::fromString("9999999999.99");
    {
        auto uow = store_->begin();
        uow->accounts().adjustBalance(account.id, max);
        uow->commit();
    }

    auto uow = store_->begin();
    try {
        uow->accounts().adjustBalance(account.id, domain::Money::fromCents(1));
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.field(), "amount");
    }
    EXPECT_EQ(uow->accounts().findById(account.id)->balance, max);

    uow->accounts().adjustBalance(account.id, -max - max);
    EXPECT_THROW(
        uow->accounts().adjustBalance(account.id, domain::Money::fromCents(-1)),
        domain::ValidationError);
    uow->rollback();

    EXPECT_EQ(balanceOf(account.id), max);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, FindByUserId_SortedByNameWithoutSystem) {
    createAccount("user-1", "Savings");
    createAccount("user-1", "Cash");
    createAccount("user-2", "Bank");
    {
        auto uow = store_->begin();
        uow->accounts().insertIfAbsent(domain::Account("user-1", "External", true));
        uow->commit();
    }

    auto accounts = store_->begin()->accounts().findByUserId("user-1");

    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[0].name, "Cash");
    EXPECT_EQ(accounts[1].name, "Savings");
}

TEST_F(InMemoryLedgerStoreTest, Entries_NewestFirstAndFiltered) {
    auto cash = createAccount("user-1", "Cash");
    auto bank = createAccount("user-1", "Bank");
    auto day1 = domain::Timestamp::fromDate(2025, 8, 1);
    auto day2 = domain::Timestamp::fromDate(2025, 8, 2);
    auto day3 = domain::Timestamp::fromDate(2025, 8, 3);
    {
        auto uow = store_->begin();
        uow->incomes().insert(makeIncome("user-1", cash.id, 100, day1));
        uow->incomes().insert(makeIncome("user-1", bank.id, 200, day3));
        uow->incomes().insert(makeIncome("user-1", cash.id, 300, day2));
        uow->commit();
    }

    auto uow = store_->begin();
    auto all = uow->incomes().findByUserId("user-1", domain::EntryFilter());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].amount.cents(), 200);
    EXPECT_EQ(all[1].amount.cents(), 300);
    EXPECT_EQ(all[2].amount.cents(), 100);

    domain::EntryFilter cashOnly;
    cashOnly.accountId = cash.id;
    EXPECT_EQ(uow->incomes().findByUserId("user-1", cashOnly).size(), 2u);

    domain::EntryFilter range;
    range.from = day2;
    range.to = day2.endOfDay();
    auto inRange = uow->incomes().findByUserId("user-1", range);
    ASSERT_EQ(inRange.size(), 1u);
    EXPECT_EQ(inRange[0].amount.cents(), 300);

    EXPECT_TRUE(uow->incomes().findByUserId("user-2", domain::EntryFilter()).empty());
}

TEST_F(InMemoryLedgerStoreTest, FindByIdForUpdate_Missing) {
    auto uow = store_->begin();

    EXPECT_FALSE(uow->transfers().findByIdForUpdate(5).has_value());
}

// ============================================================================
// VISIBILITY
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, UncommittedBalance_VisibleOnlyToWriter) {
    auto account = createAccount("user-1", "Cash");

    auto writer = store_->begin();
    writer->accounts().adjustBalance(account.id, domain::Money::fromCents(50000));
    EXPECT_EQ(writer->accounts().findById(account.id)->balance.cents(), 50000);

    {
        auto reader = store_->begin();
        EXPECT_TRUE(reader->accounts().findById(account.id)->balance.isZero());
        auto listed = reader->accounts().findByUserId("user-1");
        ASSERT_EQ(listed.size(), 1u);
        EXPECT_TRUE(listed[0].balance.isZero());
    }

    writer->commit();

    EXPECT_EQ(balanceOf(account.id).cents(), 50000);
}

TEST_F(InMemoryLedgerStoreTest, UncommittedInsertAndDelete_InvisibleToOthers) {
    auto cash = createAccount("user-1", "Cash");
    int64_t incomeId = 0;
    {
        auto uow = store_->begin();
        incomeId = uow->incomes().insert(makeIncome("user-1", cash.id, 100, domain::Timestamp::now())).id;
        uow->commit();
    }

    auto writer = store_->begin();
    writer->accounts().insert(domain::Account("user-1", "Bank"));
    EXPECT_TRUE(writer->incomes().deleteById(incomeId));
    EXPECT_FALSE(writer->incomes().findById(incomeId).has_value());

    {
        auto reader = store_->begin();
        auto accounts = reader->accounts().findByUserId("user-1");
        ASSERT_EQ(accounts.size(), 1u);
        EXPECT_EQ(accounts[0].name, "Cash");
        EXPECT_TRUE(reader->incomes().findById(incomeId).has_value());
        EXPECT_EQ(reader->incomes().findByUserId("user-1", domain::EntryFilter()).size(), 1u);
        EXPECT_TRUE(reader->accounts().isReferenced(cash.id));
    }

    writer->rollback();

    auto uow = store_->begin();
    EXPECT_EQ(uow->accounts().findByUserId("user-1").size(), 1u);
    EXPECT_TRUE(uow->incomes().findById(incomeId).has_value());
}

TEST_F(InMemoryLedgerStoreTest, PendingRename_KeepsOldNameTaken) {
    auto cash = createAccount("user-1", "Cash");

    auto writer = store_->begin();
    writer->accounts().rename(cash.id, "Wallet");
    EXPECT_EQ(store_->begin()->accounts().findById(cash.id)->name, "Cash");

    auto contender = std::async(std::launch::async, [&]() {
        auto uow = store_->begin();
        auto inserted = uow->accounts().insertIfAbsent(domain::Account("user-1", "Cash"));
        uow->commit();
        return inserted.has_value();
    });

    std::this_thread::sleep_for(50ms);
    writer->rollback();

    EXPECT_FALSE(contender.get());
    EXPECT_EQ(store_->begin()->accounts().findByUserId("user-1").size(), 1u);
}

// ============================================================================
// ROW LOCKS
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, LockForUpdate_ReturnsLockedRowsInIdOrder) {
    auto a = createAccount("user-1", "A");
    auto b = createAccount("user-1", "B");

    auto uow = store_->begin();
    auto locked = uow->accounts().lockForUpdate({b.id, a.id, b.id, 999});

    ASSERT_EQ(locked.size(), 2u);
    EXPECT_EQ(locked[0].id, a.id);
    EXPECT_EQ(locked[1].id, b.id);
}

TEST_F(InMemoryLedgerStoreTest, LockedRow_BlocksOtherUnitOfWorkUntilTimeout) {
    auto account = createAccount("user-1", "Cash");

    auto holder = store_->begin();
    holder->accounts().lockForUpdate({account.id});

    auto contender = store_->begin();
    EXPECT_THROW(contender->accounts().lockForUpdate({account.id}), domain::ConcurrencyTimeout);
    EXPECT_THROW(
        contender->accounts().adjustBalance(account.id, domain::Money::fromCents(1)),
        domain::ConcurrencyTimeout);
    contender->rollback();

    holder->commit();

    auto next = store_->begin();
    EXPECT_NO_THROW(next->accounts().lockForUpdate({account.id}));
}

TEST_F(InMemoryLedgerStoreTest, LockedRow_GrantedAfterHolderCommits) {
    auto account = createAccount("user-1", "Cash");

    auto holder = store_->begin();
    holder->accounts().adjustBalance(account.id, domain::Money::fromCents(100));

    auto waiter = std::async(std::launch::async, [&]() {
        auto uow = store_->begin();
        uow->accounts().adjustBalance(account.id, domain::Money::fromCents(50));
        uow->commit();
    });

    std::this_thread::sleep_for(50ms);
    holder->commit();
    waiter.get();

    EXPECT_EQ(balanceOf(account.id).cents(), 150);
}

TEST_F(InMemoryLedgerStoreTest, ConcurrentSystemAccountInsert_WaitsForPendingRow) {
    auto first = store_->begin();
    ASSERT_TRUE(first->accounts().insertIfAbsent(domain::Account("user-1", "External", true)).has_value());

    auto second = std::async(std::launch::async, [&]() {
        auto uow = store_->begin();
        auto inserted = uow->accounts().insertIfAbsent(domain::Account("user-1", "External", true));
        uow->commit();
        return inserted.has_value();
    });

    std::this_thread::sleep_for(50ms);
    first->commit();

    EXPECT_FALSE(second.get());
}

TEST_F(InMemoryLedgerStoreTest, ConcurrentSystemAccountInsert_SucceedsAfterRollback) {
    auto first = store_->begin();
    ASSERT_TRUE(first->accounts().insertIfAbsent(domain::Account("user-1", "External", true)).has_value());

    auto second = std::async(std::launch::async, [&]() {
        auto uow = store_->begin();
        auto inserted = uow->accounts().insertIfAbsent(domain::Account("user-1", "External", true));
        uow->commit();
        return inserted.has_value();
    });

    std::this_thread::sleep_for(50ms);
    first->rollback();

    EXPECT_TRUE(second.get());
    EXPECT_TRUE(store_->begin()->accounts().findSystemAccount("user-1").has_value());
}
