/**
 * @file IncomeServiceTest.cpp
 * @brief Unit tests for IncomeService
 */

#include <gtest/gtest.h>
#include "application/IncomeService.hpp"
#include "application/AccountService.hpp"
#include "application/SystemAccountProvisioner.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/FailingUnitOfWorkFactory.hpp"
#include "../mocks/BalanceAudit.hpp"
#include <thread>
#include <vector>

using namespace finance;
using namespace finance::application;
using namespace finance::tests;

class IncomeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>("memory", 5000, "External (System)");
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        failingStore_ = std::make_shared<FailingUnitOfWorkFactory>(store_);
        clock_ = std::make_shared<FixedClock>();

        accountService_ = std::make_shared<AccountService>(store_, settings_, clock_);
        incomeService_ = std::make_shared<IncomeService>(failingStore_, clock_);

        a_ = accountService_->createAccount(USER, {"A"}).id;
        b_ = accountService_->createAccount(USER, {"B"}).id;
    }

    domain::IncomeRequest income(int64_t accountId, const std::string& amount) {
        domain::IncomeRequest request;
        request.accountId = accountId;
        request.amount = domain::Money::fromString(amount);
        request.description = "salary";
        return request;
    }

    std::string balanceOf(int64_t accountId) {
        return accountService_->getAccount(USER, accountId)->balance.toString();
    }

    const std::string USER = "user-1";

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FailingUnitOfWorkFactory> failingStore_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<AccountService> accountService_;
    std::shared_ptr<IncomeService> incomeService_;

    int64_t a_ = 0;
    int64_t b_ = 0;
};

// ============================================================================
// CREATE / UPDATE / DELETE
// ============================================================================

TEST_F(IncomeServiceTest, CreateIncome_CreditsAccount) {
    auto created = incomeService_->createIncome(USER, income(a_, "200.00"));

    EXPECT_GT(created.id, 0);
    EXPECT_EQ(created.description, "salary");
    EXPECT_EQ(balanceOf(a_), "200.00");
}

TEST_F(IncomeServiceTest, UpdateIncome_ReassignedToOtherAccount) {
    auto created = incomeService_->createIncome(USER, income(a_, "200.00"));

    incomeService_->updateIncome(USER, created.id, income(b_, "200.00"));

    EXPECT_EQ(balanceOf(a_), "0.00");
    EXPECT_EQ(balanceOf(b_), "200.00");
    expectBalancesConsistent(*store_, USER);
}

TEST_F(IncomeServiceTest, UpdateIncome_SameAccountDifference) {
    auto created = incomeService_->createIncome(USER, income(a_, "200.00"));

    auto updated = incomeService_->updateIncome(USER, created.id, income(a_, "75.50"));

    EXPECT_EQ(updated.amount.toString(), "75.50");
    EXPECT_EQ(balanceOf(a_), "75.50");
}

TEST_F(IncomeServiceTest, UpdateIncome_BumpsUpdatedAt) {
    auto created = incomeService_->createIncome(USER, income(a_, "10.00"));
    clock_->advance(3600);

    auto updated = incomeService_->updateIncome(USER, created.id, income(a_, "20.00"));

    EXPECT_EQ(updated.createdAt, created.createdAt);
    EXPECT_EQ(updated.updatedAt, clock_->now());
}

TEST_F(IncomeServiceTest, DeleteIncome_MayLeaveNegativeBalance) {
    auto created = incomeService_->createIncome(USER, income(a_, "100.00"));
    // Часть дохода уже потрачена: откат дохода уводит баланс в минус
    {
        auto uow = store_->begin();
        uow->accounts().adjustBalance(a_, domain::Money::fromString("-60.00"));
        uow->commit();
    }
    incomeService_->deleteIncome(USER, created.id);

    EXPECT_EQ(balanceOf(a_), "-60.00");
}

// ============================================================================
// VALIDATION & ATOMICITY
// ============================================================================

TEST_F(IncomeServiceTest, CreateIncome_Invalid) {
    EXPECT_THROW(incomeService_->createIncome(USER, income(a_, "0")), domain::ValidationError);
    EXPECT_THROW(incomeService_->createIncome(USER, income(404, "1.00")), domain::NotFoundError);
    EXPECT_THROW(incomeService_->createIncome("user-2", income(a_, "1.00")), domain::ValidationError);
    EXPECT_EQ(balanceOf(a_), "0.00");
}

TEST_F(IncomeServiceTest, CreateIncome_SystemAccountRejected) {
    SystemAccountProvisioner provisioner(store_, settings_);
    auto system = provisioner.getOrCreateSystemAccount(USER);

    try {
        incomeService_->createIncome(USER, income(system.id, "1.00"));
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.field(), "account");
        EXPECT_STREQ(e.what(), "System account cannot be used for incomes.");
    }
}

TEST_F(IncomeServiceTest, FailedCommit_LeavesNoTrace) {
    auto created = incomeService_->createIncome(USER, income(a_, "200.00"));
    failingStore_->failCommits(1);

    EXPECT_THROW(incomeService_->deleteIncome(USER, created.id), std::runtime_error);

    EXPECT_EQ(balanceOf(a_), "200.00");
    EXPECT_TRUE(incomeService_->getIncome(USER, created.id).has_value());
}

TEST_F(IncomeServiceTest, OtherUsersIncome_NotFound) {
    auto created = incomeService_->createIncome(USER, income(a_, "200.00"));

    EXPECT_THROW(incomeService_->updateIncome("user-2", created.id, income(a_, "1.00")),
                 domain::NotFoundError);
    EXPECT_THROW(incomeService_->deleteIncome("user-2", created.id), domain::NotFoundError);
    EXPECT_TRUE(incomeService_->listIncomes("user-2", domain::EntryFilter()).empty());
    EXPECT_EQ(incomeService_->listIncomes(USER, domain::EntryFilter()).size(), 1u);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(IncomeServiceTest, ConcurrentCreateAndDelete_SameAccount) {
    std::vector<int64_t> existing;
    for (int i = 0; i < 40; ++i) {
        existing.push_back(incomeService_->createIncome(USER, income(a_, "1.00")).id);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 25; ++i) {
                incomeService_->createIncome(USER, income(a_, "3.00"));
            }
            for (size_t i = t; i < existing.size(); i += 4) {
                incomeService_->deleteIncome(USER, existing[i]);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(balanceOf(a_), "300.00");
    EXPECT_EQ(incomeService_->listIncomes(USER, domain::EntryFilter()).size(), 100u);
    expectBalancesConsistent(*store_, USER);
}
