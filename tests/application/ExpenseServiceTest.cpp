/**
 * @file ExpenseServiceTest.cpp
 * @brief Unit tests for ExpenseService
 */

#include <gtest/gtest.h>
#include "application/ExpenseService.hpp"
#include "application/IncomeService.hpp"
#include "application/AccountService.hpp"
#include "application/CategoryService.hpp"
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

class ExpenseServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>("memory", 5000, "External (System)");
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        failingStore_ = std::make_shared<FailingUnitOfWorkFactory>(store_);
        clock_ = std::make_shared<FixedClock>();

        accountService_ = std::make_shared<AccountService>(store_, settings_, clock_);
        categoryService_ = std::make_shared<CategoryService>(store_, clock_);
        incomeService_ = std::make_shared<IncomeService>(store_, clock_);
        expenseService_ = std::make_shared<ExpenseService>(failingStore_, clock_);

        cash_ = accountService_->createAccount(USER, {"Cash"}).id;
        card_ = accountService_->createAccount(USER, {"Card"}).id;
        food_ = categoryService_->createCategory(USER, {"Food"}).id;

        deposit(cash_, "1000.00");
        deposit(card_, "1000.00");
    }

    void deposit(int64_t accountId, const std::string& amount) {
        domain::IncomeRequest request;
        request.accountId = accountId;
        request.amount = domain::Money::fromString(amount);
        incomeService_->createIncome(USER, request);
    }

    domain::ExpenseRequest expense(int64_t accountId, const std::string& amount) {
        domain::ExpenseRequest request;
        request.accountId = accountId;
        request.categoryId = food_;
        request.amount = domain::Money::fromString(amount);
        request.description = "groceries";
        return request;
    }

    std::string balanceOf(int64_t accountId) {
        auto account = accountService_->getAccount(USER, accountId);
        return account ? account->balance.toString() : "missing";
    }

    const std::string USER = "user-1";

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FailingUnitOfWorkFactory> failingStore_;
    std::shared_ptr<FixedClock> clock_;

    std::shared_ptr<AccountService> accountService_;
    std::shared_ptr<CategoryService> categoryService_;
    std::shared_ptr<IncomeService> incomeService_;
    std::shared_ptr<ExpenseService> expenseService_;

    int64_t cash_ = 0;
    int64_t card_ = 0;
    int64_t food_ = 0;
};

// ============================================================================
// CREATE / UPDATE / DELETE
// ============================================================================

TEST_F(ExpenseServiceTest, CreateExpense_DebitsAccount) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "500.00"));

    EXPECT_GT(created.id, 0);
    EXPECT_EQ(created.userId, USER);
    EXPECT_EQ(created.description, "groceries");
    EXPECT_EQ(created.createdAt, clock_->now());
    EXPECT_EQ(balanceOf(cash_), "500.00");
    EXPECT_EQ(balanceOf(card_), "1000.00");
}

TEST_F(ExpenseServiceTest, UpdateExpense_AppliesOnlyTheDifference) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "500.00"));
    EXPECT_EQ(balanceOf(cash_), "500.00");

    expenseService_->updateExpense(USER, created.id, expense(cash_, "400.00"));
    EXPECT_EQ(balanceOf(cash_), "600.00");

    auto updated = expenseService_->updateExpense(USER, created.id, expense(cash_, "350.00"));
    EXPECT_EQ(balanceOf(cash_), "650.00");
    EXPECT_EQ(updated.amount.toString(), "350.00");
    EXPECT_EQ(updated.createdAt, created.createdAt);
}

TEST_F(ExpenseServiceTest, UpdateExpense_MovedToOtherAccount) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "100.00"));

    expenseService_->updateExpense(USER, created.id, expense(card_, "150.00"));

    EXPECT_EQ(balanceOf(cash_), "1000.00");
    EXPECT_EQ(balanceOf(card_), "850.00");
    expectBalancesConsistent(*store_, USER);
}

TEST_F(ExpenseServiceTest, DeleteExpense_RestoresBalance) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "250.00"));

    expenseService_->deleteExpense(USER, created.id);

    EXPECT_EQ(balanceOf(cash_), "1000.00");
    EXPECT_FALSE(expenseService_->getExpense(USER, created.id).has_value());
}

TEST_F(ExpenseServiceTest, CreateExpense_MayOverdrawAccount) {
    expenseService_->createExpense(USER, expense(cash_, "1500.00"));

    EXPECT_EQ(balanceOf(cash_), "-500.00");
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(ExpenseServiceTest, CreateExpense_NonPositiveAmount) {
    try {
        expenseService_->createExpense(USER, expense(cash_, "0.00"));
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.field(), "amount");
    }
    EXPECT_THROW(expenseService_->createExpense(USER, expense(cash_, "-5.00")), domain::ValidationError);
    EXPECT_EQ(balanceOf(cash_), "1000.00");
}

TEST_F(ExpenseServiceTest, CreateExpense_UnknownAccount) {
    EXPECT_THROW(expenseService_->createExpense(USER, expense(999, "10.00")), domain::NotFoundError);
}

TEST_F(ExpenseServiceTest, CreateExpense_ForeignAccount) {
    auto foreign = accountService_->createAccount("user-2", {"Cash"}).id;

    EXPECT_THROW(expenseService_->createExpense(USER, expense(foreign, "10.00")), domain::ValidationError);
    EXPECT_EQ(accountService_->getAccount("user-2", foreign)->balance.toString(), "0.00");
}

TEST_F(ExpenseServiceTest, CreateExpense_ForeignCategory) {
    auto foreignCategory = categoryService_->createCategory("user-2", {"Food"}).id;
    auto request = expense(cash_, "10.00");
    request.categoryId = foreignCategory;

    EXPECT_THROW(expenseService_->createExpense(USER, request), domain::ValidationError);
    EXPECT_EQ(balanceOf(cash_), "1000.00");
}

TEST_F(ExpenseServiceTest, CreateExpense_SystemAccountRejected) {
    SystemAccountProvisioner provisioner(store_, settings_);
    auto system = provisioner.getOrCreateSystemAccount(USER);

    EXPECT_THROW(expenseService_->createExpense(USER, expense(system.id, "10.00")), domain::ValidationError);
}

TEST_F(ExpenseServiceTest, UpdateExpense_InvalidChangeLeavesBalances) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "100.00"));

    EXPECT_THROW(expenseService_->updateExpense(USER, created.id, expense(999, "50.00")),
                 domain::NotFoundError);

    EXPECT_EQ(balanceOf(cash_), "900.00");
    EXPECT_EQ(expenseService_->getExpense(USER, created.id)->amount.toString(), "100.00");
}

TEST_F(ExpenseServiceTest, OtherUsersExpense_NotFound) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "100.00"));

    EXPECT_THROW(expenseService_->updateExpense("user-2", created.id, expense(cash_, "1.00")),
                 domain::NotFoundError);
    EXPECT_THROW(expenseService_->deleteExpense("user-2", created.id), domain::NotFoundError);
    EXPECT_FALSE(expenseService_->getExpense("user-2", created.id).has_value());
    EXPECT_THROW(expenseService_->deleteExpense(USER, 12345), domain::NotFoundError);
    EXPECT_EQ(balanceOf(cash_), "900.00");
}

// ============================================================================
// ATOMICITY
// ============================================================================

TEST_F(ExpenseServiceTest, FailedCommit_RollsBackBalanceAndRow) {
    failingStore_->failCommits(1);

    EXPECT_THROW(expenseService_->createExpense(USER, expense(cash_, "300.00")), std::runtime_error);

    EXPECT_EQ(failingStore_->rollbackCount(), 1);
    EXPECT_EQ(balanceOf(cash_), "1000.00");
    EXPECT_TRUE(expenseService_->listExpenses(USER, domain::EntryFilter()).empty());
}

TEST_F(ExpenseServiceTest, FailedUpdateCommit_KeepsPreviousState) {
    auto created = expenseService_->createExpense(USER, expense(cash_, "300.00"));
    failingStore_->failCommits(1);

    EXPECT_THROW(expenseService_->updateExpense(USER, created.id, expense(card_, "20.00")),
                 std::runtime_error);

    EXPECT_EQ(balanceOf(cash_), "700.00");
    EXPECT_EQ(balanceOf(card_), "1000.00");
    expectBalancesConsistent(*store_, USER);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(ExpenseServiceTest, ListExpenses_FilteredAndNewestFirst) {
    clock_->set(domain::Timestamp::fromDate(2025, 7, 10));
    expenseService_->createExpense(USER, expense(cash_, "10.00"));
    clock_->set(domain::Timestamp::fromDate(2025, 8, 5));
    expenseService_->createExpense(USER, expense(card_, "20.00"));
    clock_->set(domain::Timestamp::fromDate(2025, 8, 20));
    expenseService_->createExpense(USER, expense(cash_, "30.00"));

    auto all = expenseService_->listExpenses(USER, domain::EntryFilter());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].amount.toString(), "30.00");
    EXPECT_EQ(all[2].amount.toString(), "10.00");

    domain::EntryFilter august;
    august.from = domain::Timestamp::fromDate(2025, 8, 1);
    august.to = august.from->endOfMonth();
    august.accountId = cash_;
    auto filtered = expenseService_->listExpenses(USER, august);
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].amount.toString(), "30.00");

    EXPECT_TRUE(expenseService_->listExpenses("user-2", domain::EntryFilter()).empty());
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(ExpenseServiceTest, ConcurrentEntriesOnOneAccount_KeepInvariant) {
    std::vector<int64_t> expenses;
    for (int i = 0; i < 10; ++i) {
        expenses.push_back(expenseService_->createExpense(USER, expense(cash_, "10.00")).id);
    }
    std::vector<int64_t> cardIncomes;
    for (int i = 0; i < 10; ++i) {
        domain::IncomeRequest request;
        request.accountId = card_;
        request.amount = domain::Money::fromString("5.00");
        cardIncomes.push_back(incomeService_->createIncome(USER, request).id);
    }
    ASSERT_EQ(balanceOf(cash_), "900.00");
    ASSERT_EQ(balanceOf(card_), "1050.00");

    std::vector<std::thread> threads;
    threads.emplace_back([&]() {
        for (int i = 0; i < 50; ++i) {
            expenseService_->createExpense(USER, expense(cash_, "1.00"));
        }
    });
    threads.emplace_back([&]() {
        for (size_t i = 0; i < 5; ++i) {
            expenseService_->updateExpense(USER, expenses[i], expense(cash_, "20.00"));
        }
    });
    threads.emplace_back([&]() {
        for (size_t i = 5; i < expenses.size(); ++i) {
            expenseService_->deleteExpense(USER, expenses[i]);
        }
    });
    threads.emplace_back([&]() {
        for (int i = 0; i < 50; ++i) {
            deposit(cash_, "2.00");
        }
    });
    threads.emplace_back([&]() {
        for (int64_t id : cardIncomes) {
            domain::IncomeRequest request;
            request.accountId = cash_;
            request.amount = domain::Money::fromString("5.00");
            incomeService_->updateIncome(USER, id, request);
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    // Cash: 900 - 50 * 1 - 5 * 10 + 5 * 10 + 50 * 2 + 10 * 5
    EXPECT_EQ(balanceOf(cash_), "1000.00");
    EXPECT_EQ(balanceOf(card_), "1000.00");
    expectBalancesConsistent(*store_, USER);
}
