#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace finance::tests {

/**
 * @brief Пересчитать балансы счетов пользователя из всех записей
 *
 * balance = sum(incomes) - sum(expenses) + sum(transfers in) - sum(transfers out)
 */
inline std::map<int64_t, domain::Money> recomputeBalances(
    ports::output::IUnitOfWorkFactory& factory,
    const std::string& userId)
{
    auto uow = factory.begin();
    std::map<int64_t, domain::Money> balances;
    for (const auto& account : uow->accounts().findByUserId(userId)) {
        balances[account.id] = domain::Money();
    }
    if (auto system = uow->accounts().findSystemAccount(userId)) {
        balances[system->id] = domain::Money();
    }

    domain::EntryFilter all;
    for (const auto& income : uow->incomes().findByUserId(userId, all)) {
        balances[income.accountId] += income.amount;
    }
    for (const auto& expense : uow->expenses().findByUserId(userId, all)) {
        balances[expense.accountId] -= expense.amount;
    }
    for (const auto& transfer : uow->transfers().findByUserId(userId, all)) {
        balances[transfer.fromAccountId] -= transfer.amount;
        balances[transfer.toAccountId] += transfer.amount;
    }
    uow->commit();
    return balances;
}

/**
 * @brief Кэшированные балансы совпадают с пересчитанными из истории
 */
inline void expectBalancesConsistent(
    ports::output::IUnitOfWorkFactory& factory,
    const std::string& userId)
{
    auto expected = recomputeBalances(factory, userId);

    auto uow = factory.begin();
    for (const auto& [accountId, balance] : expected) {
        auto account = uow->accounts().findById(accountId);
        ASSERT_TRUE(account.has_value()) << "account " << accountId;
        EXPECT_EQ(account->balance.toString(), balance.toString()) << "account " << accountId;
    }
    uow->commit();
}

} // namespace finance::tests
