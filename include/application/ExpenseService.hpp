#pragma once

#include "ports/input/IExpenseService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"
#include "application/TransactionScope.hpp"
#include "application/BalanceAdjuster.hpp"
#include "application/EntryValidation.hpp"
#include "domain/BalanceEffect.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <iostream>

namespace finance::application {

/**
 * @brief Сервис расходов
 *
 * Протокол мутации (всё в одной единице работы):
 * 1. валидация (сумма > 0, счёт и категория пользователя, счёт не системный);
 * 2. дельта баланса через BalanceAdjuster;
 * 3. запись строки расхода.
 *
 * Строки счетов явно не блокируются: одиночное обновление баланса
 * сериализуется блокировкой записи самого хранилища.
 */
class ExpenseService : public ports::input::IExpenseService {
public:
    ExpenseService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , clock_(std::move(clock))
    {}

    domain::Expense createExpense(
        const std::string& userId,
        const domain::ExpenseRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            validate(uow, userId, request);

            domain::Expense expense;
            expense.userId = userId;
            expense.accountId = request.accountId;
            expense.categoryId = request.categoryId;
            expense.amount = request.amount;
            expense.description = request.description;
            expense.createdAt = clock_->now();
            expense.updatedAt = expense.createdAt;

            BalanceAdjuster::apply(uow.accounts(), domain::BalanceEffect::of(expense));
            auto saved = uow.expenses().insert(expense);

            std::cout << "[ExpenseService] Created expense " << saved.id
                      << ": " << saved.amount.toString()
                      << " from account " << saved.accountId << std::endl;
            return saved;
        });
    }

    domain::Expense updateExpense(
        const std::string& userId,
        int64_t expenseId,
        const domain::ExpenseRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.expenses().findByIdForUpdate(expenseId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Expense not found.");
            }

            validate(uow, userId, request);

            domain::Expense updated = *previous;
            updated.accountId = request.accountId;
            updated.categoryId = request.categoryId;
            updated.amount = request.amount;
            updated.description = request.description;
            updated.updatedAt = clock_->now();

            // Тот же счёт: одна дельта (old - new); другой счёт: возврат + списание
            BalanceAdjuster::apply(
                uow.accounts(),
                domain::BalanceEffect::replace(
                    domain::BalanceEffect::of(*previous),
                    domain::BalanceEffect::of(updated)));
            uow.expenses().update(updated);

            std::cout << "[ExpenseService] Updated expense " << updated.id
                      << ": " << previous->amount.toString() << " -> " << updated.amount.toString()
                      << std::endl;
            return updated;
        });
    }

    void deleteExpense(const std::string& userId, int64_t expenseId) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.expenses().findByIdForUpdate(expenseId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Expense not found.");
            }

            BalanceAdjuster::revert(uow.accounts(), domain::BalanceEffect::of(*previous));
            uow.expenses().deleteById(expenseId);

            std::cout << "[ExpenseService] Deleted expense " << expenseId << std::endl;
        });
    }

    std::optional<domain::Expense> getExpense(
        const std::string& userId,
        int64_t expenseId
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto expense = uow.expenses().findById(expenseId);
            if (!expense || expense->userId != userId) {
                return std::optional<domain::Expense>();
            }
            return expense;
        });
    }

    std::vector<domain::Expense> listExpenses(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            return uow.expenses().findByUserId(userId, filter);
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::output::IClock> clock_;

    void validate(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        const domain::ExpenseRequest& request
    ) {
        validation::requirePositiveAmount(request.amount);
        validation::requireUsableAccount(
            uow.accounts(), userId, request.accountId, "account", false, "expenses");
        validation::requireOwnedCategory(uow.categories(), userId, request.categoryId);
    }
};

} // namespace finance::application
