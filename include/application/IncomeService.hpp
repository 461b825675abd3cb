#pragma once

#include "ports/input/IIncomeService.hpp"
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
 * @brief Сервис доходов
 *
 * Тот же протокол, что и у ExpenseService, но дельта положительная.
 */
class IncomeService : public ports::input::IIncomeService {
public:
    IncomeService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , clock_(std::move(clock))
    {}

    domain::Income createIncome(
        const std::string& userId,
        const domain::IncomeRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            validate(uow, userId, request);

            domain::Income income;
            income.userId = userId;
            income.accountId = request.accountId;
            income.amount = request.amount;
            income.description = request.description;
            income.createdAt = clock_->now();
            income.updatedAt = income.createdAt;

            BalanceAdjuster::apply(uow.accounts(), domain::BalanceEffect::of(income));
            auto saved = uow.incomes().insert(income);

            std::cout << "[IncomeService] Created income " << saved.id
                      << ": " << saved.amount.toString()
                      << " to account " << saved.accountId << std::endl;
            return saved;
        });
    }

    domain::Income updateIncome(
        const std::string& userId,
        int64_t incomeId,
        const domain::IncomeRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.incomes().findByIdForUpdate(incomeId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Income not found.");
            }

            validate(uow, userId, request);

            domain::Income updated = *previous;
            updated.accountId = request.accountId;
            updated.amount = request.amount;
            updated.description = request.description;
            updated.updatedAt = clock_->now();

            BalanceAdjuster::apply(
                uow.accounts(),
                domain::BalanceEffect::replace(
                    domain::BalanceEffect::of(*previous),
                    domain::BalanceEffect::of(updated)));
            uow.incomes().update(updated);

            std::cout << "[IncomeService] Updated income " << updated.id
                      << ": account " << previous->accountId << " -> " << updated.accountId
                      << ", " << previous->amount.toString() << " -> " << updated.amount.toString()
                      << std::endl;
            return updated;
        });
    }

    void deleteIncome(const std::string& userId, int64_t incomeId) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.incomes().findByIdForUpdate(incomeId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Income not found.");
            }

            BalanceAdjuster::revert(uow.accounts(), domain::BalanceEffect::of(*previous));
            uow.incomes().deleteById(incomeId);

            std::cout << "[IncomeService] Deleted income " << incomeId << std::endl;
        });
    }

    std::optional<domain::Income> getIncome(
        const std::string& userId,
        int64_t incomeId
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto income = uow.incomes().findById(incomeId);
            if (!income || income->userId != userId) {
                return std::optional<domain::Income>();
            }
            return income;
        });
    }

    std::vector<domain::Income> listIncomes(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            return uow.incomes().findByUserId(userId, filter);
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::output::IClock> clock_;

    void validate(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        const domain::IncomeRequest& request
    ) {
        validation::requirePositiveAmount(request.amount);
        validation::requireUsableAccount(
            uow.accounts(), userId, request.accountId, "account", false, "incomes");
    }
};

} // namespace finance::application
