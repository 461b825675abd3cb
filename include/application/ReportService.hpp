#pragma once

#include "ports/input/IReportService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"
#include "application/TransactionScope.hpp"
#include "domain/EntryFilter.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <map>
#include <algorithm>
#include <string>
#include <vector>

namespace finance::application {

/**
 * @brief Отчёты по уже согласованным данным
 *
 * Только читает записи и балансы в одной единице работы,
 * ничего не блокирует и не изменяет.
 */
class ReportService : public ports::input::IReportService {
public:
    ReportService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , clock_(std::move(clock))
    {}

    domain::CashflowSummary getSummary(
        const std::string& userId,
        const domain::ReportQuery& query
    ) override {
        auto range = query;
        if (!range.start && !range.end) {
            auto now = clock_->now();
            range.start = now.startOfMonth();
            range.end = now.endOfMonth();
        }
        requireOrderedRange(range);

        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            domain::CashflowSummary summary;
            summary.start = range.start;
            summary.end = range.end;
            summary.accountId = range.accountId;

            domain::EntryFilter filter = toFilter(range);
            filter.accountId = range.accountId;

            for (const auto& income : uow.incomes().findByUserId(userId, filter)) {
                summary.income += income.amount;
            }
            for (const auto& expense : uow.expenses().findByUserId(userId, filter)) {
                summary.expense += expense.amount;
            }

            // Поступления извне: переводы с системного счёта
            if (auto system = uow.accounts().findSystemAccount(userId)) {
                domain::EntryFilter transferFilter = toFilter(range);
                transferFilter.fromAccountId = system->id;
                transferFilter.toAccountId = range.accountId;
                for (const auto& transfer : uow.transfers().findByUserId(userId, transferFilter)) {
                    summary.transfersIn += transfer.amount;
                }
            }

            summary.incomeIncludingTransfers = summary.income + summary.transfersIn;
            summary.net = summary.incomeIncludingTransfers - summary.expense;

            for (const auto& account : uow.accounts().findByUserId(userId)) {
                if (range.accountId && account.id != *range.accountId) {
                    continue;
                }
                summary.balances.push_back({account.id, account.name, account.balance});
                summary.totalBalance += account.balance;
            }
            return summary;
        });
    }

    std::vector<domain::CategoryTotal> getCategoryTotals(
        const std::string& userId,
        const domain::ReportQuery& query
    ) override {
        requireOrderedRange(query);

        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            domain::EntryFilter filter = toFilter(query);
            filter.accountId = query.accountId;

            std::map<int64_t, domain::Money> totals;
            for (const auto& expense : uow.expenses().findByUserId(userId, filter)) {
                totals[expense.categoryId] += expense.amount;
            }

            std::vector<domain::CategoryTotal> result;
            for (const auto& [categoryId, total] : totals) {
                auto category = uow.categories().findById(categoryId);
                result.push_back({categoryId, category ? category->name : std::string(), total});
            }
            std::stable_sort(result.begin(), result.end(),
                [](const domain::CategoryTotal& a, const domain::CategoryTotal& b) {
                    return a.total > b.total;
                });
            return result;
        });
    }

    domain::Money getTransferTotal(
        const std::string& userId,
        const domain::ReportQuery& query
    ) override {
        requireOrderedRange(query);

        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            domain::EntryFilter filter = toFilter(query);
            filter.fromAccountId = query.fromAccountId;
            filter.toAccountId = query.toAccountId;

            domain::Money total;
            for (const auto& transfer : uow.transfers().findByUserId(userId, filter)) {
                total += transfer.amount;
            }
            return total;
        });
    }

    domain::Money getIncomeTotal(
        const std::string& userId,
        const domain::ReportQuery& query
    ) override {
        requireOrderedRange(query);

        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            domain::EntryFilter filter = toFilter(query);
            filter.accountId = query.accountId;

            domain::Money total;
            for (const auto& income : uow.incomes().findByUserId(userId, filter)) {
                total += income.amount;
            }
            return total;
        });
    }

    std::vector<domain::MonthlyCashflow> getMonthlyCashflow(
        const std::string& userId,
        const domain::ReportQuery& query
    ) override {
        requireOrderedRange(query);

        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            domain::EntryFilter filter = toFilter(query);
            filter.accountId = query.accountId;

            CashflowBuilder builder(uow, query.grouping);
            for (const auto& income : uow.incomes().findByUserId(userId, filter)) {
                builder.addIncome(income.createdAt, income.accountId, income.amount);
            }
            if (auto system = uow.accounts().findSystemAccount(userId)) {
                domain::EntryFilter transferFilter = toFilter(query);
                transferFilter.fromAccountId = system->id;
                transferFilter.toAccountId = query.accountId;
                for (const auto& transfer : uow.transfers().findByUserId(userId, transferFilter)) {
                    builder.addIncome(transfer.createdAt, transfer.toAccountId, transfer.amount);
                }
            }
            for (const auto& expense : uow.expenses().findByUserId(userId, filter)) {
                builder.addExpense(expense.createdAt, expense.accountId, expense.categoryId, expense.amount);
            }
            return builder.build();
        });
    }

private:
    /**
     * @brief Накопление помесячных сумм с нужной разбивкой
     */
    class CashflowBuilder {
    public:
        CashflowBuilder(ports::output::IUnitOfWork& uow, domain::CashflowGrouping grouping)
            : uow_(uow)
            , grouping_(grouping)
        {}

        void addIncome(const domain::Timestamp& at, int64_t accountId, const domain::Money& amount) {
            auto& month = monthOf(at);
            month.totals.income += amount;
            if (byAccount()) {
                accountOf(month, accountId).income += amount;
            }
        }

        void addExpense(const domain::Timestamp& at, int64_t accountId, int64_t categoryId,
                        const domain::Money& amount) {
            auto& month = monthOf(at);
            month.totals.expense += amount;
            if (byAccount()) {
                accountOf(month, accountId).expense += amount;
            }
            if (grouping_ == domain::CashflowGrouping::CATEGORY) {
                month.categories[categoryId] += amount;
            }
            if (grouping_ == domain::CashflowGrouping::ACCOUNT_CATEGORY) {
                month.accountCategories[accountId][categoryId] += amount;
            }
        }

        std::vector<domain::MonthlyCashflow> build() {
            std::vector<domain::MonthlyCashflow> result;
            for (auto& [start, month] : months_) {
                auto totals = month.totals;
                totals.net = totals.income - totals.expense;

                for (auto& [accountId, account] : month.accounts) {
                    account.net = account.income - account.expense;
                    account.categories = categoryTotals(month.accountCategories[accountId]);
                    totals.accounts.push_back(account);
                }
                std::sort(totals.accounts.begin(), totals.accounts.end(),
                    [](const domain::AccountCashflow& a, const domain::AccountCashflow& b) {
                        return a.name != b.name ? a.name < b.name : a.accountId < b.accountId;
                    });

                totals.categories = categoryTotals(month.categories);
                result.push_back(std::move(totals));
            }
            return result;
        }

    private:
        struct Month {
            domain::MonthlyCashflow totals;
            std::map<int64_t, domain::AccountCashflow> accounts;
            std::map<int64_t, domain::Money> categories;
            std::map<int64_t, std::map<int64_t, domain::Money>> accountCategories;
        };

        ports::output::IUnitOfWork& uow_;
        domain::CashflowGrouping grouping_;
        std::map<int64_t, Month> months_;     ///< Ключ: начало месяца в секундах
        std::map<int64_t, std::string> accountNames_;
        std::map<int64_t, std::string> categoryNames_;

        bool byAccount() const {
            return grouping_ == domain::CashflowGrouping::ACCOUNT ||
                   grouping_ == domain::CashflowGrouping::ACCOUNT_CATEGORY;
        }

        Month& monthOf(const domain::Timestamp& at) {
            auto start = at.startOfMonth();
            auto [it, inserted] = months_.try_emplace(start.toUnixSeconds());
            if (inserted) {
                it->second.totals.month = start;
            }
            return it->second;
        }

        domain::AccountCashflow& accountOf(Month& month, int64_t accountId) {
            auto [it, inserted] = month.accounts.try_emplace(accountId);
            if (inserted) {
                it->second.accountId = accountId;
                it->second.name = accountName(accountId);
            }
            return it->second;
        }

        std::vector<domain::CategoryTotal> categoryTotals(const std::map<int64_t, domain::Money>& totals) {
            std::vector<domain::CategoryTotal> result;
            for (const auto& [categoryId, total] : totals) {
                result.push_back({categoryId, categoryName(categoryId), total});
            }
            std::sort(result.begin(), result.end(),
                [](const domain::CategoryTotal& a, const domain::CategoryTotal& b) {
                    return a.name != b.name ? a.name < b.name : a.categoryId < b.categoryId;
                });
            return result;
        }

        const std::string& accountName(int64_t id) {
            auto it = accountNames_.find(id);
            if (it == accountNames_.end()) {
                auto account = uow_.accounts().findById(id);
                it = accountNames_.emplace(id, account ? account->name : std::string()).first;
            }
            return it->second;
        }

        const std::string& categoryName(int64_t id) {
            auto it = categoryNames_.find(id);
            if (it == categoryNames_.end()) {
                auto category = uow_.categories().findById(id);
                it = categoryNames_.emplace(id, category ? category->name : std::string()).first;
            }
            return it->second;
        }
    };

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::output::IClock> clock_;

    static void requireOrderedRange(const domain::ReportQuery& query) {
        if (query.start && query.end && *query.start > *query.end) {
            throw domain::ValidationError("'start' cannot be after 'end'.", "start");
        }
    }

    static domain::EntryFilter toFilter(const domain::ReportQuery& query) {
        domain::EntryFilter filter;
        filter.from = query.start;
        filter.to = query.end;
        return filter;
    }
};

} // namespace finance::application
