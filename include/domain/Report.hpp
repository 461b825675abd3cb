#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Разбивка помесячного отчёта внутри месяца
 */
enum class CashflowGrouping {
    NONE,               ///< Только итоги месяца
    ACCOUNT,            ///< По счетам
    CATEGORY,           ///< Расходы по категориям
    ACCOUNT_CATEGORY    ///< По счетам, внутри счёта расходы по категориям
};

inline std::string toString(CashflowGrouping grouping) {
    switch (grouping) {
        case CashflowGrouping::NONE:             return "none";
        case CashflowGrouping::ACCOUNT:          return "account";
        case CashflowGrouping::CATEGORY:         return "category";
        case CashflowGrouping::ACCOUNT_CATEGORY: return "account_category";
    }
    return "unknown";
}

/**
 * @brief Период и счёт, по которым строится отчёт
 */
struct ReportQuery {
    std::optional<Timestamp> start;     ///< Начало дня start (включительно)
    std::optional<Timestamp> end;       ///< Конец дня end (включительно)
    std::optional<int64_t> accountId;
    std::optional<int64_t> fromAccountId;
    std::optional<int64_t> toAccountId;
    CashflowGrouping grouping = CashflowGrouping::NONE;
};

/**
 * @brief Текущий баланс обычного счёта
 */
struct AccountBalance {
    int64_t accountId = 0;
    std::string name;
    Money balance;
};

/**
 * @brief Сводка по движению денег за период
 *
 * transfersIn: переводы с системного счёта (зарплата и т.п.),
 * они считаются доходом наряду с Income.
 */
struct CashflowSummary {
    std::optional<Timestamp> start;     ///< nullopt: без нижней границы
    std::optional<Timestamp> end;       ///< nullopt: без верхней границы
    std::optional<int64_t> accountId;

    Money income;
    Money transfersIn;
    Money incomeIncludingTransfers;
    Money expense;
    Money net;

    Money totalBalance;
    std::vector<AccountBalance> balances;   ///< Отсортированы по имени
};

/**
 * @brief Сумма расходов по категории
 */
struct CategoryTotal {
    int64_t categoryId = 0;
    std::string name;
    Money total;
};

/**
 * @brief Доходы и расходы счёта за месяц
 *
 * categories заполняется только при разбивке ACCOUNT_CATEGORY.
 */
struct AccountCashflow {
    int64_t accountId = 0;
    std::string name;
    Money income;                       ///< Income + переводы с системного счёта
    Money expense;
    Money net;
    std::vector<CategoryTotal> categories;  ///< По имени категории
};

/**
 * @brief Итоги одного календарного месяца
 *
 * Поступления с системного счёта считаются доходом месяца.
 * Месяц попадает в отчёт, если в нём есть хоть одна запись.
 */
struct MonthlyCashflow {
    Timestamp month;                    ///< Первое число месяца, 00:00 UTC
    Money income;
    Money expense;
    Money net;
    std::vector<AccountCashflow> accounts;  ///< Разбивка ACCOUNT / ACCOUNT_CATEGORY, по имени счёта
    std::vector<CategoryTotal> categories;  ///< Разбивка CATEGORY, по имени категории
};

} // namespace finance::domain
