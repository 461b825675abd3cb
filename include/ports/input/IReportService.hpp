#pragma once

#include "domain/Report.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>

namespace finance::ports::input {

/**
 * @brief Интерфейс отчётов (только чтение)
 *
 * Читает уже согласованные данные и ничего не изменяет.
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    /**
     * @brief Сводка доходов, расходов и текущих балансов
     *
     * Без start и end берётся текущий календарный месяц.
     *
     * @throws domain::ValidationError если start позже end
     */
    virtual domain::CashflowSummary getSummary(
        const std::string& userId,
        const domain::ReportQuery& query
    ) = 0;

    /**
     * @brief Суммы расходов по категориям, по убыванию
     */
    virtual std::vector<domain::CategoryTotal> getCategoryTotals(
        const std::string& userId,
        const domain::ReportQuery& query
    ) = 0;

    /**
     * @brief Сумма переводов (фильтры fromAccountId / toAccountId)
     */
    virtual domain::Money getTransferTotal(
        const std::string& userId,
        const domain::ReportQuery& query
    ) = 0;

    /**
     * @brief Сумма доходов (Income) за период, по счёту accountId
     *
     * Переводы с системного счёта сюда не входят.
     */
    virtual domain::Money getIncomeTotal(
        const std::string& userId,
        const domain::ReportQuery& query
    ) = 0;

    /**
     * @brief Помесячные доходы и расходы, по возрастанию месяца
     *
     * Доход месяца: Income плюс переводы с системного счёта.
     * С accountId учитываются расходы и доходы этого счёта
     * и переводы на него. Разбивка задаётся query.grouping.
     *
     * @throws domain::ValidationError если start позже end
     */
    virtual std::vector<domain::MonthlyCashflow> getMonthlyCashflow(
        const std::string& userId,
        const domain::ReportQuery& query
    ) = 0;
};

} // namespace finance::ports::input
