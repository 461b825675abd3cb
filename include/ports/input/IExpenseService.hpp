#pragma once

#include "domain/Expense.hpp"
#include "domain/ExpenseRequest.hpp"
#include "domain/EntryFilter.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::ports::input {

/**
 * @brief Интерфейс сервиса расходов
 *
 * Каждая мутация выполняется одной единицей работы: валидация,
 * дельта баланса счёта и запись строки фиксируются вместе или не
 * фиксируются вовсе.
 */
class IExpenseService {
public:
    virtual ~IExpenseService() = default;

    /**
     * @brief Создать расход и списать сумму со счёта
     *
     * @throws domain::ValidationError сумма <= 0, чужой или системный счёт, чужая категория
     * @throws domain::NotFoundError счёт или категория не существуют
     */
    virtual domain::Expense createExpense(
        const std::string& userId,
        const domain::ExpenseRequest& request
    ) = 0;

    /**
     * @brief Изменить расход
     *
     * Если счёт не изменился, применяется только разница сумм;
     * иначе старая сумма возвращается на старый счёт, а новая
     * списывается с нового.
     */
    virtual domain::Expense updateExpense(
        const std::string& userId,
        int64_t expenseId,
        const domain::ExpenseRequest& request
    ) = 0;

    /**
     * @brief Удалить расход и вернуть сумму на счёт
     */
    virtual void deleteExpense(const std::string& userId, int64_t expenseId) = 0;

    virtual std::optional<domain::Expense> getExpense(
        const std::string& userId,
        int64_t expenseId
    ) = 0;

    virtual std::vector<domain::Expense> listExpenses(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;
};

} // namespace finance::ports::input
