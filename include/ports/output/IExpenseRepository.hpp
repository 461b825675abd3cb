#pragma once

#include "domain/Expense.hpp"
#include "domain/EntryFilter.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace finance::ports::output {

/**
 * @brief Репозиторий расходов
 *
 * Хранит только строки записей; балансы счетов меняет сервис
 * через IAccountRepository::adjustBalance в той же единице работы.
 */
class IExpenseRepository {
public:
    virtual ~IExpenseRepository() = default;

    virtual std::optional<domain::Expense> findById(int64_t id) = 0;

    /**
     * @brief Найти запись и заблокировать её строку до конца единицы работы
     */
    virtual std::optional<domain::Expense> findByIdForUpdate(int64_t id) = 0;

    /**
     * @brief Записи пользователя, новые первыми
     */
    virtual std::vector<domain::Expense> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;

    /**
     * @return Запись с присвоенным id
     */
    virtual domain::Expense insert(const domain::Expense& entry) = 0;

    virtual void update(const domain::Expense& entry) = 0;

    virtual bool deleteById(int64_t id) = 0;
};

} // namespace finance::ports::output
