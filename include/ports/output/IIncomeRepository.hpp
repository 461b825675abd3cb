#pragma once

#include "domain/Income.hpp"
#include "domain/EntryFilter.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace finance::ports::output {

/**
 * @brief Репозиторий доходов
 *
 * Хранит только строки записей; балансы счетов меняет сервис
 * через IAccountRepository::adjustBalance в той же единице работы.
 */
class IIncomeRepository {
public:
    virtual ~IIncomeRepository() = default;

    virtual std::optional<domain::Income> findById(int64_t id) = 0;

    /**
     * @brief Найти запись и заблокировать её строку до конца единицы работы
     */
    virtual std::optional<domain::Income> findByIdForUpdate(int64_t id) = 0;

    /**
     * @brief Записи пользователя, новые первыми
     */
    virtual std::vector<domain::Income> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;

    /**
     * @return Запись с присвоенным id
     */
    virtual domain::Income insert(const domain::Income& entry) = 0;

    virtual void update(const domain::Income& entry) = 0;

    virtual bool deleteById(int64_t id) = 0;
};

} // namespace finance::ports::output
