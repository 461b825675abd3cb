#pragma once

#include "domain/Transfer.hpp"
#include "domain/EntryFilter.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace finance::ports::output {

/**
 * @brief Репозиторий переводов
 *
 * Хранит только строки записей; балансы счетов меняет сервис
 * через IAccountRepository::adjustBalance в той же единице работы.
 */
class ITransferRepository {
public:
    virtual ~ITransferRepository() = default;

    virtual std::optional<domain::Transfer> findById(int64_t id) = 0;

    /**
     * @brief Найти запись и заблокировать её строку до конца единицы работы
     */
    virtual std::optional<domain::Transfer> findByIdForUpdate(int64_t id) = 0;

    /**
     * @brief Записи пользователя, новые первыми
     */
    virtual std::vector<domain::Transfer> findByUserId(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;

    /**
     * @return Запись с присвоенным id
     */
    virtual domain::Transfer insert(const domain::Transfer& entry) = 0;

    virtual void update(const domain::Transfer& entry) = 0;

    virtual bool deleteById(int64_t id) = 0;
};

} // namespace finance::ports::output
