#pragma once

#include "domain/Account.hpp"
#include "domain/AccountRequest.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::ports::input {

/**
 * @brief Интерфейс сервиса управления счетами
 *
 * Системный счёт через этот интерфейс не виден: его нет в списке,
 * его нельзя получить, переименовать или удалить.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Создать счёт с нулевым балансом
     *
     * @throws domain::ValidationError пустое/занятое/зарезервированное имя
     */
    virtual domain::Account createAccount(
        const std::string& userId,
        const domain::AccountRequest& request
    ) = 0;

    /**
     * @brief Переименовать счёт
     *
     * @throws domain::NotFoundError счёт не найден
     * @throws domain::ValidationError имя некорректно или занято
     */
    virtual domain::Account renameAccount(
        const std::string& userId,
        int64_t accountId,
        const domain::AccountRequest& request
    ) = 0;

    /**
     * @brief Обычные счета пользователя, по имени
     */
    virtual std::vector<domain::Account> listAccounts(const std::string& userId) = 0;

    /**
     * @brief Получить счёт пользователя
     */
    virtual std::optional<domain::Account> getAccount(
        const std::string& userId,
        int64_t accountId
    ) = 0;

    /**
     * @brief Удалить счёт
     *
     * @throws domain::NotFoundError счёт не найден
     * @throws domain::ValidationError на счёт ссылаются записи
     */
    virtual void deleteAccount(const std::string& userId, int64_t accountId) = 0;
};

} // namespace finance::ports::input
