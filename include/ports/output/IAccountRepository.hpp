#pragma once

#include "domain/Account.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace finance::ports::output {

/**
 * @brief Репозиторий счетов (Account Store)
 *
 * Все операции выполняются в рамках единицы работы (IUnitOfWork),
 * которая выдала репозиторий. Баланс никогда не пересчитывается
 * из истории: он меняется только через adjustBalance().
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Найти счёт по ID (включая системный)
     */
    virtual std::optional<domain::Account> findById(int64_t id) = 0;

    /**
     * @brief Найти счёт пользователя по имени
     */
    virtual std::optional<domain::Account> findByName(
        const std::string& userId,
        const std::string& name
    ) = 0;

    /**
     * @brief Найти системный счёт пользователя
     */
    virtual std::optional<domain::Account> findSystemAccount(const std::string& userId) = 0;

    /**
     * @brief Обычные (не системные) счета пользователя, по имени
     */
    virtual std::vector<domain::Account> findByUserId(const std::string& userId) = 0;

    /**
     * @brief Сохранить новый счёт
     *
     * @return Счёт с присвоенным id
     * @throws domain::ValidationError при нарушении уникальности
     */
    virtual domain::Account insert(const domain::Account& account) = 0;

    /**
     * @brief Сохранить счёт, если это не нарушает уникальность
     *
     * @return Сохранённый счёт или nullopt, если конфликтующая строка уже есть
     */
    virtual std::optional<domain::Account> insertIfAbsent(const domain::Account& account) = 0;

    /**
     * @brief Переименовать счёт
     * @throws domain::ValidationError если имя уже занято
     */
    virtual void rename(int64_t id, const std::string& name) = 0;

    /**
     * @brief Удалить счёт
     *
     * @return true если удалён
     * @throws domain::ValidationError если на счёт ссылаются записи
     */
    virtual bool deleteById(int64_t id) = 0;

    /**
     * @brief Атомарно изменить баланс на знаковую дельту
     *
     * balance = balance + delta. Никогда не перезаписывает баланс целиком,
     * чтобы не затереть дельты параллельных транзакций.
     *
     * @throws domain::NotFoundError если счёта нет
     */
    virtual void adjustBalance(int64_t id, const domain::Money& delta) = 0;

    /**
     * @brief Захватить эксклюзивные блокировки строк счетов
     *
     * Блокировки берутся в порядке возрастания id и держатся
     * до конца единицы работы.
     *
     * @return Заблокированные счета (по возрастанию id); отсутствующие id пропускаются
     * @throws domain::ConcurrencyTimeout если блокировку не удалось получить
     */
    virtual std::vector<domain::Account> lockForUpdate(const std::vector<int64_t>& ids) = 0;

    /**
     * @brief Есть ли записи (расходы, доходы, переводы), ссылающиеся на счёт
     */
    virtual bool isReferenced(int64_t id) = 0;
};

} // namespace finance::ports::output
