#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ICategoryRepository.hpp"
#include "ports/output/IExpenseRepository.hpp"
#include "ports/output/IIncomeRepository.hpp"
#include "ports/output/ITransferRepository.hpp"
#include <memory>

namespace finance::ports::output {

/**
 * @brief Единица работы: одна атомарная транзакция хранилища
 *
 * Репозитории, полученные из единицы работы, читают и пишут
 * в её транзакции. Блокировки строк держатся до commit()/rollback().
 * Если ни commit(), ни rollback() не вызваны, деструктор откатывает
 * все изменения.
 *
 * @example
 * ```cpp
 * auto uow = factory->begin();
 * uow->accounts().adjustBalance(accountId, -amount);
 * uow->expenses().insert(expense);
 * uow->commit();
 * ```
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IAccountRepository& accounts() = 0;
    virtual ICategoryRepository& categories() = 0;
    virtual IExpenseRepository& expenses() = 0;
    virtual IIncomeRepository& incomes() = 0;
    virtual ITransferRepository& transfers() = 0;

    /**
     * @brief Зафиксировать изменения и снять блокировки
     */
    virtual void commit() = 0;

    /**
     * @brief Отменить все изменения и снять блокировки
     */
    virtual void rollback() = 0;
};

/**
 * @brief Фабрика единиц работы (транзакционная граница хранилища)
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace finance::ports::output
