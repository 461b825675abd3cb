// include/adapters/secondary/persistence/InMemoryLedgerStore.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>

namespace finance::adapters::secondary {

/**
 * @brief In-memory хранилище учёта с транзакционной семантикой
 *
 * Используется по умолчанию (FINANCE_STORAGE=memory) и в тестах.
 * Повторяет поведение PostgreSQL-схемы в объёме, нужном ядру:
 * - эксклюзивные блокировки строк до конца единицы работы
 *   (lockForUpdate, findByIdForUpdate, а также неявно при изменении строки);
 * - таймаут ожидания блокировки -> domain::ConcurrencyTimeout;
 * - зафиксированные версии изменённых строк: rollback() возвращает их,
 *   а чтения без блокировки из других единиц работы видят только их;
 * - уникальность имени счёта и категории для пользователя,
 *   один системный счёт на пользователя;
 * - запрет удаления счетов и категорий, на которые ссылаются записи;
 * - баланс в пределах NUMERIC(12,2), иначе domain::ValidationError (поле amount).
 *
 * Единица работы видит свои изменения сразу, чужие - после commit().
 *
 * @example
 * ```cpp
 * auto settings = std::make_shared<settings::LedgerSettings>("memory", 5000, "External (System)");
 * auto store = std::make_shared<InMemoryLedgerStore>(settings);
 *
 * auto uow = store->begin();
 * auto account = uow->accounts().insert(domain::Account("user-1", "Cash"));
 * uow->accounts().adjustBalance(account.id, domain::Money::fromCents(50000));
 * uow->commit();
 * ```
 */
class InMemoryLedgerStore : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings);
    ~InMemoryLedgerStore() override;

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

    struct State;

private:
    std::shared_ptr<State> state_;
};

} // namespace finance::adapters::secondary
