// include/adapters/secondary/persistence/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>

namespace finance::adapters::secondary {

/**
 * @brief PostgreSQL хранилище учёта (libpqxx)
 *
 * Каждая единица работы открывает своё соединение и одну pqxx::work.
 * В начале транзакции выставляется SET LOCAL lock_timeout, поэтому
 * долгое ожидание блокировки превращается в domain::ConcurrencyTimeout.
 *
 * Таблицы:
 * - accounts:   id BIGSERIAL, user_id, name, balance NUMERIC(12,2), is_system,
 *               UNIQUE (user_id, name), один is_system на user_id
 * - categories: id BIGSERIAL, user_id, name, UNIQUE (user_id, name)
 * - expenses / incomes / transfers: внешние ключи ON DELETE RESTRICT,
 *               CHECK (amount > 0), у transfers CHECK (from <> to)
 *
 * Баланс меняется только как balance = balance + $delta.
 */
class PostgresLedgerStore : public ports::output::IUnitOfWorkFactory {
public:
    PostgresLedgerStore(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::LedgerSettings> ledgerSettings
    );

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;

    void initSchema();
};

} // namespace finance::adapters::secondary
