#pragma once

#include "ports/input/ISystemAccountProvisioner.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/TransactionScope.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <iostream>

namespace finance::application {

/**
 * @brief Поиск или создание системного счёта пользователя
 *
 * Параллельные первые вызовы сходятся на одной строке за счёт
 * ограничения уникальности хранилища: insertIfAbsent() проигравшей
 * стороны возвращает nullopt, после чего счёт перечитывается.
 */
class SystemAccountProvisioner : public ports::input::ISystemAccountProvisioner {
public:
    SystemAccountProvisioner(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : uowFactory_(std::move(uowFactory))
      , settings_(std::move(settings))
    {}

    domain::Account getOrCreateSystemAccount(const std::string& userId) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            if (auto existing = uow.accounts().findSystemAccount(userId)) {
                return *existing;
            }

            domain::Account account(userId, settings_->getSystemAccountName(), true);
            if (auto created = uow.accounts().insertIfAbsent(account)) {
                std::cout << "[SystemAccountProvisioner] Created system account "
                          << created->id << " for user " << userId << std::endl;
                return *created;
            }

            if (auto existing = uow.accounts().findSystemAccount(userId)) {
                return *existing;
            }

            // Конфликт не по системному счёту: имя занято обычным счётом
            std::cerr << "[SystemAccountProvisioner] Name '" << account.name
                      << "' is taken by a regular account of user " << userId << std::endl;
            throw domain::ValidationError(
                "Account name '" + account.name + "' is reserved.", "name");
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace finance::application
