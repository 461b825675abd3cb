#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"
#include "application/TransactionScope.hpp"
#include "application/EntryValidation.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <iostream>

namespace finance::application {

/**
 * @brief Сервис управления счетами
 *
 * Новый счёт всегда создаётся с нулевым балансом: баланс меняется
 * только записями. Имя системного счёта зарезервировано.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::LedgerSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , settings_(std::move(settings))
      , clock_(std::move(clock))
    {}

    domain::Account createAccount(
        const std::string& userId,
        const domain::AccountRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            validateName(uow, userId, request.name, 0);

            domain::Account account(userId, request.name);
            account.createdAt = clock_->now();
            auto saved = uow.accounts().insert(account);

            std::cout << "[AccountService] Created account " << saved.id
                      << " '" << saved.name << "' for user " << userId << std::endl;
            return saved;
        });
    }

    domain::Account renameAccount(
        const std::string& userId,
        int64_t accountId,
        const domain::AccountRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto account = requireVisible(uow, userId, accountId);
            validateName(uow, userId, request.name, accountId);

            uow.accounts().rename(accountId, request.name);
            account.name = request.name;
            return account;
        });
    }

    std::vector<domain::Account> listAccounts(const std::string& userId) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            return uow.accounts().findByUserId(userId);
        });
    }

    std::optional<domain::Account> getAccount(
        const std::string& userId,
        int64_t accountId
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto account = uow.accounts().findById(accountId);
            if (!account || account->userId != userId || account->isSystem) {
                return std::optional<domain::Account>();
            }
            return account;
        });
    }

    void deleteAccount(const std::string& userId, int64_t accountId) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            requireVisible(uow, userId, accountId);
            if (uow.accounts().isReferenced(accountId)) {
                throw domain::ValidationError("Account has ledger entries; delete them first.");
            }
            uow.accounts().deleteById(accountId);

            std::cout << "[AccountService] Deleted account " << accountId << std::endl;
        });
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::Account requireVisible(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        int64_t accountId
    ) {
        auto account = uow.accounts().findById(accountId);
        if (!account || account->userId != userId || account->isSystem) {
            throw domain::NotFoundError("Account not found.");
        }
        return *account;
    }

    /**
     * @param selfId id переименовываемого счёта (0 при создании)
     */
    void validateName(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        const std::string& name,
        int64_t selfId
    ) {
        validation::requireValidName(name);
        if (name == settings_->getSystemAccountName()) {
            throw domain::ValidationError("Account name '" + name + "' is reserved.", "name");
        }
        auto existing = uow.accounts().findByName(userId, name);
        if (existing && existing->id != selfId) {
            throw domain::ValidationError("Account with this name already exists.", "name");
        }
    }
};

} // namespace finance::application
