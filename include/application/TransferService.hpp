#pragma once

#include "ports/input/ITransferService.hpp"
#include "ports/input/ISystemAccountProvisioner.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"
#include "application/TransactionScope.hpp"
#include "application/BalanceAdjuster.hpp"
#include "application/EntryValidation.hpp"
#include "domain/BalanceEffect.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <random>
#include <vector>
#include <algorithm>
#include <iostream>

namespace finance::application {

/**
 * @brief Сервис переводов
 *
 * В отличие от расходов и доходов, перевод читает баланс счёта списания
 * для проверки средств, поэтому строки обоих счетов блокируются
 * (по возрастанию id) до чтения баланса.
 *
 * Протокол изменения:
 * 1. заблокировать строку перевода и прочитать прежнее состояние;
 * 2. валидация нового состояния;
 * 3. заблокировать объединение старых и новых счетов;
 * 4. полностью отменить прежнее влияние;
 * 5. перечитать счёт списания и проверить средства
 *    (при нехватке вернуть прежнее влияние и бросить InsufficientFundsError);
 * 6. применить новое влияние и сохранить строку.
 */
class TransferService : public ports::input::ITransferService {
public:
    TransferService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::input::ISystemAccountProvisioner> provisioner,
        std::shared_ptr<ports::output::IClock> clock
    ) : uowFactory_(std::move(uowFactory))
      , provisioner_(std::move(provisioner))
      , clock_(std::move(clock))
    {}

    domain::Transfer createTransfer(
        const std::string& userId,
        const domain::TransferRequest& request
    ) override {
        return create(userId, request, Counterparty::REGULAR_ONLY);
    }

    domain::Transfer updateTransfer(
        const std::string& userId,
        int64_t transferId,
        const domain::TransferRequest& request
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.transfers().findByIdForUpdate(transferId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Transfer not found.");
            }

            validate(uow, userId, request, Counterparty::REGULAR_ONLY);

            domain::Transfer updated = *previous;
            updated.fromAccountId = request.fromAccountId;
            updated.toAccountId = request.toAccountId;
            updated.amount = request.amount;

            lockAccounts(uow, {
                previous->fromAccountId, previous->toAccountId,
                updated.fromAccountId, updated.toAccountId
            });

            auto previousEffect = domain::BalanceEffect::of(*previous);
            BalanceAdjuster::revert(uow.accounts(), previousEffect);

            auto source = uow.accounts().findById(updated.fromAccountId);
            if (!source) {
                throw domain::NotFoundError("Both accounts must exist.");
            }
            if (!source->isSystem && source->balance < updated.amount) {
                // Балансы должны остаться ровно такими, какими были до вызова
                BalanceAdjuster::apply(uow.accounts(), previousEffect);
                std::cerr << "[TransferService] Update of transfer " << transferId
                          << " rejected: account " << source->id << " has "
                          << source->balance.toString() << ", needs "
                          << updated.amount.toString() << std::endl;
                throw domain::InsufficientFundsError("Insufficient funds in from_account.");
            }

            BalanceAdjuster::apply(uow.accounts(), domain::BalanceEffect::of(updated));
            uow.transfers().update(updated);

            std::cout << "[TransferService] Updated transfer " << updated.id
                      << ": " << previous->fromAccountId << "->" << previous->toAccountId
                      << " " << previous->amount.toString() << " => "
                      << updated.fromAccountId << "->" << updated.toAccountId
                      << " " << updated.amount.toString() << std::endl;
            return updated;
        });
    }

    void deleteTransfer(const std::string& userId, int64_t transferId) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto previous = uow.transfers().findByIdForUpdate(transferId);
            if (!previous || previous->userId != userId) {
                throw domain::NotFoundError("Transfer not found.");
            }

            lockAccounts(uow, {previous->fromAccountId, previous->toAccountId});
            BalanceAdjuster::revert(uow.accounts(), domain::BalanceEffect::of(*previous));
            uow.transfers().deleteById(transferId);

            std::cout << "[TransferService] Deleted transfer " << transferId << std::endl;
        });
    }

    std::optional<domain::Transfer> getTransfer(
        const std::string& userId,
        int64_t transferId
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto transfer = uow.transfers().findById(transferId);
            if (!transfer || transfer->userId != userId) {
                return std::optional<domain::Transfer>();
            }
            return transfer;
        });
    }

    std::vector<domain::Transfer> listTransfers(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) override {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            return uow.transfers().findByUserId(userId, filter);
        });
    }

    domain::Transfer depositSalary(
        const std::string& userId,
        int64_t toAccountId,
        const domain::Money& amount
    ) override {
        runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            auto target = uow.accounts().findById(toAccountId);
            if (!target || target->userId != userId || target->isSystem) {
                throw domain::NotFoundError("Account not found.", "account");
            }
        });

        auto system = provisioner_->getOrCreateSystemAccount(userId);

        domain::TransferRequest request;
        request.fromAccountId = system.id;
        request.toAccountId = toAccountId;
        request.amount = amount;
        return create(userId, request, Counterparty::ALLOW_SYSTEM_SOURCE);
    }

    domain::Transfer depositRandomSalary(
        const std::string& userId,
        int64_t toAccountId,
        const domain::Money& min,
        const domain::Money& max
    ) override {
        if (max < min) {
            throw domain::ValidationError("max must be >= min.", "max");
        }
        return depositSalary(userId, toAccountId, randomAmount(min, max));
    }

private:
    /**
     * @brief Какие счета допустимы в качестве сторон перевода
     */
    enum class Counterparty {
        REGULAR_ONLY,           ///< Только обычные счета
        ALLOW_SYSTEM_SOURCE     ///< Списание с системного счёта (зарплата)
    };

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::input::ISystemAccountProvisioner> provisioner_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::Transfer create(
        const std::string& userId,
        const domain::TransferRequest& request,
        Counterparty counterparty
    ) {
        return runInTransaction(*uowFactory_, [&](ports::output::IUnitOfWork& uow) {
            validate(uow, userId, request, counterparty);
            lockAccounts(uow, {request.fromAccountId, request.toAccountId});

            auto source = uow.accounts().findById(request.fromAccountId);
            if (!source) {
                throw domain::NotFoundError("Both accounts must exist.");
            }
            if (!source->isSystem && source->balance < request.amount) {
                std::cerr << "[TransferService] Transfer rejected: account " << source->id
                          << " has " << source->balance.toString()
                          << ", needs " << request.amount.toString() << std::endl;
                throw domain::InsufficientFundsError("Insufficient funds in from_account.");
            }

            domain::Transfer transfer;
            transfer.userId = userId;
            transfer.fromAccountId = request.fromAccountId;
            transfer.toAccountId = request.toAccountId;
            transfer.amount = request.amount;
            transfer.createdAt = clock_->now();

            BalanceAdjuster::apply(uow.accounts(), domain::BalanceEffect::of(transfer));
            auto saved = uow.transfers().insert(transfer);

            std::cout << "[TransferService] Created transfer " << saved.id
                      << ": " << saved.amount.toString()
                      << " from account " << saved.fromAccountId
                      << " to account " << saved.toAccountId
                      << (source->isSystem ? " (salary)" : "") << std::endl;
            return saved;
        });
    }

    void validate(
        ports::output::IUnitOfWork& uow,
        const std::string& userId,
        const domain::TransferRequest& request,
        Counterparty counterparty
    ) {
        validation::requirePositiveAmount(request.amount);
        if (request.fromAccountId == request.toAccountId) {
            throw domain::ValidationError(
                "from_account and to_account must be different.", "to_account");
        }
        validation::requireUsableAccount(
            uow.accounts(), userId, request.fromAccountId, "from_account",
            counterparty == Counterparty::ALLOW_SYSTEM_SOURCE, "transfers");
        validation::requireUsableAccount(
            uow.accounts(), userId, request.toAccountId, "to_account",
            false, "transfers");
    }

    /**
     * @brief Заблокировать различные счета по возрастанию id
     *
     * @throws domain::NotFoundError если какой-то счёт исчез
     */
    static void lockAccounts(ports::output::IUnitOfWork& uow, std::vector<int64_t> ids) {
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        auto locked = uow.accounts().lockForUpdate(ids);
        if (locked.size() != ids.size()) {
            throw domain::NotFoundError("Both accounts must exist.");
        }
    }

    /**
     * @brief Равномерно распределённая сумма из [min, max] с точностью до копейки
     */
    static domain::Money randomAmount(const domain::Money& min, const domain::Money& max) {
        thread_local std::mt19937_64 generator{std::random_device{}()};
        std::uniform_int_distribution<int64_t> distribution(min.cents(), max.cents());
        return domain::Money::fromCents(distribution(generator));
    }
};

} // namespace finance::application
