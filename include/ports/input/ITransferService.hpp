#pragma once

#include "domain/Transfer.hpp"
#include "domain/TransferRequest.hpp"
#include "domain/EntryFilter.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::ports::input {

/**
 * @brief Интерфейс сервиса переводов
 *
 * Переводы затрагивают два счёта и перед проверкой средств
 * блокируют строки обоих счетов.
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Создать перевод между обычными счетами пользователя
     *
     * @throws domain::ValidationError сумма <= 0, одинаковые счета, чужой или системный счёт
     * @throws domain::InsufficientFundsError на счёте списания недостаточно средств
     * @throws domain::NotFoundError счёт не существует
     * @throws domain::ConcurrencyTimeout не удалось заблокировать счета
     */
    virtual domain::Transfer createTransfer(
        const std::string& userId,
        const domain::TransferRequest& request
    ) = 0;

    /**
     * @brief Изменить перевод
     *
     * Старое влияние полностью отменяется до проверки средств, поэтому
     * уменьшение суммы или смена счетов не отклоняются из-за самого
     * изменяемого перевода. При нехватке средств балансы остаются
     * в точности такими, какими были до вызова.
     */
    virtual domain::Transfer updateTransfer(
        const std::string& userId,
        int64_t transferId,
        const domain::TransferRequest& request
    ) = 0;

    /**
     * @brief Удалить перевод и отменить его влияние на оба счёта
     */
    virtual void deleteTransfer(const std::string& userId, int64_t transferId) = 0;

    virtual std::optional<domain::Transfer> getTransfer(
        const std::string& userId,
        int64_t transferId
    ) = 0;

    virtual std::vector<domain::Transfer> listTransfers(
        const std::string& userId,
        const domain::EntryFilter& filter
    ) = 0;

    /**
     * @brief Зачислить зарплату: перевод с системного счёта на обычный
     *
     * @throws domain::NotFoundError счёт зачисления не найден или системный
     */
    virtual domain::Transfer depositSalary(
        const std::string& userId,
        int64_t toAccountId,
        const domain::Money& amount
    ) = 0;

    /**
     * @brief Зачислить зарплату случайного размера из [min, max]
     *
     * @throws domain::ValidationError если max < min
     */
    virtual domain::Transfer depositRandomSalary(
        const std::string& userId,
        int64_t toAccountId,
        const domain::Money& min,
        const domain::Money& max
    ) = 0;
};

} // namespace finance::ports::input
