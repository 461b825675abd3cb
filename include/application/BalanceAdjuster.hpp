#pragma once

#include "domain/BalanceEffect.hpp"
#include "ports/output/IAccountRepository.hpp"
#include <vector>
#include <algorithm>

namespace finance::application {

/**
 * @brief Применение влияния записи к балансам счетов
 *
 * Единственная точка, через которую сервисы записей меняют балансы.
 * Каждая дельта уходит в IAccountRepository::adjustBalance внутри
 * текущей единицы работы; нулевые дельты пропускаются.
 *
 * Дельты применяются по возрастанию id счёта: неявные блокировки строк
 * берутся в том же порядке, что и явные у переводов.
 */
class BalanceAdjuster {
public:
    static void apply(ports::output::IAccountRepository& accounts, const domain::BalanceEffect& effect) {
        std::vector<domain::BalanceDelta> deltas = effect.deltas();
        std::sort(deltas.begin(), deltas.end(),
            [](const domain::BalanceDelta& a, const domain::BalanceDelta& b) {
                return a.accountId < b.accountId;
            });

        for (const auto& delta : deltas) {
            if (!delta.amount.isZero()) {
                accounts.adjustBalance(delta.accountId, delta.amount);
            }
        }
    }

    static void revert(ports::output::IAccountRepository& accounts, const domain::BalanceEffect& effect) {
        apply(accounts, effect.reversed());
    }
};

} // namespace finance::application
