#pragma once

#include "Money.hpp"
#include "Expense.hpp"
#include "Income.hpp"
#include "Transfer.hpp"
#include <vector>
#include <cstdint>
#include <algorithm>

namespace finance::domain {

/**
 * @brief Знаковая дельта баланса одного счёта
 */
struct BalanceDelta {
    int64_t accountId = 0;
    Money amount;
};

/**
 * @brief Влияние записи на балансы счетов
 *
 * Чистая функция от записи: расход даёт {account, -amount},
 * доход {account, +amount}, перевод {from, -amount}, {to, +amount}.
 *
 * Обновление записи выражается как "отменить старое влияние,
 * применить новое". replace() объединяет обе части по счетам,
 * поэтому при неизменном счёте остаётся одна дельта (new - old),
 * а итоговые балансы совпадают с полным reverse-then-reapply.
 *
 * @example
 * ```
 * old: Expense 100 на A  -> {A, -100}
 * new: Expense 150 на A  -> {A, -150}
 * replace(old, new)      -> {A, -50}
 *
 * old: Income 200 на A   -> {A, +200}
 * new: Income 200 на B   -> {B, +200}
 * replace(old, new)      -> {A, -200}, {B, +200}
 * ```
 */
class BalanceEffect {
public:
    BalanceEffect() = default;

    static BalanceEffect of(const Expense& expense) {
        BalanceEffect effect;
        effect.add(expense.accountId, -expense.amount);
        return effect;
    }

    static BalanceEffect of(const Income& income) {
        BalanceEffect effect;
        effect.add(income.accountId, income.amount);
        return effect;
    }

    static BalanceEffect of(const Transfer& transfer) {
        BalanceEffect effect;
        effect.add(transfer.fromAccountId, -transfer.amount);
        effect.add(transfer.toAccountId, transfer.amount);
        return effect;
    }

    /**
     * @brief Влияние при замене previous на next (нулевые дельты отброшены)
     */
    static BalanceEffect replace(const BalanceEffect& previous, const BalanceEffect& next) {
        BalanceEffect effect = previous.reversed();
        for (const auto& delta : next.deltas_) {
            effect.add(delta.accountId, delta.amount);
        }
        effect.deltas_.erase(
            std::remove_if(effect.deltas_.begin(), effect.deltas_.end(),
                           [](const BalanceDelta& d) { return d.amount.isZero(); }),
            effect.deltas_.end());
        return effect;
    }

    /**
     * @brief Обратное влияние (все дельты с противоположным знаком)
     */
    BalanceEffect reversed() const {
        BalanceEffect effect;
        for (const auto& delta : deltas_) {
            effect.deltas_.push_back({delta.accountId, -delta.amount});
        }
        return effect;
    }

    /**
     * @brief Добавить дельту (суммируется с существующей по тому же счёту)
     */
    BalanceEffect& add(int64_t accountId, const Money& amount) {
        for (auto& delta : deltas_) {
            if (delta.accountId == accountId) {
                delta.amount += amount;
                return *this;
            }
        }
        deltas_.push_back({accountId, amount});
        return *this;
    }

    /**
     * @brief Суммарная дельта по счёту (0, если счёт не затронут)
     */
    Money deltaFor(int64_t accountId) const {
        for (const auto& delta : deltas_) {
            if (delta.accountId == accountId) {
                return delta.amount;
            }
        }
        return Money();
    }

    const std::vector<BalanceDelta>& deltas() const { return deltas_; }

    bool empty() const { return deltas_.empty(); }

private:
    std::vector<BalanceDelta> deltas_;
};

} // namespace finance::domain
