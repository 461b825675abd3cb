#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Счёт пользователя с кэшированным балансом
 *
 * Баланс не пересчитывается из истории: он меняется только дельтами
 * при создании, изменении и удалении записей (расходов, доходов, переводов).
 *
 * Системный счёт (isSystem) один на пользователя, скрыт из списков
 * и моделирует деньги вне отслеживаемой системы (например, источник зарплаты).
 */
struct Account {
    int64_t id = 0;             ///< Идентификатор (0, если ещё не сохранён)
    std::string userId;         ///< Владелец
    std::string name;           ///< Название, уникально для пользователя
    Money balance;              ///< Текущий баланс
    bool isSystem = false;      ///< Системный (внешний) счёт
    Timestamp createdAt;        ///< Дата создания

    Account() = default;

    Account(
        const std::string& userId,
        const std::string& name,
        bool isSystem = false
    ) : userId(userId), name(name), isSystem(isSystem) {}
};

} // namespace finance::domain
