#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Перевод между двумя счетами одного пользователя
 *
 * Списывает amount со счёта fromAccountId и зачисляет на toAccountId.
 * Источником может быть системный счёт (зарплата): он не проверяется
 * на достаточность средств и может уходить в минус.
 */
struct Transfer {
    int64_t id = 0;
    std::string userId;
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;    ///< != fromAccountId
    Money amount;               ///< > 0
    Timestamp createdAt;
};

} // namespace finance::domain
