#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Доход: увеличивает баланс одного счёта на amount
 */
struct Income {
    int64_t id = 0;
    std::string userId;
    int64_t accountId = 0;      ///< Счёт зачисления (не системный)
    Money amount;               ///< > 0
    std::string description;
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace finance::domain
