#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Расход: уменьшает баланс одного счёта на amount
 */
struct Expense {
    int64_t id = 0;
    std::string userId;
    int64_t accountId = 0;      ///< Счёт списания (не системный)
    int64_t categoryId = 0;     ///< Категория того же пользователя
    Money amount;               ///< > 0
    std::string description;
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace finance::domain
