#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Данные расхода
 *
 * Используется и при создании, и при обновлении (полная замена полей).
 */
struct ExpenseRequest {
    int64_t accountId = 0;
    int64_t categoryId = 0;
    Money amount;
    std::string description;
};

} // namespace finance::domain
