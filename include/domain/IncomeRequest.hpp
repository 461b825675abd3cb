#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Данные дохода (создание / полная замена)
 */
struct IncomeRequest {
    int64_t accountId = 0;
    Money amount;
    std::string description;
};

} // namespace finance::domain
