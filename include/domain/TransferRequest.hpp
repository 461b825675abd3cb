#pragma once

#include "Money.hpp"
#include <cstdint>

namespace finance::domain {

/**
 * @brief Данные перевода
 */
struct TransferRequest {
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;
    Money amount;
};

} // namespace finance::domain
