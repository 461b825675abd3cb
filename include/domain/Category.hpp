#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Категория расходов
 *
 * Используется только для классификации, на балансы не влияет.
 */
struct Category {
    int64_t id = 0;
    std::string userId;
    std::string name;           ///< Уникально для пользователя
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace finance::domain
