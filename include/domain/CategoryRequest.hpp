#pragma once

#include <string>

namespace finance::domain {

/**
 * @brief Запрос на создание или переименование категории
 */
struct CategoryRequest {
    std::string name;
};

} // namespace finance::domain
