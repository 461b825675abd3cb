#pragma once

#include <string>

namespace finance::domain {

/**
 * @brief Запрос на создание или переименование счёта
 */
struct AccountRequest {
    std::string name;           ///< Название счёта
};

} // namespace finance::domain
