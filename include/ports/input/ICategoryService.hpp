#pragma once

#include "domain/Category.hpp"
#include "domain/CategoryRequest.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace finance::ports::input {

/**
 * @brief Интерфейс сервиса категорий расходов
 */
class ICategoryService {
public:
    virtual ~ICategoryService() = default;

    virtual domain::Category createCategory(
        const std::string& userId,
        const domain::CategoryRequest& request
    ) = 0;

    virtual domain::Category renameCategory(
        const std::string& userId,
        int64_t categoryId,
        const domain::CategoryRequest& request
    ) = 0;

    virtual std::vector<domain::Category> listCategories(const std::string& userId) = 0;

    virtual std::optional<domain::Category> getCategory(
        const std::string& userId,
        int64_t categoryId
    ) = 0;

    /**
     * @throws domain::ValidationError на категорию ссылаются расходы
     */
    virtual void deleteCategory(const std::string& userId, int64_t categoryId) = 0;
};

} // namespace finance::ports::input
