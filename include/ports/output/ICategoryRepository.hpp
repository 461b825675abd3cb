#pragma once

#include "domain/Category.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace finance::ports::output {

/**
 * @brief Репозиторий категорий расходов
 */
class ICategoryRepository {
public:
    virtual ~ICategoryRepository() = default;

    virtual std::optional<domain::Category> findById(int64_t id) = 0;

    /**
     * @brief Категории пользователя, по имени
     */
    virtual std::vector<domain::Category> findByUserId(const std::string& userId) = 0;

    /**
     * @throws domain::ValidationError если имя уже занято
     */
    virtual domain::Category insert(const domain::Category& category) = 0;

    /**
     * @throws domain::ValidationError если имя уже занято
     */
    virtual void update(const domain::Category& category) = 0;

    /**
     * @throws domain::ValidationError если на категорию ссылаются расходы
     */
    virtual bool deleteById(int64_t id) = 0;

    virtual bool isReferenced(int64_t id) = 0;
};

} // namespace finance::ports::output
