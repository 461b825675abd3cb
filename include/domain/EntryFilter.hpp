#pragma once

#include "Timestamp.hpp"
#include <optional>
#include <cstdint>

namespace finance::domain {

/**
 * @brief Фильтр выборки записей пользователя
 *
 * Все условия необязательные и объединяются через AND.
 * Границы периода включительные (createdAt in [from, to]).
 *
 * Для переводов accountId совпадает с любой из сторон,
 * fromAccountId / toAccountId ограничивают конкретную сторону.
 */
struct EntryFilter {
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    std::optional<int64_t> accountId;
    std::optional<int64_t> fromAccountId;
    std::optional<int64_t> toAccountId;

    bool contains(const Timestamp& ts) const {
        return (!from || ts >= *from) && (!to || ts <= *to);
    }
};

} // namespace finance::domain
