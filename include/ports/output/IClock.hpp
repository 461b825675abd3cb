#pragma once

#include "domain/Timestamp.hpp"

namespace finance::ports::output {

/**
 * @brief Источник текущего времени для меток записей
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() = 0;
};

} // namespace finance::ports::output
