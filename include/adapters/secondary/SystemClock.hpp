// include/adapters/secondary/SystemClock.hpp
#pragma once

#include "ports/output/IClock.hpp"

namespace finance::adapters::secondary {

/**
 * @brief Системные часы (UTC, точность до секунды)
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() override {
        return domain::Timestamp::fromUnixSeconds(domain::Timestamp::now().toUnixSeconds());
    }
};

} // namespace finance::adapters::secondary
