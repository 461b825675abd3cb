#pragma once

#include "domain/Account.hpp"
#include <string>

namespace finance::ports::input {

/**
 * @brief Провайдер системного (внешнего) счёта пользователя
 *
 * Системный счёт моделирует деньги, приходящие извне отслеживаемой
 * системы. Он скрыт из списков и не проверяется на овердрафт.
 */
class ISystemAccountProvisioner {
public:
    virtual ~ISystemAccountProvisioner() = default;

    /**
     * @brief Получить системный счёт, создав его при первом обращении
     *
     * Идемпотентно: параллельные первые вызовы для одного пользователя
     * возвращают один и тот же счёт.
     *
     * @param userId ID пользователя
     * @return Системный счёт (isSystem = true)
     */
    virtual domain::Account getOrCreateSystemAccount(const std::string& userId) = 0;
};

} // namespace finance::ports::input
