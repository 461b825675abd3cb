// include/adapters/primary/ICommandHandler.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace finance::adapters::primary {

/**
 * @brief Команда, пришедшая на вход сервиса
 *
 * Строка протокола: {"op": "expense.create", "user": "user-1", "data": {...}}
 */
struct CommandRequest {
    std::string op;
    std::string userId;
    nlohmann::json data = nlohmann::json::object();
};

/**
 * @brief Ответ на команду
 *
 * Успех: {"status": 200, "body": ...}
 * Ошибка: {"status": 400, "error": "...", "field": "..."}
 */
struct CommandResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Обработчик группы команд (primary adapter)
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    /**
     * @throws domain::LedgerError ошибки ядра, статус выставляет CommandRouter
     */
    virtual void handle(const CommandRequest& req, CommandResponse& res) = 0;
};

} // namespace finance::adapters::primary
