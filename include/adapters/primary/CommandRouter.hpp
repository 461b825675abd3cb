// include/adapters/primary/CommandRouter.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include <map>
#include <memory>
#include <string>

namespace finance::adapters::primary {

/**
 * @brief Таблица маршрутов "op -> обработчик"
 *
 * Единственное место, где ошибки ядра превращаются в статусы:
 * - ValidationError      -> 400
 * - NotFoundError        -> 404
 * - InsufficientFunds    -> 422
 * - ConcurrencyTimeout   -> 503
 * - прочие исключения    -> 500
 *
 * @example
 * ```cpp
 * CommandRouter router;
 * router.addRoute("expense.create", expenseHandler);
 * std::string reply = router.handleLine(
 *     R"({"op":"expense.create","user":"u1","data":{"account":1,"category":2,"amount":"10.00"}})");
 * ```
 */
class CommandRouter {
public:
    void addRoute(const std::string& op, std::shared_ptr<ICommandHandler> handler);

    bool hasRoute(const std::string& op) const;

    /**
     * @brief Выполнить команду; исключения обработчика становятся ответом с ошибкой
     */
    CommandResponse dispatch(const CommandRequest& req) const;

    /**
     * @brief Разобрать строку JSON, выполнить и сериализовать ответ
     *
     * Некорректный JSON или отсутствие "op" / "user" -> 400.
     */
    std::string handleLine(const std::string& line) const;

    static nlohmann::json toJson(const CommandResponse& res);

private:
    std::map<std::string, std::shared_ptr<ICommandHandler>> routes_;

    static CommandResponse error(int status, const std::string& message, const std::string& field = "");
};

} // namespace finance::adapters::primary
