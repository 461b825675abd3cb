// include/adapters/primary/ExpenseHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IExpenseService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Команды расходов
 *
 * - expense.create {"account", "category", "amount", "description"?}
 * - expense.update {"id", "account", "category", "amount", "description"?}
 * - expense.delete {"id"}
 * - expense.get    {"id"}
 * - expense.list   {"start"?, "end"?, "account"?}
 */
class ExpenseHandler : public ICommandHandler {
public:
    explicit ExpenseHandler(std::shared_ptr<ports::input::IExpenseService> expenseService)
        : expenseService_(std::move(expenseService))
    {
        std::cout << "[ExpenseHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        if (req.op == "expense.create") {
            res.status = 201;
            res.body = JsonMapper::toJson(expenseService_->createExpense(req.userId, parseRequest(req.data)));
        } else if (req.op == "expense.update") {
            auto id = JsonMapper::requireId(req.data, "id");
            res.status = 200;
            res.body = JsonMapper::toJson(expenseService_->updateExpense(req.userId, id, parseRequest(req.data)));
        } else if (req.op == "expense.delete") {
            expenseService_->deleteExpense(req.userId, JsonMapper::requireId(req.data, "id"));
            res.status = 204;
            res.body = nullptr;
        } else if (req.op == "expense.get") {
            auto expense = expenseService_->getExpense(req.userId, JsonMapper::requireId(req.data, "id"));
            if (!expense) {
                sendNotFound(res);
                return;
            }
            res.status = 200;
            res.body = JsonMapper::toJson(*expense);
        } else if (req.op == "expense.list") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(
                expenseService_->listExpenses(req.userId, JsonMapper::toFilter(req.data)));
        } else {
            sendNotFound(res);
        }
    }

private:
    std::shared_ptr<ports::input::IExpenseService> expenseService_;

    static domain::ExpenseRequest parseRequest(const nlohmann::json& data) {
        domain::ExpenseRequest request;
        request.accountId = JsonMapper::requireId(data, "account");
        request.categoryId = JsonMapper::requireId(data, "category");
        request.amount = JsonMapper::requireMoney(data, "amount");
        request.description = JsonMapper::optionalString(data, "description");
        return request;
    }

    void sendNotFound(CommandResponse& res) {
        res.status = 404;
        res.body = {{"error", "Not found."}};
    }
};

} // namespace finance::adapters::primary
