// include/adapters/primary/IncomeHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IIncomeService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Команды доходов: income.create / update / delete / get / list
 */
class IncomeHandler : public ICommandHandler {
public:
    explicit IncomeHandler(std::shared_ptr<ports::input::IIncomeService> incomeService)
        : incomeService_(std::move(incomeService))
    {
        std::cout << "[IncomeHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        if (req.op == "income.create") {
            res.status = 201;
            res.body = JsonMapper::toJson(incomeService_->createIncome(req.userId, parseRequest(req.data)));
        } else if (req.op == "income.update") {
            auto id = JsonMapper::requireId(req.data, "id");
            res.status = 200;
            res.body = JsonMapper::toJson(incomeService_->updateIncome(req.userId, id, parseRequest(req.data)));
        } else if (req.op == "income.delete") {
            incomeService_->deleteIncome(req.userId, JsonMapper::requireId(req.data, "id"));
            res.status = 204;
            res.body = nullptr;
        } else if (req.op == "income.get") {
            auto income = incomeService_->getIncome(req.userId, JsonMapper::requireId(req.data, "id"));
            if (!income) {
                sendNotFound(res);
                return;
            }
            res.status = 200;
            res.body = JsonMapper::toJson(*income);
        } else if (req.op == "income.list") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(
                incomeService_->listIncomes(req.userId, JsonMapper::toFilter(req.data)));
        } else {
            sendNotFound(res);
        }
    }

private:
    std::shared_ptr<ports::input::IIncomeService> incomeService_;

    static domain::IncomeRequest parseRequest(const nlohmann::json& data) {
        domain::IncomeRequest request;
        request.accountId = JsonMapper::requireId(data, "account");
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
