// include/adapters/primary/TransferHandler.hpp
#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/ITransferService.hpp"
#include <memory>
#include <iostream>

namespace finance::adapters::primary {

/**
 * @brief Команды переводов
 *
 * - transfer.create        {"from_account", "to_account", "amount"}
 * - transfer.update        {"id", "from_account", "to_account", "amount"}
 * - transfer.delete        {"id"}
 * - transfer.get           {"id"}
 * - transfer.list          {"start"?, "end"?, "account"?, "from_account"?, "to_account"?}
 * - transfer.salary        {"account", "amount"}
 * - transfer.salary_random {"account", "min", "max"}
 */
class TransferHandler : public ICommandHandler {
public:
    explicit TransferHandler(std::shared_ptr<ports::input::ITransferService> transferService)
        : transferService_(std::move(transferService))
    {
        std::cout << "[TransferHandler] Created" << std::endl;
    }

    void handle(const CommandRequest& req, CommandResponse& res) override {
        if (req.op == "transfer.create") {
            res.status = 201;
            res.body = JsonMapper::toJson(transferService_->createTransfer(req.userId, parseRequest(req.data)));
        } else if (req.op == "transfer.update") {
            auto id = JsonMapper::requireId(req.data, "id");
            res.status = 200;
            res.body = JsonMapper::toJson(transferService_->updateTransfer(req.userId, id, parseRequest(req.data)));
        } else if (req.op == "transfer.delete") {
            transferService_->deleteTransfer(req.userId, JsonMapper::requireId(req.data, "id"));
            res.status = 204;
            res.body = nullptr;
        } else if (req.op == "transfer.get") {
            auto transfer = transferService_->getTransfer(req.userId, JsonMapper::requireId(req.data, "id"));
            if (!transfer) {
                sendNotFound(res);
                return;
            }
            res.status = 200;
            res.body = JsonMapper::toJson(*transfer);
        } else if (req.op == "transfer.list") {
            res.status = 200;
            res.body = JsonMapper::toJsonArray(
                transferService_->listTransfers(req.userId, JsonMapper::toFilter(req.data)));
        } else if (req.op == "transfer.salary") {
            auto transfer = transferService_->depositSalary(
                req.userId,
                JsonMapper::requireId(req.data, "account"),
                JsonMapper::requireMoney(req.data, "amount"));
            res.status = 201;
            res.body = JsonMapper::toJson(transfer);
        } else if (req.op == "transfer.salary_random") {
            auto transfer = transferService_->depositRandomSalary(
                req.userId,
                JsonMapper::requireId(req.data, "account"),
                JsonMapper::requireMoney(req.data, "min"),
                JsonMapper::requireMoney(req.data, "max"));
            res.status = 201;
            res.body = JsonMapper::toJson(transfer);
        } else {
            sendNotFound(res);
        }
    }

private:
    std::shared_ptr<ports::input::ITransferService> transferService_;

    static domain::TransferRequest parseRequest(const nlohmann::json& data) {
        domain::TransferRequest request;
        request.fromAccountId = JsonMapper::requireId(data, "from_account");
        request.toAccountId = JsonMapper::requireId(data, "to_account");
        request.amount = JsonMapper::requireMoney(data, "amount");
        return request;
    }

    void sendNotFound(CommandResponse& res) {
        res.status = 404;
        res.body = {{"error", "Not found."}};
    }
};

} // namespace finance::adapters::primary
